#include "transition.hpp"
#include "../defs.hpp"
#include "../log.hpp"

#include <cstdio>

namespace kpctl {

const char* transition_state_name(TransitionState state) {
    switch (state) {
    case TransitionState::Idle:
        return "idle";
    case TransitionState::Polling:
        return "polling";
    case TransitionState::Stalled:
        return "stalled";
    case TransitionState::Signaled:
        return "signaled";
    case TransitionState::Resolved:
        return "resolved";
    case TransitionState::Failed:
        return "failed";
    }
    return "unknown";
}

bool in_transition(Host& host, KernelAbi abi, const std::string& module) {
    auto value = read_value(host, module_state_file(abi, module, TRANSITION_FILE_NAME));
    return value && *value == "1";
}

std::optional<StalledProcess> check_stalled(Host& host, KernelAbi abi, const std::string& module,
                                            const std::string& task_dir, int tid) {
    auto patch_state = read_number(host, join_path(task_dir, PATCH_STATE_FILE_NAME));
    // Task is not part of any transition
    if (patch_state && *patch_state == -1) {
        return std::nullopt;
    }

    auto enabled = read_number(host, module_state_file(abi, module, ENABLED_FILE_NAME));
    if (!enabled || !patch_state) {
        return std::nullopt;
    }

    // patched/unpatched share their values with enabled/disabled
    if (*patch_state == *enabled) {
        return std::nullopt;
    }

    StalledProcess process;
    process.pid = tid;
    process.comm = read_value(host, join_path(task_dir, COMM_FILE_NAME)).value_or("");
    process.stack = host.read(join_path(task_dir, STACK_FILE_NAME)).value_or("");
    process.patch_state = *patch_state;
    process.target = *enabled;
    return process;
}

std::vector<StalledProcess> find_stalled_processes(Host& host, KernelAbi abi,
                                                   const std::string& module) {
    std::vector<StalledProcess> stalled;

    for (const auto& pid : host.list_dir(PROC_DIR)) {
        if (!is_numeric(pid))
            continue;

        std::string task_root = join_path(join_path(PROC_DIR, pid), "task");
        for (const auto& tid : host.list_dir(task_root)) {
            if (!is_numeric(tid))
                continue;

            auto process = check_stalled(host, abi, module, join_path(task_root, tid),
                                         static_cast<int>(parse_long(tid).value_or(-1)));
            if (process) {
                stalled.push_back(*process);
            }
        }
    }

    return stalled;
}

void print_stalled_processes(const std::vector<StalledProcess>& stalled) {
    if (stalled.empty())
        return;

    printf("\nStalled processes:\n");
    for (const auto& process : stalled) {
        printf("%d %s\nstack:\n%s\n", process.pid, process.comm.c_str(),
               trim(process.stack).c_str());
    }
}

std::optional<std::string> find_transitioning_module(Host& host, KernelAbi abi) {
    for (const auto& module : host.list_dir(abi_root(abi))) {
        if (in_transition(host, abi, module)) {
            return module;
        }
    }
    return std::nullopt;
}

Status signal_stalled_processes(Host& host, KernelAbi abi, const std::string& module) {
    if (!has_signal_control(host, abi, module)) {
        LOGW("Livepatch process signaling is disabled.");
        return Status::UnsupportedRemediation;
    }

    printf("signaling stalled process(es):\n");
    std::string error = host.write(module_state_file(abi, module, SIGNAL_FILE_NAME), "1");
    if (!error.empty()) {
        LOGW("failed to signal stalled processes of %s: %s", module.c_str(), error.c_str());
        return Status::ToolFailure;
    }
    return Status::Ok;
}

TransitionResult wait_for_transition(const Runtime& rt, KernelAbi abi, const std::string& module) {
    TransitionResult result{module, TransitionState::Idle, 0, false, false, {}};

    auto enabled = read_number(rt.host, module_state_file(abi, module, ENABLED_FILE_NAME));
    result.target = enabled && *enabled == 1;

    if (!in_transition(rt.host, abi, module)) {
        return result;
    }

    unsigned window = rt.config.post_enable_wait;
    unsigned waited = 0;
    bool escalated = false;

    printf("waiting (up to %u seconds) for patch transition to complete...\n", window);
    result.state = TransitionState::Polling;

    for (;;) {
        switch (result.state) {
        case TransitionState::Polling:
            if (!in_transition(rt.host, abi, module)) {
                printf("transition complete (%u seconds)\n", waited);
                result.state = TransitionState::Resolved;
            } else if (waited >= window) {
                result.state = escalated ? TransitionState::Failed : TransitionState::Stalled;
            } else {
                rt.host.sleep(1);
                waited++;
                result.elapsed++;
            }
            break;

        case TransitionState::Stalled:
            printf("patch transition has stalled!\n");
            result.stalled = find_stalled_processes(rt.host, abi, module);
            print_stalled_processes(result.stalled);
            result.state = TransitionState::Signaled;
            break;

        case TransitionState::Signaled:
            // Best effort, the nudge is not guaranteed to unblock anything
            result.signaled = signal_stalled_processes(rt.host, abi, module) == Status::Ok;
            escalated = true;
            window = rt.config.post_signal_wait;
            waited = 0;
            printf("waiting (up to %u seconds) for patch transition to complete...\n", window);
            result.state = TransitionState::Polling;
            break;

        case TransitionState::Idle:
        case TransitionState::Resolved:
        case TransitionState::Failed:
            LOGD("transition of %s: %s after %u seconds", module.c_str(),
                 transition_state_name(result.state), result.elapsed);
            return result;
        }
    }
}

}  // namespace kpctl
