#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../runtime.hpp"
#include "../status.hpp"
#include "abi.hpp"

namespace kpctl {

enum class TransitionState {
    Idle,      // flag already clear when the wait started
    Polling,
    Stalled,   // primary window exhausted
    Signaled,  // remediation attempted
    Resolved,
    Failed,    // secondary window exhausted
};

const char* transition_state_name(TransitionState state);

struct StalledProcess {
    int pid;
    std::string comm;
    std::string stack;
    long patch_state;
    long target;
};

struct TransitionResult {
    std::string module;
    TransitionState state;
    unsigned elapsed;  // seconds spent sleeping
    bool target;       // value of the enabled flag being applied
    bool signaled;
    std::vector<StalledProcess> stalled;

    bool settled() const { return state != TransitionState::Failed; }
};

bool in_transition(Host& host, KernelAbi abi, const std::string& module);

// Task at |task_dir| (/proc/<pid>/task/<tid>) has not reached the target
// state of |module|. Unreadable state counts as not stalled.
std::optional<StalledProcess> check_stalled(Host& host, KernelAbi abi, const std::string& module,
                                            const std::string& task_dir, int tid);

std::vector<StalledProcess> find_stalled_processes(Host& host, KernelAbi abi,
                                                   const std::string& module);
void print_stalled_processes(const std::vector<StalledProcess>& stalled);

// First resident module whose transition flag is set
std::optional<std::string> find_transitioning_module(Host& host, KernelAbi abi);

// One-shot request for the kernel to nudge tasks blocking |module|.
// UnsupportedRemediation when the ABI has no signal control.
Status signal_stalled_processes(Host& host, KernelAbi abi, const std::string& module);

// Bounded wait for the transition of |module|, called right after its
// enabled flag (or the module itself) changed. Polls post_enable_wait
// seconds, signals once, then polls post_signal_wait more seconds.
TransitionResult wait_for_transition(const Runtime& rt, KernelAbi abi, const std::string& module);

}  // namespace kpctl
