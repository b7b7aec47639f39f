#include "retry.hpp"
#include "../defs.hpp"
#include "../log.hpp"

#include <cstdio>

namespace kpctl {

static const char* mutation_name(Mutation kind) {
    return kind == Mutation::Insert ? "load" : "write enabled flag of";
}

Status run_with_retry(const Runtime& rt, Mutation kind, const std::string& target,
                      const MutationOp& op) {
    unsigned max_attempts = rt.config.max_load_attempts > 0 ? rt.config.max_load_attempts : 1;

    for (unsigned attempt = 1;; attempt++) {
        std::string out = trim(op());
        if (out.empty()) {
            LOGD("%s %s: ok (attempt %u)", mutation_name(kind), target.c_str(), attempt);
            return Status::Ok;
        }

        fprintf(stderr, "%s\n", out.c_str());

        if (out.find(BUSY_MARKER) == std::string::npos) {
            LOGE("failed to %s %s", mutation_name(kind), target.c_str());
            return Status::ToolFailure;
        }

        if (attempt >= max_attempts) {
            LOGE("failed to %s %s: still busy after %u attempts", mutation_name(kind),
                 target.c_str(), attempt);
            return Status::ContentionBusy;
        }

        LOGW("activeness safety check failed for %s, retrying in %u seconds...",
             target.c_str(), rt.config.retry_interval);
        rt.host.sleep(rt.config.retry_interval);
    }
}

Status insert_module(const Runtime& rt, const std::string& path) {
    return run_with_retry(rt, Mutation::Insert, path, [&rt, &path]() {
        auto result = rt.host.exec({"insmod", path});
        std::string out = trim(result.stdout_str + result.stderr_str);
        if (out.empty() && result.exit_code != 0) {
            out = "insmod exited with status " + std::to_string(result.exit_code);
        }
        return out;
    });
}

Status write_enabled(const Runtime& rt, KernelAbi abi, const std::string& module, bool enabled) {
    std::string path = module_state_file(abi, module, ENABLED_FILE_NAME);
    return run_with_retry(rt, Mutation::WriteEnabled, module, [&rt, &path, enabled]() {
        return rt.host.write(path, enabled ? "1" : "0");
    });
}

}  // namespace kpctl
