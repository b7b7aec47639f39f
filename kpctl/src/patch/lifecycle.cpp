#include "lifecycle.hpp"
#include "../core/refcount.hpp"
#include "../core/retry.hpp"
#include "../core/transition.hpp"
#include "../defs.hpp"
#include "../log.hpp"

#include <cstdio>
#include <map>

namespace kpctl {

std::optional<std::string> find_core_module(const Runtime& rt) {
    std::string release = rt.host.kernel_release();
    const std::vector<std::string> candidates = {
        join_path(rt.host.self_dir(), std::string("../kmod/core/") + CORE_MODULE_FILE),
        "/usr/local/lib/kpatch/" + release + "/" + CORE_MODULE_FILE,
        "/usr/lib/kpatch/" + release + "/" + CORE_MODULE_FILE,
        "/usr/local/lib/modules/" + release + "/extra/kpatch/" + CORE_MODULE_FILE,
        "/usr/lib/modules/" + release + "/extra/kpatch/" + CORE_MODULE_FILE,
    };

    for (const auto& candidate : candidates) {
        if (rt.host.exists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::pair<Status, KernelAbi> ensure_core_loaded(const Runtime& rt) {
    if (core_loaded(rt.host)) {
        return {Status::Ok, resolve_abi(rt.host)};
    }

    auto result = rt.host.exec({"modprobe", "-q", CORE_MODULE_NAME});
    if (result.exit_code == 0) {
        printf("loaded core module\n");
    } else {
        auto core = find_core_module(rt);
        if (!core) {
            LOGE("can't find core module");
            return {Status::NotFound, resolve_abi(rt.host)};
        }

        printf("loading core module: %s\n", core->c_str());
        result = rt.host.exec({"insmod", *core});
        if (result.exit_code != 0) {
            LOGE("failed to load core module: %s",
                 trim(result.stdout_str + result.stderr_str).c_str());
            return {Status::ToolFailure, resolve_abi(rt.host)};
        }
    }

    // The state root only appears once the core is up
    return {Status::Ok, resolve_abi(rt.host)};
}

Status verify_checksum(const Runtime& rt, KernelAbi abi, const PatchModule& module) {
    auto resident = read_value(rt.host, module_state_file(abi, module.name, CHECKSUM_FILE_NAME));
    if (!resident) {
        LOGD("%s: no resident checksum to compare", module.name.c_str());
        return Status::Ok;
    }

    if (module.checksum.empty()) {
        LOGE("%s: binary carries no checksum", module.path.c_str());
        return Status::ChecksumMismatch;
    }

    if (module.checksum != *resident) {
        LOGE("%s: checksum %s does not match resident %s", module.name.c_str(),
             module.checksum.c_str(), resident->c_str());
        return Status::ChecksumMismatch;
    }
    return Status::Ok;
}

static Status reenable_module(const Runtime& rt, KernelAbi abi, const PatchModule& module) {
    if (verify_checksum(rt, abi, module) != Status::Ok) {
        fprintf(stderr, "error: cannot re-enable patch module %s, cannot verify checksum match\n",
                module.name.c_str());
        return Status::ChecksumMismatch;
    }

    printf("module already loaded, re-enabling\n");
    Status status = write_enabled(rt, abi, module.name, true);
    if (status != Status::Ok) {
        fprintf(stderr, "error: failed to re-enable module %s\n", module.name.c_str());
        return status;
    }

    if (wait_for_transition(rt, abi, module.name).settled()) {
        return Status::Ok;
    }

    printf("module %s did not complete its transition, disabling...\n", module.name.c_str());
    status = write_enabled(rt, abi, module.name, false);
    if (status != Status::Ok) {
        LOGE("failed to disable module %s: %s", module.name.c_str(), status_name(status));
    } else if (!wait_for_transition(rt, abi, module.name).settled()) {
        LOGE("module %s did not settle after rollback", module.name.c_str());
    }
    fprintf(stderr, "error: failed to re-enable module %s (transition stalled), patch disabled\n",
            module.name.c_str());
    return Status::TransitionStalled;
}

static Status insert_and_enable(const Runtime& rt, KernelAbi abi, const PatchModule& module) {
    // Leftover disabled copy under the same name
    Status status = remove_module(rt, module.name, true);
    if (status != Status::Ok) {
        return status;
    }

    printf("loading patch module: %s\n", module.path.c_str());
    status = insert_module(rt, module.path);
    if (status != Status::Ok) {
        fprintf(stderr, "error: failed to load module %s\n", module.path.c_str());
        return status;
    }

    if (wait_for_transition(rt, abi, module.name).settled()) {
        return Status::Ok;
    }

    printf("module %s did not complete its transition, unloading...\n", module.name.c_str());
    status = unload_module(rt, abi, module.name);
    if (status != Status::Ok) {
        LOGE("failed to unload module %s: %s", module.name.c_str(), status_name(status));
    }
    fprintf(stderr, "error: failed to load module %s (transition stalled)\n",
            module.name.c_str());
    return Status::TransitionStalled;
}

Status load_module(const Runtime& rt, const PatchModule& module) {
    std::string release = rt.host.kernel_release();
    if (module.kernel_version != release) {
        fprintf(stderr, "error: invalid module version %s for kernel %s\n",
                module.kernel_version.empty() ? "(none)" : module.kernel_version.c_str(),
                release.c_str());
        return Status::VersionMismatch;
    }

    auto [status, abi] = ensure_core_loaded(rt);
    if (status != Status::Ok) {
        return status;
    }

    std::string enabled_path = module_state_file(abi, module.name, ENABLED_FILE_NAME);
    if (!rt.host.is_dir(module_state_dir(abi, module.name))) {
        status = insert_and_enable(rt, abi, module);
    } else if (read_number(rt.host, enabled_path).value_or(0) == 0) {
        status = reenable_module(rt, abi, module);
    } else if (in_transition(rt.host, abi, module.name)) {
        // Still enabling from an earlier load
        printf("module named %s already loaded, waiting for its transition\n",
               module.name.c_str());
        if (!wait_for_transition(rt, abi, module.name).settled()) {
            fprintf(stderr, "error: module %s did not complete its transition\n",
                    module.name.c_str());
            return Status::TransitionStalled;
        }
    } else {
        printf("module named %s already loaded and enabled\n", module.name.c_str());
        return Status::Ok;
    }

    if (status == Status::Ok) {
        printf("patch module %s is enabled\n", module.name.c_str());
    }
    return status;
}

Status load_patch(const Runtime& rt, const std::string& arg) {
    auto module = find_module(rt, arg);
    if (!module) {
        fprintf(stderr, "error: module %s not found\n", arg.c_str());
        return Status::NotFound;
    }
    return load_module(rt, *module);
}

Status load_all(const Runtime& rt) {
    for (const auto& binary : installed_binaries(rt, rt.host.kernel_release())) {
        Status status = load_module(rt, describe_binary(rt, binary));
        if (status != Status::Ok) {
            fprintf(stderr, "error: failed to load module %s\n", binary.c_str());
            return status;
        }
    }
    return Status::Ok;
}

Status disable_patch(const Runtime& rt, KernelAbi abi, const std::string& module) {
    std::string enabled_path = module_state_file(abi, module, ENABLED_FILE_NAME);

    if (!rt.host.exists(enabled_path)) {
        if (module_resident(rt.host, module)) {
            // Loaded, but already disabled
            return Status::Ok;
        }
        LOGW("patch module %s is not loaded", module.c_str());
        return Status::NotFound;
    }

    if (read_number(rt.host, enabled_path).value_or(0) == 1) {
        printf("disabling patch module: %s\n", module.c_str());
        Status status = write_enabled(rt, abi, module, false);
        if (status != Status::Ok) {
            return status;
        }
    }

    if (!wait_for_transition(rt, abi, module).settled()) {
        printf("module %s did not complete its transition...\n", module.c_str());
        return Status::TransitionStalled;
    }
    return Status::Ok;
}

Status remove_module(const Runtime& rt, const std::string& module, bool quiet) {
    if (!module_resident(rt.host, module)) {
        return Status::Ok;
    }

    if (wait_for_zero_refcount(rt, module) != Status::Ok) {
        fprintf(stderr, "error: failed to unload module %s (refcnt)\n", module.c_str());
        return Status::RefcountTimeout;
    }

    if (!quiet) {
        printf("unloading patch module: %s\n", module.c_str());
    }

    // rmmod refuses modules built with KPATCH_FORCE_UNSAFE
    auto result = rt.host.exec({"rmmod", module});
    if (result.exit_code != 0) {
        LOGD("rmmod %s: %s", module.c_str(), trim(result.stderr_str).c_str());
    }
    return Status::Ok;
}

Status unload_module(const Runtime& rt, KernelAbi abi, const std::string& module) {
    Status status = disable_patch(rt, abi, module);
    if (status != Status::Ok) {
        fprintf(stderr, "error: failed to disable module %s\n", module.c_str());
        return status;
    }
    return remove_module(rt, module, false);
}

Status unload_patch(const Runtime& rt, const std::string& arg) {
    return unload_module(rt, resolve_abi(rt.host), canonical_name(arg));
}

UnloadAllReport unload_all(const Runtime& rt) {
    UnloadAllReport report;
    KernelAbi abi = resolve_abi(rt.host);
    std::map<std::string, Status> last_error;
    unsigned progress;

    // Kernels before 5.1 only disable patches in LIFO order, so keep sweeping
    // until nothing more can be disabled
    do {
        progress = 0;
        report.sweeps++;

        for (const auto& module : rt.host.list_dir(abi_root(abi))) {
            if (!rt.host.is_dir(module_state_dir(abi, module)))
                continue;

            if (in_transition(rt.host, abi, module)) {
                LOGI("%s is still in transition, skipping", module.c_str());
                last_error[module] = Status::TransitionStalled;
                continue;
            }

            bool was_enabled =
                read_number(rt.host, module_state_file(abi, module, ENABLED_FILE_NAME))
                    .value_or(0) == 1;

            Status status = disable_patch(rt, abi, module);
            if (status != Status::Ok) {
                last_error[module] = status;
                continue;
            }
            if (was_enabled) {
                progress++;
            }

            status = remove_module(rt, module, false);
            if (status != Status::Ok) {
                last_error[module] = status;
                continue;
            }

            if (!rt.host.exists(module_state_dir(abi, module))) {
                if (!was_enabled) {
                    progress++;
                }
                last_error.erase(module);
            }
        }
    } while (progress > 0);

    for (const auto& module : rt.host.list_dir(abi_root(abi))) {
        if (!rt.host.is_dir(module_state_dir(abi, module)))
            continue;

        auto it = last_error.find(module);
        Status status = it != last_error.end() ? it->second : Status::ToolFailure;
        report.failures.emplace_back(module, status);
    }

    return report;
}

std::vector<PatchModule> loaded_modules(const Runtime& rt, KernelAbi abi) {
    std::vector<PatchModule> modules;

    for (const auto& name : rt.host.list_dir(abi_root(abi))) {
        if (!rt.host.is_dir(module_state_dir(abi, name)))
            continue;

        PatchModule module;
        module.name = name;
        module.enabled =
            read_number(rt.host, module_state_file(abi, name, ENABLED_FILE_NAME)).value_or(0) == 1;
        module.transitioning = in_transition(rt.host, abi, name);
        module.checksum =
            read_value(rt.host, module_state_file(abi, name, CHECKSUM_FILE_NAME)).value_or("");
        module.stack_order =
            read_number(rt.host, module_state_file(abi, name, STACK_ORDER_FILE_NAME));
        modules.push_back(module);
    }

    return modules;
}

const char* module_state_label(const PatchModule& module) {
    if (module.enabled) {
        return module.transitioning ? "enabling..." : "enabled";
    }
    return module.transitioning ? "disabling..." : "disabled";
}

}  // namespace kpctl
