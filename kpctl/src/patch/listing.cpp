#include "listing.hpp"
#include "../core/transition.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "functions.hpp"
#include "lifecycle.hpp"
#include "module_finder.hpp"

#include <cstdio>

namespace kpctl {

Status list_patches(const Runtime& rt) {
    KernelAbi abi = resolve_abi(rt.host);

    printf("Loaded patch modules:\n");
    for (const auto& module : loaded_modules(rt, abi)) {
        printf("%s [%s]\n", module.name.c_str(), module_state_label(module));
    }

    auto transitioning = find_transitioning_module(rt.host, abi);
    if (transitioning) {
        print_stalled_processes(find_stalled_processes(rt.host, abi, *transitioning));
    }

    print_patched_functions(patched_functions(rt, abi));

    printf("\nInstalled patch modules:\n");
    for (const auto& release : rt.host.list_dir(rt.config.install_dir)) {
        if (!rt.host.is_dir(installed_dir(rt.config, release)))
            continue;
        for (const auto& binary : installed_binaries(rt, release)) {
            printf("%s (%s)\n", canonical_name(binary).c_str(), release.c_str());
        }
    }

    return Status::Ok;
}

Status print_module_info(const Runtime& rt, const std::string& arg) {
    auto module = find_module(rt, arg);
    if (!module) {
        fprintf(stderr, "error: module %s not found\n", arg.c_str());
        return Status::NotFound;
    }

    printf("Patch information for %s:\n", arg.c_str());
    printf("name:           %s\n", module->name.c_str());
    printf("filename:       %s\n", module->path.c_str());
    printf("kernel:         %s\n", module->kernel_version.c_str());
    printf("checksum:       %s\n", module->checksum.c_str());

    auto modinfo = rt.reader.section_strings(module->path, MODINFO_SECTION);
    if (modinfo) {
        for (const auto& entry : *modinfo) {
            size_t eq = entry.find('=');
            if (eq == std::string::npos)
                continue;
            std::string key = entry.substr(0, eq) + ":";
            printf("%-15s %s\n", key.c_str(), entry.substr(eq + 1).c_str());
        }
    }

    return Status::Ok;
}

Status signal_transition(const Runtime& rt) {
    KernelAbi abi = resolve_abi(rt.host);

    auto module = find_transitioning_module(rt.host, abi);
    if (!module) {
        printf("no patch transition in progress\n");
        return Status::Ok;
    }

    Status status = signal_stalled_processes(rt.host, abi, *module);
    // Kernels without signal control only get a warning
    if (status == Status::UnsupportedRemediation) {
        return Status::Ok;
    }
    return status;
}

}  // namespace kpctl
