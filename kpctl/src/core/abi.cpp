#include "abi.hpp"
#include "../defs.hpp"
#include "../log.hpp"

#include <sstream>

namespace kpctl {

const char* abi_name(KernelAbi abi) {
    switch (abi) {
    case KernelAbi::NativeLivepatch:
        return "livepatch";
    case KernelAbi::LegacyPatches:
        return "kpatch-patches";
    case KernelAbi::LegacyCore:
        return "kpatch";
    }
    return "unknown";
}

const char* abi_root(KernelAbi abi) {
    switch (abi) {
    case KernelAbi::NativeLivepatch:
        return LIVEPATCH_ROOT;
    case KernelAbi::LegacyPatches:
        return KPATCH_PATCHES_ROOT;
    case KernelAbi::LegacyCore:
        return KPATCH_CORE_ROOT;
    }
    return KPATCH_CORE_ROOT;
}

KernelAbi resolve_abi(Host& host) {
    KernelAbi abi = KernelAbi::LegacyCore;
    if (host.exists(LIVEPATCH_ROOT)) {
        abi = KernelAbi::NativeLivepatch;
    } else if (host.exists(KPATCH_PATCHES_ROOT)) {
        abi = KernelAbi::LegacyPatches;
    }
    LOGD("abi: %s (%s)", abi_name(abi), abi_root(abi));
    return abi;
}

std::string module_state_dir(KernelAbi abi, const std::string& module) {
    return join_path(abi_root(abi), module);
}

std::string module_state_file(KernelAbi abi, const std::string& module, const char* file) {
    return join_path(module_state_dir(abi, module), file);
}

bool kallsyms_has(Host& host, const std::vector<std::string>& symbols, bool text_only) {
    auto content = host.read(KALLSYMS_PATH);
    if (!content) {
        LOGW("Cannot read %s", KALLSYMS_PATH);
        return false;
    }

    std::istringstream iss(*content);
    std::string line;
    while (std::getline(iss, line)) {
        std::istringstream fields(line);
        std::string addr, type, name;
        if (!(fields >> addr >> type >> name)) {
            continue;
        }
        if (text_only && type != "T") {
            continue;
        }
        for (const auto& symbol : symbols) {
            if (name == symbol) {
                return true;
            }
        }
    }

    return false;
}

bool core_loaded(Host& host) {
    return kallsyms_has(host, {LIVEPATCH_ENABLE_SYMBOL, KPATCH_REGISTER_SYMBOL}, true);
}

bool core_forces_module_ref(Host& host, const Config& config) {
    if (config.force_ref_symbol.empty())
        return false;
    return kallsyms_has(host, {config.force_ref_symbol}, false);
}

bool has_signal_control(Host& host, KernelAbi abi, const std::string& module) {
    if (abi != KernelAbi::NativeLivepatch)
        return false;
    return host.exists(module_state_file(abi, module, SIGNAL_FILE_NAME));
}

}  // namespace kpctl
