#pragma once

#include <string>

#include "../config.hpp"
#include "../host.hpp"

namespace kpctl {

// How the running kernel exposes patch state
enum class KernelAbi {
    NativeLivepatch,  // /sys/kernel/livepatch
    LegacyPatches,    // /sys/kernel/kpatch/patches (kpatch core before 0.4)
    LegacyCore,       // /sys/kernel/kpatch
};

const char* abi_name(KernelAbi abi);
const char* abi_root(KernelAbi abi);

// First state root that exists. Must be called again after the patch core
// has been activated, since activation is what creates the root.
KernelAbi resolve_abi(Host& host);

std::string module_state_dir(KernelAbi abi, const std::string& module);
std::string module_state_file(KernelAbi abi, const std::string& module, const char* file);

// True if /proc/kallsyms carries any of |symbols| (any type when
// |text_only| is false, global text otherwise)
bool kallsyms_has(Host& host, const std::vector<std::string>& symbols, bool text_only);

// A live patch core (in-kernel livepatch or the kpatch core module) is active
bool core_loaded(Host& host);

// The core keeps a reference on patch modules, so refcnt never drops to zero
bool core_forces_module_ref(Host& host, const Config& config);

// Remediation control is available for |module|
bool has_signal_control(Host& host, KernelAbi abi, const std::string& module);

}  // namespace kpctl
