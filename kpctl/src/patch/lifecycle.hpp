#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../core/abi.hpp"
#include "../runtime.hpp"
#include "../status.hpp"
#include "module_finder.hpp"

namespace kpctl {

// Activate the patch core if needed and return the ABI it exposes
std::pair<Status, KernelAbi> ensure_core_loaded(const Runtime& rt);
std::optional<std::string> find_core_module(const Runtime& rt);

// Re-enabling a resident module requires the binary's checksum to match
Status verify_checksum(const Runtime& rt, KernelAbi abi, const PatchModule& module);

// Load and enable; on success the module is resident, enabled and settled
Status load_module(const Runtime& rt, const PatchModule& module);
Status load_patch(const Runtime& rt, const std::string& arg);
// Every binary installed for the running kernel; stops at the first failure
Status load_all(const Runtime& rt);

// Disable |module| and wait for the transition. Ok if the module is resident
// but has no state directory (already disabled).
Status disable_patch(const Runtime& rt, KernelAbi abi, const std::string& module);
// Wait for zero refcount and rmmod. A refused rmmod is tolerated.
Status remove_module(const Runtime& rt, const std::string& module, bool quiet);
Status unload_module(const Runtime& rt, KernelAbi abi, const std::string& module);
Status unload_patch(const Runtime& rt, const std::string& arg);

struct UnloadAllReport {
    unsigned sweeps = 0;
    std::vector<std::pair<std::string, Status>> failures;  // modules still resident

    bool ok() const { return failures.empty(); }
};

// Repeated sweeps until one disables nothing; failures never abort a sweep
UnloadAllReport unload_all(const Runtime& rt);

// Modules under the state root with their current flags
std::vector<PatchModule> loaded_modules(const Runtime& rt, KernelAbi abi);
const char* module_state_label(const PatchModule& module);

}  // namespace kpctl
