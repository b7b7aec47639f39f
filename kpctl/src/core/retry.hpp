#pragma once

#include <functional>
#include <string>

#include "../runtime.hpp"
#include "../status.hpp"
#include "abi.hpp"

namespace kpctl {

// The two mutations that can race the kernel's activeness safety check
enum class Mutation {
    Insert,
    WriteEnabled,
};

// Runs the mutation and returns its diagnostic output; empty means success
using MutationOp = std::function<std::string()>;

// Busy diagnostics are retried every retry_interval seconds up to
// max_load_attempts attempts (ContentionBusy once exhausted). Any other
// diagnostic fails at once with ToolFailure.
Status run_with_retry(const Runtime& rt, Mutation kind, const std::string& target,
                      const MutationOp& op);

Status insert_module(const Runtime& rt, const std::string& path);
Status write_enabled(const Runtime& rt, KernelAbi abi, const std::string& module, bool enabled);

}  // namespace kpctl
