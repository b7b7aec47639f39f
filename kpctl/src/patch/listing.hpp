#pragma once

#include <string>

#include "../runtime.hpp"
#include "../status.hpp"

namespace kpctl {

// Loaded modules with their state, stalled tasks, function owners, then the
// binaries installed for every kernel release
Status list_patches(const Runtime& rt);

Status print_module_info(const Runtime& rt, const std::string& arg);

// Nudge the tasks blocking whichever module is in transition
Status signal_transition(const Runtime& rt);

}  // namespace kpctl
