#pragma once

#include <string>

#include "../runtime.hpp"
#include "../status.hpp"

namespace kpctl {

// Wait (up to module_ref_wait seconds) for the external reference count of
// |module| to drop to zero. Satisfied at once when the module is not
// resident or the patch core pins patch modules itself.
Status wait_for_zero_refcount(const Runtime& rt, const std::string& module);

bool module_resident(Host& host, const std::string& module);

}  // namespace kpctl
