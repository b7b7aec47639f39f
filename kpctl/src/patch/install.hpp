#pragma once

#include <optional>
#include <string>

#include "../runtime.hpp"
#include "../status.hpp"

namespace kpctl {

// Copy |path| into the install directory of |kernel_release| (running
// kernel when unset). The binary must have been built for that release.
Status install_module(const Runtime& rt, const std::string& path,
                      const std::optional<std::string>& kernel_release);

Status uninstall_module(const Runtime& rt, const std::string& arg,
                        const std::optional<std::string>& kernel_release);

}  // namespace kpctl
