#include "install.hpp"
#include "../log.hpp"
#include "../utils.hpp"
#include "module_finder.hpp"

#include <cstdio>

namespace kpctl {

Status install_module(const Runtime& rt, const std::string& path,
                      const std::optional<std::string>& kernel_release) {
    if (!rt.host.exists(path)) {
        fprintf(stderr, "error: file %s does not exist\n", path.c_str());
        return Status::NotFound;
    }

    std::string release = kernel_release.value_or(rt.host.kernel_release());
    auto version = binary_kernel_version(rt.reader, path);
    if (!version || *version != release) {
        fprintf(stderr, "error: invalid module version %s for kernel %s\n",
                version ? version->c_str() : "(none)", release.c_str());
        return Status::VersionMismatch;
    }

    std::string dir = installed_dir(rt.config, release);
    std::string dest = join_path(dir, basename_of(path));
    if (rt.host.exists(dest)) {
        fprintf(stderr, "error: %s is already installed\n", basename_of(path).c_str());
        return Status::ToolFailure;
    }

    printf("installing %s (%s)\n", path.c_str(), release.c_str());
    if (!rt.host.make_dirs(dir) || !rt.host.copy(path, dest)) {
        fprintf(stderr, "error: failed to install module %s\n", path.c_str());
        return Status::ToolFailure;
    }

    LOGI("installed %s to %s", path.c_str(), dest.c_str());
    return Status::Ok;
}

Status uninstall_module(const Runtime& rt, const std::string& arg,
                        const std::optional<std::string>& kernel_release) {
    std::string release = kernel_release.value_or(rt.host.kernel_release());
    std::string wanted = canonical_name(arg);

    for (const auto& binary : installed_binaries(rt, release)) {
        if (canonical_name(binary) != wanted)
            continue;

        printf("uninstalling %s (%s)\n", wanted.c_str(), release.c_str());
        if (!rt.host.remove(binary)) {
            fprintf(stderr, "error: failed to uninstall module %s\n", wanted.c_str());
            return Status::ToolFailure;
        }
        return Status::Ok;
    }

    fprintf(stderr, "error: module %s is not installed for kernel %s\n", arg.c_str(),
            release.c_str());
    return Status::NotFound;
}

}  // namespace kpctl
