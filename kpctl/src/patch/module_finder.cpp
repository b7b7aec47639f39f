#include "module_finder.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <algorithm>

namespace kpctl {

std::string canonical_name(const std::string& name_or_path) {
    std::string name = basename_of(name_or_path);
    if (ends_with(name, MODULE_SUFFIX)) {
        name.resize(name.size() - std::char_traits<char>::length(MODULE_SUFFIX));
    }
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

static std::optional<std::string> first_string(SectionReader& reader, const std::string& path,
                                               const char* section) {
    auto strings = reader.section_strings(path, section);
    if (!strings || strings->empty()) {
        return std::nullopt;
    }
    return strings->front();
}

std::optional<std::string> binary_module_name(SectionReader& reader, const std::string& path) {
    return first_string(reader, path, THIS_MODULE_SECTION);
}

std::optional<std::string> binary_checksum(SectionReader& reader, const std::string& path) {
    return first_string(reader, path, CHECKSUM_SECTION);
}

std::optional<std::string> binary_modinfo(SectionReader& reader, const std::string& path,
                                          const std::string& key) {
    auto strings = reader.section_strings(path, MODINFO_SECTION);
    if (!strings) {
        return std::nullopt;
    }

    std::string prefix = key + "=";
    for (const auto& entry : *strings) {
        if (starts_with(entry, prefix)) {
            return entry.substr(prefix.size());
        }
    }
    return std::nullopt;
}

std::optional<std::string> binary_kernel_version(SectionReader& reader, const std::string& path) {
    auto vermagic = binary_modinfo(reader, path, "vermagic");
    if (!vermagic) {
        return std::nullopt;
    }

    std::string release = trim(*vermagic);
    size_t space = release.find(' ');
    if (space != std::string::npos) {
        release.resize(space);
    }
    return release;
}

std::string installed_dir(const Config& config, const std::string& kernel_release) {
    return join_path(config.install_dir, kernel_release);
}

std::vector<std::string> installed_binaries(const Runtime& rt, const std::string& kernel_release) {
    std::vector<std::string> binaries;
    std::string dir = installed_dir(rt.config, kernel_release);

    for (const auto& entry : rt.host.list_dir(dir)) {
        if (!ends_with(entry, MODULE_SUFFIX))
            continue;
        binaries.push_back(join_path(dir, entry));
    }

    return binaries;
}

PatchModule describe_binary(const Runtime& rt, const std::string& path) {
    PatchModule module;
    module.path = path;

    auto name = binary_module_name(rt.reader, path);
    if (name) {
        module.name = *name;
    } else {
        module.name = canonical_name(path);
        LOGD("%s: no embedded module name, using %s", path.c_str(), module.name.c_str());
    }

    module.kernel_version = binary_kernel_version(rt.reader, path).value_or("");
    module.checksum = binary_checksum(rt.reader, path).value_or("");
    return module;
}

static bool looks_like_path(const std::string& arg) {
    return arg.find('/') != std::string::npos || ends_with(arg, MODULE_SUFFIX);
}

std::optional<PatchModule> find_module(const Runtime& rt, const std::string& arg) {
    std::string release = rt.host.kernel_release();

    if (looks_like_path(arg)) {
        if (rt.host.exists(arg)) {
            return describe_binary(rt, arg);
        }

        std::string installed = join_path(installed_dir(rt.config, release), basename_of(arg));
        if (rt.host.exists(installed)) {
            return describe_binary(rt, installed);
        }

        LOGD("module file %s not found", arg.c_str());
        return std::nullopt;
    }

    std::string wanted = canonical_name(arg);
    for (const auto& binary : installed_binaries(rt, release)) {
        if (canonical_name(binary) == wanted) {
            return describe_binary(rt, binary);
        }
    }

    LOGD("module %s not installed for %s", arg.c_str(), release.c_str());
    return std::nullopt;
}

}  // namespace kpctl
