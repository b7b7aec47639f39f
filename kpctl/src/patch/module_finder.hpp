#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../runtime.hpp"

namespace kpctl {

struct PatchModule {
    std::string name;  // name the kernel knows the module by
    std::string path;
    std::string kernel_version;
    std::string checksum;
    bool enabled = false;
    bool transitioning = false;
    std::optional<long> stack_order;
};

// "/x/livepatch-foo.ko" -> "livepatch_foo"
std::string canonical_name(const std::string& name_or_path);

// Metadata embedded in the binary
std::optional<std::string> binary_module_name(SectionReader& reader, const std::string& path);
std::optional<std::string> binary_checksum(SectionReader& reader, const std::string& path);
std::optional<std::string> binary_modinfo(SectionReader& reader, const std::string& path,
                                          const std::string& key);
// Kernel release the binary was built for (first word of vermagic)
std::optional<std::string> binary_kernel_version(SectionReader& reader, const std::string& path);

std::string installed_dir(const Config& config, const std::string& kernel_release);
// *.ko files installed for |kernel_release|, sorted
std::vector<std::string> installed_binaries(const Runtime& rt, const std::string& kernel_release);

// Fill a PatchModule from the binary at |path|
PatchModule describe_binary(const Runtime& rt, const std::string& path);

// Resolve a bare module name or a binary path against the binaries installed
// for the running kernel
std::optional<PatchModule> find_module(const Runtime& rt, const std::string& arg);

}  // namespace kpctl
