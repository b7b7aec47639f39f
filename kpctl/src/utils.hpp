#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kpctl {

// String utilities
std::string trim(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
bool is_numeric(const std::string& str);
std::optional<long> parse_long(const std::string& str);
std::string basename_of(const std::string& path);
std::string dirname_of(const std::string& path);

// File I/O
std::optional<std::string> read_file(const std::string& path);
bool copy_file(const std::string& from, const std::string& to);
bool ensure_dir_exists(const std::string& path);

// Write a kernel attribute with a single write(2). Returns the error text,
// empty on success.
std::string write_attribute(const std::string& path, const std::string& value);

// Command execution
struct ExecResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};
ExecResult exec_command(const std::vector<std::string>& args);

}  // namespace kpctl
