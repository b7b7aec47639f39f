#pragma once

#include <optional>
#include <string>
#include <vector>

#include "utils.hpp"

namespace kpctl {

// Everything kpctl touches outside its own memory: kernel attribute files,
// helper tools, the clock. Swapped for a simulated kernel in tests.
class Host {
public:
    virtual ~Host() = default;

    virtual bool exists(const std::string& path) = 0;
    virtual bool is_dir(const std::string& path) = 0;
    virtual std::optional<std::string> read(const std::string& path) = 0;
    // Returns the error text of the write, empty on success
    virtual std::string write(const std::string& path, const std::string& value) = 0;
    // Entry names of |path|, sorted; empty if it cannot be read
    virtual std::vector<std::string> list_dir(const std::string& path) = 0;
    virtual bool make_dirs(const std::string& path) = 0;
    virtual bool copy(const std::string& from, const std::string& to) = 0;
    virtual bool remove(const std::string& path) = 0;

    virtual ExecResult exec(const std::vector<std::string>& args) = 0;
    virtual void sleep(unsigned seconds) = 0;

    virtual std::string kernel_release() = 0;
    // Directory holding the running executable
    virtual std::string self_dir() = 0;
};

class LinuxHost : public Host {
public:
    bool exists(const std::string& path) override;
    bool is_dir(const std::string& path) override;
    std::optional<std::string> read(const std::string& path) override;
    std::string write(const std::string& path, const std::string& value) override;
    std::vector<std::string> list_dir(const std::string& path) override;
    bool make_dirs(const std::string& path) override;
    bool copy(const std::string& from, const std::string& to) override;
    bool remove(const std::string& path) override;
    ExecResult exec(const std::vector<std::string>& args) override;
    void sleep(unsigned seconds) override;
    std::string kernel_release() override;
    std::string self_dir() override;
};

// Trimmed content of a single-value attribute file
std::optional<std::string> read_value(Host& host, const std::string& path);
std::optional<long> read_number(Host& host, const std::string& path);

std::string join_path(const std::string& dir, const std::string& name);

}  // namespace kpctl
