#include "host.hpp"
#include "log.hpp"

#include <sys/utsname.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace kpctl {

bool LinuxHost::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LinuxHost::is_dir(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::optional<std::string> LinuxHost::read(const std::string& path) {
    return read_file(path);
}

std::string LinuxHost::write(const std::string& path, const std::string& value) {
    return write_attribute(path, value);
}

std::vector<std::string> LinuxHost::list_dir(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        LOGD("list %s: %s", path.c_str(), ec.message().c_str());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool LinuxHost::make_dirs(const std::string& path) {
    return ensure_dir_exists(path);
}

bool LinuxHost::copy(const std::string& from, const std::string& to) {
    return copy_file(from, to);
}

bool LinuxHost::remove(const std::string& path) {
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        LOGE("Failed to remove %s: %s", path.c_str(),
             ec ? ec.message().c_str() : "no such file");
        return false;
    }
    return true;
}

ExecResult LinuxHost::exec(const std::vector<std::string>& args) {
    return exec_command(args);
}

void LinuxHost::sleep(unsigned seconds) {
    ::sleep(seconds);
}

std::string LinuxHost::kernel_release() {
    struct utsname uts;
    if (uname(&uts) != 0) {
        LOGE("uname failed: %s", strerror(errno));
        return "";
    }
    return uts.release;
}

std::string LinuxHost::self_dir() {
    char self_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", self_path, sizeof(self_path) - 1);
    if (len < 0) {
        LOGW("Failed to get self path");
        return ".";
    }
    self_path[len] = '\0';
    return dirname_of(self_path);
}

std::optional<std::string> read_value(Host& host, const std::string& path) {
    auto content = host.read(path);
    if (!content)
        return std::nullopt;
    return trim(*content);
}

std::optional<long> read_number(Host& host, const std::string& path) {
    auto value = read_value(host, path);
    if (!value)
        return std::nullopt;
    return parse_long(*value);
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (!dir.empty() && dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

}  // namespace kpctl
