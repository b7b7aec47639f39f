#include "utils.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace kpctl {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_numeric(const std::string& str) {
    if (str.empty())
        return false;
    for (char c : str) {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

std::optional<long> parse_long(const std::string& str) {
    std::string value = trim(str);
    if (value.empty())
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long result = strtol(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return result;
}

std::string basename_of(const std::string& path) {
    size_t pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string dirname_of(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";
    return path.substr(0, pos);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs)
        return std::nullopt;

    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

bool copy_file(const std::string& from, const std::string& to) {
    std::ifstream src(from, std::ios::binary);
    if (!src) {
        LOGE("Failed to open %s", from.c_str());
        return false;
    }
    std::ofstream dst(to, std::ios::binary | std::ios::trunc);
    if (!dst) {
        LOGE("Failed to create %s", to.c_str());
        return false;
    }
    dst << src.rdbuf();
    return static_cast<bool>(dst);
}

bool ensure_dir_exists(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    // Create directory recursively
    std::string current;
    for (char c : path) {
        current += c;
        if (c == '/' && current.size() > 1) {
            if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                LOGE("Failed to create directory %s: %s", current.c_str(), strerror(errno));
                return false;
            }
        }
    }

    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        LOGE("Failed to create directory %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    return true;
}

std::string write_attribute(const std::string& path, const std::string& value) {
    int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return path + ": " + strerror(errno);
    }

    std::string error;
    ssize_t written = write(fd, value.data(), value.size());
    if (written < 0) {
        error = path + ": " + strerror(errno);
    } else if (static_cast<size_t>(written) != value.size()) {
        error = path + ": short write";
    }
    close(fd);
    return error;
}

ExecResult exec_command(const std::vector<std::string>& args) {
    ExecResult result{-1, "", ""};

    if (args.empty())
        return result;

    int stdout_pipe[2], stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        return result;
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        // Diagnostics are matched against English strerror text
        setenv("LC_ALL", "C", 1);

        std::vector<char*> c_args;
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // Drain both pipes together, a full pipe blocks the child
    struct pollfd fds[2] = {{stdout_pipe[0], POLLIN, 0}, {stderr_pipe[0], POLLIN, 0}};
    std::string* outputs[2] = {&result.stdout_str, &result.stderr_str};
    int open_fds = 2;
    char buf[1024];

    while (open_fds > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR)
                continue;
            LOGE("poll failed: %s", strerror(errno));
            break;
        }

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;

            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                outputs[i]->append(buf, n);
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }
    for (const auto& fd : fds) {
        if (fd.fd >= 0)
            close(fd.fd);
    }

    int status;
    waitpid(pid, &status, 0);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    return result;
}

}  // namespace kpctl
