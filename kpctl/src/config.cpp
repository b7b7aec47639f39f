#include "config.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>

namespace kpctl {

std::map<std::string, std::string> parse_config_text(const std::string& text) {
    std::map<std::string, std::string> values;

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            LOGW("config: ignoring line without '=': %s", line.c_str());
            continue;
        }
        values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }

    return values;
}

static bool set_seconds(unsigned& field, const std::string& key, const std::string& value,
                        bool allow_zero) {
    auto number = parse_long(value);
    if (!number || *number < 0 || (!allow_zero && *number == 0) ||
        static_cast<unsigned long>(*number) > std::numeric_limits<unsigned>::max()) {
        LOGW("config: invalid value for %s: %s", key.c_str(), value.c_str());
        return false;
    }
    field = static_cast<unsigned>(*number);
    return true;
}

void apply_config(Config& config, const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "post_enable_wait") {
            set_seconds(config.post_enable_wait, key, value, true);
        } else if (key == "post_signal_wait") {
            set_seconds(config.post_signal_wait, key, value, true);
        } else if (key == "module_ref_wait") {
            set_seconds(config.module_ref_wait, key, value, true);
        } else if (key == "max_load_attempts") {
            set_seconds(config.max_load_attempts, key, value, false);
        } else if (key == "retry_interval") {
            set_seconds(config.retry_interval, key, value, true);
        } else if (key == "install_dir") {
            if (value.empty()) {
                LOGW("config: install_dir must not be empty");
            } else {
                config.install_dir = value;
            }
        } else if (key == "force_ref_symbol") {
            config.force_ref_symbol = value;
        } else {
            LOGW("config: unknown key %s", key.c_str());
        }
    }
}

Config load_config() {
    Config config;

    const char* env_path = getenv(CONFIG_ENV);
    std::string path = env_path && env_path[0] != '\0' ? env_path : CONFIG_PATH;

    auto content = read_file(path);
    if (!content) {
        if (env_path) {
            LOGW("config: cannot read %s", path.c_str());
        }
        return config;
    }

    LOGD("config: loading %s", path.c_str());
    apply_config(config, parse_config_text(*content));
    return config;
}

}  // namespace kpctl
