#pragma once

#include <map>
#include <string>

#include "defs.hpp"

namespace kpctl {

struct Config {
    unsigned post_enable_wait = POST_ENABLE_WAIT;
    unsigned post_signal_wait = POST_SIGNAL_WAIT;
    unsigned module_ref_wait = MODULE_REF_WAIT;
    unsigned max_load_attempts = MAX_LOAD_ATTEMPTS;
    unsigned retry_interval = RETRY_INTERVAL;
    std::string install_dir = INSTALL_DIR;
    std::string force_ref_symbol = DEFAULT_FORCE_REF_SYMBOL;
};

// Parse "key=value" lines; '#' starts a comment
std::map<std::string, std::string> parse_config_text(const std::string& text);

// Overlay parsed values onto |config|. Unknown keys and bad numbers are
// reported and skipped.
void apply_config(Config& config, const std::map<std::string, std::string>& values);

// Defaults overridden by $KPCTL_CONFIG or /etc/kpctl.conf when present
Config load_config();

}  // namespace kpctl
