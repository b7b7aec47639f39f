#pragma once

#include <cstdint>
#include <string>

namespace kpctl {

// Version info
constexpr const char* KPCTL_VERSION = "0.9.9";
extern const char* VERSION_NAME;

// Installed patch binaries, keyed by kernel release
constexpr const char* INSTALL_DIR = "/var/lib/kpatch";
constexpr const char* MODULE_SUFFIX = ".ko";

// Kernel state roots, in probe priority order
constexpr const char* LIVEPATCH_ROOT = "/sys/kernel/livepatch";
constexpr const char* KPATCH_PATCHES_ROOT = "/sys/kernel/kpatch/patches";
constexpr const char* KPATCH_CORE_ROOT = "/sys/kernel/kpatch";

constexpr const char* SYS_MODULE_DIR = "/sys/module";
constexpr const char* PROC_DIR = "/proc";
constexpr const char* KALLSYMS_PATH = "/proc/kallsyms";

// Per-module state files
constexpr const char* ENABLED_FILE_NAME = "enabled";
constexpr const char* TRANSITION_FILE_NAME = "transition";
constexpr const char* CHECKSUM_FILE_NAME = "checksum";
constexpr const char* STACK_ORDER_FILE_NAME = "stack_order";
constexpr const char* SIGNAL_FILE_NAME = "signal";
constexpr const char* REFCNT_FILE_NAME = "refcnt";

// Per-task diagnostic files
constexpr const char* PATCH_STATE_FILE_NAME = "patch_state";
constexpr const char* COMM_FILE_NAME = "comm";
constexpr const char* STACK_FILE_NAME = "stack";

// Sections embedded in patch binaries
constexpr const char* THIS_MODULE_SECTION = ".gnu.linkonce.this_module";
constexpr const char* CHECKSUM_SECTION = ".kpatch.checksum";
constexpr const char* MODINFO_SECTION = ".modinfo";

// Core module
constexpr const char* CORE_MODULE_NAME = "kpatch";
constexpr const char* CORE_MODULE_FILE = "kpatch.ko";

// Kernel symbols that tell us a patch core is active
constexpr const char* LIVEPATCH_ENABLE_SYMBOL = "klp_enable_patch";
constexpr const char* KPATCH_REGISTER_SYMBOL = "kpatch_register";
constexpr const char* DEFAULT_FORCE_REF_SYMBOL = "klp_force_transition";

// Wait bounds (seconds) and retry policy
constexpr unsigned POST_ENABLE_WAIT = 15;
constexpr unsigned POST_SIGNAL_WAIT = 60;
constexpr unsigned MODULE_REF_WAIT = 15;
constexpr unsigned MAX_LOAD_ATTEMPTS = 5;
constexpr unsigned RETRY_INTERVAL = 2;

// Contention marker emitted when the activeness safety check fails
constexpr const char* BUSY_MARKER = "Device or resource busy";

// Config file
constexpr const char* CONFIG_PATH = "/etc/kpctl.conf";
constexpr const char* CONFIG_ENV = "KPCTL_CONFIG";
constexpr const char* LOG_LEVEL_ENV = "KPCTL_LOG_LEVEL";

}  // namespace kpctl
