#include "cli.hpp"
#include "defs.hpp"
#include "log.hpp"
#include "patch/install.hpp"
#include "patch/lifecycle.hpp"
#include "patch/listing.hpp"
#include "status.hpp"

#include <cstdio>
#include <cstdlib>

namespace kpctl {

const char* VERSION_NAME = KPCTL_VERSION;

void CliParser::add_option(const CliOption& opt) {
    options_.push_back(opt);
}

bool CliParser::parse(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.empty())
            continue;

        // Check if it's an option
        if (arg[0] == '-' && arg.size() > 1) {
            bool found = false;
            std::string opt_name;
            std::string opt_value;

            // Long option
            if (arg[1] == '-') {
                std::string long_opt = arg.substr(2);
                size_t eq_pos = long_opt.find('=');
                if (eq_pos != std::string::npos) {
                    opt_name = long_opt.substr(0, eq_pos);
                    opt_value = long_opt.substr(eq_pos + 1);
                } else {
                    opt_name = long_opt;
                }

                for (const auto& opt : options_) {
                    if (opt.long_name == opt_name) {
                        found = true;
                        if (opt.takes_value && opt_value.empty()) {
                            if (i + 1 >= argc) {
                                LOGE("Option --%s needs a value", opt_name.c_str());
                                return false;
                            }
                            opt_value = argv[++i];
                        }
                        parsed_options_[opt_name] = opt_value.empty() ? "true" : opt_value;
                        break;
                    }
                }
            }
            // Short option
            else {
                char short_opt = arg[1];
                for (const auto& opt : options_) {
                    if (opt.short_name != '\0' && opt.short_name == short_opt) {
                        found = true;
                        opt_name = opt.long_name;
                        if (opt.takes_value) {
                            if (i + 1 >= argc) {
                                LOGE("Option -%c needs a value", short_opt);
                                return false;
                            }
                            opt_value = argv[++i];
                        }
                        parsed_options_[opt_name] = opt_value.empty() ? "true" : opt_value;
                        break;
                    }
                }
            }

            if (!found) {
                LOGE("Unknown option: %s", arg.c_str());
                return false;
            }
        }
        // Positional argument
        else {
            if (subcommand_.empty()) {
                subcommand_ = arg;
            } else {
                positional_args_.push_back(arg);
            }
        }
    }

    return true;
}

std::optional<std::string> CliParser::get_option(const std::string& name) const {
    auto it = parsed_options_.find(name);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    // Return default value if exists
    for (const auto& opt : options_) {
        if (opt.long_name == name && !opt.default_value.empty()) {
            return opt.default_value;
        }
    }

    return std::nullopt;
}

bool CliParser::has_option(const std::string& name) const {
    return parsed_options_.find(name) != parsed_options_.end();
}

CliParser make_parser() {
    CliParser parser;
    parser.add_option({"all", 'a', "Apply to every module", false, ""});
    parser.add_option({"kernel-version", 'k', "Kernel release to (un)install for", true, ""});
    parser.add_option({"verbose", 'v', "Debug logging", false, ""});
    parser.add_option({"help", 'h', "Show this help", false, ""});
    return parser;
}

static void print_usage() {
    printf("usage: kpctl <command> [<args>]\n\n");
    printf("Valid commands:\n");
    printf("   install [-k|--kernel-version=<kernel version>] <module>\n");
    printf("      install patch module to be loaded at boot\n");
    printf("   uninstall [-k|--kernel-version=<kernel version>] <module>\n");
    printf("      uninstall patch module\n\n");
    printf("   load --all\n");
    printf("      load all installed patch modules into the running kernel\n");
    printf("   load <module>\n");
    printf("      load patch module into the running kernel\n");
    printf("   unload --all\n");
    printf("      unload all patch modules from the running kernel\n");
    printf("   unload <module>\n");
    printf("      unload patch module from the running kernel\n\n");
    printf("   info <module>\n");
    printf("      show information about a patch module\n\n");
    printf("   list\n");
    printf("      list installed patch modules\n\n");
    printf("   signal\n");
    printf("      signal/poke any process stalling the current patch transition\n\n");
    printf("   version\n");
    printf("      display the kpctl version\n\n");
    printf("Options:\n");
    printf("   -v, --verbose\n");
    printf("      print debug logs (or set KPCTL_LOG_LEVEL=v|d|i|w|e)\n");
}

static void print_version() {
    printf("%s\n", VERSION_NAME);
}

static int fail_usage(const char* message) {
    fprintf(stderr, "error: %s\n", message);
    print_usage();
    return 1;
}

static int finish(Status status) {
    if (status != Status::Ok) {
        LOGD("command failed: %s", status_name(status));
    }
    return exit_code(status);
}

static int cmd_load(const Runtime& rt, const CliParser& parser) {
    const auto& args = parser.positional();
    if (parser.has_option("all")) {
        if (!args.empty())
            return fail_usage("load --all takes no module");
        return finish(load_all(rt));
    }
    if (args.size() != 1)
        return fail_usage("load needs exactly one module");
    return finish(load_patch(rt, args[0]));
}

static int cmd_unload(const Runtime& rt, const CliParser& parser) {
    const auto& args = parser.positional();
    if (parser.has_option("all")) {
        if (!args.empty())
            return fail_usage("unload --all takes no module");

        UnloadAllReport report = unload_all(rt);
        for (const auto& [module, status] : report.failures) {
            fprintf(stderr, "error: failed to unload module %s (%s)\n", module.c_str(),
                    status_name(status));
        }
        LOGD("unload --all: %u sweeps", report.sweeps);
        return report.ok() ? 0 : 1;
    }
    if (args.size() != 1)
        return fail_usage("unload needs exactly one module");
    return finish(unload_patch(rt, args[0]));
}

int run_command(const Runtime& rt, const CliParser& parser) {
    const std::string& cmd = parser.subcommand();
    const auto& args = parser.positional();
    auto kernel_version = parser.get_option("kernel-version");

    LOGI("command: %s", cmd.c_str());

    if (cmd.empty() || cmd == "help" || parser.has_option("help")) {
        print_usage();
        return 0;
    } else if (cmd == "version") {
        print_version();
        return 0;
    } else if (cmd == "load") {
        return cmd_load(rt, parser);
    } else if (cmd == "unload") {
        return cmd_unload(rt, parser);
    } else if (cmd == "install") {
        if (args.size() != 1)
            return fail_usage("install needs exactly one module");
        return finish(install_module(rt, args[0], kernel_version));
    } else if (cmd == "uninstall") {
        if (args.size() != 1)
            return fail_usage("uninstall needs exactly one module");
        return finish(uninstall_module(rt, args[0], kernel_version));
    } else if (cmd == "list") {
        return finish(list_patches(rt));
    } else if (cmd == "info") {
        if (args.size() != 1)
            return fail_usage("info needs exactly one module");
        return finish(print_module_info(rt, args[0]));
    } else if (cmd == "signal") {
        return finish(signal_transition(rt));
    }

    fprintf(stderr, "error: unknown command: %s\n", cmd.c_str());
    print_usage();
    return 1;
}

int cli_run(int argc, char* argv[]) {
    log_init("kpctl");

    const char* level_env = getenv(LOG_LEVEL_ENV);
    if (level_env) {
        auto level = parse_log_level(level_env);
        if (level) {
            log_set_level(*level);
        } else {
            LOGW("Unknown log level: %s", level_env);
        }
    }

    CliParser parser = make_parser();
    if (!parser.parse(argc, argv)) {
        print_usage();
        return 1;
    }
    if (parser.has_option("verbose")) {
        log_set_level(LogLevel::DEBUG);
    }

    LinuxHost host;
    ElfSectionReader reader;
    Runtime rt{host, reader, load_config()};

    return run_command(rt, parser);
}

}  // namespace kpctl
