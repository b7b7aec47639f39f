#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "runtime.hpp"

namespace kpctl {

int cli_run(int argc, char* argv[]);

// CLI argument parser helpers
struct CliOption {
    std::string long_name;
    char short_name;
    std::string description;
    bool takes_value;
    std::string default_value;
};

class CliParser {
public:
    void add_option(const CliOption& opt);
    // False on an unknown option or a missing option value
    bool parse(int argc, char* argv[]);

    std::optional<std::string> get_option(const std::string& name) const;
    bool has_option(const std::string& name) const;
    const std::vector<std::string>& positional() const { return positional_args_; }
    const std::string& subcommand() const { return subcommand_; }

private:
    std::vector<CliOption> options_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string subcommand_;
};

// Parser with every kpctl option registered
CliParser make_parser();

// Dispatch a parsed command line; returns the process exit code
int run_command(const Runtime& rt, const CliParser& parser);

}  // namespace kpctl
