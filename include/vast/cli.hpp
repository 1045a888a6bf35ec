// cli.hpp
// Command-line options for the vast_validator driver

#ifndef VAST_CLI_HPP
#define VAST_CLI_HPP

#include <vast/rule_registry.hpp>
#include <string>
#include <vector>

namespace vast {

struct CliOptions {
    std::string vast_request;
    ImplementationType implementation_type = ImplementationType::Web;
    bool programmatic = false;
    bool json = false;
    bool decode = false;
    bool quiet = false;
    bool help = false;
};

// Parses arguments (without the program name).
// Throws UsageError on unknown flags, missing values or a missing request.
CliOptions parse_cli_args(const std::vector<std::string>& args);

std::string usage(const std::string& program);

} // namespace vast

#endif // VAST_CLI_HPP
