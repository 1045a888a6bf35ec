// cli.cpp
// Argument parsing for the vast_validator driver

#include <vast/cli.hpp>
#include <vast/errors.hpp>
#include <sstream>

namespace vast {

namespace {

// Applies one short flag character. Returns false for an unknown flag.
bool apply_short_flag(char flag, CliOptions& options) {
    switch (flag) {
        case 'p': options.programmatic = true; return true;
        case 'j': options.json = true; return true;
        case 'd': options.decode = true; return true;
        case 'q': options.quiet = true; return true;
        case 'h': options.help = true; return true;
        default: return false;
    }
}

} // namespace

CliOptions parse_cli_args(const std::vector<std::string>& args) {
    CliOptions options;
    bool have_type = false;
    bool have_request = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help") {
            options.help = true;
        } else if (arg == "--implementation_type") {
            if (i + 1 >= args.size()) throw UsageError("Option " + arg + " expects a value");
            options.implementation_type = parse_implementation_type(args[++i]);
            have_type = true;
        } else if (arg.compare(0, 22, "--implementation_type=") == 0) {
            options.implementation_type = parse_implementation_type(arg.substr(22));
            have_type = true;
        } else if (arg == "--programmatic") {
            options.programmatic = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--decode") {
            options.decode = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg.compare(0, 2, "--") == 0) {
            throw UsageError("Unknown option: " + arg);
        } else if (arg.size() > 1 && arg[0] == '-') {
            // Short flags may be clustered (-pj); -i takes the rest of the
            // cluster (-iweb) or the next argument (-i web) as its value.
            for (size_t c = 1; c < arg.size(); ++c) {
                if (arg[c] == 'i') {
                    std::string value;
                    if (c + 1 < arg.size()) {
                        value = arg.substr(c + 1);
                    } else if (i + 1 < args.size()) {
                        value = args[++i];
                    } else {
                        throw UsageError("Option -i expects a value");
                    }
                    options.implementation_type = parse_implementation_type(value);
                    have_type = true;
                    break;
                }
                if (!apply_short_flag(arg[c], options)) {
                    throw UsageError("Unknown option: -" + std::string(1, arg[c]) + " in " + arg);
                }
            }
        } else if (!have_request) {
            options.vast_request = arg;
            have_request = true;
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
        if (options.help) return options;
    }

    if (!have_request) throw UsageError("Missing VAST request argument");
    if (!have_type) throw UsageError("Option -i/--implementation_type is required");
    return options;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " <vast_request> -i <web|app|ctv|audio|doh> [-p] [-j] [-d] [-q]\n"
        << "\n"
        << "Validate VAST request parameters.\n"
        << "\n"
        << "  -i, --implementation_type  implementation type of the request (required)\n"
        << "  -p, --programmatic         also check programmatic parameters\n"
        << "  -j, --json                 output in JSON format\n"
        << "  -d, --decode               URL-decode parameter values\n"
        << "  -q, --quiet                suppress output except for errors\n"
        << "  -h, --help                 show this message\n"
        << "\n"
        << "Short flags may be combined (-pj) and -i may take its value attached (-iweb).\n";
    return out.str();
}

} // namespace vast
