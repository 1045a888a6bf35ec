// main.cpp
// CLI driver for the VAST request validator

#include <vast/cli.hpp>
#include <vast/errors.hpp>
#include <vast/report.hpp>
#include <vast/validator.hpp>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace vast;

    std::string program = argc > 0 ? argv[0] : "vast_validator";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.push_back(argv[i]);

    CliOptions options;
    ValidationResult result;
    try {
        options = parse_cli_args(args);
        if (options.help) {
            std::cout << usage(program);
            return EXIT_PASSED;
        }
        result = validate_request(options.vast_request, options.implementation_type, options.programmatic,
                                  options.decode);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n" << usage(program);
        return EXIT_USAGE;
    } catch (const ParseError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    if (options.json) {
        std::cout << render_json(result) << std::endl;
    } else {
        std::cout << render_text(result, options.implementation_type, options.quiet);
    }
    return exit_status(result);
}
