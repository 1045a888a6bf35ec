// report.hpp
// Rendering of validation results as text or JSON, and exit status mapping

#ifndef VAST_REPORT_HPP
#define VAST_REPORT_HPP

#include <vast/result.hpp>
#include <vast/rule_registry.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace vast {

enum ExitStatus : int {
    EXIT_PASSED = 0,
    EXIT_FAILED = 1,
    EXIT_USAGE = 2
};

// Line-based report. quiet keeps only the error block.
std::string render_text(const ValidationResult& result, ImplementationType context, bool quiet);

// {"valid", "passed", "errors", "warnings", "present_parameters"}
nlohmann::json to_json(const ValidationResult& result);

// to_json(result) dumped with an indent of 4
std::string render_json(const ValidationResult& result);

ExitStatus exit_status(const ValidationResult& result);

} // namespace vast

#endif // VAST_REPORT_HPP
