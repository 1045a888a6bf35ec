// result.hpp
// Structured outcome of validating one VAST request

#ifndef VAST_RESULT_HPP
#define VAST_RESULT_HPP

#include <vast/type_checker.hpp>
#include <map>
#include <string>
#include <vector>

namespace vast {

enum class Severity {
    Error,
    Warning
};

enum class FindingKind {
    Missing,
    Invalid
};

struct Finding {
    Severity severity;
    FindingKind kind;
    std::string parameter_name;
    std::string message;
    TypeError type_error;  // None unless kind == Invalid
};

struct ValidationResult {
    bool passed = true;
    std::vector<Finding> errors;
    std::vector<Finding> warnings;
    std::map<std::string, std::string> present_parameters;
};

const char* to_string(Severity severity);
const char* to_string(FindingKind kind);

} // namespace vast

#endif // VAST_RESULT_HPP
