// report.cpp
// Text and JSON rendering of validation results

#include <vast/report.hpp>
#include <sstream>

namespace vast {

namespace {

nlohmann::json finding_to_json(const Finding& finding) {
    nlohmann::json entry;
    entry["parameter"] = finding.parameter_name;
    entry["type"] = to_string(finding.kind);
    entry["message"] = finding.message;
    if (finding.kind == FindingKind::Invalid) entry["type_error"] = to_string(finding.type_error);
    return entry;
}

} // namespace

std::string render_text(const ValidationResult& result, ImplementationType context, bool quiet) {
    std::ostringstream report;
    if (!quiet) {
        report << "\n--- Validation Results ---\n";
        report << "Implementation Type: " << to_string(context) << "\n";
        report << "Present Parameters: ";
        if (result.present_parameters.empty()) {
            report << "None";
        } else {
            std::map<std::string, std::string>::const_iterator it = result.present_parameters.begin();
            for (; it != result.present_parameters.end(); ++it) {
                if (it != result.present_parameters.begin()) report << ", ";
                report << it->first;
            }
        }
        report << "\n";
    }
    if (!result.errors.empty()) {
        report << "\n--- Errors ---\n";
        for (size_t i = 0; i < result.errors.size(); ++i) {
            report << "  Parameter: " << result.errors[i].parameter_name << "\n";
            report << "    Type: " << to_string(result.errors[i].kind) << "\n";
            report << "    Message: " << result.errors[i].message << "\n";
        }
    }
    if (!result.warnings.empty() && !quiet) {
        report << "\n--- Warnings ---\n";
        for (size_t i = 0; i < result.warnings.size(); ++i) {
            report << "  Parameter: " << result.warnings[i].parameter_name << "\n";
            report << "    Message: " << result.warnings[i].message << "\n";
        }
    }
    if (result.errors.empty() && !quiet) report << "No errors found.\n";
    return report.str();
}

nlohmann::json to_json(const ValidationResult& result) {
    nlohmann::json errors = nlohmann::json::array();
    for (size_t i = 0; i < result.errors.size(); ++i) errors.push_back(finding_to_json(result.errors[i]));
    nlohmann::json warnings = nlohmann::json::array();
    for (size_t i = 0; i < result.warnings.size(); ++i) warnings.push_back(finding_to_json(result.warnings[i]));

    nlohmann::json output;
    output["valid"] = result.passed;
    output["passed"] = result.passed;
    output["errors"] = errors;
    output["warnings"] = warnings;
    output["present_parameters"] = result.present_parameters;
    return output;
}

std::string render_json(const ValidationResult& result) {
    // Decoded values may hold bytes that are not valid UTF-8
    return to_json(result).dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}

ExitStatus exit_status(const ValidationResult& result) {
    return result.passed ? EXIT_PASSED : EXIT_FAILED;
}

} // namespace vast
