// validator.cpp
// Reconciles parsed request parameters against the rule tables

#include <vast/validator.hpp>
#include <vast/type_checker.hpp>
#include <map>
#include <vector>

namespace vast {

namespace {

void check_required(const std::vector<ParameterSpec>& specs, const ParsedRequest& parsed,
                    ValidationResult& result) {
    for (size_t i = 0; i < specs.size(); ++i) {
        const ParameterSpec& spec = specs[i];
        std::map<std::string, std::string>::const_iterator it = parsed.params.find(spec.name);
        if (it == parsed.params.end()) {
            result.errors.push_back(Finding{Severity::Error, FindingKind::Missing, spec.name,
                                            "missing required parameter " + spec.name, TypeError::None});
            continue;
        }
        TypeError error = check(spec, it->second);
        if (error != TypeError::None) {
            result.errors.push_back(Finding{Severity::Error, FindingKind::Invalid, spec.name,
                                            spec.name + ": " + describe(error, spec, it->second), error});
        }
    }
}

void check_recommended(const std::vector<ParameterSpec>& specs, const ParsedRequest& parsed,
                       ValidationResult& result) {
    for (size_t i = 0; i < specs.size(); ++i) {
        const ParameterSpec& spec = specs[i];
        std::map<std::string, std::string>::const_iterator it = parsed.params.find(spec.name);
        if (it == parsed.params.end()) {
            result.warnings.push_back(Finding{Severity::Warning, FindingKind::Missing, spec.name,
                                              "missing recommended parameter " + spec.name, TypeError::None});
            continue;
        }
        TypeError error = check(spec, it->second);
        if (error != TypeError::None) {
            result.warnings.push_back(Finding{Severity::Warning, FindingKind::Invalid, spec.name,
                                              spec.name + ": " + describe(error, spec, it->second), error});
        }
    }
}

} // namespace

ValidationResult validate(const ParsedRequest& parsed, ImplementationType context, bool programmatic) {
    const ContextRuleSet& rules = rules_for(context);
    ValidationResult result;
    result.present_parameters = parsed.params;

    check_required(rules.required, parsed, result);
    if (programmatic) {
        check_required(rules.programmatic_required, parsed, result);
        check_recommended(rules.programmatic_recommended, parsed, result);
    }

    result.passed = result.errors.empty();
    return result;
}

ValidationResult validate_request(const std::string& raw, ImplementationType context, bool programmatic,
                                  bool decode) {
    bool query_required = !rules_for(context).required.empty();
    ParsedRequest parsed = parse_request(raw, decode, query_required);
    return validate(parsed, context, programmatic);
}

} // namespace vast
