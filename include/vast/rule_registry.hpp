// rule_registry.hpp
// Declarations for the per-context parameter rule tables

#ifndef VAST_RULE_REGISTRY_HPP
#define VAST_RULE_REGISTRY_HPP

#include <vast/type_checker.hpp>
#include <string>
#include <vector>

namespace vast {

// Delivery surface the ad request comes from
enum class ImplementationType {
    Web,
    App,
    Ctv,
    Audio,
    Doh
};

struct ContextRuleSet {
    ImplementationType context;
    std::vector<ParameterSpec> required;
    std::vector<ParameterSpec> programmatic_required;
    std::vector<ParameterSpec> programmatic_recommended;
};

// Returns the rule set for context. The tables are built once and never change.
const ContextRuleSet& rules_for(ImplementationType context);

// All implementation types, in declaration order
const std::vector<ImplementationType>& all_implementation_types();

// Parses "web", "app", "ctv", "audio" or "doh". Tokens are matched exactly.
// Throws UsageError listing the allowed tokens otherwise.
ImplementationType parse_implementation_type(const std::string& token);

const char* to_string(ImplementationType context);

} // namespace vast

#endif // VAST_RULE_REGISTRY_HPP
