// validator.hpp
// Declaration for top-level VAST request validation

#ifndef VAST_VALIDATOR_HPP
#define VAST_VALIDATOR_HPP

#include <vast/request_parser.hpp>
#include <vast/result.hpp>
#include <vast/rule_registry.hpp>
#include <string>

namespace vast {

// Checks parsed against the rules for context.
// Required parameters produce errors; programmatic recommended parameters
// produce warnings. Parameters not named by any rule list are ignored.
ValidationResult validate(const ParsedRequest& parsed, ImplementationType context, bool programmatic);

// Parses raw and validates it. Throws ParseError if raw has no query
// string and the context requires parameters.
ValidationResult validate_request(const std::string& raw, ImplementationType context, bool programmatic,
                                  bool decode);

} // namespace vast

#endif // VAST_VALIDATOR_HPP
