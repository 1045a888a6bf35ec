// type_checker.hpp
// Declarations for checking raw parameter values against their declared type

#ifndef VAST_TYPE_CHECKER_HPP
#define VAST_TYPE_CHECKER_HPP

#include <string>
#include <vector>

namespace vast {

// Declared type of a request parameter
enum class TypeTag {
    Int,
    Bool,
    Str,
    Enum,
    Url,
    Size
};

// Outcome of a type check. None means the value conforms.
enum class TypeError {
    None,
    NotInteger,
    NotBoolean,
    EmptyString,
    NotInEnum,
    InvalidUrl,
    InvalidSize
};

struct ParameterSpec {
    std::string name;
    TypeTag type;
    std::vector<std::string> allowed_values;  // Enum only
    char dimension_separator;                 // Size only
};

// Checks raw_value against spec.type. Never throws.
TypeError check(const ParameterSpec& spec, const std::string& raw_value);

// True if value has an http or https scheme (any case) and a non-empty host
bool is_valid_url(const std::string& value);

// Human-readable explanation of a failed check, e.g. "expected integer, got 'abc'"
std::string describe(TypeError error, const ParameterSpec& spec, const std::string& raw_value);

const char* to_string(TypeTag type);
const char* to_string(TypeError error);

} // namespace vast

#endif // VAST_TYPE_CHECKER_HPP
