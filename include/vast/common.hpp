// common.hpp
// Declaration of string utilities shared by the request parser and type checker

#ifndef VAST_COMMON_HPP
#define VAST_COMMON_HPP

#include <string>

namespace vast {

// Decodes percent-escapes (%HH) and '+' as space.
// A '%' not followed by two hex digits is copied through unchanged.
std::string url_decode(const std::string& value);

// Returns value without leading and trailing ASCII whitespace.
std::string trim(const std::string& value);

// Lowercases ASCII letters.
std::string to_lower(const std::string& value);

} // namespace vast

#endif // VAST_COMMON_HPP
