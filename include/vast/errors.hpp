// errors.hpp
// Exceptions for failures that stop a run before validation starts

#ifndef VAST_ERRORS_HPP
#define VAST_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace vast {

// Malformed invocation: unknown implementation type, bad command-line arguments
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// The raw request cannot be split into a base URL and parameters
class ParseError : public std::runtime_error {
public:
    enum class Kind {
        MissingQuery
    };

    ParseError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace vast

#endif // VAST_ERRORS_HPP
