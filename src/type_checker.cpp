// type_checker.cpp
// Per-type conformance checks for request parameter values

#include <vast/type_checker.hpp>
#include <vast/common.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace vast {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool all_digits(const std::string& value, size_t begin, size_t end) {
    if (begin >= end) return false;
    for (size_t i = begin; i < end; ++i) {
        if (!is_digit(value[i])) return false;
    }
    return true;
}

bool is_integer(const std::string& value) {
    size_t begin = 0;
    if (!value.empty() && (value[0] == '+' || value[0] == '-')) begin = 1;
    return all_digits(value, begin, value.size());
}

bool is_size(const std::string& value, char separator) {
    size_t pos = value.find(separator);
    if (pos == std::string::npos) return false;
    return all_digits(value, 0, pos) && all_digits(value, pos + 1, value.size());
}

std::string join(const std::vector<std::string>& values, const char* separator) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) result += separator;
        result += values[i];
    }
    return result;
}

} // namespace

bool is_valid_url(const std::string& value) {
    size_t scheme_end = value.find("://");
    if (scheme_end == std::string::npos) return false;
    std::string scheme = to_lower(value.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") return false;

    size_t authority_begin = scheme_end + 3;
    size_t authority_end = value.find_first_of("/?#", authority_begin);
    if (authority_end == std::string::npos) authority_end = value.size();
    std::string authority = value.substr(authority_begin, authority_end - authority_begin);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return false;
        host = authority.substr(1, close - 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }
    if (host.empty()) return false;
    for (size_t i = 0; i < host.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(host[i]))) return false;
    }
    return true;
}

TypeError check(const ParameterSpec& spec, const std::string& raw_value) {
    switch (spec.type) {
        case TypeTag::Int:
            return is_integer(raw_value) ? TypeError::None : TypeError::NotInteger;
        case TypeTag::Bool:
            return (raw_value == "0" || raw_value == "1") ? TypeError::None : TypeError::NotBoolean;
        case TypeTag::Str:
            return trim(raw_value).empty() ? TypeError::EmptyString : TypeError::None;
        case TypeTag::Enum:
            return std::find(spec.allowed_values.begin(), spec.allowed_values.end(), raw_value) !=
                           spec.allowed_values.end()
                       ? TypeError::None
                       : TypeError::NotInEnum;
        case TypeTag::Url:
            return is_valid_url(raw_value) ? TypeError::None : TypeError::InvalidUrl;
        case TypeTag::Size:
            return is_size(raw_value, spec.dimension_separator) ? TypeError::None : TypeError::InvalidSize;
    }
    return TypeError::None;
}

std::string describe(TypeError error, const ParameterSpec& spec, const std::string& raw_value) {
    switch (error) {
        case TypeError::None:
            return "ok";
        case TypeError::NotInteger:
            return "expected integer, got '" + raw_value + "'";
        case TypeError::NotBoolean:
            return "expected 0 or 1, got '" + raw_value + "'";
        case TypeError::EmptyString:
            return "parameter value is empty";
        case TypeError::NotInEnum:
            return "invalid value '" + raw_value + "'. Allowed values: " + join(spec.allowed_values, ", ");
        case TypeError::InvalidUrl:
            return "invalid URL: '" + raw_value + "'";
        case TypeError::InvalidSize:
            return std::string("expected format WIDTH") + spec.dimension_separator + "HEIGHT (e.g., 640" +
                   spec.dimension_separator + "480)";
    }
    return "unknown type error";
}

const char* to_string(TypeTag type) {
    switch (type) {
        case TypeTag::Int: return "int";
        case TypeTag::Bool: return "bool";
        case TypeTag::Str: return "str";
        case TypeTag::Enum: return "enum";
        case TypeTag::Url: return "url";
        case TypeTag::Size: return "size";
    }
    return "unknown";
}

const char* to_string(TypeError error) {
    switch (error) {
        case TypeError::None: return "None";
        case TypeError::NotInteger: return "NotInteger";
        case TypeError::NotBoolean: return "NotBoolean";
        case TypeError::EmptyString: return "EmptyString";
        case TypeError::NotInEnum: return "NotInEnum";
        case TypeError::InvalidUrl: return "InvalidUrl";
        case TypeError::InvalidSize: return "InvalidSize";
    }
    return "Unknown";
}

} // namespace vast
