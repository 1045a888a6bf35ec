// common.cpp
// String utilities: percent-decoding, trimming, case folding

#include <vast/common.hpp>
#include <cctype>
#include <string>

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string vast::url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0) {
            result += static_cast<char>((hex_value(value[i + 1]) << 4) | hex_value(value[i + 2]));
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

std::string vast::trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && is_space(value[begin])) ++begin;
    while (end > begin && is_space(value[end - 1])) --end;
    return value.substr(begin, end - begin);
}

std::string vast::to_lower(const std::string& value) {
    std::string result(value);
    for (size_t i = 0; i < result.size(); ++i) {
        result[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[i])));
    }
    return result;
}
