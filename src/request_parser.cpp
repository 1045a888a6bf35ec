// request_parser.cpp
// Splits a raw request string into base URL and name/value parameters

#include <vast/request_parser.hpp>
#include <vast/common.hpp>
#include <vast/errors.hpp>

namespace vast {

namespace {

// "a=1&b=2" with no base URL: the first key holds no ':' or '/'
bool is_bare_query(const std::string& raw) {
    size_t eq = raw.find('=');
    if (eq == std::string::npos) return false;
    return raw.find_first_of(":/") > eq;
}

void parse_query(const std::string& query, bool decode, ParsedRequest& parsed) {
    size_t offset = 0;
    while (offset <= query.size()) {
        size_t amp = query.find('&', offset);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(offset, amp - offset);
        offset = amp + 1;
        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        std::string name = pair.substr(0, eq);
        std::string value = eq == std::string::npos ? std::string() : pair.substr(eq + 1);
        if (decode) value = url_decode(value);
        parsed.params[name] = value;
    }
}

} // namespace

ParsedRequest parse_request(const std::string& raw, bool decode, bool query_required) {
    ParsedRequest parsed;
    std::string query;

    // Leading whitespace belongs to neither the base URL nor the first key.
    // Trailing whitespace is kept: it may be part of the last value.
    size_t begin = raw.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) begin = raw.size();
    std::string input = raw.substr(begin);

    size_t question = input.find('?');
    if (question != std::string::npos) {
        parsed.base_url = input.substr(0, question);
        query = input.substr(question + 1);
    } else if (is_bare_query(input)) {
        query = input;
    } else if (query_required) {
        throw ParseError(ParseError::Kind::MissingQuery,
                         "Request has no query string: '" + raw + "'");
    } else {
        parsed.base_url = trim(input);
        return parsed;
    }

    size_t hash = query.find('#');
    if (hash != std::string::npos) query.erase(hash);

    parse_query(query, decode, parsed);
    return parsed;
}

} // namespace vast
