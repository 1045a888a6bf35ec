// request_parser.hpp
// Declarations for splitting a VAST request into base URL and query parameters

#ifndef VAST_REQUEST_PARSER_HPP
#define VAST_REQUEST_PARSER_HPP

#include <map>
#include <string>

namespace vast {

struct ParsedRequest {
    std::string base_url;
    std::map<std::string, std::string> params;  // last value wins on duplicate keys

    bool has(const std::string& name) const { return params.find(name) != params.end(); }
};

// Splits raw at the first '?' and parses the query string into params.
// Values are percent-decoded when decode is set, stored verbatim otherwise.
// A bare query string ("a=1&b=2", no scheme) is accepted with an empty base_url.
// Throws ParseError(MissingQuery) if there is no query and query_required is set.
ParsedRequest parse_request(const std::string& raw, bool decode, bool query_required);

} // namespace vast

#endif // VAST_REQUEST_PARSER_HPP
