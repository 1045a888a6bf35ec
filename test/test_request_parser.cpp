// test_request_parser.cpp
// Unit tests for request splitting and query parsing

#include <vast/request_parser.hpp>
#include <vast/common.hpp>
#include <vast/errors.hpp>
#include <cassert>
#include <iostream>
#include <string>

using namespace vast;

void test_base_url_and_params() {
    ParsedRequest parsed = parse_request("https://x/ads?iu=/123/example&sz=640x480", false, true);
    assert(parsed.base_url == "https://x/ads");
    assert(parsed.params.size() == 2);
    assert(parsed.params.at("iu") == "/123/example");
    assert(parsed.params.at("sz") == "640x480");
    std::cout << "test_base_url_and_params passed\n";
}

void test_key_without_value() {
    ParsedRequest parsed = parse_request("https://x/ads?VAST_REQUEST&cmsid=123", false, true);
    assert(parsed.has("VAST_REQUEST"));
    assert(parsed.params.at("VAST_REQUEST").empty());
    assert(parsed.params.at("cmsid") == "123");
    std::cout << "test_key_without_value passed\n";
}

void test_duplicate_last_wins() {
    ParsedRequest parsed = parse_request("https://x/ads?sz=1x1&sz=640x480", false, true);
    assert(parsed.params.size() == 1);
    assert(parsed.params.at("sz") == "640x480");
    std::cout << "test_duplicate_last_wins passed\n";
}

void test_value_split_on_first_equals() {
    ParsedRequest parsed = parse_request("https://x/ads?cust_params=a%3D1=b", false, true);
    assert(parsed.params.at("cust_params") == "a%3D1=b");
    std::cout << "test_value_split_on_first_equals passed\n";
}

void test_decode() {
    std::string raw = "https://x/ads?description_url=http%3A%2F%2Fexample.com%2Fa%20b&q=a+b";
    ParsedRequest decoded = parse_request(raw, true, true);
    assert(decoded.params.at("description_url") == "http://example.com/a b");
    assert(decoded.params.at("q") == "a b");

    ParsedRequest verbatim = parse_request(raw, false, true);
    assert(verbatim.params.at("description_url") == "http%3A%2F%2Fexample.com%2Fa%20b");
    assert(verbatim.params.at("q") == "a+b");
    std::cout << "test_decode passed\n";
}

void test_url_decode_malformed_escape() {
    assert(url_decode("100%") == "100%");
    assert(url_decode("%zz") == "%zz");
    assert(url_decode("%4") == "%4");
    assert(url_decode("%41%42") == "AB");
    std::cout << "test_url_decode_malformed_escape passed\n";
}

void test_missing_query() {
    bool thrown = false;
    try {
        parse_request("https://x/ads", false, true);
    } catch (const ParseError& e) {
        thrown = e.kind() == ParseError::Kind::MissingQuery;
    }
    assert(thrown);

    ParsedRequest parsed = parse_request("https://x/ads", false, false);
    assert(parsed.base_url == "https://x/ads");
    assert(parsed.params.empty());
    std::cout << "test_missing_query passed\n";
}

void test_bare_query_string() {
    ParsedRequest parsed = parse_request("correlator=123&env=vp", false, true);
    assert(parsed.base_url.empty());
    assert(parsed.params.size() == 2);
    assert(parsed.params.at("correlator") == "123");
    std::cout << "test_bare_query_string passed\n";
}

void test_empty_segments_and_fragment() {
    ParsedRequest parsed = parse_request("https://x/ads?a=1&&b=2&#frag", false, true);
    assert(parsed.params.size() == 2);
    assert(parsed.params.at("a") == "1");
    assert(parsed.params.at("b") == "2");

    ParsedRequest empty = parse_request("https://x/ads?", false, true);
    assert(empty.base_url == "https://x/ads");
    assert(empty.params.empty());
    std::cout << "test_empty_segments_and_fragment passed\n";
}

void test_trailing_whitespace_kept_in_value() {
    ParsedRequest parsed = parse_request("https://x/ads?sz=640x480&iu= ", false, true);
    assert(parsed.params.at("iu") == " ");

    ParsedRequest padded = parse_request("  https://x/ads?iu=/1/a", false, true);
    assert(padded.base_url == "https://x/ads");

    bool thrown = false;
    try {
        parse_request("  https://x/ads  ", false, true);
    } catch (const ParseError& e) {
        thrown = e.kind() == ParseError::Kind::MissingQuery;
    }
    assert(thrown);
    assert(parse_request("  https://x/ads  ", false, false).base_url == "https://x/ads");
    std::cout << "test_trailing_whitespace_kept_in_value passed\n";
}

int main() {
    test_base_url_and_params();
    test_key_without_value();
    test_duplicate_last_wins();
    test_value_split_on_first_equals();
    test_decode();
    test_url_decode_malformed_escape();
    test_missing_query();
    test_bare_query_string();
    test_empty_segments_and_fragment();
    test_trailing_whitespace_kept_in_value();
    std::cout << "All tests passed.\n";
    return 0;
}
