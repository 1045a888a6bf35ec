// test_type_checker.cpp
// Unit tests for parameter type checks

#include <vast/type_checker.hpp>
#include <cassert>
#include <iostream>
#include <string>

using namespace vast;

static ParameterSpec spec_of(TypeTag type) {
    return ParameterSpec{"p", type, {}, 'x'};
}

void test_int() {
    ParameterSpec spec = spec_of(TypeTag::Int);
    assert(check(spec, "123") == TypeError::None);
    assert(check(spec, "-5") == TypeError::None);
    assert(check(spec, "+7") == TypeError::None);
    assert(check(spec, "4398046511104123456") == TypeError::None);
    assert(check(spec, "abc") == TypeError::NotInteger);
    assert(check(spec, "") == TypeError::NotInteger);
    assert(check(spec, "-") == TypeError::NotInteger);
    assert(check(spec, "12a") == TypeError::NotInteger);
    assert(check(spec, "1.5") == TypeError::NotInteger);
    assert(describe(TypeError::NotInteger, spec, "abc") == "expected integer, got 'abc'");
    std::cout << "test_int passed\n";
}

void test_bool() {
    ParameterSpec spec = spec_of(TypeTag::Bool);
    assert(check(spec, "0") == TypeError::None);
    assert(check(spec, "1") == TypeError::None);
    assert(check(spec, "true") == TypeError::NotBoolean);
    assert(check(spec, "2") == TypeError::NotBoolean);
    assert(check(spec, "") == TypeError::NotBoolean);
    assert(check(spec, " 1") == TypeError::NotBoolean);
    std::cout << "test_bool passed\n";
}

void test_str() {
    ParameterSpec spec = spec_of(TypeTag::Str);
    assert(check(spec, "/123/example") == TypeError::None);
    assert(check(spec, "") == TypeError::EmptyString);
    assert(check(spec, "   ") == TypeError::EmptyString);
    assert(check(spec, "\t\n") == TypeError::EmptyString);
    std::cout << "test_str passed\n";
}

void test_enum() {
    ParameterSpec spec{"env", TypeTag::Enum, {"vp", "instream", "outstream"}, 'x'};
    assert(check(spec, "vp") == TypeError::None);
    assert(check(spec, "outstream") == TypeError::None);
    assert(check(spec, "VP") == TypeError::NotInEnum);
    assert(check(spec, "") == TypeError::NotInEnum);
    std::string message = describe(TypeError::NotInEnum, spec, "VP");
    assert(message.find("vp, instream, outstream") != std::string::npos);
    std::cout << "test_enum passed\n";
}

void test_url() {
    ParameterSpec spec = spec_of(TypeTag::Url);
    assert(check(spec, "http://example.com") == TypeError::None);
    assert(check(spec, "https://example.com/path?query=value") == TypeError::None);
    assert(check(spec, "https://user@example.com:8080/") == TypeError::None);
    assert(check(spec, "http://[::1]/") == TypeError::None);
    assert(check(spec, "HTTPS://example.com") == TypeError::None);
    assert(check(spec, "ftp://example.com") == TypeError::InvalidUrl);
    assert(check(spec, "javascript://alert(1)") == TypeError::InvalidUrl);
    assert(check(spec, "file://etc/passwd") == TypeError::InvalidUrl);
    assert(check(spec, "not a url") == TypeError::InvalidUrl);
    assert(check(spec, "example.com") == TypeError::InvalidUrl);
    assert(check(spec, "http://") == TypeError::InvalidUrl);
    assert(check(spec, "://example.com") == TypeError::InvalidUrl);
    assert(check(spec, "http://:80/") == TypeError::InvalidUrl);
    assert(check(spec, "1http://example.com") == TypeError::InvalidUrl);
    assert(check(spec, "http%3A%2F%2Fexample.com") == TypeError::InvalidUrl);
    std::cout << "test_url passed\n";
}

void test_size() {
    ParameterSpec spec = spec_of(TypeTag::Size);
    assert(check(spec, "640x480") == TypeError::None);
    assert(check(spec, "1x1") == TypeError::None);
    assert(check(spec, "640-480") == TypeError::InvalidSize);
    assert(check(spec, "640x") == TypeError::InvalidSize);
    assert(check(spec, "x480") == TypeError::InvalidSize);
    assert(check(spec, "640X480") == TypeError::InvalidSize);
    assert(check(spec, "640x480x2") == TypeError::InvalidSize);
    assert(check(spec, "") == TypeError::InvalidSize);
    assert(describe(TypeError::InvalidSize, spec, "640-480") == "expected format WIDTHxHEIGHT (e.g., 640x480)");
    std::cout << "test_size passed\n";
}

void test_every_tag_accepts_and_rejects() {
    const TypeTag tags[] = {TypeTag::Int, TypeTag::Bool, TypeTag::Str, TypeTag::Enum, TypeTag::Url, TypeTag::Size};
    const char* accepted[] = {"1", "1", "a", "a", "http://a", "1x1"};
    for (size_t i = 0; i < 6; ++i) {
        ParameterSpec spec{"p", tags[i], {"a"}, 'x'};
        assert(check(spec, accepted[i]) == TypeError::None);
        assert(check(spec, "") != TypeError::None);
    }
    std::cout << "test_every_tag_accepts_and_rejects passed\n";
}

int main() {
    test_int();
    test_bool();
    test_str();
    test_enum();
    test_url();
    test_size();
    test_every_tag_accepts_and_rejects();
    std::cout << "All tests passed.\n";
    return 0;
}
