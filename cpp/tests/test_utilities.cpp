#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "recload/charset.h"
#include "recload/errors.h"
#include "recload/utilities.h"

using namespace recload;

static void test_join() {
    assert(join({"a", "b", "c"}, ",") == "a,b,c");
    assert(join({}, ",") == "");
    assert(join({"only"}, ", ") == "only");
    assert(join({"", ""}, "/") == "/");
}

static void test_escape_xml() {
    assert(escape_xml("a & b < c > d") == "a &amp; b &lt; c &gt; d");
    assert(escape_xml(std::nullopt) == "");
    assert(escape_xml("&lt;") == "&amp;lt;");
    assert(escape_xml("plain") == "plain");
}

static void test_string_to_boolean() {
    assert(string_to_boolean("No", true) == false);
    assert(string_to_boolean(std::nullopt, true) == true);
    assert(string_to_boolean(std::nullopt, false) == false);
    assert(string_to_boolean("yes", false) == true);
    assert(string_to_boolean("", true) == false);
    assert(string_to_boolean("0", true) == false);
    assert(string_to_boolean("F", true) == false);
    assert(string_to_boolean("FALSE", true) == false);
    assert(string_to_boolean("n", true) == false);
    assert(string_to_boolean("1", false) == true);
    assert(string_to_boolean("nope", false) == true);
}

static void test_strip_extension() {
    assert(strip_extension(std::string("file.xml")) == std::string("file"));
    assert(strip_extension(std::string("noext")) == std::string("noext"));
    assert(!strip_extension(std::nullopt).has_value());
    assert(strip_extension(std::string("a.")) == std::string("a."));      // shorter than 3
    assert(strip_extension(std::string(".profile")) == std::string(".profile"));
    assert(strip_extension(std::string("a.tar.gz")) == std::string("a.tar"));
}

static void test_deepest_cause() {
    std::exception_ptr outer;
    try {
        try {
            throw IoError("disk gone");
        } catch (const std::exception&) {
            std::throw_with_nested(std::runtime_error("while loading"));
        }
    } catch (const std::exception&) {
        outer = std::current_exception();
    }
    assert(exception_message(outer) == "while loading");
    assert(exception_message(deepest_cause(outer)) == "disk gone");

    std::exception_ptr plain = std::make_exception_ptr(std::logic_error("flat"));
    assert(exception_message(deepest_cause(plain)) == "flat");
    assert(!deepest_cause(nullptr));
}

static void test_drain() {
    bool threw = false;
    try {
        (void)drain(nullptr);
    } catch (const IoError& e) {
        threw = true;
        assert(std::string(e.what()) == "null input stream");
    }
    assert(threw);

    // crosses several chunk boundaries
    std::string big(DRAIN_CHUNK_BYTES * 3 + 17, 'x');
    big[DRAIN_CHUNK_BYTES] = 'y';
    std::istringstream in(big);
    assert(drain(&in) == big);

    std::istringstream empty("");
    assert(drain(&empty).empty());

    auto latin1 = CharsetDecoder::for_name("ISO-8859-1");
    std::istringstream caf(std::string("caf\xE9"));
    assert(drain(&caf, *latin1) == "caf\xC3\xA9");
}

static void test_path_helpers() {
    assert(trim("  a b \t\n") == "a b");
    assert(trim("   ") == "");
    assert(replace_first("tmp/tmp/x", "tmp/", "") == "tmp/x");
    assert(replace_first("abc", "", "z") == "abc");
    // literal, not a pattern
    assert(replace_first("a.c-abc", "a.c", "") == "-abc");
    assert(normalize_slashes("dir\\\\\\sub\\file.xml") == "dir/sub/file.xml");
    assert(normalize_slashes("a/b") == "a/b");

    assert(escape_uri_path("dir/a b.xml") == "dir/a%20b.xml");
    assert(escape_uri_path("q?x#y%z") == "q%3Fx%23y%25z");
    assert(escape_uri_path("a:b/c:d") == "a%3Ab/c:d");
    assert(escape_uri_path("/a:b") == "/a:b");
    assert(escape_uri_path("f\xC3\xBC.xml") == "f%C3%BC.xml");
    assert(escape_uri_path("keep-._~!$&'()*+,;=@") == "keep-._~!$&'()*+,;=@");
}

static void test_charsets() {
    auto strict = CharsetDecoder::for_name("utf8");
    assert(strict->decode("h\xC3\xA9llo") == "h\xC3\xA9llo");

    bool threw = false;
    try {
        (void)strict->decode("bad\xFF");
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);

    auto replace = CharsetDecoder::for_name("UTF-8", MalformedInputAction::Replace);
    assert(replace->decode("a\xFF" "b") == "a\xEF\xBF\xBD" "b");

    auto ignore = CharsetDecoder::for_name("US-ASCII", MalformedInputAction::Ignore);
    assert(ignore->decode("a\x80" "b") == "ab");

    auto cp1251 = CharsetDecoder::for_name("windows-1251");
    assert(cp1251->decode("\xC0") == "\xD0\x90"); // U+0410

    threw = false;
    try {
        (void)CharsetDecoder::for_name("EBCDIC");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_join();
    test_escape_xml();
    test_string_to_boolean();
    test_strip_extension();
    test_deepest_cause();
    test_drain();
    test_path_helpers();
    test_charsets();

    std::cout << "OK\n";
    return 0;
}
