#include <doctest/doctest.h>
#include <pngc/utf8.hh>
#include <pngc/exceptions.hh>

#include <string>
#include <string_view>

using namespace pngc;

namespace {
    bool valid(std::string_view s) {
        return is_valid_utf8(s.data(), s.size());
    }
}

TEST_SUITE("UTF8") {
    TEST_CASE("Well-formed input") {
        CHECK(valid(""));
        CHECK(valid("plain ASCII"));
        CHECK(valid("caf\xC3\xA9"));               // U+00E9
        CHECK(valid("\xE2\x82\xAC"));              // U+20AC
        CHECK(valid("\xF0\x9F\x98\x80"));          // U+1F600
        CHECK(valid("\xEF\xBF\xBF"));              // U+FFFF
        CHECK(valid("\xF4\x8F\xBF\xBF"));          // U+10FFFF
        CHECK(valid(std::string_view("\0", 1)));   // NUL is valid UTF-8
        CHECK(is_valid_utf8(nullptr, 0));
    }

    TEST_CASE("Malformed input") {
        SUBCASE("stray continuation byte") {
            CHECK_FALSE(valid("\x80"));
            CHECK_FALSE(valid("ab\xBF"));
        }

        SUBCASE("invalid lead bytes") {
            CHECK_FALSE(valid("\xFF"));
            CHECK_FALSE(valid("\xFE"));
            CHECK_FALSE(valid("\xF8\x88\x80\x80\x80"));
        }

        SUBCASE("truncated sequences") {
            CHECK_FALSE(valid("\xC3"));
            CHECK_FALSE(valid("\xE2\x82"));
            CHECK_FALSE(valid("\xF0\x9F\x98"));
        }

        SUBCASE("bad continuation") {
            CHECK_FALSE(valid("\xC3\x28"));
            CHECK_FALSE(valid("\xE2\x28\xA1"));
        }

        SUBCASE("overlong encodings") {
            CHECK_FALSE(valid("\xC0\x80"));
            CHECK_FALSE(valid("\xC1\xBF"));
            CHECK_FALSE(valid("\xE0\x80\xAF"));
            CHECK_FALSE(valid("\xF0\x80\x80\xAF"));
        }

        SUBCASE("surrogates and out of range") {
            CHECK_FALSE(valid("\xED\xA0\x80"));        // U+D800
            CHECK_FALSE(valid("\xED\xBF\xBF"));        // U+DFFF
            CHECK_FALSE(valid("\xF4\x90\x80\x80"));    // U+110000
        }
    }

    TEST_CASE("Conversion to string") {
        SUBCASE("valid") {
            std::string_view s = "caf\xC3\xA9";
            CHECK(utf8_to_string(s.data(), s.size()) == s);
            CHECK(utf8_to_string(nullptr, 0).empty());
        }

        SUBCASE("invalid reports offset") {
            std::string_view s = "abc\xFF";
            try {
                (void)utf8_to_string(s.data(), s.size());
                FAIL("Should have thrown");
            } catch (const codec_error& e) {
                CHECK(e.kind() == error_kind::invalid_utf8);
                std::string msg = e.what();
                CHECK(msg.find("byte 3") != std::string::npos);
                CHECK(msg.find("ff") != std::string::npos);
            }
        }
    }
}
