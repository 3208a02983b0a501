#include <doctest/doctest.h>
#include <sstream>
#include <string>
#include <vector>

#include <pngc/chunk.hh>
#include <pngc/parse_options.hh>
#include "test_utils.hh"

using namespace pngc;

namespace {
    struct warning_record {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    parse_options collecting_options(std::vector<warning_record>& warnings) {
        parse_options opts;
        opts.on_warning = [&warnings](std::uint64_t offset, std::string_view category, std::string_view message) {
            warnings.push_back({offset, std::string(category), std::string(message)});
        };
        return opts;
    }
}

TEST_CASE("Warning callbacks") {
    std::vector<warning_record> warnings;
    auto opts = collecting_options(warnings);

    SUBCASE("no warnings for a clean chunk") {
        (void)chunk::from_bytes(chunk("RuSt"_ct, secret_message).to_bytes(), opts);
        CHECK(warnings.empty());
    }

    SUBCASE("reserved bit not set") {
        auto c = chunk::from_bytes(chunk("Rust"_ct, std::string_view("x")).to_bytes(), opts);
        CHECK(c.type() == "Rust"_ct);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "type_code");
        CHECK(warnings[0].offset == 0);
        CHECK(warnings[0].message.find("'Rust'") != std::string::npos);
        CHECK(warnings[0].message.find("reserved") != std::string::npos);
    }

    SUBCASE("non-ASCII type byte") {
        (void)chunk::from_bytes(chunk(chunk_type(0xC9, 'u', 'S', 't'), std::string_view("x")).to_bytes(), opts);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "type_code");
        CHECK(warnings[0].message.find("non-ASCII") != std::string::npos);
    }

    SUBCASE("trailing data") {
        auto bytes = chunk("RuSt"_ct, std::string_view("x")).to_bytes();
        append_text(bytes, "extra");
        auto c = chunk::from_bytes(bytes, opts);
        CHECK(c.data_as_string() == "x");
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "trailing_data");
        CHECK(warnings[0].message.find("5 bytes") != std::string::npos);
    }

    SUBCASE("prefix decoding does not report trailing data") {
        auto bytes = chunk("RuSt"_ct, std::string_view("x")).to_bytes();
        append_text(bytes, "extra");
        std::size_t consumed = 0;
        (void)chunk::from_prefix(bytes.data(), bytes.size(), consumed, opts);
        CHECK(consumed == chunk::overhead + 1);
        CHECK(warnings.empty());
    }

    SUBCASE("stream decoding reports type warnings") {
        std::stringstream io;
        chunk("ruSt"_ct, std::string_view("x")).write(io);
        chunk("RUst"_ct, std::string_view("y")).write(io);
        (void)chunk::read(io, opts);
        (void)chunk::read(io, opts);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].message.find("'RUst'") != std::string::npos);
    }

    SUBCASE("no handler is fine") {
        parse_options silent;
        CHECK_NOTHROW((void)chunk::from_bytes(chunk("Rust"_ct, std::string_view("x")).to_bytes(), silent));
    }
}
