//
// Chunk decoding from and encoding to standard streams
//

#include <doctest/doctest.h>
#include <pngc/chunk.hh>
#include <pngc/exceptions.hh>

#include <sstream>
#include <streambuf>
#include <vector>
#include "test_utils.hh"

using namespace pngc;

namespace {
    // Stream buffer that hands out data but reports a hard error after fail_after bytes
    class failing_streambuf : public std::streambuf {
    public:
        failing_streambuf(const std::string& data, std::size_t fail_after)
            : m_data(data)
            , m_fail_after(fail_after) {
            setg(nullptr, nullptr, nullptr);
        }

    protected:
        int_type underflow() override {
            if (m_pos >= m_fail_after) {
                throw std::ios_base::failure("simulated device error");
            }
            if (m_pos >= m_data.size()) {
                return traits_type::eof();
            }
            m_buffer = m_data[m_pos++];
            setg(&m_buffer, &m_buffer, &m_buffer + 1);
            return traits_type::to_int_type(m_buffer);
        }

    private:
        std::string m_data;
        std::size_t m_fail_after;
        std::size_t m_pos = 0;
        char m_buffer = 0;
    };

    // Stream buffer that rejects every write
    class full_streambuf : public std::streambuf {
    protected:
        int_type overflow(int_type) override {
            return traits_type::eof();
        }
    };
}

TEST_SUITE("STREAM") {
    TEST_CASE("Reading a chunk from a stream") {
        SUBCASE("single chunk") {
            std::istringstream in(to_std_string(make_chunk_bytes(42, "RuSt", secret_message, secret_message_crc)));
            auto c = chunk::read(in);
            CHECK(c.type() == "RuSt"_ct);
            CHECK(c.data_as_string() == secret_message);
            CHECK(in.peek() == std::char_traits<char>::eof());
        }

        SUBCASE("consumes exactly one chunk") {
            chunk first("IHDR"_ct, std::string_view("first"));
            chunk second("IEND"_ct, std::vector<std::byte>{});

            std::stringstream io;
            first.write(io);
            second.write(io);
            io << "tail";

            CHECK(chunk::read(io) == first);
            CHECK(chunk::read(io) == second);

            std::string rest;
            io >> rest;
            CHECK(rest == "tail");
        }

        SUBCASE("payload larger than one read block") {
            std::vector<std::byte> data(200 * 1024);
            for (std::size_t i = 0; i < data.size(); i++) {
                data[i] = std::byte(i % 251);
            }
            chunk original("biGd"_ct, data);

            std::stringstream io;
            original.write(io);
            CHECK(chunk::read(io) == original);
        }
    }

    TEST_CASE("Stream decoding failures") {
        SUBCASE("empty stream") {
            std::istringstream in("");
            try {
                (void)chunk::read(in);
                FAIL("Should have thrown");
            } catch (const codec_error& e) {
                CHECK(e.kind() == error_kind::truncated_input);
            }
        }

        SUBCASE("declared length beyond end of stream") {
            auto bytes = make_chunk_bytes(100000000, "RuSt", "short", 0);
            std::istringstream in(to_std_string(bytes));
            try {
                (void)chunk::read(in);
                FAIL("Should have thrown");
            } catch (const codec_error& e) {
                CHECK(e.kind() == error_kind::truncated_input);
            }
        }

        SUBCASE("length above 2^31 - 1") {
            std::vector<std::byte> bytes;
            append_be32(bytes, 0xFFFFFFFFu);
            append_text(bytes, "RuSt");
            std::istringstream in(to_std_string(bytes));
            try {
                (void)chunk::read(in);
                FAIL("Should have thrown");
            } catch (const codec_error& e) {
                CHECK(e.kind() == error_kind::length_exceeded);
            }
            // Nothing after the length field was consumed
            CHECK(in.tellg() == std::streampos(4));
        }

        SUBCASE("corrupted CRC") {
            std::istringstream in(to_std_string(make_chunk_bytes(42, "RuSt", secret_message, 0)));
            try {
                (void)chunk::read(in);
                FAIL("Should have thrown");
            } catch (const codec_error& e) {
                CHECK(e.kind() == error_kind::crc_mismatch);
            }
        }

        SUBCASE("device error") {
            failing_streambuf buf(to_std_string(make_chunk_bytes(42, "RuSt", secret_message, secret_message_crc)), 10);
            std::istream in(&buf);
            CHECK_THROWS_AS((void)chunk::read(in), io_error);
        }
    }

    TEST_CASE("Writing a chunk to a stream") {
        SUBCASE("same bytes as to_bytes") {
            chunk c("RuSt"_ct, secret_message);
            std::ostringstream out;
            c.write(out);
            CHECK(out.str() == to_std_string(c.to_bytes()));
        }

        SUBCASE("write failure") {
            full_streambuf buf;
            std::ostream out(&buf);
            CHECK_THROWS_AS(chunk("RuSt"_ct, secret_message).write(out), io_error);
        }

        SUBCASE("stream already failed") {
            std::ostringstream out;
            out.setstate(std::ios::failbit);
            CHECK_THROWS_AS(chunk("RuSt"_ct, secret_message).write(out), io_error);
        }
    }
}
