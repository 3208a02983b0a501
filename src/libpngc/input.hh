//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

#include <pngc/exceptions.hh>
#include <pngc/endian.hh>
#include <pngc/chunk_type.hh>

namespace pngc {

    // Base reader interface
    class reader_base {
        public:
            // Largest single allocation made while reading from a source of unknown length
            static constexpr std::size_t read_block_size = 64 * 1024;

        public:
            virtual ~reader_base() = default;

            // Returns the number of bytes read; short only at end of input
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            // Bytes consumed since the reader was created
            virtual std::uint64_t tell() const = 0;

            // Bytes left, or nullopt when the source cannot tell (streams)
            virtual std::optional<std::uint64_t> remaining() const = 0;

            // Throws truncated_input unless exactly size bytes are available
            std::vector<std::byte> read_exact(std::size_t size);

            // Network order field; throws truncated_input when fewer than 4 bytes remain
            std::uint32_t read_be32() {
                std::byte buff[4];
                std::size_t actual = read(buff, sizeof(buff));
                THROW_CODEC_IF(actual != sizeof(buff), truncated_input,
                               "Unexpected end of input: requested ", sizeof(buff), " bytes, got ", actual);
                return load_be32(buff);
            }

            chunk_type read_chunk_type();
    };

    // Reads from a caller-owned byte range
    class memory_reader : public reader_base {
        public:
            memory_reader(const void* data, std::size_t size);
            ~memory_reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override;
            std::optional<std::uint64_t> remaining() const override;

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Reads from a stream, starting at its current position
    class stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);
            ~stream_reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override;
            std::optional<std::uint64_t> remaining() const override;

        private:
            std::istream& m_stream;
            std::uint64_t m_consumed;
    };
}
