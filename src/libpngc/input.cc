//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <algorithm>
#include <array>
#include <cstring>

#include "input.hh"

namespace pngc {
    // reader_base implementation
    std::vector<std::byte> reader_base::read_exact(std::size_t size) {
        std::vector<std::byte> buffer;
        auto left = remaining();

        if (left) {
            THROW_CODEC_IF(*left < size, truncated_input,
                           "Unexpected end of input: requested ", size, " bytes, ", *left, " available");
            buffer.resize(size);
            std::size_t actual = size ? read(buffer.data(), size) : 0;
            THROW_CODEC_IF(actual != size, truncated_input,
                           "Unexpected end of input: requested ", size, " bytes, got ", actual);
            return buffer;
        }

        // Unknown length: grow in bounded steps so a false length cannot force a huge allocation
        while (buffer.size() < size) {
            std::size_t have = buffer.size();
            std::size_t step = std::min(size - have, read_block_size);
            buffer.resize(have + step);
            std::size_t actual = read(buffer.data() + have, step);
            THROW_CODEC_IF(actual != step, truncated_input,
                           "Unexpected end of input: requested ", size, " bytes, got ", have + actual);
        }
        return buffer;
    }

    chunk_type reader_base::read_chunk_type() {
        std::array<std::uint8_t, chunk_type::size> data;
        std::size_t actual = read(data.data(), data.size());
        THROW_CODEC_IF(actual != data.size(), truncated_input,
                       "Unexpected end of input while reading chunk type: got ", actual, " of 4 bytes");
        return chunk_type(data);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(data ? size : 0), m_position(0) {}

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        size = std::min(size, m_size - m_position);
        if (size == 0) {
            return 0;
        }

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    std::uint64_t memory_reader::tell() const {
        return m_position;
    }

    std::optional<std::uint64_t> memory_reader::remaining() const {
        return m_size - m_position;
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is) : m_stream(is), m_consumed(0) {}

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_IF(m_stream.bad(), "Stream in bad state");
        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_IF(m_stream.fail(), "Stream in failed state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        m_consumed += bytes_read;
        return bytes_read;
    }

    std::uint64_t stream_reader::tell() const {
        return m_consumed;
    }

    std::optional<std::uint64_t> stream_reader::remaining() const {
        return std::nullopt;
    }
}
