/**
 * @file chunk.hh
 * @brief Length-prefixed, type-tagged, CRC-checked chunk record
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngc/export_pngc.h>
#include <pngc/chunk_type.hh>
#include <pngc/parse_options.hh>

namespace pngc {

    /**
     * @class chunk
     * @brief One chunk record: type code plus opaque payload
     *
     * On-wire layout, all integers big-endian:
     *
     *     +--------+--------+-----------------+--------+
     *     | length |  type  | payload[length] |  CRC   |
     *     |   4    |   4    |     length      |   4    |
     *     +--------+--------+-----------------+--------+
     *
     * The CRC-32 covers type and payload, never the length field.
     * A chunk is immutable once constructed and its payload is never
     * longer than max_length bytes.
     */
    class PNGC_EXPORT chunk {
    public:
        static constexpr std::uint32_t max_length = 0x7FFFFFFFu;  ///< 2^31 - 1
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t header_size = length_field_size + chunk_type::size;
        static constexpr std::size_t crc_size = 4;
        static constexpr std::size_t overhead = header_size + crc_size;

        /**
         * @brief Build a chunk from a type and payload
         * @throws codec_error (length_exceeded) if data is longer than max_length
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk carrying text
         * @throws codec_error (length_exceeded) if text is longer than max_length
         */
        chunk(const chunk_type& type, std::string_view text);

        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        /**
         * @brief Payload decoded as UTF-8 text
         * @throws codec_error (invalid_utf8) if the payload is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief CRC-32 over type bytes followed by payload
         *
         * Recomputed on every call.
         */
        [[nodiscard]] std::uint32_t crc() const;

        /**
         * @brief Size of the serialized form (length() + 12)
         */
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        /**
         * @brief Serialize to the on-wire layout
         */
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Write the serialized form to a stream
         * @throws io_error if the stream rejects the write
         */
        void write(std::ostream& os) const;

        /**
         * @brief Human-readable "<type>\t<text>" line
         *
         * A payload that is not UTF-8 is shown as "[data]"; a type code that
         * is not UTF-8 is shown escaped. Never throws codec_error.
         */
        [[nodiscard]] std::string to_display_string() const;

        /**
         * @brief Decode a buffer holding one chunk
         *
         * Bytes after the chunk are ignored and reported as a
         * "trailing_data" warning.
         *
         * @param data Buffer start
         * @param size Buffer size in bytes
         * @param options Limits and warning handler
         * @throws codec_error with kind length_exceeded, truncated_input,
         *         crc_mismatch, or invalid_byte (only with require_valid_type)
         */
        static chunk from_bytes(const void* data, std::size_t size, const parse_options& options);
        static chunk from_bytes(const void* data, std::size_t size);
        static chunk from_bytes(const std::vector<std::byte>& bytes, const parse_options& options);
        static chunk from_bytes(const std::vector<std::byte>& bytes);

        /**
         * @brief Decode the chunk at the start of a buffer
         *
         * Like from_bytes() but reports the number of bytes the chunk
         * occupied instead of warning about the rest, so a caller can walk
         * a concatenation of chunks.
         *
         * @param consumed Receives the encoded size of the decoded chunk
         */
        static chunk from_prefix(const void* data, std::size_t size, std::size_t& consumed,
                                 const parse_options& options);

        /**
         * @brief Decode one chunk from a stream
         *
         * Consumes exactly the chunk's bytes on success. The payload is read
         * in bounded blocks, so a declared length larger than the stream
         * fails with truncated_input without allocating the declared size.
         *
         * @throws codec_error on malformed data, io_error on stream failure
         */
        static chunk read(std::istream& is, const parse_options& options);
        static chunk read(std::istream& is);

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

    // Writes to_display_string()
    PNGC_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngc
