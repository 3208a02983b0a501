/**
 * @file chunk.cc
 * @brief Chunk construction, serialization and strict decoding
 */

#include <pngc/chunk.hh>
#include <pngc/crc.hh>
#include <pngc/endian.hh>
#include <pngc/utf8.hh>
#include "input.hh"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace pngc {

    namespace {
        std::string hex32(std::uint32_t value) {
            std::ostringstream os;
            os << "0x" << std::hex << std::setw(8) << std::setfill('0') << value;
            return os.str();
        }

        std::vector<std::byte> to_byte_vector(std::string_view text) {
            std::vector<std::byte> result(text.size());
            if (!text.empty()) {
                std::memcpy(result.data(), text.data(), text.size());
            }
            return result;
        }

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        // Length, type, payload, CRC; every check in that order
        chunk decode(reader_base& in, const parse_options& options) {
            const std::uint64_t start = in.tell();

            auto length = in.read_be32();
            const std::uint32_t limit = std::min(options.max_chunk_length, chunk::max_length);
            THROW_CODEC_IF(length > limit, length_exceeded,
                           "Chunk at offset ", start, " declares length ", length,
                           ", which exceeds maximum allowed length of ", limit, " bytes");

            auto type = in.read_chunk_type();

            auto left = in.remaining();
            THROW_CODEC_IF(left && *left < length, truncated_input,
                           "Chunk ", type, " at offset ", start, " declares length ", length,
                           " but only ", *left, " bytes follow the header");

            auto payload = in.read_exact(length);

            left = in.remaining();
            THROW_CODEC_IF(left && *left < chunk::crc_size, truncated_input,
                           "Chunk ", type, " at offset ", start, " is missing its CRC: ",
                           *left, " of ", chunk::crc_size, " bytes present");

            auto declared = in.read_be32();

            chunk result(type, std::move(payload));
            const std::uint32_t actual = result.crc();
            THROW_CODEC_IF(declared != actual, crc_mismatch,
                           "Chunk ", type, " at offset ", start, " declares CRC ", hex32(declared),
                           " but its contents give ", hex32(actual));

            if (!type.is_valid()) {
                THROW_CODEC_IF(options.require_valid_type, invalid_byte,
                               "Chunk ", type, " at offset ", start, " has a malformed type code");
                warn(options, start, "type_code",
                     build_error_msg("Chunk ", type, " has a malformed type code",
                                     type.is_reserved_bit_valid() ? " (non-ASCII byte)" : " (reserved bit not set)"));
            }

            return result;
        }
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_type(type), m_data(std::move(data)) {
        THROW_CODEC_IF(m_data.size() > max_length, length_exceeded,
                       "Chunk ", m_type, " payload of ", m_data.size(),
                       " bytes exceeds maximum allowed length of ", max_length, " bytes");
    }

    chunk::chunk(const chunk_type& type, std::string_view text)
        : chunk(type, to_byte_vector(text)) {
    }

    std::string chunk::data_as_string() const {
        return utf8_to_string(m_data.data(), m_data.size());
    }

    std::uint32_t chunk::crc() const {
        return crc32()
            .update(m_type.bytes().data(), chunk_type::size)
            .update(m_data.data(), m_data.size())
            .value();
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out(encoded_size());
        std::byte* p = out.data();

        store_be32(p, length());
        m_type.to_bytes(p + length_field_size);
        if (!m_data.empty()) {
            std::memcpy(p + header_size, m_data.data(), m_data.size());
        }
        store_be32(p + header_size + m_data.size(), crc());

        return out;
    }

    void chunk::write(std::ostream& os) const {
        std::array<std::byte, header_size> header;
        store_be32(header.data(), length());
        m_type.to_bytes(header.data() + length_field_size);

        std::array<std::byte, crc_size> trailer;
        store_be32(trailer.data(), crc());

        THROW_IO_UNLESS(os.good(), "Stream in bad state");
        os.write(reinterpret_cast<const char*>(header.data()), header.size());
        os.write(reinterpret_cast<const char*>(m_data.data()), static_cast<std::streamsize>(m_data.size()));
        os.write(reinterpret_cast<const char*>(trailer.data()), trailer.size());
        THROW_IO_UNLESS(os.good(), "Failed to write chunk ", m_type, " (", encoded_size(), " bytes)");
    }

    std::string chunk::to_display_string() const {
        std::string result = is_valid_utf8(m_type.bytes().data(), chunk_type::size)
                                 ? m_type.to_string()
                                 : m_type.to_string_escaped();
        result += '\t';
        if (is_valid_utf8(m_data.data(), m_data.size())) {
            result.append(reinterpret_cast<const char*>(m_data.data()), m_data.size());
        } else {
            result += "[data]";
        }
        return result;
    }

    chunk chunk::from_bytes(const void* data, std::size_t size, const parse_options& options) {
        memory_reader in(data, size);
        chunk result = decode(in, options);

        auto left = in.remaining();
        if (left && *left > 0) {
            warn(options, 0, "trailing_data",
                 build_error_msg(*left, " bytes after chunk ", result.type(), " were ignored"));
        }
        return result;
    }

    chunk chunk::from_bytes(const void* data, std::size_t size) {
        return from_bytes(data, size, parse_options{});
    }

    chunk chunk::from_bytes(const std::vector<std::byte>& bytes, const parse_options& options) {
        return from_bytes(bytes.data(), bytes.size(), options);
    }

    chunk chunk::from_bytes(const std::vector<std::byte>& bytes) {
        return from_bytes(bytes.data(), bytes.size(), parse_options{});
    }

    chunk chunk::from_prefix(const void* data, std::size_t size, std::size_t& consumed,
                             const parse_options& options) {
        memory_reader in(data, size);
        chunk result = decode(in, options);
        consumed = static_cast<std::size_t>(in.tell());
        return result;
    }

    chunk chunk::read(std::istream& is, const parse_options& options) {
        stream_reader in(is);
        return decode(in, options);
    }

    chunk chunk::read(std::istream& is) {
        return read(is, parse_options{});
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << c.to_display_string();
    }

} // namespace pngc
