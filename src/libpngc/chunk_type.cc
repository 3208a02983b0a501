//
// Created by igor on 10/08/2025.
//

#include <pngc/chunk_type.hh>
#include <pngc/utf8.hh>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace pngc {

    chunk_type chunk_type::from_bytes(const void* data) {
        std::array<std::uint8_t, size> bytes;
        std::memcpy(bytes.data(), data, size);
        return chunk_type(bytes);
    }

    chunk_type chunk_type::parse(std::string_view text) {
        THROW_CODEC_IF(text.size() != size, invalid_byte,
                       "Chunk type must be exactly 4 bytes, got ", text.size());

        for (std::size_t i = 0; i < size; i++) {
            auto byte = static_cast<std::uint8_t>(text[i]);
            THROW_CODEC_IF(!is_valid_byte(byte), invalid_byte,
                           "Chunk type byte ", i, " (0x", std::hex, std::setw(2), std::setfill('0'),
                           static_cast<unsigned>(byte), ") is not an ASCII letter");
        }

        return from_bytes(text.data());
    }

    void chunk_type::to_bytes(void* dest) const {
        std::memcpy(dest, m_bytes.data(), size);
    }

    std::string chunk_type::to_string() const {
        return utf8_to_string(m_bytes.data(), size);
    }

    std::string chunk_type::to_string_escaped() const {
        std::ostringstream os;
        for (std::uint8_t c : m_bytes) {
            if (c >= 32 && c <= 126) {
                os << static_cast<char>(c);
            } else {
                // Escape non-printable characters
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c) << std::dec;
            }
        }
        return os.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os << '\'' << t.to_string_escaped() << '\'';
    }

} // namespace pngc
