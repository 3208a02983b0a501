//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <functional>
#include <iosfwd>

#include <pngc/export_pngc.h>
#include <pngc/exceptions.hh>

namespace pngc {

    namespace detail {
        constexpr bool is_ascii(std::uint8_t c) { return c < 0x80; }
        constexpr bool is_ascii_upper(std::uint8_t c) { return c >= 'A' && c <= 'Z'; }
        constexpr bool is_ascii_lower(std::uint8_t c) { return c >= 'a' && c <= 'z'; }
        constexpr bool is_ascii_alpha(std::uint8_t c) { return is_ascii_upper(c) || is_ascii_lower(c); }
    }

    /**
     * @class chunk_type
     * @brief Four byte chunk type code
     *
     * The case of each byte carries one property bit:
     * byte 0 critical/ancillary, byte 1 public/private,
     * byte 2 reserved (must be uppercase), byte 3 unsafe/safe to copy.
     *
     * The value is immutable. Construction from raw bytes accepts anything;
     * construction from text via parse() requires four ASCII letters.
     */
    class PNGC_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;

        // Positions of the property bytes
        static constexpr std::size_t ancillary_index = 0;
        static constexpr std::size_t private_index = 1;
        static constexpr std::size_t reserved_index = 2;
        static constexpr std::size_t safe_to_copy_index = 3;

        // Constructor from 4 raw bytes, no validation
        constexpr chunk_type(std::uint8_t b0, std::uint8_t b1, std::uint8_t b2, std::uint8_t b3)
            : m_bytes{ b0, b1, b2, b3 } {}

        constexpr explicit chunk_type(const std::array<std::uint8_t, size>& bytes)
            : m_bytes(bytes) {}

        // Constructor from raw memory, no validation
        static chunk_type from_bytes(const void* data);

        // Constructor from a big-endian packed value, e.g. 0x52755374 for "RuSt"
        static constexpr chunk_type from_uint32_be(std::uint32_t value) {
            return {
                static_cast<std::uint8_t>(value >> 24),
                static_cast<std::uint8_t>(value >> 16),
                static_cast<std::uint8_t>(value >> 8),
                static_cast<std::uint8_t>(value)
            };
        }

        /**
         * @brief Construct from text, validating every byte
         * @param text Exactly four ASCII letters
         * @return Parsed chunk type
         * @throws codec_error (invalid_byte) if text is not 4 bytes long or
         *         contains a byte outside A-Z / a-z
         */
        static chunk_type parse(std::string_view text);

        [[nodiscard]] constexpr const std::array<std::uint8_t, size>& bytes() const { return m_bytes; }

        [[nodiscard]] constexpr std::uint32_t to_uint32_be() const {
            return (std::uint32_t(m_bytes[0]) << 24) | (std::uint32_t(m_bytes[1]) << 16) |
                   (std::uint32_t(m_bytes[2]) << 8) | std::uint32_t(m_bytes[3]);
        }

        // Write the 4 bytes to dest
        void to_bytes(void* dest) const;

        // All bytes ASCII and the reserved bit set
        [[nodiscard]] constexpr bool is_valid() const {
            return detail::is_ascii(m_bytes[0]) && detail::is_ascii(m_bytes[1]) &&
                   detail::is_ascii(m_bytes[3]) && is_reserved_bit_valid();
        }

        [[nodiscard]] constexpr bool is_critical() const {
            return detail::is_ascii_upper(m_bytes[ancillary_index]);
        }

        [[nodiscard]] constexpr bool is_public() const {
            return detail::is_ascii_upper(m_bytes[private_index]);
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return detail::is_ascii_upper(m_bytes[reserved_index]);
        }

        // Inverse polarity: an uppercase letter here means "unsafe to copy"
        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return !detail::is_ascii_upper(m_bytes[safe_to_copy_index]);
        }

        static constexpr bool is_valid_byte(std::uint8_t byte) {
            return detail::is_ascii_alpha(byte);
        }

        /**
         * @brief The four bytes as text
         * @throws codec_error (invalid_utf8) if the bytes are not well-formed UTF-8
         */
        [[nodiscard]] std::string to_string() const;

        // Printable ASCII kept as is, anything else as \xNN. Never throws.
        [[nodiscard]] std::string to_string_escaped() const;

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

    private:
        std::array<std::uint8_t, size> m_bytes;
    };

    // Stream output, quoted and escaped
    PNGC_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            // Fibonacci multiplier then a fixed xor
            return (static_cast<std::size_t>(t.to_uint32_be()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for validated chunk types, e.g. "RuSt"_ct
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != chunk_type::size) {
            throw codec_error(error_kind::invalid_byte, "Chunk type literal must be exactly 4 characters");
        }
        for (std::size_t i = 0; i < len; ++i) {
            if (!chunk_type::is_valid_byte(static_cast<std::uint8_t>(str[i]))) {
                throw codec_error(error_kind::invalid_byte, "Chunk type literal must contain only ASCII letters");
            }
        }
        return {
            static_cast<std::uint8_t>(str[0]),
            static_cast<std::uint8_t>(str[1]),
            static_cast<std::uint8_t>(str[2]),
            static_cast<std::uint8_t>(str[3])
        };
    }

}
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngc::chunk_type> {
        std::size_t operator()(const pngc::chunk_type& t) const noexcept {
            return pngc::chunk_type_hash{}(t);
        }
    };
}
