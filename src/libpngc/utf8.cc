/**
 * @file utf8.cc
 * @brief Strict UTF-8 validation
 */

#include <pngc/utf8.hh>
#include <pngc/exceptions.hh>
#include <cstdint>

namespace pngc {

    namespace {
        bool is_continuation(std::uint8_t b) {
            return (b & 0xC0) == 0x80;
        }

        // Offset of the first byte that does not start a valid sequence, or size if none
        std::size_t find_invalid_utf8(const std::uint8_t* p, std::size_t size) {
            std::size_t i = 0;
            while (i < size) {
                std::uint8_t b0 = p[i];

                // 1 byte: 0xxxxxxx
                if (b0 < 0x80) {
                    i++;
                    continue;
                }

                std::size_t len;
                std::uint32_t cp;
                std::uint32_t min_cp;
                if ((b0 & 0xE0) == 0xC0) {
                    // 2 bytes: 110xxxxx 10xxxxxx
                    len = 2;
                    cp = b0 & 0x1F;
                    min_cp = 0x80;
                } else if ((b0 & 0xF0) == 0xE0) {
                    // 3 bytes: 1110xxxx 10xxxxxx 10xxxxxx
                    len = 3;
                    cp = b0 & 0x0F;
                    min_cp = 0x800;
                } else if ((b0 & 0xF8) == 0xF0) {
                    // 4 bytes: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
                    len = 4;
                    cp = b0 & 0x07;
                    min_cp = 0x10000;
                } else {
                    return i;
                }

                if (size - i < len) {
                    return i;
                }

                for (std::size_t k = 1; k < len; k++) {
                    if (!is_continuation(p[i + k])) {
                        return i;
                    }
                    cp = (cp << 6) | (p[i + k] & 0x3F);
                }

                if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                    return i;
                }

                i += len;
            }
            return size;
        }
    }

    bool is_valid_utf8(const void* data, std::size_t size) noexcept {
        if (size == 0) {
            return true;
        }
        if (!data) {
            return false;
        }
        return find_invalid_utf8(static_cast<const std::uint8_t*>(data), size) == size;
    }

    std::string utf8_to_string(const void* data, std::size_t size) {
        if (size == 0) {
            return {};
        }
        THROW_CODEC_IF(!data, invalid_utf8, "Null buffer passed as UTF-8 text");

        auto p = static_cast<const std::uint8_t*>(data);
        std::size_t bad = find_invalid_utf8(p, size);
        THROW_CODEC_IF(bad != size, invalid_utf8,
                       "Invalid UTF-8 sequence at byte ", bad, " of ", size,
                       " (lead byte 0x", std::hex, static_cast<unsigned>(p[bad]), ")");

        return {reinterpret_cast<const char*>(p), size};
    }

} // namespace pngc
