/**
 * @file utf8.hh
 * @brief UTF-8 well-formedness check for text accessors
 */

#pragma once

#include <cstddef>
#include <string>
#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @brief Check that a byte range is well-formed UTF-8
     *
     * Rejects overlong encodings, surrogate code points (U+D800..U+DFFF),
     * code points above U+10FFFF and truncated sequences.
     *
     * @param data Bytes to check (may be null when size is 0)
     * @param size Number of bytes
     * @return True if the whole range is valid UTF-8
     */
    PNGC_EXPORT bool is_valid_utf8(const void* data, std::size_t size) noexcept;

    /**
     * @brief Copy a byte range into a string, requiring valid UTF-8
     * @throws codec_error (invalid_utf8) naming the offset of the first bad byte
     */
    PNGC_EXPORT std::string utf8_to_string(const void* data, std::size_t size);

} // namespace pngc
