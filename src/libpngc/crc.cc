/**
 * @file crc.cc
 * @brief CRC-32 accumulator over zlib
 */

#include <pngc/crc.hh>
#include <algorithm>
#include <zlib.h>

namespace pngc {

    namespace {
        // zlib takes uInt lengths; feed larger ranges in pieces
        constexpr std::size_t max_block = std::size_t(1) << 30;
    }

    crc32::crc32()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {
    }

    crc32& crc32::update(const void* data, std::size_t size) {
        if (!data || size == 0) {
            return *this;
        }

        auto p = static_cast<const Bytef*>(data);
        uLong crc = m_value;
        while (size > 0) {
            std::size_t block = std::min(size, max_block);
            crc = ::crc32(crc, p, static_cast<uInt>(block));
            p += block;
            size -= block;
        }
        m_value = static_cast<std::uint32_t>(crc);
        return *this;
    }

    void crc32::reset() {
        m_value = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));
    }

    std::uint32_t crc32::compute(const void* data, std::size_t size) {
        return crc32().update(data, size).value();
    }

} // namespace pngc
