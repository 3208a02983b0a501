/**
 * @file crc.hh
 * @brief CRC-32 (ISO-HDLC) accumulator used for chunk integrity
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @class crc32
     * @brief Incremental CRC-32 with the PNG/gzip/zlib parameters
     *
     * Polynomial 0x04C11DB7 (reflected), initial value and final xor
     * 0xFFFFFFFF. Feeding the same bytes in any number of update() calls
     * gives the same value() as a single call.
     */
    class PNGC_EXPORT crc32 {
    public:
        crc32();

        /**
         * @brief Add bytes to the running checksum
         * @param data Bytes to add (may be null when size is 0)
         * @param size Number of bytes
         * @return Reference to this accumulator
         */
        crc32& update(const void* data, std::size_t size);

        /**
         * @brief Checksum of everything added so far
         */
        [[nodiscard]] std::uint32_t value() const { return m_value; }

        /**
         * @brief Forget everything added so far
         */
        void reset();

        /**
         * @brief One-shot checksum of a byte range
         */
        static std::uint32_t compute(const void* data, std::size_t size);

    private:
        std::uint32_t m_value;
    };

} // namespace pngc
