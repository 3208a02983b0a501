/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk codec
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the closed error taxonomy of the codec and the
 * convenience macros used to raise it.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>
#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @enum error_kind
     * @brief Every way a codec operation can fail on its input
     *
     * The set is closed: a switch over it needs no default branch.
     */
    enum class error_kind {
        invalid_byte,     ///< Type code text contains a non ASCII-alphabetic byte
        length_exceeded,  ///< Declared or actual length is above 2^31 - 1 (or the configured limit)
        truncated_input,  ///< Fewer bytes are available than the layout requires
        crc_mismatch,     ///< Declared checksum differs from the recomputed one
        invalid_utf8      ///< Bytes requested as text are not well-formed UTF-8
    };

    /**
     * @brief Stable name of an error kind
     * @param kind Error kind
     * @return Name such as "crc_mismatch"
     */
    PNGC_EXPORT std::string_view to_string(error_kind kind) noexcept;

    /**
     * @class pngc_error
     * @brief Base exception class for all codec errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every codec-specific error with a single catch block.
     */
    class PNGC_EXPORT pngc_error : public std::runtime_error {
    public:
        explicit pngc_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for stream failures unrelated to the data itself
     *
     * Thrown when a stream is in a bad state or a write does not complete.
     */
    class PNGC_EXPORT io_error : public pngc_error {
    public:
        explicit io_error(const std::string& msg)
            : pngc_error(msg) {}
    };

    /**
     * @class codec_error
     * @brief Exception for malformed or corrupted chunk data
     *
     * Carries the error_kind so callers can dispatch on the failure
     * without inspecting the message.
     */
    class PNGC_EXPORT codec_error : public pngc_error {
    public:
        codec_error(error_kind kind, const std::string& msg)
            : pngc_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pngc::io_error(::pngc::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CODEC
     * @brief Throw a codec_error of the given kind with formatted message
     * @param kind error_kind enumerator name (without qualification)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CODEC(kind, ...) \
        throw ::pngc::codec_error(::pngc::error_kind::kind, ::pngc::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_CODEC_IF
     * @brief Conditionally throw a codec_error
     * @param condition Condition to check
     * @param kind error_kind enumerator name
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_CODEC_IF(condition, kind, ...) \
        do { if (condition) THROW_CODEC(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngc
