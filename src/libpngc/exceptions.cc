//
// Created by igor on 14/08/2025.
//

#include <pngc/exceptions.hh>

namespace pngc {

    std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::invalid_byte:
                return "invalid_byte";
            case error_kind::length_exceeded:
                return "length_exceeded";
            case error_kind::truncated_input:
                return "truncated_input";
            case error_kind::crc_mismatch:
                return "crc_mismatch";
            case error_kind::invalid_utf8:
                return "invalid_utf8";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngc
