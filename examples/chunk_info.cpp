/**
 * @file chunk_info.cpp
 * @brief Print the properties of serialized chunks read from standard input
 *
 * Reads chunks back to back until the input ends and prints the type
 * flags, length, CRC and text rendering of each one. Decoding warnings are
 * printed to standard error.
 */

#include <pngc/chunk.hh>
#include <pngc/exceptions.hh>
#include <iostream>
#include <iomanip>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 1) {
        std::cout << "Usage: " << argv[0] << " < chunks.bin\n";
        std::cout << "\n";
        std::cout << "Lists every chunk in a concatenation of serialized chunks.\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);

    pngc::parse_options options;
    options.on_warning = [](std::uint64_t, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "]: " << message << "\n";
    };

    int count = 0;
    try {
        while (std::cin.peek() != std::char_traits<char>::eof()) {
            auto c = pngc::chunk::read(std::cin, options);
            const auto& type = c.type();

            std::cout << "Chunk " << type << " (" << c.length() << " bytes)\n";
            std::cout << "  critical:      " << std::boolalpha << type.is_critical() << "\n";
            std::cout << "  public:        " << type.is_public() << "\n";
            std::cout << "  reserved ok:   " << type.is_reserved_bit_valid() << "\n";
            std::cout << "  safe to copy:  " << type.is_safe_to_copy() << "\n";
            std::cout << "  crc:           0x" << std::hex << std::setw(8) << std::setfill('0')
                      << c.crc() << std::dec << std::setfill(' ') << "\n";
            std::cout << "  " << c << "\n";
            count++;
        }
    } catch (const pngc::codec_error& e) {
        std::cerr << "Error (" << pngc::to_string(e.kind()) << ") in chunk #" << count << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << count << " chunk(s)\n";
    return 0;
}
