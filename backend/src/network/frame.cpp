/**
 * Frame: 4-byte big-endian length prefix for channel messages.
 */

#include "network/frame.h"

#include <stdexcept>

namespace frame {

Header encode_header(std::uint32_t body_size) {
    return Header{
        static_cast<unsigned char>((body_size >> 24) & 0xFF),
        static_cast<unsigned char>((body_size >> 16) & 0xFF),
        static_cast<unsigned char>((body_size >> 8) & 0xFF),
        static_cast<unsigned char>(body_size & 0xFF),
    };
}

std::uint32_t decode_header(const Header& header) {
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8) |
           static_cast<std::uint32_t>(header[3]);
}

std::string encode(const std::string& body) {
    if (body.size() > 0xFFFFFFFFull) {
        throw std::length_error("frame body too large");
    }
    const Header header = encode_header(static_cast<std::uint32_t>(body.size()));
    std::string out(header.begin(), header.end());
    out += body;
    return out;
}

} // namespace frame
