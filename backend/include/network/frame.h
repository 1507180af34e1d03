#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

/// Length-prefixed framing used on the peer channel: a 4-byte big-endian
/// body length followed by the UTF-8 body.
namespace frame {

constexpr std::size_t   kHeaderSize = 4;
constexpr std::uint32_t kDefaultMaxBody = 1u << 20;

using Header = std::array<unsigned char, kHeaderSize>;

Header encode_header(std::uint32_t body_size);
std::uint32_t decode_header(const Header& header);

/// Header and body in one buffer, ready for a single write.
std::string encode(const std::string& body);

} // namespace frame
