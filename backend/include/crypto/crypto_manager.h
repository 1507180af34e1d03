#pragma once

#include <cstddef>
#include <string>

/**
 * Wraps libsodium for the few places that need unpredictable values:
 * room identifiers and the session/answer tokens that bind a TCP
 * connection to the published signaling blobs.
 */
class CryptoManager {
public:
    /// Must be called once before any other method.
    static bool init();

    /// 8 characters from [A-Z0-9], uniformly distributed.
    static std::string random_room_id();

    /// `bytes` random bytes, hex encoded.
    static std::string random_token(std::size_t bytes = 16);

    /// Length check plus constant-time comparison of the contents.
    static bool tokens_equal(const std::string& a, const std::string& b);

    static constexpr std::size_t kRoomIdLength = 8;
};
