/**
 * CryptoManager: libsodium-backed randomness and comparisons.
 *
 * - randombytes_uniform for room identifiers (no modulo bias)
 * - randombytes_buf + sodium_bin2hex for session tokens
 * - sodium_memcmp when checking a token presented on the wire
 */

#include "crypto/crypto_manager.h"

#include <cstdint>
#include <vector>

#include <sodium.h>

namespace {
constexpr char kRoomAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr uint32_t kRoomAlphabetSize = sizeof(kRoomAlphabet) - 1;
}

bool CryptoManager::init() {
    return sodium_init() >= 0;
}

std::string CryptoManager::random_room_id() {
    std::string id;
    id.reserve(kRoomIdLength);
    for (std::size_t i = 0; i < kRoomIdLength; ++i) {
        id.push_back(kRoomAlphabet[randombytes_uniform(kRoomAlphabetSize)]);
    }
    return id;
}

std::string CryptoManager::random_token(std::size_t bytes) {
    std::vector<unsigned char> raw(bytes);
    randombytes_buf(raw.data(), raw.size());

    std::string hex(bytes * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), raw.data(), raw.size());
    hex.resize(bytes * 2);
    return hex;
}

bool CryptoManager::tokens_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}
