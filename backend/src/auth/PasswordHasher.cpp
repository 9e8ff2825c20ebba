#include "PasswordHasher.hpp"
#include <sodium.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

void PasswordHasher::init() {
    if (sodium_init() < 0) {
        spdlog::error("sodium_init() failed");
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

std::string PasswordHasher::digest(const std::string& secret) {
    unsigned char out[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(out,
        reinterpret_cast<const unsigned char*>(secret.data()),
        static_cast<unsigned long long>(secret.size()));

    char hex[2 * crypto_hash_sha256_BYTES + 1];
    sodium_bin2hex(hex, sizeof(hex), out, sizeof(out));
    sodium_memzero(out, sizeof(out));
    return std::string(hex);
}

bool PasswordHasher::matches(const std::string& secret, const std::string& stored_digest) {
    if (stored_digest.empty()) {
        spdlog::warn("matches() called with empty digest");
        return false;
    }

    std::string computed = digest(secret);
    if (computed.size() != stored_digest.size())
        return false;

    return sodium_memcmp(computed.data(), stored_digest.data(), computed.size()) == 0;
}
