#pragma once
#include <string>

// Single place that turns secrets into stored digests. Passwords and reset
// codes both go through digest(): SHA-256, lowercase hex, no salt.
class PasswordHasher {
public:
    // sodium_init(); throws std::runtime_error if libsodium cannot start.
    static void init();

    static std::string digest(const std::string& secret);

    // Constant-time comparison of digest(secret) against a stored digest.
    static bool matches(const std::string& secret, const std::string& stored_digest);
};
