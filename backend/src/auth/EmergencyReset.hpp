#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include "AuthTypes.hpp"
#include "AuthManager.hpp"
#include "../utils/Clock.hpp"

// Produces a fresh plaintext code for one challenge.
using CodeGenerator = std::function<std::string()>;
// Hands the plaintext code to the user (mail, SMS, console...).
using CodeDelivery = std::function<void(const std::string& username, const std::string& code)>;

/*
  Forgotten-password flow, one instance per reset attempt:

    requestReset  -> challenge issued, code delivered, only its digest kept
    verify        -> Expired | BadCode (challenge kept until `max_attempts`
                     wrong codes, then dropped) | Ok (challenge consumed)
    completeReset -> new password written; only after a successful verify

  Codes compare case-insensitively.
*/
class EmergencyReset {
public:
    EmergencyReset(AuthManager& auth, std::chrono::seconds ttl,
        CodeGenerator generator, CodeDelivery delivery, Clock clock = systemClock(),
        int maxCodeAttempts = 5);

    AuthStatus requestReset(const std::string& username);
    AuthStatus verify(const std::string& username, const std::string& code);
    AuthStatus completeReset(const std::string& username, const std::string& newPassword);

    // Uppercase hex from libsodium's CSPRNG.
    static CodeGenerator randomCodeGenerator(int length);

private:
    struct Challenge {
        std::string username;
        std::string code_digest;
        TimePoint issued_at;
        TimePoint expires_at;
        int wrong_codes = 0;
    };

    AuthManager& auth;
    std::chrono::seconds ttl;
    CodeGenerator generator;
    CodeDelivery delivery;
    Clock clock;
    int max_attempts;

    std::optional<Challenge> challenge;
    std::optional<std::string> verified_user;
};
