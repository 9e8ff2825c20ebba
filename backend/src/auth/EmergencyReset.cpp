#include "EmergencyReset.hpp"
#include "PasswordHasher.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

static std::string normalizeCode(std::string code) {
    while (!code.empty() && std::isspace((unsigned char)code.front())) code.erase(code.begin());
    while (!code.empty() && std::isspace((unsigned char)code.back())) code.pop_back();
    std::transform(code.begin(), code.end(), code.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

EmergencyReset::EmergencyReset(AuthManager& a, std::chrono::seconds t,
    CodeGenerator gen, CodeDelivery deliver, Clock c, int maxCodeAttempts)
    : auth(a), ttl(t), generator(std::move(gen)), delivery(std::move(deliver)), clock(std::move(c)),
    max_attempts(maxCodeAttempts)
{
    if (max_attempts < 1)
        throw std::invalid_argument("EmergencyReset needs at least one code attempt");
    if (!generator || !delivery)
        throw std::invalid_argument("EmergencyReset needs a code generator and a delivery channel");
}

AuthStatus EmergencyReset::requestReset(const std::string& username) {
    spdlog::info("Emergency reset requested for '{}'", username);

    challenge.reset();
    verified_user.reset();

    if (!auth.userExists(username)) {
        spdlog::warn("Emergency reset refused: '{}' not found", username);
        return AuthStatus::NotFound;
    }

    std::string code = normalizeCode(generator());
    if (code.empty())
        throw std::runtime_error("Code generator produced an empty code");

    const TimePoint now = clock();
    challenge = Challenge{ username, PasswordHasher::digest(code), now, now + ttl, 0 };

    delivery(username, code);
    spdlog::info("Challenge issued for '{}', valid for {} seconds", username, ttl.count());
    return AuthStatus::Ok;
}

AuthStatus EmergencyReset::verify(const std::string& username, const std::string& code) {
    if (!challenge || challenge->username != username) {
        spdlog::warn("verify() for '{}' without a live challenge", username);
        return AuthStatus::SequenceError;
    }

    if (clock() >= challenge->expires_at) {
        spdlog::warn("Challenge for '{}' expired", username);
        challenge.reset();
        return AuthStatus::Expired;
    }

    if (!PasswordHasher::matches(normalizeCode(code), challenge->code_digest)) {
        challenge->wrong_codes += 1;
        spdlog::warn("Wrong verification code for '{}' ({}/{})", username, challenge->wrong_codes, max_attempts);
        if (challenge->wrong_codes >= max_attempts) {
            spdlog::warn("Challenge for '{}' dropped after {} wrong codes", username, max_attempts);
            challenge.reset();
        }
        return AuthStatus::BadCode;
    }

    challenge.reset();
    verified_user = username;
    spdlog::info("Identity verified for '{}'", username);
    return AuthStatus::Ok;
}

AuthStatus EmergencyReset::completeReset(const std::string& username, const std::string& newPassword) {
    if (!verified_user || *verified_user != username) {
        spdlog::warn("completeReset() for '{}' before verification", username);
        return AuthStatus::SequenceError;
    }

    AuthStatus status = auth.setPassword(username, newPassword);
    if (status == AuthStatus::Ok) {
        verified_user.reset();
        spdlog::info("Emergency reset completed for '{}'", username);
    }
    return status;
}

CodeGenerator EmergencyReset::randomCodeGenerator(int length) {
    if (length < 1)
        throw std::invalid_argument("Code length must be positive");

    return [length] {
        static const char digits[] = "0123456789ABCDEF";
        std::string code;
        code.reserve(static_cast<std::size_t>(length));
        for (int i = 0; i < length; ++i)
            code.push_back(digits[randombytes_uniform(16)]);
        return code;
    };
}
