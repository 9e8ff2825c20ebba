#include "ProtectionTracker.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

ProtectionTracker::ProtectionTracker(int threshold, std::chrono::seconds freeze, Clock c)
    : max_attempts(threshold), freeze_duration(freeze), clock(std::move(c))
{
    if (max_attempts < 1)
        throw std::invalid_argument("ProtectionTracker threshold must be at least 1");
    if (freeze_duration.count() < 0)
        throw std::invalid_argument("ProtectionTracker freeze duration must not be negative");

    spdlog::debug("ProtectionTracker: threshold={} freeze={}s", max_attempts, freeze_duration.count());
}

ProtectionStatus ProtectionTracker::evaluate(State& s, TimePoint now) const {
    if (!s.frozen_until)
        return {};

    if (now < *s.frozen_until)
        return { true, secondsUntil(now, *s.frozen_until) };

    s.frozen_until.reset();
    s.failed_attempts = 0;
    return {};
}

ProtectionStatus ProtectionTracker::recordFailure(const std::string& username) {
    const TimePoint now = clock();
    State& s = states[username];

    ProtectionStatus status = evaluate(s, now);
    if (status.frozen) {
        spdlog::debug("Failure for '{}' ignored: already frozen", username);
        return status;
    }

    s.failed_attempts += 1;
    spdlog::warn("Failed attempt {}/{} for '{}'", s.failed_attempts, max_attempts, username);

    if (s.failed_attempts >= max_attempts) {
        s.frozen_until = now + freeze_duration;
        s.failed_attempts = 0;
        spdlog::warn("'{}' frozen for {} seconds", username, freeze_duration.count());
        return evaluate(s, now);
    }

    return {};
}

void ProtectionTracker::recordSuccess(const std::string& username) {
    if (states.erase(username))
        spdlog::debug("Protection state cleared for '{}'", username);
}

ProtectionStatus ProtectionTracker::checkStatus(const std::string& username) {
    auto it = states.find(username);
    if (it == states.end())
        return {};

    ProtectionStatus status = evaluate(it->second, clock());
    if (!status.frozen && it->second.failed_attempts == 0)
        states.erase(it);
    return status;
}

int ProtectionTracker::failedAttempts(const std::string& username) const {
    auto it = states.find(username);
    return it == states.end() ? 0 : it->second.failed_attempts;
}
