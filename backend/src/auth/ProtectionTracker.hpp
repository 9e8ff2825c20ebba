#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <unordered_map>
#include "../utils/Clock.hpp"

struct ProtectionStatus {
    bool frozen = false;
    long long remaining_seconds = 0;
};

/*
  Brute-force defense, per username and in memory only (a restart forgets
  everything). Unknown usernames are tracked like real ones; an entry lives
  until a success, an observed freeze expiry, or process exit. Entries with
  a partial failure run are kept because the run has no time limit.
   - `threshold` consecutive failures freeze the username for `freeze`.
   - The counter restarts at 0 when the freeze is set.
   - Failures while frozen are not counted.
   - Expiry is noticed lazily by checkStatus()/recordFailure().
*/
class ProtectionTracker {
public:
    ProtectionTracker(int threshold, std::chrono::seconds freeze, Clock clock = systemClock());

    ProtectionStatus recordFailure(const std::string& username);
    void recordSuccess(const std::string& username);
    ProtectionStatus checkStatus(const std::string& username);

    int failedAttempts(const std::string& username) const;
    std::size_t trackedCount() const { return states.size(); }
    int threshold() const { return max_attempts; }
    std::chrono::seconds freezeDuration() const { return freeze_duration; }

private:
    struct State {
        int failed_attempts = 0;
        std::optional<TimePoint> frozen_until;
    };

    // Clears an expired freeze; returns the current status.
    ProtectionStatus evaluate(State& s, TimePoint now) const;

    std::unordered_map<std::string, State> states;
    int max_attempts;
    std::chrono::seconds freeze_duration;
    Clock clock;
};
