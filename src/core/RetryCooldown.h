#pragma once

#include <cstdint>

/**
 * RetryCooldown - failure counter with a cooldown window
 *
 * Once failureThreshold failures have been recorded, retries are refused
 * until cooldownMs has passed since the most recent failure. A success
 * (reset) clears the counter.
 *
 * Usage:
 * ```cpp
 * RetryCooldown cooldown(30000, 1);
 * if (!cooldown.isInCooldown(now)) {
 *     if (!attempt()) cooldown.recordFailure(now);
 *     else cooldown.reset();
 * }
 * ```
 */
class RetryCooldown {
public:
    static constexpr uint64_t DEFAULT_COOLDOWN_MS = 30000;

    explicit RetryCooldown(uint64_t cooldownMs = DEFAULT_COOLDOWN_MS, int failureThreshold = 1);

    void recordFailure(uint64_t nowMs);
    bool isInCooldown(uint64_t nowMs) const;
    void reset();

    int getFailureCount() const { return failureCount_; }
    uint64_t getLastFailureTime() const { return lastFailureMs_; }
    uint64_t getCooldownMs() const { return cooldownMs_; }
    // Time left before a retry is allowed, 0 when not cooling down
    uint64_t getRemainingMs(uint64_t nowMs) const;

private:
    uint64_t cooldownMs_;
    int failureThreshold_;
    int failureCount_ = 0;
    uint64_t lastFailureMs_ = 0;
};
