#include "RetryCooldown.h"

RetryCooldown::RetryCooldown(uint64_t cooldownMs, int failureThreshold)
    : cooldownMs_(cooldownMs)
    , failureThreshold_(failureThreshold > 0 ? failureThreshold : 1) {
}

void RetryCooldown::recordFailure(uint64_t nowMs) {
    failureCount_++;
    lastFailureMs_ = nowMs;
}

bool RetryCooldown::isInCooldown(uint64_t nowMs) const {
    if (failureCount_ < failureThreshold_) {
        return false;
    }
    // Clock going backwards counts as still cooling down
    if (nowMs < lastFailureMs_) {
        return true;
    }
    return nowMs - lastFailureMs_ < cooldownMs_;
}

void RetryCooldown::reset() {
    failureCount_ = 0;
    lastFailureMs_ = 0;
}

uint64_t RetryCooldown::getRemainingMs(uint64_t nowMs) const {
    if (!isInCooldown(nowMs)) {
        return 0;
    }
    if (nowMs < lastFailureMs_) {
        return cooldownMs_;
    }
    return cooldownMs_ - (nowMs - lastFailureMs_);
}
