#pragma once

#include <chrono>
#include <thread>
#include <string>

// Fixed-delay retry budget applied uniformly to each endpoint or backend.
struct RetryPolicy {
    int max_attempts = 3;
    int delay_ms = 2000;

    bool exhausted(int attempt) const { return attempt >= max_attempts; }

    void pause() const {
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
};

enum class AttemptOutcome {
    Success,
    Retryable,  // try the same target again
    Failover,   // give up on this target, move to the next
    Terminal    // stop, surface to the caller
};

inline std::string to_string(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Success: return "success";
        case AttemptOutcome::Retryable: return "retryable";
        case AttemptOutcome::Failover: return "failover";
        case AttemptOutcome::Terminal: return "terminal";
    }
    return "terminal";
}
