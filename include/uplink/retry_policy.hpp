#pragma once

#include "net/http.hpp"

#include <chrono>
#include <string>

namespace uplink {

enum class FailureClass : int {
    Transient,
    RateLimited,
    Fatal,
};

const char* FailureClassName(FailureClass c);

struct RetryDecision {
    bool retry = false;
    std::chrono::milliseconds delay{0};
    std::string reason;
};

class RetryPolicy {
public:
    struct Options {
        int max_attempts = 5;
        std::chrono::milliseconds initial_delay{1000};
        std::chrono::milliseconds max_delay{60000};
        double backoff_factor = 1.5;
    };

    RetryPolicy();
    explicit RetryPolicy(Options opt);

    // `api_reason` is the error reason from the response body, if any
    // (e.g. "quotaExceeded"); see ExtractApiErrorReason().
    static FailureClass Classify(const HttpResponse& resp, const std::string& api_reason = {});
    static FailureClass ClassifyStatus(long status, const std::string& api_reason = {});

    // initial * factor^attempt, capped at max_delay.
    std::chrono::milliseconds NextDelay(int attempt) const;

    // `failures` counts failed attempts so far for the current unit of work,
    // including the one being decided (1 for the first failure).
    RetryDecision Decide(FailureClass cls, int failures) const;

    const Options& options() const { return opt_; }

private:
    Options opt_;
};

} // namespace uplink
