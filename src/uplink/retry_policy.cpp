#include "uplink/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace uplink {

namespace {

bool IsQuotaReason(const std::string& reason) {
    return reason == "quotaExceeded" || reason == "rateLimitExceeded" ||
           reason == "userRateLimitExceeded" || reason == "dailyLimitExceeded";
}

} // namespace

const char* FailureClassName(FailureClass c) {
    switch (c) {
        case FailureClass::Transient:   return "transient";
        case FailureClass::RateLimited: return "rate_limited";
        case FailureClass::Fatal:       return "fatal";
    }
    return "unknown";
}

RetryPolicy::RetryPolicy() : RetryPolicy(Options{}) {}

RetryPolicy::RetryPolicy(Options opt) : opt_(opt) {
    opt_.max_attempts = std::max(1, opt_.max_attempts);
    opt_.backoff_factor = std::max(1.0, opt_.backoff_factor);
    opt_.max_delay = std::max(opt_.max_delay, opt_.initial_delay);
}

FailureClass RetryPolicy::Classify(const HttpResponse& resp, const std::string& api_reason) {
    switch (resp.net_error) {
        case NetError::None:
            return ClassifyStatus(resp.status, api_reason);
        case NetError::InvalidRequest:
            return FailureClass::Fatal;
        case NetError::Timeout:
        case NetError::ConnectFailed:
        case NetError::ConnectionReset:
        case NetError::Other:
            return FailureClass::Transient;
    }
    return FailureClass::Transient;
}

FailureClass RetryPolicy::ClassifyStatus(long status, const std::string& api_reason) {
    if (status >= 500) return FailureClass::Transient;
    if (status == 408) return FailureClass::Transient;
    if (status == 429) return FailureClass::RateLimited;
    if (status == 403 && IsQuotaReason(api_reason)) return FailureClass::RateLimited;
    return FailureClass::Fatal;
}

std::chrono::milliseconds RetryPolicy::NextDelay(int attempt) const {
    attempt = std::max(0, attempt);
    const double initial = static_cast<double>(opt_.initial_delay.count());
    const double cap = static_cast<double>(opt_.max_delay.count());
    const double raw = initial * std::pow(opt_.backoff_factor, attempt);
    return std::chrono::milliseconds(static_cast<long long>(std::min(raw, cap)));
}

RetryDecision RetryPolicy::Decide(FailureClass cls, int failures) const {
    RetryDecision d;
    if (cls == FailureClass::Fatal) {
        d.reason = "fatal error, not retryable";
        return d;
    }
    if (failures >= opt_.max_attempts) {
        d.reason = "gave up after " + std::to_string(failures) + " attempts";
        return d;
    }
    d.retry = true;
    d.delay = NextDelay(failures - 1);
    d.reason = std::string(FailureClassName(cls)) + " failure, attempt " +
               std::to_string(failures) + " of " + std::to_string(opt_.max_attempts);
    return d;
}

} // namespace uplink
