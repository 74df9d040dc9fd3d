#ifndef EXPIRATIONPOLICY_HPP
#define EXPIRATIONPOLICY_HPP

#include <chrono>
#include <optional>

// TTL arithmetic shared by every backend that cannot expire entries natively.
// Uses system_clock because the file backend reads write instants back from
// file modification times, which are wall-clock.
class ExpirationPolicy {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // A ttl of zero or less means entries never expire.
    explicit ExpirationPolicy(std::chrono::milliseconds ttl);

    bool neverExpires() const { return ttl_.count() == 0; }
    std::chrono::milliseconds ttl() const { return ttl_; }

    // Absolute expiry for an entry written at written_at, or nullopt if it never expires.
    std::optional<TimePoint> expiryFor(TimePoint written_at) const;

    // Strict: an entry is still fresh at the exact instant it expires.
    static bool isStale(const std::optional<TimePoint>& expires_at, TimePoint now);

private:
    std::chrono::milliseconds ttl_;
};

#endif // EXPIRATIONPOLICY_HPP
