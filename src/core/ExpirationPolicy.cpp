#include "ExpirationPolicy.hpp"

ExpirationPolicy::ExpirationPolicy(std::chrono::milliseconds ttl)
    : ttl_(ttl.count() > 0 ? ttl : std::chrono::milliseconds(0)) {}

std::optional<ExpirationPolicy::TimePoint> ExpirationPolicy::expiryFor(TimePoint written_at) const {
    if (neverExpires()) {
        return std::nullopt;
    }
    // Saturate instead of overflowing the clock's representation.
    auto headroom = TimePoint::max() - written_at;
    if (ttl_ >= std::chrono::duration_cast<std::chrono::milliseconds>(headroom)) {
        return TimePoint::max();
    }
    return written_at + std::chrono::duration_cast<Clock::duration>(ttl_);
}

bool ExpirationPolicy::isStale(const std::optional<TimePoint>& expires_at, TimePoint now) {
    return expires_at.has_value() && now > *expires_at;
}
