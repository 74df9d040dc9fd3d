#pragma once

#include <optional>
#include <string>

#include "../core/ExpirationPolicy.hpp"

// What a store knows about a present key without reading its payload.
// expires_at is empty when the entry never expires, or when the store
// enforces expiry itself.
struct EntryStamp {
    std::optional<ExpirationPolicy::TimePoint> expires_at;
};

struct StoredEntry {
    std::string payload;
    std::optional<ExpirationPolicy::TimePoint> expires_at;
};
