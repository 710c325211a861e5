#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace awx {
namespace auth {

using TimePoint = std::chrono::system_clock::time_point;

// Resolved output of authentication. Static credentials carry no
// expiration; temporary ones always do.
struct CredentialSet {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::optional<std::string> sessionToken;
    std::optional<TimePoint> expiration;
    std::optional<std::string> region;

    bool isTemporary() const { return expiration.has_value(); }

    // Strict: a credential expiring exactly at `now` is already invalid.
    bool validAt(TimePoint now) const {
        return !expiration || *expiration > now;
    }
};

} // namespace auth
} // namespace awx
