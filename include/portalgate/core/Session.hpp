#ifndef INCLUDE_PORTALGATE_CORE_SESSION_HPP
#define INCLUDE_PORTALGATE_CORE_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace portalgate::core
{

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::seconds>;
using Duration = std::chrono::seconds;
using NowProvider = std::function<TimePoint()>;

[[nodiscard]] TimePoint systemNow() noexcept;

[[nodiscard]] std::int64_t toUnixSeconds(TimePoint t) noexcept;
[[nodiscard]] TimePoint fromUnixSeconds(std::int64_t seconds) noexcept;

enum class SessionState : std::uint8_t
{
    Unauthenticated = 0,
    Authenticated = 1,
};

[[nodiscard]] std::string_view toString(SessionState state) noexcept;

// Snapshot of one device's record as observed by a single store read.
// An absent row is reported as Unauthenticated with no timestamps.
struct SessionView final
{
    std::string address;
    SessionState state{ SessionState::Unauthenticated };
    std::optional<std::string> token;
    std::optional<TimePoint> createdAt;
    std::optional<TimePoint> expiresAt;
    std::optional<TimePoint> lastSeenAt;
    // Empty when never recorded.
    std::string userAgent;

    [[nodiscard]] bool isAuthenticated() const noexcept
    {
        return state == SessionState::Authenticated;
    }

    // Seconds left before expiry, zero when unauthenticated or already expired.
    [[nodiscard]] Duration remaining(TimePoint now) const noexcept;
};

[[nodiscard]] SessionView unauthenticatedView(std::string_view address);

} // namespace portalgate::core

#endif // INCLUDE_PORTALGATE_CORE_SESSION_HPP
