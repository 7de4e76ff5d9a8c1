#include "portalgate/core/Session.hpp"

namespace portalgate::core
{

TimePoint systemNow() noexcept
{
    return std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
}

std::int64_t toUnixSeconds(TimePoint t) noexcept
{
    return static_cast<std::int64_t>(t.time_since_epoch().count());
}

TimePoint fromUnixSeconds(std::int64_t seconds) noexcept
{
    return TimePoint{ std::chrono::seconds{ seconds } };
}

std::string_view toString(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::Authenticated:
        return "authenticated";
    case SessionState::Unauthenticated:
        break;
    }
    return "unauthenticated";
}

Duration SessionView::remaining(TimePoint now) const noexcept
{
    if (!isAuthenticated() || !expiresAt.has_value() || *expiresAt <= now)
    {
        return Duration{ 0 };
    }
    return std::chrono::duration_cast<Duration>(*expiresAt - now);
}

SessionView unauthenticatedView(std::string_view address)
{
    SessionView view{};
    view.address = std::string{ address };
    return view;
}

} // namespace portalgate::core
