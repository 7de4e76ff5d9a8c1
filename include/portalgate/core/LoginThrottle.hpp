#ifndef INCLUDE_PORTALGATE_CORE_LOGINTHROTTLE_HPP
#define INCLUDE_PORTALGATE_CORE_LOGINTHROTTLE_HPP

#include "portalgate/core/Session.hpp"
#include "portalgate/storage/ILoginAuditStore.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace portalgate::core
{

struct ThrottlePolicy final
{
    // Zero disables lockout; attempts are still recorded.
    std::size_t maxFailures{ 5U };
    Duration window{ 3600 };
    Duration lockout{ 300 };
    // Attempt history older than this is deleted. Never shorter than `window`.
    Duration retention{ 7 * 24 * 3600 };
};

// Failed-login lockout kept in the login audit store, so it holds across restarts and is
// shared by every auth process on the same database. Reaching maxFailures inside the
// window locks the address for the lockout duration; a successful login resets the count.
// Storage failures propagate as StoreIoError.
class LoginThrottle final
{
public:
    LoginThrottle(portalgate::storage::ILoginAuditStore& audit, ThrottlePolicy policy, NowProvider now = systemNow);

    LoginThrottle(const LoginThrottle&) = delete;
    LoginThrottle& operator=(const LoginThrottle&) = delete;
    LoginThrottle(LoginThrottle&&) = delete;
    LoginThrottle& operator=(LoginThrottle&&) = delete;
    ~LoginThrottle() = default;

    // Time left on the address' lockout, zero when it may attempt a login.
    [[nodiscard]] Duration lockedFor(std::string_view address) const;

    // Returns true when this failure started a lockout.
    bool recordFailure(std::string_view address, std::string_view username, std::string_view userAgent);

    void recordSuccess(std::string_view address, std::string_view username, std::string_view userAgent);

    // Newest first.
    [[nodiscard]] std::vector<portalgate::storage::LoginAttempt> history(std::size_t limit, std::size_t offset) const;

    // Deletes history past the retention period and ended lockouts; returns the rows removed.
    std::size_t prune();

private:
    portalgate::storage::ILoginAuditStore* m_audit{ nullptr };
    ThrottlePolicy m_policy;
    NowProvider m_now;
};

} // namespace portalgate::core

#endif // INCLUDE_PORTALGATE_CORE_LOGINTHROTTLE_HPP
