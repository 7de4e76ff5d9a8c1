#include "portalgate/core/LoginThrottle.hpp"

#include <algorithm>
#include <utility>

namespace portalgate::core
{

LoginThrottle::LoginThrottle(portalgate::storage::ILoginAuditStore& audit, ThrottlePolicy policy, NowProvider now)
    : m_audit(&audit), m_policy(policy), m_now(std::move(now))
{
    m_policy.retention = std::max(m_policy.retention, m_policy.window);
}

Duration LoginThrottle::lockedFor(std::string_view address) const
{
    if (m_policy.maxFailures == 0U)
    {
        return Duration{ 0 };
    }

    const auto until{ m_audit->lockedUntil(address) };
    if (!until.has_value())
    {
        return Duration{ 0 };
    }
    const auto now{ m_now() };
    return (*until > now) ? std::chrono::duration_cast<Duration>(*until - now) : Duration{ 0 };
}

bool LoginThrottle::recordFailure(std::string_view address, std::string_view username, std::string_view userAgent)
{
    const auto now{ m_now() };
    m_audit->recordAttempt(address, username, false, userAgent);
    // Keeps the history within the retention period however many addresses fail.
    (void)prune();

    if (m_policy.maxFailures == 0U || m_audit->lockedUntil(address).has_value())
    {
        return false;
    }

    const auto failures{ m_audit->failuresSince(address, now - m_policy.window) };
    if (failures < m_policy.maxFailures)
    {
        return false;
    }
    m_audit->lock(address, now + m_policy.lockout, failures);
    return true;
}

void LoginThrottle::recordSuccess(std::string_view address, std::string_view username, std::string_view userAgent)
{
    m_audit->recordAttempt(address, username, true, userAgent);
}

std::vector<portalgate::storage::LoginAttempt> LoginThrottle::history(std::size_t limit, std::size_t offset) const
{
    return m_audit->attempts(limit, offset);
}

std::size_t LoginThrottle::prune()
{
    return m_audit->prune(m_now() - m_policy.retention);
}

} // namespace portalgate::core
