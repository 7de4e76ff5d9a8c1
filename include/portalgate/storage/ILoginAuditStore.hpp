#ifndef INCLUDE_PORTALGATE_STORAGE_ILOGINAUDITSTORE_HPP
#define INCLUDE_PORTALGATE_STORAGE_ILOGINAUDITSTORE_HPP

#include "portalgate/core/Session.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portalgate::storage
{

struct LoginAttempt final
{
    std::string address;
    std::string username;
    bool success{ false };
    portalgate::core::TimePoint attemptedAt{};
    std::string userAgent;
};

// Durable history of login attempts and the address lockouts derived from it.
// Same error contract as ISessionStore: malformed addresses throw std::invalid_argument,
// storage failures throw StoreIoError.
class ILoginAuditStore
{
public:
    ILoginAuditStore() = default;
    ILoginAuditStore(const ILoginAuditStore&) = delete;
    ILoginAuditStore& operator=(const ILoginAuditStore&) = delete;
    ILoginAuditStore(ILoginAuditStore&&) = delete;
    ILoginAuditStore& operator=(ILoginAuditStore&&) = delete;
    virtual ~ILoginAuditStore() = default;

    // Appends one attempt stamped with the current time.
    virtual void recordAttempt(std::string_view address, std::string_view username, bool success,
                               std::string_view userAgent) = 0;

    // Failed attempts from `address` made after `since` and after its latest success.
    [[nodiscard]] virtual std::size_t failuresSince(std::string_view address, portalgate::core::TimePoint since) = 0;

    // End of the address' lockout, nullopt when it is not locked now.
    [[nodiscard]] virtual std::optional<portalgate::core::TimePoint> lockedUntil(std::string_view address) = 0;

    virtual void lock(std::string_view address, portalgate::core::TimePoint until, std::size_t failures) = 0;

    // Newest first.
    [[nodiscard]] virtual std::vector<LoginAttempt> attempts(std::size_t limit, std::size_t offset) = 0;

    // Deletes attempts made before `before` and lockouts that have ended. Returns the rows removed.
    virtual std::size_t prune(portalgate::core::TimePoint before) = 0;
};

} // namespace portalgate::storage

#endif // INCLUDE_PORTALGATE_STORAGE_ILOGINAUDITSTORE_HPP
