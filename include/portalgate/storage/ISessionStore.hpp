#ifndef INCLUDE_PORTALGATE_STORAGE_ISESSIONSTORE_HPP
#define INCLUDE_PORTALGATE_STORAGE_ISESSIONSTORE_HPP

#include "portalgate/core/Session.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace portalgate::storage
{

// Durable per-address session records. Implementations must be safe for concurrent use
// from many threads; every mutation is committed before the call returns.
// Malformed addresses throw std::invalid_argument, storage failures throw StoreIoError.
class ISessionStore
{
public:
    ISessionStore() = default;
    ISessionStore(const ISessionStore&) = delete;
    ISessionStore& operator=(const ISessionStore&) = delete;
    ISessionStore(ISessionStore&&) = delete;
    ISessionStore& operator=(ISessionStore&&) = delete;
    virtual ~ISessionStore() = default;

    // Never creates a row. An expired authenticated row is demoted before returning.
    [[nodiscard]] virtual portalgate::core::SessionView get(std::string_view address) = 0;

    // Creates or overwrites the record in one atomic statement.
    virtual void put(std::string_view address, std::string_view token, portalgate::core::Duration ttl) = 0;

    // Records the browser a device authenticated with; absent rows are left absent.
    virtual void setUserAgent(std::string_view address, std::string_view userAgent) = 0;

    // Idempotent.
    virtual void remove(std::string_view address) = 0;

    // Refreshes last_seen_at of an existing row; absent rows are left absent.
    virtual void touch(std::string_view address) = 0;

    [[nodiscard]] virtual std::vector<portalgate::core::SessionView> list(std::size_t limit) = 0;

    // Demotes every expired authenticated row, returns how many were demoted.
    virtual std::size_t sweepExpired() = 0;
};

} // namespace portalgate::storage

#endif // INCLUDE_PORTALGATE_STORAGE_ISESSIONSTORE_HPP
