#include "portalgate/core/AuthService.hpp"

#include "portalgate/core/Address.hpp"
#include "portalgate/log/Loggers.hpp"
#include "portalgate/security/SecureEquals.hpp"
#include "portalgate/storage/StorageErrors.hpp"
#include <array>
#include <exception>
#include <span>
#include <stdexcept>
#include <utility>

namespace portalgate::core
{
namespace
{

// Usernames and user agents are stored truncated to this many bytes.
constexpr std::size_t g_kMaxRecordedField{ 256U };

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

} // namespace

std::string_view toString(AuthError error) noexcept
{
    switch (error)
    {
    case AuthError::InvalidCredentials:
        return "invalid credentials";
    case AuthError::InvalidAddress:
        return "invalid client address";
    case AuthError::LockedOut:
        return "too many failed attempts";
    case AuthError::StorageError:
        return "session storage failure";
    case AuthError::CryptoError:
        break;
    }
    return "crypto failure";
}

AuthService::AuthService(portalgate::storage::ISessionStore& store, portalgate::storage::ILoginAuditStore& audit,
                         portalgate::crypto::ICryptoProvider& crypto, const Credentials& credentials,
                         AuthOptions options, NowProvider now)
    : m_store(&store), m_crypto(&crypto), m_options(options), m_throttle(audit, options.throttle, std::move(now)),
      m_log(portalgate::log::logger("auth"))
{
    if (credentials.username.empty() || credentials.password.empty())
    {
        throw std::invalid_argument("auth: username and password must be configured");
    }
    if (m_options.sessionTtl.count() <= 0)
    {
        throw std::invalid_argument("auth: session ttl must be positive");
    }

    m_usernameDigest = m_crypto->sha256(asBytes(credentials.username));
    m_passwordDigest = m_crypto->sha256(asBytes(credentials.password));
}

bool AuthService::credentialsMatch(std::string_view username, std::string_view password) const
{
    const auto userDigest{ m_crypto->sha256(asBytes(username)) };
    const auto passDigest{ m_crypto->sha256(asBytes(password)) };

    // Both comparisons always run so the outcome does not reveal which field was wrong.
    const bool userOk{ portalgate::security::secureEquals(std::span{ userDigest }, std::span{ m_usernameDigest }) };
    const bool passOk{ portalgate::security::secureEquals(std::span{ passDigest }, std::span{ m_passwordDigest }) };
    return userOk & passOk;
}

AuthResult<std::string> AuthService::newToken() noexcept
{
    try
    {
        std::array<std::uint8_t, portalgate::crypto::g_sessionTokenBytes> rnd{};
        if (!m_crypto->randomBytes(std::span<std::uint8_t>{ rnd }))
        {
            return AuthError::CryptoError;
        }
        return toHex(std::span<const std::uint8_t>{ rnd });
    }
    catch (const std::exception&)
    {
        return AuthError::CryptoError;
    }
}

AuthResult<IssuedSession> AuthService::login(std::string_view address, std::string_view username,
                                             std::string_view password, std::string_view userAgent) noexcept
{
    try
    {
        const auto key{ normalizeAddress(address) };
        if (!key.has_value())
        {
            return AuthError::InvalidAddress;
        }
        const auto recordedName{ username.substr(0, g_kMaxRecordedField) };
        const auto recordedAgent{ userAgent.substr(0, g_kMaxRecordedField) };

        if (const auto locked{ m_throttle.lockedFor(*key) }; locked.count() > 0)
        {
            m_log->warn("[{}] login refused, locked out for {}s", *key, locked.count());
            return AuthError::LockedOut;
        }

        if (!credentialsMatch(username, password))
        {
            if (m_throttle.recordFailure(*key, recordedName, recordedAgent))
            {
                m_log->warn("[{}] address locked after repeated failures", *key);
            }
            m_log->warn("[{}] login failed for user '{}'", *key, username);
            return AuthError::InvalidCredentials;
        }

        auto token{ newToken() };
        if (std::holds_alternative<AuthError>(token))
        {
            m_log->error("[{}] could not generate a session token", *key);
            return std::get<AuthError>(token);
        }

        m_store->put(*key, std::get<std::string>(token), m_options.sessionTtl);
        try
        {
            m_store->setUserAgent(*key, recordedAgent);
            m_throttle.recordSuccess(*key, recordedName, recordedAgent);
        }
        catch (const portalgate::storage::StoreIoError& e)
        {
            // The session is already committed; only the audit trail is incomplete.
            m_log->warn("[{}] login audit not recorded: {}", *key, e.what());
        }
        m_log->info("[{}] login succeeded for user '{}'", *key, username);

        return IssuedSession{ *key, std::move(std::get<std::string>(token)), m_options.sessionTtl };
    }
    catch (const portalgate::storage::StoreIoError& e)
    {
        m_log->error("[{}] login could not persist the session: {}", address, e.what());
        return AuthError::StorageError;
    }
    catch (const std::invalid_argument& e)
    {
        m_log->warn("[{}] login rejected: {}", address, e.what());
        return AuthError::InvalidAddress;
    }
    catch (const std::exception& e)
    {
        m_log->error("[{}] login failed: {}", address, e.what());
        return AuthError::CryptoError;
    }
}

AuthResult<std::monostate> AuthService::logout(std::string_view address) noexcept
{
    try
    {
        const auto key{ normalizeAddress(address) };
        if (!key.has_value())
        {
            return AuthError::InvalidAddress;
        }
        m_store->remove(*key);
        m_log->info("[{}] logged out", *key);
        return std::monostate{};
    }
    catch (const portalgate::storage::StoreIoError& e)
    {
        m_log->error("[{}] logout failed: {}", address, e.what());
        return AuthError::StorageError;
    }
    catch (const std::exception& e)
    {
        m_log->error("[{}] logout failed: {}", address, e.what());
        return AuthError::StorageError;
    }
}

AuthResult<SessionView> AuthService::status(std::string_view address) noexcept
{
    try
    {
        const auto key{ normalizeAddress(address) };
        if (!key.has_value())
        {
            return AuthError::InvalidAddress;
        }
        return m_store->get(*key);
    }
    catch (const std::exception& e)
    {
        m_log->error("[{}] status lookup failed: {}", address, e.what());
        return AuthError::StorageError;
    }
}

AuthResult<bool> AuthService::verify(std::string_view address, std::string_view token) noexcept
{
    try
    {
        const auto key{ normalizeAddress(address) };
        if (!key.has_value())
        {
            return AuthError::InvalidAddress;
        }

        const auto view{ m_store->get(*key) };
        if (!view.isAuthenticated() || !view.token.has_value() ||
            !portalgate::security::secureEquals(std::string_view{ *view.token }, token))
        {
            m_log->warn("[{}] session verification failed", *key);
            return false;
        }

        m_store->touch(*key);
        return true;
    }
    catch (const std::exception& e)
    {
        m_log->error("[{}] session verification failed: {}", address, e.what());
        return AuthError::StorageError;
    }
}

AuthResult<std::vector<SessionView>> AuthService::devices(std::size_t limit) noexcept
{
    try
    {
        return m_store->list(limit);
    }
    catch (const std::exception& e)
    {
        m_log->error("device listing failed: {}", e.what());
        return AuthError::StorageError;
    }
}

AuthResult<std::size_t> AuthService::sweepExpired() noexcept
{
    try
    {
        return m_store->sweepExpired();
    }
    catch (const std::exception& e)
    {
        m_log->error("expired-session sweep failed: {}", e.what());
        return AuthError::StorageError;
    }
}

AuthResult<std::vector<portalgate::storage::LoginAttempt>> AuthService::loginHistory(std::size_t limit,
                                                                                     std::size_t offset) noexcept
{
    try
    {
        return m_throttle.history(limit, offset);
    }
    catch (const std::exception& e)
    {
        m_log->error("login history listing failed: {}", e.what());
        return AuthError::StorageError;
    }
}

AuthResult<std::size_t> AuthService::pruneLoginHistory() noexcept
{
    try
    {
        return m_throttle.prune();
    }
    catch (const std::exception& e)
    {
        m_log->error("login history pruning failed: {}", e.what());
        return AuthError::StorageError;
    }
}

Duration AuthService::lockoutRemaining(std::string_view address) const noexcept
{
    try
    {
        const auto key{ normalizeAddress(address) };
        return key.has_value() ? m_throttle.lockedFor(*key) : Duration{ 0 };
    }
    catch (const std::exception&)
    {
        return Duration{ 0 };
    }
}

} // namespace portalgate::core
