#ifndef INCLUDE_PORTALGATE_CORE_AUTHSERVICE_HPP
#define INCLUDE_PORTALGATE_CORE_AUTHSERVICE_HPP

#include "portalgate/core/LoginThrottle.hpp"
#include "portalgate/core/Session.hpp"
#include "portalgate/crypto/ICryptoProvider.hpp"
#include "portalgate/storage/ILoginAuditStore.hpp"
#include "portalgate/storage/ISessionStore.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <spdlog/logger.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace portalgate::core
{

enum class AuthError : std::uint8_t
{
    InvalidCredentials,
    InvalidAddress,
    LockedOut,
    StorageError,
    CryptoError,
};

[[nodiscard]] std::string_view toString(AuthError error) noexcept;

template <class T> using AuthResult = std::variant<T, AuthError>;

struct Credentials final
{
    std::string username;
    std::string password;
};

struct AuthOptions final
{
    Duration sessionTtl{ 3600 };
    ThrottlePolicy throttle{};
};

struct IssuedSession final
{
    std::string address;
    std::string token;
    Duration expiresIn{};
};

class AuthService final
{
public:
    // Throws std::invalid_argument for an empty credential pair or non-positive ttl.
    AuthService(portalgate::storage::ISessionStore& store, portalgate::storage::ILoginAuditStore& audit,
                portalgate::crypto::ICryptoProvider& crypto, const Credentials& credentials, AuthOptions options = {},
                NowProvider now = systemNow);

    AuthService(const AuthService&) = delete;
    AuthService& operator=(const AuthService&) = delete;
    AuthService(AuthService&&) = delete;
    AuthService& operator=(AuthService&&) = delete;
    ~AuthService() = default;

    // Every attempt that reaches the credential check is recorded in the login audit.
    // On a credential mismatch the session store is left untouched.
    [[nodiscard]] AuthResult<IssuedSession> login(std::string_view address, std::string_view username,
                                                  std::string_view password, std::string_view userAgent = {}) noexcept;

    // Succeeds whether or not a session existed.
    [[nodiscard]] AuthResult<std::monostate> logout(std::string_view address) noexcept;

    [[nodiscard]] AuthResult<SessionView> status(std::string_view address) noexcept;

    // True when the address holds a live session issued with `token`; refreshes last_seen_at.
    [[nodiscard]] AuthResult<bool> verify(std::string_view address, std::string_view token) noexcept;

    [[nodiscard]] AuthResult<std::vector<SessionView>> devices(std::size_t limit) noexcept;

    [[nodiscard]] AuthResult<std::size_t> sweepExpired() noexcept;

    // Newest attempts first.
    [[nodiscard]] AuthResult<std::vector<portalgate::storage::LoginAttempt>> loginHistory(std::size_t limit,
                                                                                         std::size_t offset) noexcept;

    [[nodiscard]] AuthResult<std::size_t> pruneLoginHistory() noexcept;

    [[nodiscard]] Duration lockoutRemaining(std::string_view address) const noexcept;

    [[nodiscard]] Duration sessionTtl() const noexcept
    {
        return m_options.sessionTtl;
    }

private:
    [[nodiscard]] bool credentialsMatch(std::string_view username, std::string_view password) const;
    [[nodiscard]] AuthResult<std::string> newToken() noexcept;

    portalgate::storage::ISessionStore* m_store{ nullptr };
    portalgate::crypto::ICryptoProvider* m_crypto{ nullptr };
    AuthOptions m_options;
    portalgate::crypto::Sha256Digest m_usernameDigest{};
    portalgate::crypto::Sha256Digest m_passwordDigest{};
    LoginThrottle m_throttle;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace portalgate::core

#endif // INCLUDE_PORTALGATE_CORE_AUTHSERVICE_HPP
