#ifndef PORTALGATE_AUTH_FALLBACKPAGE_HPP
#define PORTALGATE_AUTH_FALLBACKPAGE_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace portalgate::auth
{

// Script-free login form for captive-portal sheets that cannot run the full UI.
// All interpolated values are HTML-escaped.
[[nodiscard]] std::string renderLoginForm(std::string_view clientAddress, std::string_view username,
                                          std::string_view errorMessage);

[[nodiscard]] std::string renderSuccessPage(std::string_view clientAddress, std::chrono::seconds expiresIn);

} // namespace portalgate::auth

#endif // PORTALGATE_AUTH_FALLBACKPAGE_HPP
