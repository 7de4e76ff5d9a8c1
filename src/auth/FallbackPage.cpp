#include "FallbackPage.hpp"

#include "portalgate/net/HttpText.hpp"

namespace portalgate::auth
{
namespace
{

constexpr std::string_view g_kHead{ "<!DOCTYPE html><html><head><meta charset=\"utf-8\">"
                                    "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">"
                                    "<title>Network sign-in</title>"
                                    "<style>body{font-family:sans-serif;max-width:24em;margin:2em auto;padding:0 1em}"
                                    "input{display:block;width:100%;margin:.4em 0 1em;padding:.5em}"
                                    ".error{color:#b00020}</style></head><body>" };
constexpr std::string_view g_kTail{ "</body></html>" };

} // namespace

std::string renderLoginForm(std::string_view clientAddress, std::string_view username, std::string_view errorMessage)
{
    using portalgate::net::htmlEscape;

    std::string page{ g_kHead };
    page.append("<h1>Network sign-in</h1>");
    page.append("<p>Sign in to use the Internet from this device.</p>");
    if (!errorMessage.empty())
    {
        page.append("<p class=\"error\">").append(htmlEscape(errorMessage)).append("</p>");
    }
    page.append("<form method=\"post\" action=\"/api/auth/fallback\">");
    page.append("<label>Username<input name=\"username\" autocomplete=\"username\" value=\"")
        .append(htmlEscape(username))
        .append("\"></label>");
    page.append("<label>Password<input name=\"password\" type=\"password\" autocomplete=\"current-password\">"
                "</label>");
    page.append("<input type=\"hidden\" name=\"client_ip\" value=\"").append(htmlEscape(clientAddress)).append("\">");
    page.append("<input type=\"submit\" value=\"Sign in\">");
    page.append("</form>");
    if (!clientAddress.empty())
    {
        page.append("<p><small>Device ").append(htmlEscape(clientAddress)).append("</small></p>");
    }
    page.append(g_kTail);
    return page;
}

std::string renderSuccessPage(std::string_view clientAddress, std::chrono::seconds expiresIn)
{
    using portalgate::net::htmlEscape;

    constexpr long long kSecondsPerMinute{ 60 };

    std::string page{ g_kHead };
    page.append("<h1>You are online</h1>");
    page.append("<p>Device ").append(htmlEscape(clientAddress)).append(" may now use the network.</p>");
    page.append("<p>The session lasts ")
        .append(std::to_string(static_cast<long long>(expiresIn.count()) / kSecondsPerMinute))
        .append(" minutes.</p>");
    page.append(g_kTail);
    return page;
}

} // namespace portalgate::auth
