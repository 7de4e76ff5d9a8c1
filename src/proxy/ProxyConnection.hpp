#ifndef PORTALGATE_PROXY_PROXYCONNECTION_HPP
#define PORTALGATE_PROXY_PROXYCONNECTION_HPP

#include "RequestFraming.hpp"
#include "RequestHead.hpp"
#include "portalgate/core/PolicyEngine.hpp"
#include "portalgate/storage/ISessionStore.hpp"
#include <array>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <string>

namespace portalgate::proxy
{

struct ProxyOptions final
{
    std::string portalUrl{ "http://127.0.0.1:8080/api/auth/fallback" };
    std::chrono::seconds headTimeout{ 10 };
    std::chrono::seconds connectTimeout{ 10 };
    std::chrono::seconds idleTimeout{ 60 };
    std::size_t maxHeadBytes{ 16384U };
};

// Shared by every connection of one server; outlives them.
struct ProxyContext final
{
    const portalgate::core::PolicyEngine* policy{ nullptr };
    portalgate::storage::ISessionStore* store{ nullptr };
    // Runs blocking store calls off the I/O threads.
    boost::asio::thread_pool* storePool{ nullptr };
    ProxyOptions options;
};

// One accepted client. All handlers run on the strand the client socket was accepted on.
class ProxyConnection final : public std::enable_shared_from_this<ProxyConnection>
{
public:
    ProxyConnection(boost::asio::ip::tcp::socket client, const ProxyContext& context);

    ProxyConnection(const ProxyConnection&) = delete;
    ProxyConnection& operator=(const ProxyConnection&) = delete;
    ProxyConnection(ProxyConnection&&) = delete;
    ProxyConnection& operator=(ProxyConnection&&) = delete;
    ~ProxyConnection() = default;

    void start();

private:
    static constexpr std::size_t kChunkBytes{ 8192U };

    enum class Phase : std::uint8_t
    {
        Head,
        Deciding,
        Connecting,
        Relaying,
        Responding,
        Closed,
    };

    struct Pipe final
    {
        boost::asio::ip::tcp::socket* from{ nullptr };
        boost::asio::ip::tcp::socket* to{ nullptr };
        std::array<char, kChunkBytes> buffer{};
        bool done{ false };
    };

    void readHead();
    void onHeadTimeout(const boost::system::error_code& ec);
    void onHeadParsed(HeadParse parsed);
    void execute(portalgate::core::Action action);

    void sendRedirect();
    void connectUpstream();
    void onUpstreamConnected(const boost::system::error_code& ec);
    void sendBadGateway();
    void flushPendingToUpstream();

    void startRelay();
    void pump(Pipe& pipe);
    void relayFramed(std::size_t n);
    void afterFramedWrite(FrameStop stop);
    void armIdleTimer();
    void finishPipe(Pipe& pipe);

    void recordActivity();
    void writeThenClose(std::shared_ptr<std::string> bytes);
    void closeAll();

    boost::asio::ip::tcp::socket m_client;
    boost::asio::ip::tcp::socket m_upstream;
    boost::asio::ip::tcp::resolver m_resolver;
    boost::asio::steady_timer m_deadline;
    const ProxyContext* m_context{ nullptr };
    std::shared_ptr<spdlog::logger> m_log;

    std::string m_source;
    std::string m_headBuffer;
    std::array<char, kChunkBytes> m_readChunk{};
    RequestHead m_head;
    std::size_t m_headLength{ 0U };
    portalgate::core::Scheme m_scheme{ portalgate::core::Scheme::Plain };
    Phase m_phase{ Phase::Head };

    // Set for plain HTTP once the upstream is connected.
    std::optional<RequestFramer> m_framer;
    std::string m_framed;

    Pipe m_toUpstream;
    Pipe m_toClient;
    std::chrono::steady_clock::time_point m_lastActivity{};
};

} // namespace portalgate::proxy

#endif // PORTALGATE_PROXY_PROXYCONNECTION_HPP
