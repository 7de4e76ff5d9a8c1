#ifndef PORTALGATE_PROXY_REQUESTFRAMING_HPP
#define PORTALGATE_PROXY_REQUESTFRAMING_HPP

#include "RequestHead.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace portalgate::proxy
{

enum class FrameStop : std::uint8_t
{
    None,
    OtherTarget,
    BadHead,
};

[[nodiscard]] std::string_view toString(FrameStop stop) noexcept;

struct FrameStep final
{
    // Bytes that may be written to the upstream, in order.
    std::string forward;
    FrameStop stop{ FrameStop::None };
};

// Follows request boundaries on a kept-alive plain HTTP connection. Every request after the
// first must name the same host and port; the first one that does not ends the stream and
// none of its bytes are released. Bodies are delimited by Content-Length or chunked coding.
// A body with any other framing is passed through untouched until the connection ends.
class RequestFramer final
{
public:
    // `first` is the head already forwarded; its body is expected next.
    RequestFramer(const RequestHead& first, std::size_t maxHeadBytes);

    [[nodiscard]] FrameStep feed(std::string_view bytes);

    [[nodiscard]] bool stopped() const noexcept
    {
        return m_stopped;
    }

private:
    enum class State : std::uint8_t
    {
        Head,
        Body,
        ChunkSize,
        ChunkData,
        ChunkDataEnd,
        Trailer,
        Opaque,
    };

    void beginBody(const RequestHead& head);
    [[nodiscard]] bool sameTarget(const RequestHead& head) const noexcept;
    [[nodiscard]] std::size_t consumeBody(std::string_view bytes, std::string& out);
    [[nodiscard]] std::size_t consumeLine(std::string_view bytes, std::string& out, bool& complete);

    static constexpr std::size_t kMaxLineBytes{ 4096U };

    std::string m_host;
    std::uint16_t m_port{ 0 };
    std::size_t m_maxHeadBytes{ 0U };

    State m_state{ State::Head };
    std::uint64_t m_remaining{ 0U };
    std::string m_pending;
    std::string m_line;
    bool m_stopped{ false };
};

} // namespace portalgate::proxy

#endif // PORTALGATE_PROXY_REQUESTFRAMING_HPP
