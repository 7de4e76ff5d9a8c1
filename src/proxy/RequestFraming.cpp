#include "RequestFraming.hpp"

#include "portalgate/net/HttpText.hpp"
#include <algorithm>
#include <charconv>
#include <optional>
#include <system_error>

namespace portalgate::proxy
{
namespace
{

[[nodiscard]] std::optional<std::uint64_t> parseNumber(std::string_view text, int base) noexcept
{
    text = portalgate::net::trim(text);
    std::uint64_t value{};
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(text.data(), last, value, base) };
    if (text.empty() || ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

// True when "chunked" is the final transfer coding.
[[nodiscard]] bool isChunked(std::string_view codings) noexcept
{
    const auto comma{ codings.rfind(',') };
    const auto last{ (comma == std::string_view::npos) ? codings : codings.substr(comma + 1U) };
    return portalgate::net::iequals(portalgate::net::trim(last), "chunked");
}

} // namespace

std::string_view toString(FrameStop stop) noexcept
{
    switch (stop)
    {
    case FrameStop::None:
        return "none";
    case FrameStop::OtherTarget:
        return "request for another target";
    case FrameStop::BadHead:
        break;
    }
    return "unusable request head";
}

RequestFramer::RequestFramer(const RequestHead& first, std::size_t maxHeadBytes)
    : m_host(first.host), m_port(first.port), m_maxHeadBytes(maxHeadBytes)
{
    beginBody(first);
}

void RequestFramer::beginBody(const RequestHead& head)
{
    m_remaining = 0U;
    if (const auto codings{ head.header("Transfer-Encoding") }; codings.has_value())
    {
        m_state = isChunked(*codings) ? State::ChunkSize : State::Opaque;
        return;
    }
    if (const auto length{ head.header("Content-Length") }; length.has_value())
    {
        const auto value{ parseNumber(*length, 10) };
        if (!value.has_value())
        {
            m_state = State::Opaque;
            return;
        }
        m_remaining = *value;
        m_state = (m_remaining == 0U) ? State::Head : State::Body;
        return;
    }
    m_state = State::Head;
}

bool RequestFramer::sameTarget(const RequestHead& head) const noexcept
{
    return !portalgate::net::iequals(head.method, "CONNECT") && head.port == m_port &&
           portalgate::net::iequals(head.host, m_host);
}

FrameStep RequestFramer::feed(std::string_view bytes)
{
    FrameStep step{};
    if (m_stopped)
    {
        return step;
    }

    std::string carry{};
    while (!bytes.empty())
    {
        if (m_state == State::Opaque)
        {
            step.forward.append(bytes);
            break;
        }
        if (m_state != State::Head)
        {
            bytes.remove_prefix(consumeBody(bytes, step.forward));
            continue;
        }

        m_pending.append(bytes);
        bytes = {};
        // Stray line breaks between requests are tolerated and dropped.
        m_pending.erase(0, std::min(m_pending.find_first_not_of("\r\n"), m_pending.size()));
        if (m_pending.empty())
        {
            break;
        }

        auto parsed{ parseRequestHead(m_pending, m_maxHeadBytes) };
        if (parsed.status == HeadStatus::Incomplete)
        {
            break;
        }
        if (parsed.status != HeadStatus::Complete)
        {
            step.stop = FrameStop::BadHead;
            break;
        }
        if (!sameTarget(parsed.head))
        {
            step.stop = FrameStop::OtherTarget;
            break;
        }

        step.forward.append(m_pending, 0U, parsed.length);
        carry = m_pending.substr(parsed.length);
        m_pending.clear();
        beginBody(parsed.head);
        bytes = carry;
    }

    if (step.stop != FrameStop::None)
    {
        m_stopped = true;
        m_pending.clear();
    }
    return step;
}

std::size_t RequestFramer::consumeBody(std::string_view bytes, std::string& out)
{
    switch (m_state)
    {
    case State::Body:
    case State::ChunkData:
    {
        const auto n{ static_cast<std::size_t>(std::min<std::uint64_t>(m_remaining, bytes.size())) };
        out.append(bytes.substr(0, n));
        m_remaining -= n;
        if (m_remaining == 0U)
        {
            m_state = (m_state == State::Body) ? State::Head : State::ChunkDataEnd;
        }
        return n;
    }
    case State::ChunkSize:
    case State::ChunkDataEnd:
    case State::Trailer:
        break;
    case State::Head:
    case State::Opaque:
        return 0U;
    }

    bool complete{ false };
    const auto used{ consumeLine(bytes, out, complete) };
    if (!complete)
    {
        return used;
    }

    std::string_view line{ m_line };
    if (!line.empty() && line.back() == '\r')
    {
        line.remove_suffix(1U);
    }

    if (m_state == State::ChunkSize)
    {
        const auto size{ parseNumber(line.substr(0, line.find(';')), 16) };
        if (!size.has_value())
        {
            m_state = State::Opaque;
        }
        else
        {
            m_remaining = *size;
            m_state = (m_remaining == 0U) ? State::Trailer : State::ChunkData;
        }
    }
    else if (m_state == State::ChunkDataEnd)
    {
        m_state = line.empty() ? State::ChunkSize : State::Opaque;
    }
    else if (line.empty())
    {
        m_state = State::Head;
    }
    m_line.clear();
    return used;
}

std::size_t RequestFramer::consumeLine(std::string_view bytes, std::string& out, bool& complete)
{
    const auto newline{ bytes.find('\n') };
    complete = (newline != std::string_view::npos);
    const auto used{ complete ? newline + 1U : bytes.size() };

    out.append(bytes.substr(0, used));
    m_line.append(bytes.substr(0, complete ? newline : used));
    if (!complete && m_line.size() > kMaxLineBytes)
    {
        // Not chunked framing after all; stop interpreting the stream.
        m_state = State::Opaque;
        m_line.clear();
    }
    return used;
}

} // namespace portalgate::proxy
