#include "RequestFraming.hpp"

#include <gtest/gtest.h>
#include <string>

namespace
{

using portalgate::proxy::FrameStop;
using portalgate::proxy::parseRequestHead;
using portalgate::proxy::RequestFramer;
using portalgate::proxy::RequestHead;

constexpr std::size_t g_kLimit{ 16384U };

[[nodiscard]] RequestHead headOf(const std::string& raw)
{
    auto parsed{ parseRequestHead(raw, g_kLimit) };
    EXPECT_EQ(parsed.status, portalgate::proxy::HeadStatus::Complete);
    return parsed.head;
}

} // namespace

TEST(RequestFraming, FollowUpRequestForSameTargetIsReleased)
{
    RequestFramer framer{ headOf("GET http://a.test/one HTTP/1.1\r\nHost: a.test\r\n\r\n"), g_kLimit };

    const std::string next{ "GET /two HTTP/1.1\r\nHost: A.TEST:80\r\n\r\n" };
    const auto step{ framer.feed(next) };

    EXPECT_EQ(step.stop, FrameStop::None);
    EXPECT_EQ(step.forward, next);
    EXPECT_FALSE(framer.stopped());
}

TEST(RequestFraming, RequestForAnotherTargetIsWithheld)
{
    RequestFramer framer{ headOf("GET http://a.test/ HTTP/1.1\r\nHost: a.test\r\n\r\n"), g_kLimit };

    const auto step{ framer.feed("GET http://b.test/ HTTP/1.1\r\nHost: b.test\r\n\r\n") };

    EXPECT_EQ(step.stop, FrameStop::OtherTarget);
    EXPECT_TRUE(step.forward.empty());
    EXPECT_TRUE(framer.stopped());
    EXPECT_TRUE(framer.feed("more").forward.empty());
}

TEST(RequestFraming, DifferentPortIsAnotherTarget)
{
    RequestFramer framer{ headOf("GET / HTTP/1.1\r\nHost: a.test:8080\r\n\r\n"), g_kLimit };

    EXPECT_EQ(framer.feed("GET / HTTP/1.1\r\nHost: a.test:8081\r\n\r\n").stop, FrameStop::OtherTarget);
}

TEST(RequestFraming, ContentLengthBodyIsNotMistakenForAHead)
{
    RequestFramer framer{ headOf("POST /submit HTTP/1.1\r\nHost: a.test\r\nContent-Length: 45\r\n\r\n"), g_kLimit };

    // The body happens to look like a request for another host.
    const std::string body{ "GET http://b.test/ HTTP/1.1\r\nHost: b.test\r\n\r\n" };
    ASSERT_EQ(body.size(), 45U);
    const std::string next{ "GET /after HTTP/1.1\r\nHost: a.test\r\n\r\n" };

    const auto step{ framer.feed(body + next) };
    EXPECT_EQ(step.stop, FrameStop::None);
    EXPECT_EQ(step.forward, body + next);
}

TEST(RequestFraming, HeadSplitAcrossReadsIsHeldUntilComplete)
{
    RequestFramer framer{ headOf("GET / HTTP/1.1\r\nHost: a.test\r\n\r\n"), g_kLimit };

    const auto first{ framer.feed("GET /x HTTP/1.1\r\nHo") };
    EXPECT_TRUE(first.forward.empty());
    EXPECT_EQ(first.stop, FrameStop::None);

    const auto second{ framer.feed("st: b.test\r\n\r\n") };
    EXPECT_EQ(second.stop, FrameStop::OtherTarget);
    EXPECT_TRUE(second.forward.empty());
}

TEST(RequestFraming, ChunkedBodyIsFollowedToItsEnd)
{
    RequestFramer framer{ headOf("POST / HTTP/1.1\r\nHost: a.test\r\nTransfer-Encoding: gzip, chunked\r\n\r\n"),
                          g_kLimit };

    const std::string body{ "5;ext=1\r\nhello\r\n3\r\nGET\r\n0\r\nX-Trailer: t\r\n\r\n" };
    const auto released{ framer.feed(body.substr(0, 11U)) };
    const auto rest{ framer.feed(body.substr(11U)) };
    EXPECT_EQ(released.forward + rest.forward, body);
    EXPECT_EQ(rest.stop, FrameStop::None);

    EXPECT_EQ(framer.feed("GET / HTTP/1.1\r\nHost: b.test\r\n\r\n").stop, FrameStop::OtherTarget);
}

TEST(RequestFraming, UnknownBodyFramingPassesThrough)
{
    RequestFramer framer{ headOf("POST / HTTP/1.1\r\nHost: a.test\r\nTransfer-Encoding: gzip\r\n\r\n"), g_kLimit };

    const std::string tail{ "GET / HTTP/1.1\r\nHost: b.test\r\n\r\n" };
    const auto step{ framer.feed(tail) };
    EXPECT_EQ(step.stop, FrameStop::None);
    EXPECT_EQ(step.forward, tail);
}

TEST(RequestFraming, MalformedFollowUpHeadStops)
{
    RequestFramer framer{ headOf("GET / HTTP/1.1\r\nHost: a.test\r\n\r\n"), g_kLimit };

    EXPECT_EQ(framer.feed("\r\nNOT A REQUEST\r\n\r\n").stop, FrameStop::BadHead);
}

TEST(RequestFraming, FollowUpConnectIsAnotherTarget)
{
    RequestFramer framer{ headOf("GET / HTTP/1.1\r\nHost: a.test:443\r\n\r\n"), g_kLimit };

    EXPECT_EQ(framer.feed("CONNECT a.test:443 HTTP/1.1\r\nHost: a.test:443\r\n\r\n").stop, FrameStop::OtherTarget);
}
