// SPDX-License-Identifier: Apache-2.0
#include <ai/SseParser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace vocatype;

namespace
{

auto feedAll(SseParser& parser, std::vector<std::string_view> chunks) -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    for (auto const chunk: chunks)
    {
        auto completed = parser.feed(chunk);
        events.insert(events.end(), completed.begin(), completed.end());
    }
    return events;
}

} // namespace

TEST_CASE("SseParser dispatches events on a blank line", "[sse]")
{
    auto parser = SseParser {};
    auto const events = parser.feed("data: {\"a\":1}\n\ndata: second\n\n");
    REQUIRE(events.size() == 2);
    CHECK(events[0].event == "message");
    CHECK(events[0].data == "{\"a\":1}");
    CHECK(events[1].data == "second");
}

TEST_CASE("SseParser holds back an event until it is terminated", "[sse]")
{
    auto parser = SseParser {};
    CHECK(parser.feed("data: partial").empty());
    CHECK(parser.feed("\n").empty());
    auto const events = parser.feed("\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "partial");
}

TEST_CASE("SseParser accepts chunks split anywhere", "[sse]")
{
    auto parser = SseParser {};
    auto const events = feedAll(parser, { "ev", "ent: content_block_delta\r", "\nda", "ta: x", "yz\r\n\r", "\n" });
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "content_block_delta");
    CHECK(events[0].data == "xyz");
}

TEST_CASE("SseParser handles CR, LF and CRLF line endings", "[sse]")
{
    auto parser = SseParser {};
    auto const events = parser.feed("data: a\r\rdata: b\n\ndata: c\r\n\r\n");
    REQUIRE(events.size() == 3);
    CHECK(events[0].data == "a");
    CHECK(events[1].data == "b");
    CHECK(events[2].data == "c");
}

TEST_CASE("SseParser joins multiple data lines with a newline", "[sse]")
{
    auto parser = SseParser {};
    auto const events = parser.feed("data: first\ndata:second\ndata\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "first\nsecond\n");
}

TEST_CASE("SseParser ignores comments and unknown fields", "[sse]")
{
    auto parser = SseParser {};
    auto const events = parser.feed(": keep-alive\n\nretry: 100\nfoo: bar\ndata: payload\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "payload");
}

TEST_CASE("SseParser does not dispatch events without data", "[sse]")
{
    auto parser = SseParser {};
    CHECK(parser.feed("event: ping\n\n").empty());

    // The event name does not leak into the next event.
    auto const events = parser.feed("data: x\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "message");
}

TEST_CASE("SseParser keeps the last event id across events", "[sse]")
{
    auto parser = SseParser {};
    auto const events = parser.feed("id: 7\ndata: a\n\ndata: b\n\n");
    REQUIRE(events.size() == 2);
    CHECK(events[0].id == "7");
    CHECK(events[1].id == "7");
}

TEST_CASE("SseParser::finish flushes an unterminated event", "[sse]")
{
    auto parser = SseParser {};
    CHECK(parser.feed("data: [DONE]").empty());
    auto const last = parser.finish();
    REQUIRE(last.has_value());
    CHECK(last->data == "[DONE]");
    CHECK(!parser.finish().has_value());
}

TEST_CASE("SseParser::reset discards partial state", "[sse]")
{
    auto parser = SseParser {};
    CHECK(parser.feed("id: 3\ndata: stale\n").empty());
    parser.reset();
    auto const events = parser.feed("data: fresh\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "fresh");
    CHECK(events[0].id.empty());
}
