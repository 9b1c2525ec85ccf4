#include <catch2/catch_test_macros.hpp>

#include "mcpenum/transport/sse_parser.hpp"

using namespace mcpenum;

TEST_CASE("SseParser parses single event", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("data: {\"jsonrpc\":\"2.0\"}\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "{\"jsonrpc\":\"2.0\"}");
    CHECK(events[0].is_message());
}

TEST_CASE("SseParser parses event with all fields", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("id: 42\nevent: message\ndata: payload\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].id == std::optional<std::string>("42"));
    CHECK(events[0].event == std::optional<std::string>("message"));
    CHECK(events[0].is_message());
}

TEST_CASE("SseParser concatenates multiple data lines", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("data: {\"a\":\ndata: 1}\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "{\"a\":\n1}");
}

TEST_CASE("SseParser handles chunked input", "[sse][parser]") {
    SseParser parser;
    CHECK(parser.feed("da").empty());
    CHECK(parser.feed("ta: hel").empty());
    auto events = parser.feed("lo\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "hello");
}

TEST_CASE("SseParser ignores comments and unknown fields", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed(": keep-alive\n\nretry: 1000\nfoo: bar\ndata: x\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "x");
}

TEST_CASE("SseParser handles CRLF line endings", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("event: message\r\ndata: crlf\r\n\r\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "crlf");
}

TEST_CASE("SseParser does not leak fields across events", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("event: ping\n\ndata: second\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].event.has_value() == false);
    CHECK(events[0].is_message());
}

TEST_CASE("SseParser marks non-message events", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("event: endpoint\ndata: /messages\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].is_message() == false);
}

TEST_CASE("SseParser enforces the buffer limit", "[sse][parser]") {
    SseParser parser(SseParserConfig{16, 16});
    CHECK_THROWS_AS(parser.feed("data: this line is far too long\n\n"), SseBufferOverflowError);
}

TEST_CASE("SseParser drops oversized events and continues", "[sse][parser]") {
    SseParser parser(SseParserConfig{1024, 4});
    auto events = parser.feed("data: oversized\n\ndata: ok\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "ok");
}

TEST_CASE("parse_sse_body emits an unterminated final event", "[sse][parser]") {
    auto events = parse_sse_body("data: first\n\ndata: last");

    REQUIRE(events.size() == 2);
    CHECK(events[0].data == "first");
    CHECK(events[1].data == "last");
}

TEST_CASE("parse_sse_body returns nothing for a body of comments", "[sse][parser]") {
    CHECK(parse_sse_body(": ping\n\n: ping\n\n").empty());
}
