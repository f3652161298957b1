#include <catch2/catch_test_macros.hpp>
#include "provider/sse_parser.hpp"

#include <string>
#include <vector>

using namespace llmproxy;

namespace {

struct Collector {
    std::vector<std::string> events;
    SseParser parser{[this](std::string_view data) { events.emplace_back(data); }};
};

} // anonymous namespace

TEST_CASE("SseParser: data events split on blank lines", "[sse]") {
    Collector c;
    c.parser.feed("data: {\"a\":1}\n\ndata: {\"b\":2}\n\n");
    REQUIRE(c.events.size() == 2);
    CHECK(c.events[0] == "{\"a\":1}");
    CHECK(c.events[1] == "{\"b\":2}");
    CHECK(c.parser.events() == 2);
}

TEST_CASE("SseParser: arbitrary byte slices", "[sse]") {
    Collector c;
    const std::string stream = "data: {\"id\":\"x\"}\r\n\r\ndata: [DONE]\r\n\r\n";
    for (char ch : stream) c.parser.feed(std::string_view(&ch, 1));

    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0] == "{\"id\":\"x\"}");
    CHECK(c.parser.done());
}

TEST_CASE("SseParser: ignores comments and other fields", "[sse]") {
    Collector c;
    c.parser.feed(": keep-alive\n\nevent: message\nid: 7\nretry: 100\ndata:payload\n\n");
    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0] == "payload");
}

TEST_CASE("SseParser: multi-line data joined with newlines", "[sse]") {
    Collector c;
    c.parser.feed("data: line one\ndata: line two\ndata\n\n");
    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0] == "line one\nline two\n");
}

TEST_CASE("SseParser: finish flushes an unterminated event", "[sse]") {
    Collector c;
    c.parser.feed("data: tail");
    CHECK(c.events.empty());
    c.parser.finish();
    REQUIRE(c.events.size() == 1);
    CHECK(c.events[0] == "tail");

    c.parser.finish();
    CHECK(c.events.size() == 1);
}

TEST_CASE("SseParser: DONE sentinel is not delivered", "[sse]") {
    Collector c;
    c.parser.feed("data: [DONE]\n\n");
    CHECK(c.events.empty());
    CHECK(c.parser.done());
    CHECK(c.parser.events() == 0);
}
