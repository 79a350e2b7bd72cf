#include <doctest/doctest.h>
#include "zebralink/ftp/ftp_reply.hpp"

#include <string>
#include <vector>

using namespace zebralink::ftp;

namespace {

std::vector<Reply> feed_all(ReplyDecoder& d, const std::string& text) {
    std::vector<Reply> out;
    Reply r;
    for (char c : text) {
        if (d.feed(static_cast<uint8_t>(c), r)) out.push_back(r);
    }
    return out;
}

} // namespace

TEST_CASE("single-line replies with CRLF or bare LF") {
    ReplyDecoder d;
    auto replies = feed_all(d, "220 Service ready\r\n331 Password required\n");
    REQUIRE(replies.size() == 2);
    CHECK(replies[0].status == 220);
    CHECK(replies[0].text == "Service ready");
    CHECK(replies[0].lines.size() == 1);
    CHECK(replies[1].status == 331);
    CHECK(replies[1].to_string() == "331 Password required");
}

TEST_CASE("a reply split across reads completes on the final newline") {
    ReplyDecoder d;
    CHECK(feed_all(d, "226 Transfer ").empty());
    auto replies = feed_all(d, "complete\r\n");
    REQUIRE(replies.size() == 1);
    CHECK(replies[0].text == "Transfer complete");
}

TEST_CASE("multi-line replies end on the matching code and a space") {
    ReplyDecoder d;
    auto replies = feed_all(d,
        "211-Features:\r\n"
        " SIZE\r\n"
        "200 not the end\r\n"
        "211 End\r\n");
    REQUIRE(replies.size() == 1);
    CHECK(replies[0].status == 211);
    CHECK(replies[0].text == "Features:");
    REQUIRE(replies[0].lines.size() == 4);
    CHECK(replies[0].lines[1] == " SIZE");
    CHECK(replies[0].lines[3] == "211 End");
}

TEST_CASE("status only, classification and noise") {
    ReplyDecoder d;
    auto replies = feed_all(d, "\r\ngarbage\r\n150\r\n550 Nope\r\n");
    REQUIRE(replies.size() == 2);
    CHECK(d.malformed() == 1);

    CHECK(replies[0].status == 150);
    CHECK(replies[0].text.empty());
    CHECK(replies[0].to_string() == "150");
    CHECK(replies[0].intermediate());
    CHECK_FALSE(replies[0].failure());

    CHECK(replies[1].failure());
    CHECK_FALSE(replies[1].intermediate());
}

TEST_CASE("reset drops a half-received reply") {
    ReplyDecoder d;
    feed_all(d, "230-Welcome\r\npartial");
    d.reset();
    auto replies = feed_all(d, "200 OK\r\n");
    REQUIRE(replies.size() == 1);
    CHECK(replies[0].status == 200);
    CHECK(replies[0].lines.size() == 1);
}

TEST_CASE("overlong lines are capped") {
    ReplyDecoder d;
    auto replies = feed_all(d, "500 " + std::string(ReplyDecoder::LINE_MAX * 2, 'x') + "\r\n");
    REQUIRE(replies.size() == 1);
    CHECK(replies[0].lines[0].size() == ReplyDecoder::LINE_MAX);
}

TEST_CASE("an oversized multi-line block is dropped and the stream resyncs") {
    ReplyDecoder d;
    const std::string filler(ReplyDecoder::LINE_MAX - 1, 'x');
    std::string text = "211-start\r\n";
    for (std::size_t n = 0; n * filler.size() <= ReplyDecoder::BLOCK_MAX; ++n) text += " " + filler + "\r\n";
    text += " still inside\r\n211 End\r\n200 OK\r\n";

    auto replies = feed_all(d, text);
    CHECK(d.overflowed());
    CHECK(d.malformed() == 1);
    REQUIRE(replies.size() == 1);
    CHECK(replies[0].status == 200);
    CHECK(replies[0].lines.size() == 1);

    d.reset();
    CHECK_FALSE(d.overflowed());
}

TEST_CASE("a multi-line block under the cap is kept whole") {
    ReplyDecoder d;
    const std::string filler(1000, 'y');
    std::string text = "211-start\r\n";
    for (int n = 0; n < 20; ++n) text += filler + "\r\n";
    text += "211 End\r\n";

    auto replies = feed_all(d, text);
    CHECK_FALSE(d.overflowed());
    REQUIRE(replies.size() == 1);
    CHECK(replies[0].lines.size() == 22);
}
