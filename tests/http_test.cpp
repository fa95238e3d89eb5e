#include <gtest/gtest.h>

#include "memory_stream.hpp"

using namespace juhradial;
using namespace juhradial::http;
using juhradial::test::MemoryStream;

TEST(HttpTest, ReadsHeadWithoutTouchingBody) {
    std::string head = "POST /sync HTTP/1.1\r\nHost: 10.0.0.2\r\nContent-Length: 5\r\nX-Flow-Peer:  abc \r\n\r\n";
    MemoryStream stream(head + "hello");

    auto request = read_request_head(stream, 1000);
    ASSERT_TRUE(request);
    EXPECT_EQ(request.value.method, "POST");
    EXPECT_EQ(request.value.target, "/sync");
    EXPECT_EQ(request.value.content_length, std::optional<size_t>(5));
    EXPECT_EQ(request.value.header("x-flow-peer"), std::optional<std::string>("abc"));
    EXPECT_EQ(request.value.header("X-FLOW-PEER"), std::optional<std::string>("abc"));
    EXPECT_EQ(stream.position, head.size());

    std::string body;
    EXPECT_EQ(read_body(stream, body, 5, 1000), Error::None);
    EXPECT_EQ(body, "hello");
}

TEST(HttpTest, MissingContentLength) {
    MemoryStream stream("POST /sync HTTP/1.1\r\nHost: x\r\n\r\n");
    auto request = read_request_head(stream, 1000);
    ASSERT_TRUE(request);
    EXPECT_FALSE(request.value.content_length);
}

TEST(HttpTest, RejectsMalformedHeads) {
    const char* bad[] = {
        "GET\r\n\r\n",
        "GET /info HTTP/2\r\n\r\n",
        "GET info HTTP/1.1\r\n\r\n",
        "POST /sync HTTP/1.1\r\nContent-Length: abc\r\n\r\n",
        "POST /sync HTTP/1.1\r\nContent-Length: -1\r\n\r\n",
        "POST /sync HTTP/1.1\r\nContent-Length: 4\r\nContent-Length: 5\r\n\r\n",
        "POST /sync HTTP/1.1\r\nContent-Length: 4\r\nTransfer-Encoding: chunked\r\n\r\n",
        "POST /sync HTTP/1.1\r\nBad Header: 1\r\n\r\n",
        "POST /sync HTTP/1.1\r\nNoColon\r\n\r\n",
    };
    for (const char* text : bad) {
        MemoryStream stream(text);
        EXPECT_EQ(read_request_head(stream, 1000).error, Error::BadRequest) << text;
    }
}

TEST(HttpTest, OversizedHeadIsRejected) {
    std::string head = "GET /info HTTP/1.1\r\nX-Pad: " + std::string(MAX_HEAD_SIZE, 'a') + "\r\n\r\n";
    MemoryStream stream(head);
    EXPECT_EQ(read_request_head(stream, 1000).error, Error::BadRequest);
    EXPECT_LE(stream.position, MAX_HEAD_SIZE);
}

TEST(HttpTest, TruncatedHeadIsIoError) {
    MemoryStream stream("POST /sync HTTP/1.1\r\nHost");
    EXPECT_EQ(read_request_head(stream, 1000).error, Error::IoError);
}

TEST(HttpTest, ShortBodyFails) {
    MemoryStream stream("abc");
    std::string body;
    EXPECT_EQ(read_body(stream, body, 10, 1000), Error::IoError);
}

TEST(HttpTest, WritesResponse) {
    MemoryStream stream("");
    Response response = error_response(413, "payload too large");
    ASSERT_TRUE(write_response(stream, response));

    EXPECT_EQ(stream.output.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0), 0u);
    EXPECT_NE(stream.output.find("Content-Length: 29\r\n"), std::string::npos);
    EXPECT_NE(stream.output.find("Connection: close\r\n\r\n{\"error\":\"payload too large\"}"), std::string::npos);
}

TEST(HttpTest, ErrorMessageIsEscaped) {
    EXPECT_EQ(error_response(400, "say \"hi\"").body, "{\"error\":\"say \\\"hi\\\"\"}");
}

TEST(HttpTest, FormatsClientRequest) {
    std::string text = format_request("POST", "/sync", "10.0.0.2:24801", {{"X-Flow-Peer", "abc"}}, "{}");
    EXPECT_EQ(text,
              "POST /sync HTTP/1.1\r\n"
              "Host: 10.0.0.2:24801\r\n"
              "X-Flow-Peer: abc\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 2\r\n"
              "Connection: close\r\n\r\n{}");

    std::string get = format_request("GET", "/info", "h", {}, "");
    EXPECT_EQ(get.find("Content-Length"), std::string::npos);
}

TEST(HttpTest, ReadsResponseWithLength) {
    MemoryStream stream("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n{}");
    auto response = read_response(stream, 100, 1000);
    ASSERT_TRUE(response);
    EXPECT_EQ(response.value.status, 200);
    EXPECT_EQ(response.value.content_type, "application/json");
    EXPECT_EQ(response.value.body, "{}");
}

TEST(HttpTest, ReadsResponseToEof) {
    MemoryStream stream("HTTP/1.0 401 Unauthorized\r\n\r\n{\"error\":\"x\"}");
    auto response = read_response(stream, 100, 1000);
    ASSERT_TRUE(response);
    EXPECT_EQ(response.value.status, 401);
    EXPECT_EQ(response.value.body, "{\"error\":\"x\"}");
}

TEST(HttpTest, ResponseBodyCapIsEnforced) {
    MemoryStream declared("HTTP/1.1 200 OK\r\nContent-Length: 500\r\n\r\n");
    EXPECT_EQ(read_response(declared, 100, 1000).error, Error::PayloadTooLarge);

    MemoryStream streamed("HTTP/1.1 200 OK\r\n\r\n" + std::string(200, 'x'));
    EXPECT_EQ(read_response(streamed, 100, 1000).error, Error::PayloadTooLarge);
}

TEST(HttpTest, BearerToken) {
    EXPECT_EQ(bearer_token("Bearer abc123"), std::optional<std::string>("abc123"));
    EXPECT_EQ(bearer_token("bearer  abc123 "), std::optional<std::string>("abc123"));
    EXPECT_FALSE(bearer_token("Basic abc123"));
    EXPECT_FALSE(bearer_token("Bearer "));
    EXPECT_FALSE(bearer_token(""));
}

TEST(HttpTest, HeaderLineParsing) {
    auto header = parse_header_line("Content-Type:\tapplication/json ");
    ASSERT_TRUE(header);
    EXPECT_EQ(header->first, "content-type");
    EXPECT_EQ(header->second, "application/json");
    EXPECT_FALSE(parse_header_line(": value"));
}
