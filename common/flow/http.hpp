#pragma once

#include "../types/enums.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Minimal HTTP/1.1 framing for the peer sync channel. One request per connection.
namespace juhradial::http {

constexpr size_t MAX_HEAD_SIZE = 8192;
constexpr size_t MAX_HEADERS = 64;

// Byte stream with per-call timeouts
class Stream {
public:
    virtual ~Stream() = default;

    // >0 bytes read, 0 on orderly EOF, -1 on error or timeout
    virtual long read(std::span<uint8_t> buffer, int timeout_ms) = 0;
    virtual bool write_all(std::span<const uint8_t> data) = 0;
};

using Headers = std::vector<std::pair<std::string, std::string>>;

struct Request {
    std::string method;
    std::string target;
    Headers headers;  // names lower-cased
    std::optional<size_t> content_length;
    std::string body;

    std::optional<std::string> header(std::string_view name) const;
};

struct Response {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    Headers headers;

    std::optional<std::string> header(std::string_view name) const;
};

std::string_view status_text(int status);

Response json_response(int status, std::string body);
Response error_response(int status, std::string_view message);

// Parses "Name: value" into a lower-cased name and trimmed value
std::optional<std::pair<std::string, std::string>> parse_header_line(std::string_view line);

// Reads the request head one byte at a time so no body byte is consumed.
// BadRequest on malformed or oversized heads, IoError on EOF or timeout.
Result<Request> read_request_head(Stream& stream, int timeout_ms);

// Reads exactly `length` bytes into request.body within `timeout_ms` overall
Error read_body(Stream& stream, std::string& body, size_t length, int timeout_ms);

bool write_response(Stream& stream, const Response& response);

// Client side
std::string format_request(std::string_view method, std::string_view target, std::string_view host,
                           const Headers& headers, std::string_view body);

// Reads a full response, refusing bodies larger than max_body
Result<Response> read_response(Stream& stream, size_t max_body, int timeout_ms);

// "Bearer <token>" -> token
std::optional<std::string> bearer_token(std::string_view authorization);

} // namespace juhradial::http
