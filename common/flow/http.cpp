#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>

namespace juhradial::http {

using namespace std::chrono;

namespace {

int remaining_ms(steady_clock::time_point deadline) {
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::optional<std::string> find_header(const Headers& headers, std::string_view name) {
    std::string key = lower(name);
    for (const auto& [k, v] : headers) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::optional<size_t> parse_length(std::string_view value) {
    if (value.empty() || value.size() > 18) {
        return std::nullopt;
    }
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return length;
}

// Reads up to and including the blank line, never past it
Result<std::string> read_head(Stream& stream, int timeout_ms) {
    auto deadline = steady_clock::now() + milliseconds(timeout_ms);
    std::string head;

    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            return fail<std::string>(Error::IoError);
        }

        uint8_t byte = 0;
        long n = stream.read(std::span<uint8_t>(&byte, 1), left);
        if (n <= 0) {
            return fail<std::string>(Error::IoError);
        }

        head.push_back(static_cast<char>(byte));
        if (head.size() >= 4 && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0) {
            head.resize(head.size() - 4);
            return {head, Error::None};
        }
        if (head.size() >= MAX_HEAD_SIZE) {
            return fail<std::string>(Error::BadRequest);
        }
    }
}

std::vector<std::string_view> split_lines(std::string_view head) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= head.size()) {
        size_t end = head.find("\r\n", start);
        if (end == std::string_view::npos) {
            lines.push_back(head.substr(start));
            break;
        }
        lines.push_back(head.substr(start, end - start));
        start = end + 2;
    }
    return lines;
}

// Shared by requests and responses
Error parse_headers(const std::vector<std::string_view>& lines, Headers& headers,
                    std::optional<size_t>& content_length) {
    if (lines.size() - 1 > MAX_HEADERS) {
        return Error::BadRequest;
    }

    bool chunked = false;
    for (size_t i = 1; i < lines.size(); ++i) {
        auto header = parse_header_line(lines[i]);
        if (!header) {
            return Error::BadRequest;
        }

        if (header->first == "content-length") {
            auto length = parse_length(header->second);
            if (!length) {
                return Error::BadRequest;
            }
            if (content_length && *content_length != *length) {
                return Error::BadRequest;
            }
            content_length = length;
        } else if (header->first == "transfer-encoding") {
            chunked = true;
        }

        headers.push_back(std::move(*header));
    }

    // Both framings at once is a smuggling attempt
    if (chunked && content_length) {
        return Error::BadRequest;
    }
    return Error::None;
}

} // namespace

std::optional<std::string> Request::header(std::string_view name) const {
    return find_header(headers, name);
}

std::optional<std::string> Response::header(std::string_view name) const {
    return find_header(headers, name);
}

std::string_view status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

Response json_response(int status, std::string body) {
    Response response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

Response error_response(int status, std::string_view message) {
    std::string body = "{\"error\":\"";
    for (char c : message) {
        if (c == '"' || c == '\\') body.push_back('\\');
        body.push_back(c);
    }
    body += "\"}";
    return json_response(status, std::move(body));
}

std::optional<std::pair<std::string, std::string>> parse_header_line(std::string_view line) {
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }

    std::string_view name = line.substr(0, colon);
    if (name.find_first_of(" \t") != std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(lower(name), std::string(trim(line.substr(colon + 1))));
}

Result<Request> read_request_head(Stream& stream, int timeout_ms) {
    auto head = read_head(stream, timeout_ms);
    if (!head) {
        return fail<Request>(head.error);
    }

    auto lines = split_lines(head.value);
    if (lines.empty()) {
        return fail<Request>(Error::BadRequest);
    }

    // METHOD SP target SP HTTP/1.x
    std::string_view line = lines[0];
    size_t first = line.find(' ');
    size_t second = first == std::string_view::npos ? first : line.find(' ', first + 1);
    if (second == std::string_view::npos) {
        return fail<Request>(Error::BadRequest);
    }

    std::string_view version = line.substr(second + 1);
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return fail<Request>(Error::BadRequest);
    }

    Request request;
    request.method = std::string(line.substr(0, first));
    request.target = std::string(line.substr(first + 1, second - first - 1));
    if (request.method.empty() || request.target.empty() || request.target.front() != '/') {
        return fail<Request>(Error::BadRequest);
    }

    if (Error err = parse_headers(lines, request.headers, request.content_length); err != Error::None) {
        return fail<Request>(err);
    }

    return {std::move(request), Error::None};
}

Error read_body(Stream& stream, std::string& body, size_t length, int timeout_ms) {
    auto deadline = steady_clock::now() + milliseconds(timeout_ms);
    body.assign(length, '\0');

    size_t got = 0;
    while (got < length) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            return Error::Timeout;
        }

        auto* dst = reinterpret_cast<uint8_t*>(body.data()) + got;
        long n = stream.read(std::span<uint8_t>(dst, length - got), left);
        if (n <= 0) {
            return Error::IoError;
        }
        got += static_cast<size_t>(n);
    }
    return Error::None;
}

bool write_response(Stream& stream, const Response& response) {
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " ";
    out += status_text(response.status);
    out += "\r\nContent-Type: " + response.content_type;
    out += "\r\nContent-Length: " + std::to_string(response.body.size());
    for (const auto& [name, value] : response.headers) {
        out += "\r\n" + name + ": " + value;
    }
    out += "\r\nConnection: close\r\n\r\n";
    out += response.body;

    return stream.write_all(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(out.data()), out.size()));
}

std::string format_request(std::string_view method, std::string_view target, std::string_view host,
                           const Headers& headers, std::string_view body) {
    std::string out;
    out.reserve(256 + body.size());
    out.append(method).append(" ").append(target).append(" HTTP/1.1\r\n");
    out.append("Host: ").append(host).append("\r\n");
    for (const auto& [name, value] : headers) {
        out.append(name).append(": ").append(value).append("\r\n");
    }
    if (method != "GET" || !body.empty()) {
        out.append("Content-Type: application/json\r\n");
        out.append("Content-Length: ").append(std::to_string(body.size())).append("\r\n");
    }
    out.append("Connection: close\r\n\r\n");
    out.append(body);
    return out;
}

Result<Response> read_response(Stream& stream, size_t max_body, int timeout_ms) {
    auto deadline = steady_clock::now() + milliseconds(timeout_ms);

    auto head = read_head(stream, timeout_ms);
    if (!head) {
        return fail<Response>(head.error);
    }

    auto lines = split_lines(head.value);
    // HTTP/1.1 SP status SP reason
    std::string_view line = lines.empty() ? std::string_view{} : lines[0];
    if (line.size() < 12 || line.substr(0, 5) != "HTTP/") {
        return fail<Response>(Error::BadRequest);
    }

    Response response;
    auto code = line.substr(9, 3);
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), response.status);
    if (ec != std::errc{}) {
        return fail<Response>(Error::BadRequest);
    }

    std::optional<size_t> length;
    if (Error err = parse_headers(lines, response.headers, length); err != Error::None) {
        return fail<Response>(err);
    }
    response.content_type = response.header("content-type").value_or("");

    if (length) {
        if (*length > max_body) {
            return fail<Response>(Error::PayloadTooLarge);
        }
        Error err = read_body(stream, response.body, *length, remaining_ms(deadline));
        if (err != Error::None) {
            return fail<Response>(err);
        }
        return {std::move(response), Error::None};
    }

    // No length: body runs to EOF
    uint8_t buffer[1024];
    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            return fail<Response>(Error::Timeout);
        }
        long n = stream.read(buffer, left);
        if (n == 0) break;
        if (n < 0) return fail<Response>(Error::IoError);
        if (response.body.size() + static_cast<size_t>(n) > max_body) {
            return fail<Response>(Error::PayloadTooLarge);
        }
        response.body.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(n));
    }
    return {std::move(response), Error::None};
}

std::optional<std::string> bearer_token(std::string_view authorization) {
    constexpr std::string_view prefix = "Bearer ";
    if (authorization.size() <= prefix.size()) {
        return std::nullopt;
    }
    if (lower(authorization.substr(0, prefix.size())) != "bearer ") {
        return std::nullopt;
    }
    auto token = trim(authorization.substr(prefix.size()));
    if (token.empty()) return std::nullopt;
    return std::string(token);
}

} // namespace juhradial::http
