#pragma once

#include <flow/http.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace net {

// RFC 1918, loopback and link-local
bool is_private_ipv4(const std::string& address);

// First private IPv4 address of an up, non-loopback interface
std::optional<std::string> find_private_address();

// Move-only TCP socket
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    void close();

private:
    int fd_ = -1;
};

// Listening socket on address:port. Refuses anything but a private address.
Socket listen_on(const std::string& address, uint16_t port);

// Accepts one connection, waiting at most timeout_ms. Empty socket on timeout.
Socket accept_from(const Socket& listener, int timeout_ms, std::string* peer_address = nullptr);

// Non-blocking connect bounded by timeout_ms
Socket connect_to(const std::string& address, uint16_t port, int timeout_ms);

// http::Stream over a connected socket
class SocketStream : public juhradial::http::Stream {
public:
    explicit SocketStream(const Socket& socket) : fd_(socket.fd()) {}

    long read(std::span<uint8_t> buffer, int timeout_ms) override;
    bool write_all(std::span<const uint8_t> data) override;

private:
    int fd_;
};

} // namespace net
