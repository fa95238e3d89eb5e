#include "net.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace net {

bool is_private_ipv4(const std::string& address) {
    in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return false;
    }

    uint32_t ip = ntohl(addr.s_addr);
    uint8_t a = (ip >> 24) & 0xFF;
    uint8_t b = (ip >> 16) & 0xFF;

    if (a == 10) return true;
    if (a == 172 && b >= 16 && b <= 31) return true;
    if (a == 192 && b == 168) return true;
    if (a == 127) return true;
    if (a == 169 && b == 254) return true;
    return false;
}

std::optional<std::string> find_private_address() {
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        std::cerr << "net: getifaddrs failed: " << strerror(errno) << std::endl;
        return std::nullopt;
    }

    std::optional<std::string> found;
    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;

        char buf[INET_ADDRSTRLEN] = {};
        auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

        if (is_private_ipv4(buf)) {
            found = buf;
            break;
        }
    }

    freeifaddrs(list);
    return found;
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket::~Socket() {
    close();
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

static bool fill_address(const std::string& address, uint16_t port, sockaddr_in& out) {
    out = {};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return inet_pton(AF_INET, address.c_str(), &out.sin_addr) == 1;
}

Socket listen_on(const std::string& address, uint16_t port) {
    if (!is_private_ipv4(address)) {
        std::cerr << "net: refusing to listen on non-private address " << address << std::endl;
        return {};
    }

    sockaddr_in addr;
    if (!fill_address(address, port, addr)) {
        return {};
    }

    Socket sock(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.is_open()) {
        std::cerr << "net: socket creation failed: " << strerror(errno) << std::endl;
        return {};
    }

    int reuse = 1;
    setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (bind(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "net: bind " << address << ":" << port << " failed: " << strerror(errno) << std::endl;
        return {};
    }

    if (listen(sock.fd(), 16) < 0) {
        std::cerr << "net: listen failed: " << strerror(errno) << std::endl;
        return {};
    }

    std::cout << "net: listening on " << address << ":" << port << std::endl;
    return sock;
}

Socket accept_from(const Socket& listener, int timeout_ms, std::string* peer_address) {
    pollfd pfd = {};
    pfd.fd = listener.fd();
    pfd.events = POLLIN;

    if (poll(&pfd, 1, timeout_ms) <= 0 || !(pfd.revents & POLLIN)) {
        return {};
    }

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    Socket client(accept4(listener.fd(), reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC));
    if (!client.is_open()) {
        return {};
    }

    if (peer_address) {
        char buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
        *peer_address = buf;
    }
    return client;
}

Socket connect_to(const std::string& address, uint16_t port, int timeout_ms) {
    sockaddr_in addr;
    if (!fill_address(address, port, addr)) {
        std::cerr << "net: invalid address " << address << std::endl;
        return {};
    }

    Socket sock(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
    if (!sock.is_open()) {
        return {};
    }

    if (::connect(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            std::cerr << "net: connect " << address << ":" << port << " failed: " << strerror(errno) << std::endl;
            return {};
        }

        pollfd pfd = {};
        pfd.fd = sock.fd();
        pfd.events = POLLOUT;
        if (poll(&pfd, 1, timeout_ms) <= 0) {
            std::cerr << "net: connect " << address << ":" << port << " timed out" << std::endl;
            return {};
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            std::cerr << "net: connect " << address << ":" << port << " failed: " << strerror(so_error)
                      << std::endl;
            return {};
        }
    }

    return sock;
}

long SocketStream::read(std::span<uint8_t> buffer, int timeout_ms) {
    pollfd pfd = {};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ret = poll(&pfd, 1, timeout_ms);
    if (ret <= 0) {
        return -1;
    }

    ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
    if (n < 0) {
        return -1;
    }
    return static_cast<long>(n);
}

bool SocketStream::write_all(std::span<const uint8_t> data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd = {};
                pfd.fd = fd_;
                pfd.events = POLLOUT;
                if (poll(&pfd, 1, 2000) <= 0) return false;
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace net
