#include "sync_server.hpp"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>

using juhradial::Error;
using juhradial::Result;
using juhradial::SyncMessage;
using juhradial::flow::PairRequest;
using juhradial::flow::PairResponse;
using juhradial::flow::PeerInfo;

namespace sync_server {

namespace http = juhradial::http;

// How often the accept loop checks for stop()
constexpr int ACCEPT_POLL_MS = 200;

Mailbox::Mailbox() {
    fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd_ < 0) {
        std::cerr << "sync: eventfd failed: " << strerror(errno) << std::endl;
    }
}

Mailbox::~Mailbox() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void Mailbox::notify() {
    uint64_t one = 1;
    if (::write(fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::cerr << "sync: mailbox notify failed: " << strerror(errno) << std::endl;
    }
}

void Mailbox::post(SyncMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(std::move(message));
    }
    notify();
}

std::future<Result<PairResponse>> Mailbox::post(PairRequest request) {
    PairJob job;
    job.request = std::move(request);
    auto future = job.reply.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pairs_.push_back(std::move(job));
    }
    notify();
    return future;
}

void Mailbox::drain(std::vector<SyncMessage>& messages, std::vector<PairJob>& pairs) {
    uint64_t count = 0;
    while (::read(fd_, &count, sizeof(count)) > 0) {
    }

    std::lock_guard<std::mutex> lock(mutex_);
    while (!messages_.empty()) {
        messages.push_back(std::move(messages_.front()));
        messages_.pop_front();
    }
    while (!pairs_.empty()) {
        pairs.push_back(std::move(pairs_.front()));
        pairs_.pop_front();
    }
}

Server::Server(const juhradial::flow::TrustStore& trust, juhradial::flow::SyncTransport::Limits limits,
               Mailbox& mailbox, int pair_timeout_ms)
    : transport_(trust, limits,
                 juhradial::flow::SyncTransport::Hooks{
                     [this](SyncMessage message) {
                         mailbox_.post(std::move(message));
                         return Error::None;
                     },
                     [this](const PairRequest& request) -> Result<PairResponse> {
                         auto reply = mailbox_.post(request);
                         if (reply.wait_for(std::chrono::milliseconds(pair_timeout_ms_)) !=
                             std::future_status::ready) {
                             return juhradial::fail<PairResponse>(Error::Timeout);
                         }
                         try {
                             return reply.get();
                         } catch (const std::future_error& e) {
                             std::cerr << "sync: pair request dropped: " << e.what() << std::endl;
                             return juhradial::fail<PairResponse>(Error::IoError);
                         }
                     },
                     [this]() { return info(); },
                 }),
      mailbox_(mailbox), pair_timeout_ms_(pair_timeout_ms) {}

Server::~Server() {
    stop();
}

bool Server::start(const std::string& address, uint16_t port) {
    if (running_) return true;

    listener_ = net::listen_on(address, port);
    if (!listener_.is_open()) {
        return false;
    }

    running_ = true;
    thread_ = std::thread(&Server::run, this);
    return true;
}

void Server::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    listener_.close();
}

void Server::set_info(PeerInfo info) {
    std::lock_guard<std::mutex> lock(info_mutex_);
    info_ = std::move(info);
}

PeerInfo Server::info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return info_;
}

void Server::run() {
    std::cout << "sync: server thread started" << std::endl;

    while (running_) {
        std::string remote;
        net::Socket client = net::accept_from(listener_, ACCEPT_POLL_MS, &remote);
        if (!client.is_open()) {
            continue;
        }
        if (!net::is_private_ipv4(remote)) {
            std::cerr << "sync: dropping connection from non-private " << remote << std::endl;
            continue;
        }
        serve(std::move(client));
    }

    std::cout << "sync: server thread stopped" << std::endl;
}

void Server::serve(net::Socket client) {
    net::SocketStream stream(client);
    http::Response response = transport_.handle(stream);
    if (response.status != 200) {
        std::cerr << "sync: answered " << response.status << " " << http::status_text(response.status) << std::endl;
    }
    if (!http::write_response(stream, response)) {
        std::cerr << "sync: failed to write response" << std::endl;
    }
}

HttpPeerSender::HttpPeerSender(const juhradial::flow::TrustStore& trust, int timeout_ms)
    : trust_(trust), timeout_ms_(timeout_ms) {}

// One request per connection, the whole exchange is bounded by timeout_ms
static Result<http::Response> exchange(const juhradial::PeerRecord& peer, const std::string& request,
                                       size_t max_body, int timeout_ms) {
    if (!net::is_private_ipv4(peer.address)) {
        std::cerr << "sync: refusing to contact non-private " << peer.address << std::endl;
        return juhradial::fail<http::Response>(Error::UntrustedOrigin);
    }

    net::Socket sock = net::connect_to(peer.address, peer.port, timeout_ms);
    if (!sock.is_open()) {
        return juhradial::fail<http::Response>(Error::IoError);
    }

    net::SocketStream stream(sock);
    auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(request.data()), request.size());
    if (!stream.write_all(bytes)) {
        return juhradial::fail<http::Response>(Error::IoError);
    }
    return http::read_response(stream, max_body, timeout_ms);
}

Error HttpPeerSender::send(const juhradial::PeerRecord& peer, const SyncMessage& message) {
    auto token = trust_.token_for(peer.peer_id);
    if (!token) {
        return Error::UntrustedOrigin;
    }

    http::Headers headers = {
        {"X-Flow-Peer", trust_.self_id()},
        {"Authorization", "Bearer " + *token},
    };
    std::string host = peer.address + ":" + std::to_string(peer.port);
    std::string request =
        http::format_request("POST", "/sync", host, headers, juhradial::flow::encode_envelope(message));

    auto response = exchange(peer, request, juhradial::flow::PAIR_BODY_CAP, timeout_ms_);
    if (!response) {
        std::cerr << "sync: send " << juhradial::to_string(message.type) << " to " << peer.peer_id
                  << " failed: " << juhradial::to_string(response.error) << std::endl;
        return response.error;
    }
    if (response.value.status != 200) {
        std::cerr << "sync: " << peer.peer_id << " answered " << response.value.status << std::endl;
        switch (response.value.status) {
            case 401: return Error::UntrustedOrigin;
            case 403: return Error::UntrustedOrigin;
            case 413: return Error::PayloadTooLarge;
            default: return Error::IoError;
        }
    }
    return Error::None;
}

Result<PairResponse> request_pairing(const juhradial::PeerRecord& peer, const PairRequest& request,
                                     int timeout_ms) {
    std::string host = peer.address + ":" + std::to_string(peer.port);
    std::string text =
        http::format_request("POST", "/pair", host, {}, juhradial::flow::encode_pair_request(request));

    auto response = exchange(peer, text, juhradial::flow::PAIR_BODY_CAP, timeout_ms);
    if (!response) {
        return juhradial::fail<PairResponse>(response.error);
    }
    if (response.value.status != 200) {
        std::cerr << "sync: pairing with " << peer.peer_id << " rejected (" << response.value.status << ")"
                  << std::endl;
        return juhradial::fail<PairResponse>(Error::InvalidPairing);
    }

    auto decoded = juhradial::flow::decode_pair_response(response.value.body);
    if (!decoded) {
        return decoded;
    }
    if (decoded.value.peer_id != peer.peer_id) {
        std::cerr << "sync: pair response from " << decoded.value.peer_id << ", expected " << peer.peer_id
                  << std::endl;
        return juhradial::fail<PairResponse>(Error::UntrustedOrigin);
    }
    return decoded;
}

} // namespace sync_server
