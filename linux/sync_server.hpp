#pragma once

#include "net.hpp"

#include <flow/orchestrator.hpp>
#include <flow/sync_transport.hpp>

#include <atomic>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sync_server {

// Hands work from the server thread to the main loop. The eventfd is readable while work is queued.
class Mailbox {
public:
    struct PairJob {
        juhradial::flow::PairRequest request;
        std::promise<juhradial::Result<juhradial::flow::PairResponse>> reply;
    };

    Mailbox();
    ~Mailbox();

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }

    void post(juhradial::SyncMessage message);
    std::future<juhradial::Result<juhradial::flow::PairResponse>> post(juhradial::flow::PairRequest request);

    // Main thread only. Clears the eventfd and takes everything queued.
    void drain(std::vector<juhradial::SyncMessage>& messages, std::vector<PairJob>& pairs);

private:
    void notify();

    int fd_ = -1;
    std::mutex mutex_;
    std::deque<juhradial::SyncMessage> messages_;
    std::deque<PairJob> pairs_;
};

// Accept loop on its own thread. Validation happens in SyncTransport, accepted work goes to the mailbox.
class Server {
public:
    Server(const juhradial::flow::TrustStore& trust, juhradial::flow::SyncTransport::Limits limits, Mailbox& mailbox,
           int pair_timeout_ms);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    bool start(const std::string& address, uint16_t port);
    void stop();
    bool running() const { return running_; }

    // What /info answers, published by the main thread
    void set_info(juhradial::flow::PeerInfo info);

private:
    void run();
    void serve(net::Socket client);
    juhradial::flow::PeerInfo info() const;

    juhradial::flow::SyncTransport transport_;
    Mailbox& mailbox_;
    int pair_timeout_ms_;

    net::Socket listener_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex info_mutex_;
    juhradial::flow::PeerInfo info_;
};

// POSTs envelopes to /sync with our identity and the peer's session token
class HttpPeerSender : public juhradial::flow::PeerSender {
public:
    HttpPeerSender(const juhradial::flow::TrustStore& trust, int timeout_ms);

    juhradial::Error send(const juhradial::PeerRecord& peer, const juhradial::SyncMessage& message) override;

private:
    const juhradial::flow::TrustStore& trust_;
    int timeout_ms_;
};

// Client half of pairing: POST /pair with the code shown on the other machine
juhradial::Result<juhradial::flow::PairResponse> request_pairing(const juhradial::PeerRecord& peer,
                                                                 const juhradial::flow::PairRequest& request,
                                                                 int timeout_ms);

} // namespace sync_server
