#pragma once

#include "http.hpp"
#include "sync_message.hpp"
#include "trust_store.hpp"

#include <functional>

namespace juhradial::flow {

constexpr uint16_t DEFAULT_PORT = 24801;

// Request validation and routing for the sync server.
// Holds no clipboard or focus semantics, accepted messages go to the hooks.
class SyncTransport {
public:
    struct Limits {
        size_t payload_cap = DEFAULT_PAYLOAD_CAP;
        int head_timeout_ms = 5000;
        int body_timeout_ms = 5000;
    };

    struct Hooks {
        std::function<Error(SyncMessage)> deliver;
        std::function<Result<PairResponse>(const PairRequest&)> pair;
        std::function<PeerInfo()> info;
    };

    SyncTransport(const TrustStore& trust, Limits limits, Hooks hooks);

    // Reads one request from `stream` and produces the response to send.
    // Length and identity are checked before any body byte is read.
    http::Response handle(http::Stream& stream);

    const Limits& limits() const { return limits_; }

private:
    http::Response handle_sync(http::Stream& stream, const http::Request& request);
    http::Response handle_pair(http::Stream& stream, const http::Request& request);
    http::Response handle_info(const http::Request& request);

    // 411/413 or nullopt if the declared length is acceptable
    std::optional<http::Response> check_length(const http::Request& request, size_t cap) const;

    const TrustStore& trust_;
    Limits limits_;
    Hooks hooks_;
};

int status_for(Error error);

} // namespace juhradial::flow
