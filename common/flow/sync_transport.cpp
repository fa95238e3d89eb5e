#include "sync_transport.hpp"

#include <iostream>

namespace juhradial::flow {

int status_for(Error error) {
    switch (error) {
        case Error::None: return 200;
        case Error::BadRequest:
        case Error::MalformedFrame: return 400;
        case Error::InvalidPairing:
        case Error::UnknownPeer: return 401;
        case Error::UntrustedOrigin: return 403;
        case Error::NotFound: return 404;
        case Error::Timeout: return 408;
        case Error::LengthRequired: return 411;
        case Error::PayloadTooLarge: return 413;
        case Error::DeviceUnavailable: return 503;
        default: return 500;
    }
}

SyncTransport::SyncTransport(const TrustStore& trust, Limits limits, Hooks hooks)
    : trust_(trust), limits_(limits), hooks_(std::move(hooks)) {}

http::Response SyncTransport::handle(http::Stream& stream) {
    auto head = http::read_request_head(stream, limits_.head_timeout_ms);
    if (!head) {
        return http::error_response(head.error == Error::IoError ? 408 : 400, "malformed request");
    }

    const http::Request& request = head.value;

    if (request.target == "/sync") {
        if (request.method != "POST") return http::error_response(405, "method not allowed");
        return handle_sync(stream, request);
    }
    if (request.target == "/pair") {
        if (request.method != "POST") return http::error_response(405, "method not allowed");
        return handle_pair(stream, request);
    }
    if (request.target == "/info") {
        if (request.method != "GET") return http::error_response(405, "method not allowed");
        return handle_info(request);
    }

    return http::error_response(404, "not found");
}

std::optional<http::Response> SyncTransport::check_length(const http::Request& request, size_t cap) const {
    if (!request.content_length) {
        return http::error_response(411, "content length required");
    }
    if (*request.content_length > cap) {
        std::cerr << "flow: rejecting " << *request.content_length << " byte body on " << request.target
                  << std::endl;
        return http::error_response(413, "payload too large");
    }
    return std::nullopt;
}

http::Response SyncTransport::handle_sync(http::Stream& stream, const http::Request& request) {
    if (auto rejected = check_length(request, envelope_cap(limits_.payload_cap))) {
        return *rejected;
    }

    // Identity before body
    auto peer = request.header("x-flow-peer");
    auto auth = request.header("authorization");
    auto token = auth ? http::bearer_token(*auth) : std::nullopt;
    if (!peer || !token || !trust_.verify(*peer, *token)) {
        std::cerr << "flow: unauthenticated sync request" << (peer ? " claiming " + *peer : std::string{})
                  << std::endl;
        return http::error_response(401, "unauthorized");
    }

    std::string body;
    if (Error err = http::read_body(stream, body, *request.content_length, limits_.body_timeout_ms);
        err != Error::None) {
        return http::error_response(408, "body not received");
    }

    auto message = decode_envelope(body, limits_.payload_cap);
    if (!message) {
        return http::error_response(status_for(message.error), to_string(message.error));
    }
    if (message.value.origin != *peer) {
        std::cerr << "flow: " << *peer << " sent a message claiming origin " << message.value.origin << std::endl;
        return http::error_response(403, "origin mismatch");
    }

    if (!hooks_.deliver) {
        return http::error_response(503, "not ready");
    }
    if (Error err = hooks_.deliver(std::move(message.value)); err != Error::None) {
        return http::error_response(status_for(err), to_string(err));
    }
    return http::json_response(200, "{\"status\":\"ok\"}");
}

http::Response SyncTransport::handle_pair(http::Stream& stream, const http::Request& request) {
    if (auto rejected = check_length(request, PAIR_BODY_CAP)) {
        return *rejected;
    }

    std::string body;
    if (Error err = http::read_body(stream, body, *request.content_length, limits_.body_timeout_ms);
        err != Error::None) {
        return http::error_response(408, "body not received");
    }

    auto pair_request = decode_pair_request(body);
    if (!pair_request) {
        return http::error_response(400, "bad pair request");
    }

    if (!hooks_.pair) {
        return http::error_response(503, "not ready");
    }
    auto response = hooks_.pair(pair_request.value);
    if (!response) {
        return http::error_response(status_for(response.error), "pairing rejected");
    }
    return http::json_response(200, encode_pair_response(response.value));
}

http::Response SyncTransport::handle_info(const http::Request&) {
    PeerInfo info = hooks_.info ? hooks_.info() : PeerInfo{trust_.self_id(), {}, -1, {}};
    return http::json_response(200, encode_info(info));
}

} // namespace juhradial::flow
