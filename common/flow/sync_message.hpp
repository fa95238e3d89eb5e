#pragma once

#include "../types/peer.hpp"

#include <cstddef>
#include <string>
#include <string_view>

// JSON bodies exchanged between peers
namespace juhradial::flow {

constexpr size_t DEFAULT_PAYLOAD_CAP = 1024 * 1024;
constexpr size_t PAIR_BODY_CAP = 4096;

// Envelope text is bigger than the payload it carries (base64 plus fields)
constexpr size_t envelope_cap(size_t payload_cap) {
    return 4 * ((payload_cap + 2) / 3) + 1024;
}

// {"type","origin","epoch","sequence","payload"(base64)}
std::string encode_envelope(const SyncMessage& message);

// BadRequest on shape errors, PayloadTooLarge if the decoded payload exceeds the cap
Result<SyncMessage> decode_envelope(std::string_view body, size_t payload_cap);

struct PairRequest {
    std::string peer_id;
    std::string code;
    std::string hostname;
};

struct PairResponse {
    std::string peer_id;
    std::string token;
    std::string hostname;
};

struct PeerInfo {
    std::string peer_id;
    std::string hostname;
    int host_slot = -1;
    std::string version;
};

std::string encode_pair_request(const PairRequest& request);
Result<PairRequest> decode_pair_request(std::string_view body);

std::string encode_pair_response(const PairResponse& response);
Result<PairResponse> decode_pair_response(std::string_view body);

std::string encode_info(const PeerInfo& info);
Result<PeerInfo> decode_info(std::string_view body);

} // namespace juhradial::flow
