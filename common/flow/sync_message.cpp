#include "sync_message.hpp"
#include "../protocol/crypto.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

using json = nlohmann::json;

namespace juhradial::flow {

namespace {

bool is_string(const json& doc, const char* key) {
    return doc.contains(key) && doc[key].is_string();
}

bool is_unsigned(const json& doc, const char* key) {
    return doc.contains(key) && doc[key].is_number_unsigned();
}

} // namespace

std::string encode_envelope(const SyncMessage& message) {
    json doc = {
        {"type", std::string(to_string(message.type))},
        {"origin", message.origin},
        {"epoch", message.epoch},
        {"sequence", message.sequence},
        {"payload", crypto::base64_encode(message.payload)},
    };
    return doc.dump();
}

Result<SyncMessage> decode_envelope(std::string_view body, size_t payload_cap) {
    try {
        json doc = json::parse(body.begin(), body.end());
        if (!doc.is_object() || !is_string(doc, "type") || !is_string(doc, "origin") ||
            !is_unsigned(doc, "epoch") || !is_unsigned(doc, "sequence") || !is_string(doc, "payload")) {
            return fail<SyncMessage>(Error::BadRequest);
        }

        auto type = sync_type_from_string(doc["type"].get<std::string>());
        if (!type) {
            return fail<SyncMessage>(Error::BadRequest);
        }

        const auto& encoded = doc["payload"].get_ref<const std::string&>();
        if (crypto::base64_decoded_size(encoded.size()) > payload_cap + 2) {
            return fail<SyncMessage>(Error::PayloadTooLarge);
        }

        auto payload = crypto::base64_decode(encoded);
        if (!payload) {
            return fail<SyncMessage>(Error::BadRequest);
        }
        if (payload->size() > payload_cap) {
            return fail<SyncMessage>(Error::PayloadTooLarge);
        }

        SyncMessage message;
        message.type = *type;
        message.origin = doc["origin"].get<std::string>();
        message.epoch = doc["epoch"].get<uint64_t>();
        message.sequence = doc["sequence"].get<uint64_t>();
        message.payload = std::move(*payload);

        if (message.origin.empty()) {
            return fail<SyncMessage>(Error::BadRequest);
        }
        return {std::move(message), Error::None};
    } catch (const json::exception& e) {
        std::cerr << "flow: bad envelope: " << e.what() << std::endl;
        return fail<SyncMessage>(Error::BadRequest);
    }
}

std::string encode_pair_request(const PairRequest& request) {
    json doc = {
        {"peer_id", request.peer_id},
        {"code", request.code},
        {"hostname", request.hostname},
    };
    return doc.dump();
}

Result<PairRequest> decode_pair_request(std::string_view body) {
    try {
        json doc = json::parse(body.begin(), body.end());
        if (!doc.is_object() || !is_string(doc, "peer_id") || !is_string(doc, "code")) {
            return fail<PairRequest>(Error::BadRequest);
        }

        PairRequest request;
        request.peer_id = doc["peer_id"].get<std::string>();
        request.code = doc["code"].get<std::string>();
        request.hostname = doc.value("hostname", std::string{});
        if (request.peer_id.empty()) {
            return fail<PairRequest>(Error::BadRequest);
        }
        return {std::move(request), Error::None};
    } catch (const json::exception& e) {
        std::cerr << "flow: bad pair request: " << e.what() << std::endl;
        return fail<PairRequest>(Error::BadRequest);
    }
}

std::string encode_pair_response(const PairResponse& response) {
    json doc = {
        {"peer_id", response.peer_id},
        {"token", response.token},
        {"hostname", response.hostname},
    };
    return doc.dump();
}

Result<PairResponse> decode_pair_response(std::string_view body) {
    try {
        json doc = json::parse(body.begin(), body.end());
        if (!doc.is_object() || !is_string(doc, "peer_id") || !is_string(doc, "token")) {
            return fail<PairResponse>(Error::BadRequest);
        }

        PairResponse response;
        response.peer_id = doc["peer_id"].get<std::string>();
        response.token = doc["token"].get<std::string>();
        response.hostname = doc.value("hostname", std::string{});
        if (response.token.empty()) {
            return fail<PairResponse>(Error::BadRequest);
        }
        return {std::move(response), Error::None};
    } catch (const json::exception& e) {
        std::cerr << "flow: bad pair response: " << e.what() << std::endl;
        return fail<PairResponse>(Error::BadRequest);
    }
}

std::string encode_info(const PeerInfo& info) {
    json doc = {
        {"peer_id", info.peer_id},
        {"hostname", info.hostname},
        {"host_slot", info.host_slot},
        {"version", info.version},
    };
    return doc.dump();
}

Result<PeerInfo> decode_info(std::string_view body) {
    try {
        json doc = json::parse(body.begin(), body.end());
        if (!doc.is_object() || !is_string(doc, "peer_id")) {
            return fail<PeerInfo>(Error::BadRequest);
        }

        PeerInfo info;
        info.peer_id = doc["peer_id"].get<std::string>();
        info.hostname = doc.value("hostname", std::string{});
        info.host_slot = doc.value("host_slot", -1);
        info.version = doc.value("version", std::string{});
        return {std::move(info), Error::None};
    } catch (const json::exception& e) {
        std::cerr << "flow: bad info response: " << e.what() << std::endl;
        return fail<PeerInfo>(Error::BadRequest);
    }
}

} // namespace juhradial::flow
