#pragma once

#include "enums.hpp"
#include "menu.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace juhradial {

struct PeerRecord {
    std::string peer_id;
    std::string address;   // dotted IPv4
    uint16_t port = 0;
    int host_slot = -1;    // Easy-Switch slot the peer sits on, -1 if not advertised
    std::string hostname;
    Clock::time_point last_seen{};
    PairingState pairing_state = PairingState::Unpaired;
};

struct PairingCode {
    std::string peer_id;
    std::string value;
    Clock::time_point expires_at{};
};

struct SyncMessage {
    SyncType type = SyncType::Clipboard;
    std::string origin;     // peer_id of the sender
    uint64_t epoch = 0;     // sender process instance, resets sequence tracking
    uint64_t sequence = 0;
    std::vector<uint8_t> payload;
};

} // namespace juhradial
