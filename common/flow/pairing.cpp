#include "pairing.hpp"
#include "../protocol/crypto.hpp"

#include <iostream>

namespace juhradial::flow {

size_t restore_paired(PeerDirectory& directory, const TrustStore& trust, Clock::time_point now) {
    size_t restored = 0;
    for (const auto& [peer_id, entry] : trust.entries()) {
        directory.restore(Sighting{peer_id, entry.address, entry.port, entry.host_slot, entry.hostname}, now);
        ++restored;
    }
    return restored;
}

Result<std::string> secure_code() {
    return crypto::random_digits(PAIRING_CODE_DIGITS);
}

PairingAuthority::PairingAuthority(PeerDirectory& directory, std::chrono::milliseconds ttl,
                                   CodeGenerator generate)
    : directory_(directory), ttl_(ttl), generate_(std::move(generate)) {}

Result<PairingCode> PairingAuthority::issue_code(const std::string& peer_id, Clock::time_point now) {
    auto peer = directory_.find(peer_id);
    if (!peer) {
        return fail<PairingCode>(Error::UnknownPeer);
    }
    if (peer->pairing_state == PairingState::Paired) {
        return fail<PairingCode>(Error::InvalidPairing);
    }

    auto code = generate_();
    if (!code) {
        std::cerr << "flow: could not generate pairing code: " << to_string(code.error) << std::endl;
        return fail<PairingCode>(code.error);
    }

    if (peer->pairing_state == PairingState::Unpaired &&
        !directory_.transition(peer_id, PairingState::Pairing)) {
        return fail<PairingCode>(Error::InvalidPairing);
    }

    PairingCode issued{peer_id, code.value, now + ttl_};
    codes_[peer_id] = issued;

    std::cout << "flow: pairing code issued for " << peer_id << std::endl;
    return {issued, Error::None};
}

void PairingAuthority::reject(const std::string& peer_id) {
    // A paired peer keeps its trust, only an open attempt is dropped
    auto peer = directory_.find(peer_id);
    if (peer && peer->pairing_state == PairingState::Pairing) {
        directory_.transition(peer_id, PairingState::Unpaired);
    }
}

Result<std::string> PairingAuthority::verify(const std::string& peer_id, const std::string& code,
                                             Clock::time_point now) {
    auto it = codes_.find(peer_id);
    if (it == codes_.end()) {
        std::cerr << "flow: no outstanding pairing code for " << peer_id << std::endl;
        reject(peer_id);
        return fail<std::string>(Error::InvalidPairing);
    }

    PairingCode issued = it->second;
    codes_.erase(it);

    if (now >= issued.expires_at) {
        std::cerr << "flow: pairing code for " << peer_id << " expired" << std::endl;
        reject(peer_id);
        return fail<std::string>(Error::InvalidPairing);
    }

    if (!crypto::constant_time_equals(issued.value, code)) {
        std::cerr << "flow: wrong pairing code from " << peer_id << std::endl;
        reject(peer_id);
        return fail<std::string>(Error::InvalidPairing);
    }

    if (!directory_.transition(peer_id, PairingState::Paired)) {
        reject(peer_id);
        return fail<std::string>(Error::InvalidPairing);
    }

    auto token = crypto::random_token();
    if (!token) {
        directory_.transition(peer_id, PairingState::Unpaired);
        return fail<std::string>(token.error);
    }

    std::cout << "flow: paired with " << peer_id << std::endl;
    return token;
}

std::vector<std::string> PairingAuthority::expire(Clock::time_point now) {
    std::vector<std::string> expired;

    for (auto it = codes_.begin(); it != codes_.end();) {
        if (now >= it->second.expires_at) {
            expired.push_back(it->first);
            reject(it->first);
            it = codes_.erase(it);
        } else {
            ++it;
        }
    }

    return expired;
}

} // namespace juhradial::flow
