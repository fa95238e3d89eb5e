#include "peer_directory.hpp"

#include <iostream>

namespace juhradial::flow {

bool transition_allowed(PairingState from, PairingState to) {
    switch (from) {
        case PairingState::Unpaired:
            return to == PairingState::Pairing;
        case PairingState::Pairing:
            return to == PairingState::Paired || to == PairingState::Unpaired;
        case PairingState::Paired:
            return to == PairingState::Unpaired;
    }
    return false;
}

PeerDirectory::PeerDirectory(DiscoveryBackend* backend, std::chrono::milliseconds liveness_timeout,
                             TrustPredicate is_trusted)
    : backend_(backend), liveness_timeout_(liveness_timeout), is_trusted_(std::move(is_trusted)) {}

bool PeerDirectory::upsert(const Sighting& sighting, Clock::time_point now) {
    if (sighting.peer_id.empty()) {
        return false;
    }

    auto it = peers_.find(sighting.peer_id);
    if (it == peers_.end()) {
        PeerRecord record;
        record.peer_id = sighting.peer_id;
        record.address = sighting.address;
        record.port = sighting.port;
        record.host_slot = sighting.host_slot;
        record.hostname = sighting.hostname;
        record.last_seen = now;
        record.pairing_state = is_trusted_ && is_trusted_(sighting.peer_id)
            ? PairingState::Paired
            : PairingState::Unpaired;

        std::cout << "flow: discovered " << record.peer_id << " (" << record.hostname << ") at "
                  << record.address << ":" << record.port << std::endl;
        peers_.emplace(record.peer_id, std::move(record));
        return true;
    }

    PeerRecord& record = it->second;
    if (!sighting.address.empty()) {
        record.address = sighting.address;
        record.port = sighting.port;
    }
    if (!sighting.hostname.empty()) {
        record.hostname = sighting.hostname;
    }
    record.host_slot = sighting.host_slot;
    record.last_seen = now;
    return false;
}

bool PeerDirectory::remove(const std::string& peer_id) {
    return peers_.erase(peer_id) != 0;
}

void PeerDirectory::restore(const Sighting& sighting, Clock::time_point now) {
    if (sighting.peer_id.empty()) {
        return;
    }

    PeerRecord& record = peers_[sighting.peer_id];
    if (record.peer_id.empty()) {
        record.peer_id = sighting.peer_id;
        record.last_seen = now;
    }
    if (!sighting.address.empty()) {
        record.address = sighting.address;
        record.port = sighting.port;
        record.host_slot = sighting.host_slot;
    }
    if (!sighting.hostname.empty()) {
        record.hostname = sighting.hostname;
    }
    record.pairing_state = PairingState::Paired;
}

bool PeerDirectory::forget(const std::string& peer_id) {
    auto it = peers_.find(peer_id);
    if (it == peers_.end() || it->second.pairing_state == PairingState::Paired) {
        return false;
    }
    peers_.erase(it);
    return true;
}

std::vector<std::string> PeerDirectory::sweep(Clock::time_point now) {
    std::vector<std::string> removed;

    for (auto it = peers_.begin(); it != peers_.end();) {
        bool stale = now - it->second.last_seen > liveness_timeout_;
        if (stale && it->second.pairing_state != PairingState::Paired) {
            std::cout << "flow: " << it->first << " unseen, removing" << std::endl;
            removed.push_back(it->first);
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }

    return removed;
}

std::optional<PeerRecord> PeerDirectory::find(const std::string& peer_id) const {
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

std::optional<PeerRecord> PeerDirectory::find_by_slot(int host_slot) const {
    if (host_slot < 0) return std::nullopt;

    for (const auto& [id, record] : peers_) {
        if (record.host_slot == host_slot) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<PeerRecord> PeerDirectory::peers() const {
    std::vector<PeerRecord> out;
    out.reserve(peers_.size());
    for (const auto& [id, record] : peers_) {
        out.push_back(record);
    }
    return out;
}

bool PeerDirectory::transition(const std::string& peer_id, PairingState to) {
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return false;
    }

    PairingState from = it->second.pairing_state;
    if (!transition_allowed(from, to)) {
        std::cerr << "flow: refusing " << to_string(from) << " -> " << to_string(to)
                  << " for " << peer_id << std::endl;
        return false;
    }

    it->second.pairing_state = to;
    return true;
}

bool PeerDirectory::attach(const std::string& consumer) {
    if (consumers_.count(consumer)) {
        return backend_ == nullptr || backend_->active();
    }
    if (consumers_.empty() && backend_) {
        if (!backend_->start()) {
            std::cerr << "flow: discovery failed to start" << std::endl;
            return false;
        }
        std::cout << "flow: discovery started" << std::endl;
    }
    consumers_.insert(consumer);
    return true;
}

void PeerDirectory::detach(const std::string& consumer) {
    if (consumers_.erase(consumer) == 0) {
        return;
    }
    if (consumers_.empty()) {
        stop_backend();
    }
}

void PeerDirectory::detach_all() {
    if (consumers_.empty()) {
        return;
    }
    consumers_.clear();
    stop_backend();
}

void PeerDirectory::stop_backend() {
    if (backend_) {
        backend_->stop();
        std::cout << "flow: discovery stopped" << std::endl;
    }
}

} // namespace juhradial::flow
