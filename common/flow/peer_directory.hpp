#pragma once

#include "../types/peer.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace juhradial::flow {

// Network browser/advertiser. Started and stopped by the directory only.
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool active() const = 0;
};

// What a browse result tells us about a peer
struct Sighting {
    std::string peer_id;
    std::string address;
    uint16_t port = 0;
    int host_slot = -1;
    std::string hostname;
};

// Arena of known peers keyed by peer_id
class PeerDirectory {
public:
    using TrustPredicate = std::function<bool(const std::string& peer_id)>;

    PeerDirectory(DiscoveryBackend* backend, std::chrono::milliseconds liveness_timeout,
                  TrustPredicate is_trusted = {});

    // Returns true if the peer was not known before
    bool upsert(const Sighting& sighting, Clock::time_point now);
    bool remove(const std::string& peer_id);

    // Seeds a paired record for a peer the trust store already vouches for
    void restore(const Sighting& sighting, Clock::time_point now);

    // Discovery lost sight of the peer. Paired records stay, the trust store anchors them.
    bool forget(const std::string& peer_id);

    // Drops unpaired records unseen for longer than the liveness timeout, returns their ids
    std::vector<std::string> sweep(Clock::time_point now);

    std::optional<PeerRecord> find(const std::string& peer_id) const;
    std::optional<PeerRecord> find_by_slot(int host_slot) const;
    std::vector<PeerRecord> peers() const;
    size_t size() const { return peers_.size(); }

    // unpaired->pairing, pairing->paired, pairing->unpaired, paired->unpaired
    bool transition(const std::string& peer_id, PairingState to);

    // Consumer-scoped discovery: backend runs while at least one consumer is attached.
    // Consumers are named (a D-Bus unique name), attaching twice under one name counts once.
    bool attach(const std::string& consumer);
    void detach(const std::string& consumer);
    void detach_all();
    size_t consumers() const { return consumers_.size(); }
    bool attached(const std::string& consumer) const { return consumers_.count(consumer) != 0; }

    void set_liveness_timeout(std::chrono::milliseconds timeout) { liveness_timeout_ = timeout; }

private:
    DiscoveryBackend* backend_;
    std::chrono::milliseconds liveness_timeout_;
    TrustPredicate is_trusted_;
    void stop_backend();

    std::map<std::string, PeerRecord> peers_;
    std::set<std::string> consumers_;
};

bool transition_allowed(PairingState from, PairingState to);

} // namespace juhradial::flow
