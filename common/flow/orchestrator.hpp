#pragma once

#include "peer_directory.hpp"
#include "sync_message.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace juhradial::flow {

class Clipboard {
public:
    virtual ~Clipboard() = default;

    virtual std::optional<std::string> read() = 0;
    virtual bool write(const std::string& text) = 0;
};

class PeerSender {
public:
    virtual ~PeerSender() = default;

    virtual Error send(const PeerRecord& peer, const SyncMessage& message) = 0;
};

// Who holds keyboard/mouse focus across the paired peers
struct Focus {
    enum class Kind : uint8_t { Unowned, Local, Remote };

    Kind kind = Kind::Unowned;
    std::string owner;  // Remote only

    static Focus unowned() { return {Kind::Unowned, {}}; }
    static Focus local() { return {Kind::Local, {}}; }
    static Focus remote(std::string peer) { return {Kind::Remote, std::move(peer)}; }

    bool operator==(const Focus&) const = default;
};

std::string describe(const Focus& focus);

// Clipboard and focus hand-off protocol between paired peers
class Orchestrator {
public:
    Orchestrator(std::string self_id, uint64_t epoch, PeerDirectory& directory, Clipboard& clipboard,
                 PeerSender& sender, size_t payload_cap = DEFAULT_PAYLOAD_CAP);

    // Applies an authenticated message from a paired peer, UntrustedOrigin for anyone else.
    // Replays are accepted and ignored.
    Error receive(const SyncMessage& message);

    // Our device moved to `peer_id`: push the clipboard, then hand over focus
    Error hand_off(const std::string& peer_id, int host_slot = -1);
    Error hand_off_to_slot(int host_slot);

    // Device is (back) on this machine
    void claim_local();

    // Forwards a changed local clipboard while armed. Returns peers reached.
    size_t poll_clipboard();

    const Focus& focus() const { return focus_; }
    bool forwarding() const { return armed_; }
    uint64_t epoch() const { return epoch_; }

    void on_focus_changed(std::function<void(const Focus&)> callback) { on_focus_ = std::move(callback); }

private:
    struct Seen {
        uint64_t epoch = 0;
        uint64_t sequence = 0;
    };

    bool already_applied(const SyncMessage& message) const;
    Error apply(const SyncMessage& message);
    SyncMessage next(SyncType type, const std::string& payload);
    size_t broadcast(const SyncMessage& message);
    void set_focus(Focus focus, bool armed);

    std::string self_id_;
    uint64_t epoch_;
    uint64_t sequence_ = 0;
    PeerDirectory& directory_;
    Clipboard& clipboard_;
    PeerSender& sender_;
    size_t payload_cap_;

    Focus focus_;
    bool armed_ = false;
    std::optional<std::string> last_clipboard_;
    std::map<std::string, Seen> seen_;
    std::function<void(const Focus&)> on_focus_;
};

} // namespace juhradial::flow
