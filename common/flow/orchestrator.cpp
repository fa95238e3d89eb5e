#include "orchestrator.hpp"

#include <iostream>

namespace juhradial::flow {

std::string describe(const Focus& focus) {
    switch (focus.kind) {
        case Focus::Kind::Unowned: return "unowned";
        case Focus::Kind::Local: return "local";
        case Focus::Kind::Remote: return "remote:" + focus.owner;
    }
    return "unknown";
}

Orchestrator::Orchestrator(std::string self_id, uint64_t epoch, PeerDirectory& directory, Clipboard& clipboard,
                           PeerSender& sender, size_t payload_cap)
    : self_id_(std::move(self_id)), epoch_(epoch), directory_(directory), clipboard_(clipboard),
      sender_(sender), payload_cap_(payload_cap) {}

void Orchestrator::set_focus(Focus focus, bool armed) {
    armed_ = armed;
    if (focus_ == focus) {
        return;
    }
    focus_ = std::move(focus);
    std::cout << "flow: focus is now " << describe(focus_) << std::endl;
    if (on_focus_) on_focus_(focus_);
}

bool Orchestrator::already_applied(const SyncMessage& message) const {
    auto it = seen_.find(message.origin);
    if (it == seen_.end()) {
        return false;
    }
    // Older epoch is a previous run of the sender
    if (message.epoch != it->second.epoch) {
        return message.epoch < it->second.epoch;
    }
    return message.sequence <= it->second.sequence;
}

Error Orchestrator::receive(const SyncMessage& message) {
    // The token only proves who sent it; the sender must still be a paired peer here
    auto peer = directory_.find(message.origin);
    if (!peer || peer->pairing_state != PairingState::Paired) {
        std::cerr << "flow: ignoring message from unpaired " << message.origin << std::endl;
        return Error::UntrustedOrigin;
    }

    if (already_applied(message)) {
        return Error::None;
    }

    Error err = apply(message);
    if (err == Error::None) {
        // Only what took effect counts, a failed write can be retried with the same sequence
        seen_[message.origin] = Seen{message.epoch, message.sequence};
    }
    return err;
}

Error Orchestrator::apply(const SyncMessage& message) {
    std::string text(message.payload.begin(), message.payload.end());

    switch (message.type) {
        case SyncType::FocusHandoff:
            std::cout << "flow: " << message.origin << " handed focus to us" << std::endl;
            last_clipboard_ = clipboard_.read();
            set_focus(Focus::local(), true);
            return Error::None;

        case SyncType::Clipboard:
            // Our own clipboard wins while we hold focus
            if (focus_.kind == Focus::Kind::Local) {
                return Error::None;
            }
            if (!clipboard_.write(text)) {
                std::cerr << "flow: failed to apply clipboard from " << message.origin << std::endl;
                return Error::IoError;
            }
            last_clipboard_ = text;
            return Error::None;
    }
    return Error::BadRequest;
}

SyncMessage Orchestrator::next(SyncType type, const std::string& payload) {
    SyncMessage message;
    message.type = type;
    message.origin = self_id_;
    message.epoch = epoch_;
    message.sequence = ++sequence_;
    message.payload.assign(payload.begin(), payload.end());
    return message;
}

size_t Orchestrator::broadcast(const SyncMessage& message) {
    size_t reached = 0;
    for (const auto& peer : directory_.peers()) {
        if (peer.pairing_state != PairingState::Paired) continue;
        if (sender_.send(peer, message) == Error::None) {
            ++reached;
        }
    }
    return reached;
}

Error Orchestrator::hand_off(const std::string& peer_id, int host_slot) {
    auto peer = directory_.find(peer_id);
    if (!peer) {
        return Error::UnknownPeer;
    }
    if (peer->pairing_state != PairingState::Paired) {
        return Error::UntrustedOrigin;
    }

    if (armed_) {
        auto text = clipboard_.read();
        if (text && text->size() <= payload_cap_) {
            if (sender_.send(*peer, next(SyncType::Clipboard, *text)) != Error::None) {
                std::cerr << "flow: clipboard not delivered to " << peer_id << std::endl;
            }
            last_clipboard_ = text;
        }
    }

    Error err = sender_.send(*peer, next(SyncType::FocusHandoff, host_slot >= 0 ? std::to_string(host_slot) : ""));
    if (err != Error::None) {
        std::cerr << "flow: focus hand-off to " << peer_id << " failed: " << to_string(err) << std::endl;
    }

    // The device already left, focus follows it regardless of delivery
    set_focus(Focus::remote(peer_id), false);
    return err;
}

Error Orchestrator::hand_off_to_slot(int host_slot) {
    auto peer = directory_.find_by_slot(host_slot);
    if (!peer || peer->pairing_state != PairingState::Paired) {
        set_focus(Focus::unowned(), false);
        return Error::NotFound;
    }
    return hand_off(peer->peer_id, host_slot);
}

void Orchestrator::claim_local() {
    last_clipboard_ = clipboard_.read();
    set_focus(Focus::local(), true);
}

size_t Orchestrator::poll_clipboard() {
    if (!armed_) {
        return 0;
    }

    auto text = clipboard_.read();
    if (!text || text == last_clipboard_) {
        return 0;
    }
    last_clipboard_ = text;

    if (text->size() > payload_cap_) {
        std::cerr << "flow: clipboard too large to sync (" << text->size() << " bytes)" << std::endl;
        return 0;
    }

    return broadcast(next(SyncType::Clipboard, *text));
}

} // namespace juhradial::flow
