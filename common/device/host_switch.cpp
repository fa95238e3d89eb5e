#include "host_switch.hpp"
#include "../protocol/parse.hpp"

#include <iostream>

namespace juhradial {

HostSwitch::HostSwitch(Session& session, std::vector<std::string> names, int confirm_timeout_ms)
    : session_(session), names_(std::move(names)), confirm_timeout_ms_(confirm_timeout_ms) {}

std::string HostSwitch::name_of(uint8_t index) const {
    if (index < names_.size() && !names_[index].empty()) {
        return names_[index];
    }
    return "Host " + std::to_string(index + 1);
}

std::vector<HostSlot> HostSwitch::list_hosts() const {
    const HostInfo& hosts = session_.state().hosts;

    std::vector<HostSlot> slots;
    slots.reserve(hosts.count);
    for (uint8_t i = 0; i < hosts.count; ++i) {
        slots.push_back(HostSlot{i, name_of(i), i == hosts.current});
    }
    return slots;
}

Error HostSwitch::refresh() {
    if (!session_.connected()) {
        return Error::DeviceUnavailable;
    }
    return session_.refresh_hosts();
}

Error HostSwitch::switch_to(int index) {
    const HostInfo hosts = session_.state().hosts;

    if (index < 0 || index >= hosts.count) {
        std::cerr << "host_switch: slot " << index << " out of range (device reports "
                  << static_cast<int>(hosts.count) << ")" << std::endl;
        return Error::InvalidSlot;
    }

    auto slot = static_cast<uint8_t>(index);
    if (slot == hosts.current) {
        return Error::None;
    }

    if (Error err = session_.send_command(commands::change_host::set_current_host(slot)); err != Error::None) {
        std::cerr << "host_switch: setCurrentHost failed: " << to_string(err) << std::endl;
        return err;
    }

    std::cout << "host_switch: switching to " << name_of(slot) << std::endl;

    // The acknowledgement only means the command was accepted, wait for the device to move
    auto confirmed = session_.await_notification(
        [slot](const Notification& n) {
            if (n.feature_id == packets::features::CHANGE_HOST) {
                auto info = parse::parse_host_info(n.frame.params);
                return info && info->current == slot;
            }
            return n.is_receiver() && n.frame.feature_index == packets::DEVICE_CONNECTION &&
                   parse::parse_link_lost(n.frame.params);
        },
        confirm_timeout_ms_);

    if (confirmed.error == Error::DeviceUnavailable) {
        // Direct links drop the moment the device leaves
        std::cout << "host_switch: device left for " << name_of(slot) << std::endl;
        return Error::None;
    }
    if (!confirmed) {
        std::cerr << "host_switch: no confirmation for slot " << index << std::endl;
        return confirmed.error;
    }

    if (confirmed.value.is_receiver()) {
        session_.mark_current_host(slot);
    }
    return Error::None;
}

} // namespace juhradial
