#pragma once

#include "../types/host.hpp"
#include "session.hpp"

#include <string>
#include <vector>

namespace juhradial {

// Easy-Switch control on top of a connected session
class HostSwitch {
public:
    HostSwitch(Session& session, std::vector<std::string> names, int confirm_timeout_ms);

    // Exactly the slots the device reported, empty until host info was read
    std::vector<HostSlot> list_hosts() const;

    // InvalidSlot for anything outside the live slot count, nothing is sent then
    Error switch_to(int index);

    Error refresh();

    void set_names(std::vector<std::string> names) { names_ = std::move(names); }
    std::string name_of(uint8_t index) const;

private:
    Session& session_;
    std::vector<std::string> names_;
    int confirm_timeout_ms_;
};

} // namespace juhradial
