#pragma once

#include "../types/enums.hpp"
#include "../types/haptic.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace juhradial {

struct Config {
    struct Device {
        int request_timeout_ms = 1000;
        int discovery_attempts = 2;
        int receiver_index = -1;  // -1 picks the usual slot for the receiver type
        std::string hidraw_path;  // empty scans /sys/class/hidraw
    };

    struct Gesture {
        int hold_threshold_ms = 300;
        std::string tap_action = "toggle";
        int menu_radius = 140;
        int edge_margin = 20;
        int screen_width = 1920;
        int screen_height = 1080;
    };

    struct EasySwitch {
        std::vector<std::string> host_names;
        int confirm_timeout_ms = 3000;
    };

    struct Flow {
        bool enabled = true;
        uint16_t port = 24801;
        std::string bind_address;  // empty picks the first private IPv4 address
        std::string hostname;      // empty uses gethostname()
        int host_slot = -1;        // Easy-Switch slot this machine occupies
        size_t max_payload = 1024 * 1024;
        int liveness_timeout_ms = 30000;
        int sweep_interval_ms = 5000;
        int pairing_ttl_ms = 120000;
        int clipboard_poll_ms = 1000;
        int request_timeout_ms = 2000;
    };

    Device device;
    Gesture gesture;
    EasySwitch easy_switch;
    Flow flow;
    HapticProfile haptics;
};

namespace config {

// $XDG_CONFIG_HOME/juhradial/config.json, falling back to ~/.config
std::string default_path();

// $XDG_DATA_HOME/juhradial, falling back to ~/.local/share
std::string data_dir();

// Unknown keys are ignored, out-of-range values are clamped
Result<Config> parse(const std::string& text);

// Missing file yields defaults. BadRequest if the file exists but is not valid JSON.
Result<Config> load(const std::string& path);

} // namespace config

} // namespace juhradial
