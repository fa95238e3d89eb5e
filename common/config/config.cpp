#include "config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace juhradial::config {

namespace {

std::string xdg_dir(const char* variable, const char* fallback) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return std::string(value) + "/juhradial";
    }
    const char* home = std::getenv("HOME");
    return std::string(home ? home : ".") + "/" + fallback + "/juhradial";
}

template<typename T>
void read_number(const json& section, const char* key, T& target, T min, T max) {
    if (!section.contains(key)) return;

    const json& value = section[key];
    if (!value.is_number()) {
        std::cerr << "config: " << key << " must be a number, keeping " << target << std::endl;
        return;
    }

    double raw = value.get<double>();
    double clamped = std::clamp(raw, static_cast<double>(min), static_cast<double>(max));
    if (clamped != raw) {
        std::cerr << "config: " << key << " clamped to " << clamped << std::endl;
    }
    target = static_cast<T>(clamped);
}

void read_string(const json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void read_bool(const json& section, const char* key, bool& target) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

bool read_pattern(const json& section, const char* key, HapticPattern& target) {
    if (!section.contains(key)) return false;

    const json& value = section[key];
    auto pattern = value.is_string() ? haptic_pattern_from_string(value.get<std::string>()) : std::nullopt;
    if (!pattern) {
        std::cerr << "config: unknown haptic pattern for " << key << ", keeping " << to_string(target) << std::endl;
        return false;
    }
    target = *pattern;
    return true;
}

} // namespace

std::string default_path() {
    return xdg_dir("XDG_CONFIG_HOME", ".config") + "/config.json";
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

Result<Config> parse(const std::string& text) {
    Config config;

    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            return fail<Config>(Error::BadRequest);
        }

        if (doc.contains("device") && doc["device"].is_object()) {
            const json& device = doc["device"];
            read_number(device, "request_timeout_ms", config.device.request_timeout_ms, 50, 10000);
            read_number(device, "discovery_attempts", config.device.discovery_attempts, 1, 5);
            read_number(device, "receiver_index", config.device.receiver_index, -1, 6);
            read_string(device, "hidraw_path", config.device.hidraw_path);
        }

        if (doc.contains("gesture") && doc["gesture"].is_object()) {
            const json& gesture = doc["gesture"];
            read_number(gesture, "hold_threshold_ms", config.gesture.hold_threshold_ms, 50, 5000);
            read_string(gesture, "tap_action", config.gesture.tap_action);
            read_number(gesture, "menu_radius", config.gesture.menu_radius, 10, 2000);
            read_number(gesture, "edge_margin", config.gesture.edge_margin, 0, 500);
            read_number(gesture, "screen_width", config.gesture.screen_width, 320, 32768);
            read_number(gesture, "screen_height", config.gesture.screen_height, 240, 32768);
        }

        if (doc.contains("easy_switch") && doc["easy_switch"].is_object()) {
            const json& easy_switch = doc["easy_switch"];
            if (easy_switch.contains("host_names") && easy_switch["host_names"].is_array()) {
                for (const auto& name : easy_switch["host_names"]) {
                    config.easy_switch.host_names.push_back(name.is_string() ? name.get<std::string>() : "");
                }
            }
            read_number(easy_switch, "confirm_timeout_ms", config.easy_switch.confirm_timeout_ms, 100, 30000);
        }

        if (doc.contains("flow") && doc["flow"].is_object()) {
            const json& flow = doc["flow"];
            read_bool(flow, "enabled", config.flow.enabled);
            read_number<uint16_t>(flow, "port", config.flow.port, 1024, 65535);
            read_string(flow, "bind_address", config.flow.bind_address);
            read_string(flow, "hostname", config.flow.hostname);
            read_number(flow, "host_slot", config.flow.host_slot, -1, 2);
            read_number<size_t>(flow, "max_payload", config.flow.max_payload, 1024, 16 * 1024 * 1024);
            read_number(flow, "liveness_timeout_ms", config.flow.liveness_timeout_ms, 1000, 600000);
            read_number(flow, "sweep_interval_ms", config.flow.sweep_interval_ms, 500, 60000);
            read_number(flow, "pairing_ttl_ms", config.flow.pairing_ttl_ms, 10000, 600000);
            read_number(flow, "clipboard_poll_ms", config.flow.clipboard_poll_ms, 100, 60000);
            read_number(flow, "request_timeout_ms", config.flow.request_timeout_ms, 100, 30000);
        }

        if (doc.contains("haptics") && doc["haptics"].is_object()) {
            const json& haptics = doc["haptics"];
            read_bool(haptics, "enabled", config.haptics.enabled);

            // default_pattern seeds every event, per_event entries override it
            HapticPattern fallback = config.haptics.slice_change;
            if (read_pattern(haptics, "default_pattern", fallback)) {
                config.haptics.menu_appear = fallback;
                config.haptics.slice_change = fallback;
                config.haptics.confirm = fallback;
                config.haptics.invalid = fallback;
            }
            if (haptics.contains("per_event") && haptics["per_event"].is_object()) {
                const json& per_event = haptics["per_event"];
                read_pattern(per_event, "menu_appear", config.haptics.menu_appear);
                read_pattern(per_event, "slice_change", config.haptics.slice_change);
                read_pattern(per_event, "confirm", config.haptics.confirm);
                read_pattern(per_event, "invalid", config.haptics.invalid);
            }
            read_number(haptics, "debounce_ms", config.haptics.debounce_ms, 0, 1000);
            read_number(haptics, "slice_debounce_ms", config.haptics.slice_debounce_ms, 0, 1000);
            read_number(haptics, "reentry_debounce_ms", config.haptics.reentry_debounce_ms, 0, 1000);
        }
    } catch (const json::exception& e) {
        std::cerr << "config: " << e.what() << std::endl;
        return fail<Config>(Error::BadRequest);
    }

    return {config, Error::None};
}

Result<Config> load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "config: " << path << " not found, using defaults" << std::endl;
        return {Config{}, Error::None};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse(buffer.str());
    if (!config) {
        std::cerr << "config: failed to parse " << path << std::endl;
    }
    return config;
}

} // namespace juhradial::config
