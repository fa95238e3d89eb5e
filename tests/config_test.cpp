#include <gtest/gtest.h>

#include <config/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace juhradial;

TEST(ConfigTest, EmptyObjectGivesDefaults) {
    auto parsed = config::parse("{}");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.gesture.hold_threshold_ms, 300);
    EXPECT_EQ(parsed.value.device.discovery_attempts, 2);
    EXPECT_EQ(parsed.value.flow.port, 24801);
    EXPECT_EQ(parsed.value.flow.max_payload, 1024u * 1024u);
    EXPECT_EQ(parsed.value.flow.liveness_timeout_ms, 30000);
    EXPECT_EQ(parsed.value.flow.pairing_ttl_ms, 120000);
    EXPECT_TRUE(parsed.value.flow.enabled);
}

TEST(ConfigTest, ReadsSections) {
    auto parsed = config::parse(R"({
        "device": {"hidraw_path": "/dev/hidraw3", "receiver_index": 2},
        "gesture": {"hold_threshold_ms": 450, "tap_action": "screenshot"},
        "easy_switch": {"host_names": ["Desk", 5, "Laptop"]},
        "flow": {"enabled": false, "port": 30000, "host_slot": 1, "hostname": "studio"}
    })");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.device.hidraw_path, "/dev/hidraw3");
    EXPECT_EQ(parsed.value.device.receiver_index, 2);
    EXPECT_EQ(parsed.value.gesture.hold_threshold_ms, 450);
    EXPECT_EQ(parsed.value.gesture.tap_action, "screenshot");
    EXPECT_EQ(parsed.value.easy_switch.host_names, (std::vector<std::string>{"Desk", "", "Laptop"}));
    EXPECT_FALSE(parsed.value.flow.enabled);
    EXPECT_EQ(parsed.value.flow.port, 30000);
    EXPECT_EQ(parsed.value.flow.host_slot, 1);
    EXPECT_EQ(parsed.value.flow.hostname, "studio");
}

TEST(ConfigTest, OutOfRangeValuesAreClamped) {
    auto parsed = config::parse(R"({
        "gesture": {"hold_threshold_ms": 1},
        "flow": {"port": 80, "host_slot": 9, "max_payload": 1e12}
    })");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.gesture.hold_threshold_ms, 50);
    EXPECT_EQ(parsed.value.flow.port, 1024);
    EXPECT_EQ(parsed.value.flow.host_slot, 2);
    EXPECT_EQ(parsed.value.flow.max_payload, 16u * 1024u * 1024u);
}

TEST(ConfigTest, WrongTypesAndUnknownKeysAreIgnored) {
    auto parsed = config::parse(R"({
        "gesture": {"hold_threshold_ms": "slow", "tap_action": 3},
        "flow": {"enabled": "yes"},
        "theme": {"accent": "blue"},
        "device": []
    })");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.gesture.hold_threshold_ms, 300);
    EXPECT_EQ(parsed.value.gesture.tap_action, "toggle");
    EXPECT_TRUE(parsed.value.flow.enabled);
}

TEST(ConfigTest, InvalidJsonIsRejected) {
    EXPECT_EQ(config::parse("{").error, Error::BadRequest);
    EXPECT_EQ(config::parse("[]").error, Error::BadRequest);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
    auto parsed = config::load("/nonexistent/juhradial/config.json");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.gesture.hold_threshold_ms, 300);
}

TEST(ConfigTest, LoadsFromDisk) {
    auto path = std::filesystem::path(::testing::TempDir()) / "juhradial_config_test.json";
    std::ofstream(path) << R"({"flow": {"port": 25000}})";

    auto parsed = config::load(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.flow.port, 25000);
}

TEST(ConfigTest, PathsFollowXdg) {
    const char* home = std::getenv("HOME");
    std::string saved_home = home ? home : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg-config", 1);
    setenv("XDG_DATA_HOME", "/tmp/xdg-data", 1);
    EXPECT_EQ(config::default_path(), "/tmp/xdg-config/juhradial/config.json");
    EXPECT_EQ(config::data_dir(), "/tmp/xdg-data/juhradial");

    unsetenv("XDG_CONFIG_HOME");
    setenv("HOME", "/home/someone", 1);
    EXPECT_EQ(config::default_path(), "/home/someone/.config/juhradial/config.json");

    unsetenv("XDG_DATA_HOME");
    setenv("HOME", saved_home.c_str(), 1);
}

TEST(ConfigTest, HapticsDefaultsMatchMenuFeel) {
    auto parsed = config::parse("{}");
    ASSERT_TRUE(parsed);
    const HapticProfile& haptics = parsed.value.haptics;
    EXPECT_TRUE(haptics.enabled);
    EXPECT_EQ(haptics.menu_appear, HapticPattern::DampStateChange);
    EXPECT_EQ(haptics.slice_change, HapticPattern::SubtleCollision);
    EXPECT_EQ(haptics.confirm, HapticPattern::SharpStateChange);
    EXPECT_EQ(haptics.invalid, HapticPattern::AngryAlert);
    EXPECT_EQ(haptics.debounce_ms, 20);
    EXPECT_EQ(haptics.reentry_debounce_ms, 50);
}

TEST(ConfigTest, HapticPatternsByName) {
    auto parsed = config::parse(R"({
        "haptics": {
            "enabled": false,
            "default_pattern": "knock",
            "per_event": {"confirm": "whisper_collision", "invalid": "buzz", "slice_change": 4},
            "slice_debounce_ms": 35,
            "reentry_debounce_ms": 5000
        }
    })");
    ASSERT_TRUE(parsed);
    const HapticProfile& haptics = parsed.value.haptics;
    EXPECT_FALSE(haptics.enabled);
    EXPECT_EQ(haptics.menu_appear, HapticPattern::Knock);
    EXPECT_EQ(haptics.confirm, HapticPattern::WhisperCollision);
    EXPECT_EQ(haptics.invalid, HapticPattern::Knock);
    EXPECT_EQ(haptics.slice_change, HapticPattern::Knock);
    EXPECT_EQ(haptics.slice_debounce_ms, 35);
    EXPECT_EQ(haptics.reentry_debounce_ms, 1000);
}

TEST(ConfigTest, UnknownDefaultPatternKeepsPerEventDefaults) {
    auto parsed = config::parse(R"({"haptics": {"default_pattern": "thunder"}})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value.haptics.menu_appear, HapticPattern::DampStateChange);
    EXPECT_EQ(parsed.value.haptics.invalid, HapticPattern::AngryAlert);
}
