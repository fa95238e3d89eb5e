#include <gtest/gtest.h>

#include <protocol/parse.hpp>

using namespace juhradial;
using namespace juhradial::parse;

namespace {

std::vector<uint8_t> bytes(std::initializer_list<uint8_t> list) {
    return std::vector<uint8_t>(list);
}

} // namespace

TEST(ParseTest, ProtocolVersionNeedsPingMarker) {
    auto version = parse_protocol_version(bytes({4, 5, packets::PING_MARKER}));
    ASSERT_TRUE(version);
    EXPECT_EQ(version->major, 4);
    EXPECT_EQ(version->minor, 5);

    EXPECT_FALSE(parse_protocol_version(bytes({4, 5, 0x00})));
    EXPECT_FALSE(parse_protocol_version(bytes({1, 0, packets::PING_MARKER})));
    EXPECT_FALSE(parse_protocol_version(bytes({4})));
}

TEST(ParseTest, FeatureIndexZeroMeansAbsent) {
    EXPECT_FALSE(parse_feature_index(bytes({0})));
    EXPECT_EQ(parse_feature_index(bytes({9})), std::optional<uint8_t>(9));
    EXPECT_FALSE(parse_feature_index({}));
}

TEST(ParseTest, FeatureIdIsBigEndian) {
    EXPECT_EQ(parse_feature_id(bytes({0x18, 0x14})), 0x1814);
    EXPECT_EQ(parse_feature_id(bytes({0x18})), 0);
}

TEST(ParseTest, BatteryStatus) {
    auto battery = parse_battery_status(bytes({50, 20, 1}));
    ASSERT_TRUE(battery);
    EXPECT_EQ(battery->level, 50);
    EXPECT_TRUE(battery->charging);
    EXPECT_EQ(battery->status, BatteryStatus::Charging);

    auto full = parse_battery_status(bytes({100, 0, 3}));
    ASSERT_TRUE(full);
    EXPECT_EQ(full->status, BatteryStatus::Full);

    EXPECT_FALSE(parse_battery_status(bytes({101, 0, 0})));
}

TEST(ParseTest, UnifiedBattery) {
    auto battery = parse_unified_battery(bytes({73, 8, 0, 0}));
    ASSERT_TRUE(battery);
    EXPECT_EQ(battery->level, 73);
    EXPECT_FALSE(battery->charging);
    EXPECT_EQ(battery->status, BatteryStatus::Discharging);

    auto slow = parse_unified_battery(bytes({20, 2, 0, 2}));
    ASSERT_TRUE(slow);
    EXPECT_TRUE(slow->charging);
    EXPECT_EQ(slow->status, BatteryStatus::ChargingSlow);

    EXPECT_FALSE(parse_unified_battery(bytes({20, 2, 0})));
}

TEST(ParseTest, HostInfoRejectsCurrentOutOfRange) {
    auto info = parse_host_info(bytes({3, 1}));
    ASSERT_TRUE(info);
    EXPECT_EQ(info->count, 3);
    EXPECT_EQ(info->current, 1);

    EXPECT_FALSE(parse_host_info(bytes({2, 2})));
    EXPECT_FALSE(parse_host_info(bytes({3})));
}

TEST(ParseTest, DpiAndDpiList) {
    EXPECT_EQ(parse_dpi(bytes({0, 0x06, 0x40})), std::optional<uint16_t>(1600));
    EXPECT_FALSE(parse_dpi(bytes({0, 0, 0})));

    auto list = parse_dpi_list(bytes({0, 0x00, 0xC8, 0xE0, 0x32, 0x1F, 0x40, 0x00, 0x00, 0x03, 0x20}));
    EXPECT_EQ(list, (std::vector<uint16_t>{200, 8000}));
}

TEST(ParseTest, DivertedButtons) {
    auto pressed = parse_diverted_buttons(bytes({0x00, 0xC3, 0x00, 0x00}));
    EXPECT_EQ(pressed, (std::vector<uint16_t>{packets::cid::GESTURE_BUTTON}));
    EXPECT_TRUE(is_gesture_pressed(pressed));

    auto haptic = parse_diverted_buttons(bytes({0x00, 0x52, 0x01, 0xA0}));
    EXPECT_EQ(haptic, (std::vector<uint16_t>{0x52, packets::cid::HAPTIC_SENSE}));
    EXPECT_TRUE(is_gesture_pressed(haptic));

    auto released = parse_diverted_buttons(bytes({0, 0, 0, 0, 0, 0, 0, 0}));
    EXPECT_TRUE(released.empty());
    EXPECT_FALSE(is_gesture_pressed(released));

    EXPECT_FALSE(is_gesture_pressed({0x52, 0x53}));
}

TEST(ParseTest, NameChunkStopsAtNulAndRemaining) {
    EXPECT_EQ(parse_name_chunk(bytes({'M', 'X', ' ', 'M', 0, 'z'}), 10), "MX M");
    EXPECT_EQ(parse_name_chunk(bytes({'M', 'X', ' ', 'M'}), 2), "MX");
}

TEST(ParseTest, LinkLostBit) {
    EXPECT_TRUE(parse_link_lost(bytes({0x40})));
    EXPECT_TRUE(parse_link_lost(bytes({0x42})));
    EXPECT_FALSE(parse_link_lost(bytes({0x02})));
    EXPECT_FALSE(parse_link_lost({}));
}

TEST(ParseTest, ErrorNames) {
    EXPECT_EQ(error_name(0x02), "invalid argument");
    EXPECT_EQ(error_name(0x09), "unsupported");
    EXPECT_EQ(error_name(0x42), "error 66");
}
