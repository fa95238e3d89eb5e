#include <gtest/gtest.h>

#include "fake_device.hpp"

#include <device/session.hpp>

using namespace juhradial;
using juhradial::test::FakeDevice;

namespace {

namespace features = packets::features;
namespace functions = packets::functions;

std::unique_ptr<FakeDevice> make_mouse() {
    auto device = std::make_unique<FakeDevice>(std::vector<uint16_t>{
        features::UNIFIED_BATTERY,
        features::CHANGE_HOST,
        features::REPROG_CONTROLS_V4,
        features::ADJUSTABLE_DPI,
    });
    device->replies[{features::UNIFIED_BATTERY, functions::UNIFIED_BATTERY_GET_STATUS}] = {80, 0, 0, 0};
    device->replies[{features::CHANGE_HOST, functions::CHANGE_HOST_GET_INFO}] = {3, 0};
    device->replies[{features::ADJUSTABLE_DPI, functions::DPI_GET}] = {0, 0x06, 0x40};
    device->replies[{features::ADJUSTABLE_DPI, functions::DPI_SET}] = {0, 0x0C, 0x80};
    device->replies[{features::ADJUSTABLE_DPI, functions::DPI_GET_LIST}] = {0, 0x01, 0x90, 0x03, 0x20, 0xE0, 0x64,
                                                                          0x0F, 0xA0, 0x00, 0x00};
    return device;
}

} // namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto owned = make_mouse();
        device = owned.get();

        Session::Callbacks callbacks;
        callbacks.on_connection = [this](bool connected) { connections.push_back(connected); };
        callbacks.on_battery = [this](const Battery& battery) { batteries.push_back(battery); };
        callbacks.on_hosts = [this](const HostInfo& hosts) { host_updates.push_back(hosts); };
        callbacks.on_dpi = [this](uint16_t dpi) { dpis.push_back(dpi); };

        Session::Options options;
        options.request_timeout_ms = 50;
        options.discovery_attempts = 2;
        session = std::make_unique<Session>(std::move(owned), options, callbacks);
    }

    FakeDevice* device = nullptr;
    std::unique_ptr<Session> session;

    std::vector<bool> connections;
    std::vector<Battery> batteries;
    std::vector<HostInfo> host_updates;
    std::vector<uint16_t> dpis;
};

TEST_F(SessionTest, ConnectDiscoversFeaturesAndReadsState) {
    ASSERT_EQ(session->connect(), Error::None);

    EXPECT_TRUE(session->connected());
    EXPECT_EQ(session->handle().protocol_major, 4);
    EXPECT_EQ(session->handle().features.find(features::CHANGE_HOST), std::optional<uint8_t>(4));
    EXPECT_EQ(session->handle().features.find(features::ADJUSTABLE_DPI), std::optional<uint8_t>(6));

    const DeviceState& state = session->state();
    EXPECT_EQ(state.device_name, "MX Master 3S");
    EXPECT_EQ(state.battery.level, 80);
    EXPECT_FALSE(state.battery.charging);
    EXPECT_EQ(state.hosts.count, 3);
    EXPECT_EQ(state.hosts.current, 0);
    EXPECT_EQ(state.dpi, 1600);

    ASSERT_EQ(connections.size(), 1u);
    EXPECT_TRUE(connections[0]);
    EXPECT_EQ(batteries.size(), 1u);
    EXPECT_EQ(dpis.size(), 1u);
}

TEST_F(SessionTest, FeatureIndicesComeFromTheDevice) {
    // Same features at different positions on another connect
    device->features = {features::I_FEATURE_SET, features::ADJUSTABLE_DPI, features::DEVICE_NAME};
    ASSERT_EQ(session->connect(), Error::None);

    EXPECT_EQ(session->handle().features.find(features::ADJUSTABLE_DPI), std::optional<uint8_t>(2));
    EXPECT_FALSE(session->supports(features::CHANGE_HOST));

    auto dpi = session->get_dpi();
    ASSERT_TRUE(dpi);
    EXPECT_EQ(device->requests.back().feature_index, 2);
}

TEST_F(SessionTest, BlockedFeatureIsNeverSent) {
    ASSERT_EQ(session->connect(), Error::None);
    size_t before = device->requests.size();

    auto reply = session->send_request(features::REPROG_CONTROLS_V4, 0x02);
    EXPECT_EQ(reply.error, Error::FeatureBlocked);
    EXPECT_EQ(device->requests.size(), before);
}

TEST_F(SessionTest, UnknownFeatureIsUnsupported) {
    ASSERT_EQ(session->connect(), Error::None);
    auto reply = session->send_request(features::BATTERY_STATUS, functions::BATTERY_STATUS_GET);
    EXPECT_EQ(reply.error, Error::FeatureUnsupported);
}

TEST_F(SessionTest, RequestTimesOut) {
    ASSERT_EQ(session->connect(), Error::None);
    device->silent.insert(features::ADJUSTABLE_DPI);

    auto dpi = session->get_dpi();
    EXPECT_EQ(dpi.error, Error::Timeout);
    EXPECT_TRUE(session->connected());
}

TEST_F(SessionTest, DeviceErrorReplyIsSurfaced) {
    ASSERT_EQ(session->connect(), Error::None);
    device->replies.erase({features::ADJUSTABLE_DPI, functions::DPI_GET});

    auto dpi = session->get_dpi();
    EXPECT_EQ(dpi.error, Error::DeviceError);
}

TEST_F(SessionTest, SetDpiUpdatesState) {
    ASSERT_EQ(session->connect(), Error::None);

    EXPECT_EQ(session->set_dpi(3200), Error::None);
    EXPECT_EQ(session->state().dpi, 3200);
    EXPECT_EQ(device->requests.back().params[1], 0x0C);
    EXPECT_EQ(device->requests.back().params[2], 0x80);
    EXPECT_EQ(dpis.back(), 3200);

    EXPECT_EQ(session->set_dpi(0), Error::BadRequest);
}

TEST_F(SessionTest, DpiListSkipsStepMarkers) {
    ASSERT_EQ(session->connect(), Error::None);

    auto list = session->get_dpi_list();
    ASSERT_TRUE(list);
    EXPECT_EQ(list.value, (std::vector<uint16_t>{400, 800, 4000}));
}

TEST_F(SessionTest, NotificationsUpdateStateInArrivalOrder) {
    ASSERT_EQ(session->connect(), Error::None);

    device->notify(features::UNIFIED_BATTERY, 0, {55, 0, 0, 1});
    device->notify(features::REPROG_CONTROLS_V4, functions::DIVERTED_BUTTONS_EVENT, {0x00, 0xC3});
    device->notify(features::REPROG_CONTROLS_V4, functions::DIVERTED_BUTTONS_EVENT, {});

    auto notes = session->poll_notifications();
    ASSERT_EQ(notes.size(), 3u);
    EXPECT_EQ(notes[0].feature_id, features::UNIFIED_BATTERY);
    EXPECT_EQ(notes[1].feature_id, features::REPROG_CONTROLS_V4);
    EXPECT_EQ(notes[1].frame.params[1], 0xC3);
    EXPECT_EQ(notes[2].feature_id, features::REPROG_CONTROLS_V4);

    EXPECT_EQ(session->state().battery.level, 55);
    EXPECT_TRUE(session->state().battery.charging);
    EXPECT_EQ(batteries.size(), 2u);

    EXPECT_TRUE(session->poll_notifications().empty());
}

TEST_F(SessionTest, UnchangedStateDoesNotNotify) {
    ASSERT_EQ(session->connect(), Error::None);

    device->notify(features::UNIFIED_BATTERY, 0, {80, 0, 0, 0});
    session->poll_notifications();
    EXPECT_EQ(batteries.size(), 1u);
}

TEST_F(SessionTest, FramesForOtherDevicesAreDropped) {
    ASSERT_EQ(session->connect(), Error::None);

    codec::Frame other;
    other.device_index = 0x03;
    other.feature_index = device->index_of(features::UNIFIED_BATTERY);
    other.params[0] = 10;
    device->inbox.push_back(codec::encode(other));

    EXPECT_TRUE(session->poll_notifications().empty());
    EXPECT_EQ(session->state().battery.level, 80);
}

TEST_F(SessionTest, MalformedFramesAreDropped) {
    ASSERT_EQ(session->connect(), Error::None);

    device->inbox.push_back({0x11, 0xFF, 0x02});
    device->notify(features::UNIFIED_BATTERY, 0, {40, 0, 0, 0});

    auto notes = session->poll_notifications();
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(session->state().battery.level, 40);
}

TEST_F(SessionTest, InputReportsAreSkippedQuietly) {
    ASSERT_EQ(session->connect(), Error::None);

    // Plain mouse movement and a keyboard report on the same node
    device->inbox.push_back({0x02, 0x00, 0x01, 0xFF, 0x00, 0x00, 0x00, 0x00});
    device->inbox.push_back({0x01, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x00});

    ::testing::internal::CaptureStderr();
    auto notes = session->poll_notifications();
    std::string logged = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(notes.empty());
    EXPECT_EQ(logged, "");
    EXPECT_TRUE(session->connected());
    EXPECT_EQ(session->state().battery.level, 80);
}

TEST_F(SessionTest, FullFeatureTableIsWalkedOnce) {
    device->features = {features::I_FEATURE_SET, features::DEVICE_NAME};
    while (device->features.size() < 255) {
        device->features.push_back(static_cast<uint16_t>(0xF000 + device->features.size()));
    }

    ASSERT_EQ(session->connect(), Error::None);
    EXPECT_EQ(device->requests_to(features::I_FEATURE_SET, functions::FEATURE_SET_GET_ID), 255u);
    EXPECT_EQ(session->handle().features.find(0xF000 + 254), std::optional<uint8_t>(255));
}

TEST_F(SessionTest, TransportLossDisconnects) {
    ASSERT_EQ(session->connect(), Error::None);
    device->gone = true;

    auto dpi = session->get_dpi();
    EXPECT_EQ(dpi.error, Error::DeviceUnavailable);
    EXPECT_FALSE(session->connected());
    EXPECT_FALSE(device->opened);
    ASSERT_EQ(connections.size(), 2u);
    EXPECT_FALSE(connections[1]);
}

TEST_F(SessionTest, ConnectFailureReleasesTransport) {
    device->silent.insert(features::I_FEATURE_SET);

    EXPECT_EQ(session->connect(), Error::DeviceUnavailable);
    EXPECT_FALSE(device->opened);
    EXPECT_FALSE(session->connected());
    EXPECT_TRUE(connections.empty());

    // Timeouts get one retry
    EXPECT_EQ(device->requests_to(features::I_FEATURE_SET, functions::FEATURE_SET_COUNT), 2u);
}

TEST_F(SessionTest, ReconnectRebuildsFeatureTable) {
    ASSERT_EQ(session->connect(), Error::None);
    session->disconnect();
    EXPECT_FALSE(session->connected());
    EXPECT_EQ(session->handle().features.size(), 0u);

    device->features = {features::I_FEATURE_SET, features::DEVICE_NAME, features::ADJUSTABLE_DPI};
    ASSERT_EQ(session->connect(), Error::None);
    EXPECT_EQ(session->handle().features.find(features::ADJUSTABLE_DPI), std::optional<uint8_t>(3));
    EXPECT_FALSE(session->supports(features::CHANGE_HOST));
}

TEST_F(SessionTest, StaleReplyIsIgnored) {
    ASSERT_EQ(session->connect(), Error::None);

    // Reply to a tag with nothing outstanding
    codec::Frame stale;
    stale.device_index = device->index;
    stale.feature_index = device->index_of(features::ADJUSTABLE_DPI);
    stale.function_id = functions::DPI_GET;
    stale.sw_id = 0x0E;
    stale.params = {0, 0x0F, 0xA0};
    device->inbox.push_back(codec::encode(stale));

    auto dpi = session->get_dpi();
    ASSERT_TRUE(dpi);
    EXPECT_EQ(dpi.value, 1600);
}
