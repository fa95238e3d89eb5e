#include <gtest/gtest.h>

#include "fake_device.hpp"

#include <device/haptics.hpp>

using namespace juhradial;
using juhradial::test::FakeDevice;
using namespace std::chrono_literals;

namespace features = packets::features;
namespace functions = packets::functions;

class HapticsTest : public ::testing::Test {
protected:
    void connect(std::vector<uint16_t> extra = {features::HAPTIC}) {
        auto owned = std::make_unique<FakeDevice>(std::move(extra));
        device = owned.get();
        device->replies[{features::HAPTIC, functions::HAPTIC_PLAY}] = {};

        Session::Options options;
        options.request_timeout_ms = 50;
        session = std::make_unique<Session>(std::move(owned), options, Session::Callbacks{});
        ASSERT_EQ(session->connect(), Error::None);

        haptics = std::make_unique<Haptics>(*session, HapticProfile{});
    }

    // Waveform ids of every play request, in order
    std::vector<uint8_t> played() const {
        std::vector<uint8_t> waveforms;
        uint8_t index = device->index_of(features::HAPTIC);
        for (const auto& frame : device->requests) {
            if (frame.feature_index == index && frame.function_id == functions::HAPTIC_PLAY) {
                waveforms.push_back(frame.params[0]);
            }
        }
        return waveforms;
    }

    Haptics::Clock::time_point t0 = Haptics::Clock::now();
    FakeDevice* device = nullptr;
    std::unique_ptr<Session> session;
    std::unique_ptr<Haptics> haptics;
};

TEST_F(HapticsTest, EventsPlayTheirPattern) {
    connect();

    EXPECT_EQ(haptics->emit(HapticEvent::MenuAppear, t0), Error::None);
    EXPECT_EQ(haptics->emit(HapticEvent::SelectionConfirm, t0 + 100ms), Error::None);
    EXPECT_EQ(haptics->emit(HapticEvent::InvalidAction, t0 + 200ms), Error::None);

    EXPECT_EQ(played(), (std::vector<uint8_t>{0x01, 0x00, 0x06}));
}

TEST_F(HapticsTest, PulsesInsideDebounceAreDropped) {
    connect();

    EXPECT_EQ(haptics->emit(HapticEvent::MenuAppear, t0), Error::None);
    EXPECT_EQ(haptics->emit(HapticEvent::SelectionConfirm, t0 + 10ms), Error::None);
    EXPECT_EQ(played().size(), 1u);

    EXPECT_EQ(haptics->emit(HapticEvent::SelectionConfirm, t0 + 20ms), Error::None);
    EXPECT_EQ(played().size(), 2u);
}

TEST_F(HapticsTest, DisabledProfileSendsNothing) {
    connect();
    HapticProfile quiet;
    quiet.enabled = false;
    haptics->configure(quiet);

    EXPECT_FALSE(haptics->enabled());
    EXPECT_EQ(haptics->emit(HapticEvent::MenuAppear, t0), Error::None);
    EXPECT_EQ(haptics->slice_hovered(2, t0 + 100ms), Error::None);
    EXPECT_TRUE(played().empty());
}

TEST_F(HapticsTest, MissingFeatureIsReported) {
    connect({});

    EXPECT_EQ(haptics->emit(HapticEvent::MenuAppear, t0), Error::FeatureUnsupported);
    EXPECT_EQ(device->requests_to(features::HAPTIC, functions::HAPTIC_PLAY), 0u);
}

TEST_F(HapticsTest, SliceChangesPulseOncePerSlice) {
    connect();

    EXPECT_EQ(haptics->slice_hovered(0, t0), Error::None);
    EXPECT_EQ(haptics->slice_hovered(0, t0 + 100ms), Error::None);
    EXPECT_EQ(haptics->slice_hovered(1, t0 + 200ms), Error::None);

    EXPECT_EQ(played(), (std::vector<uint8_t>{0x04, 0x04}));
}

TEST_F(HapticsTest, FastSweepIsThinned) {
    connect();

    haptics->slice_hovered(0, t0);
    haptics->slice_hovered(1, t0 + 5ms);
    haptics->slice_hovered(2, t0 + 10ms);
    EXPECT_EQ(played().size(), 1u);

    // The sweep settled on slice 2, moving on from it pulses again
    haptics->slice_hovered(3, t0 + 40ms);
    EXPECT_EQ(played().size(), 2u);
}

TEST_F(HapticsTest, QuickReentryIsHeldBack) {
    connect();

    haptics->slice_hovered(4, t0);
    haptics->slice_hovered(Haptics::NO_SLICE, t0 + 10ms);
    haptics->slice_hovered(4, t0 + 30ms);
    EXPECT_EQ(played().size(), 1u);

    haptics->slice_hovered(Haptics::NO_SLICE, t0 + 40ms);
    haptics->slice_hovered(4, t0 + 60ms);
    EXPECT_EQ(played().size(), 2u);
}

TEST_F(HapticsTest, ResetForgetsLastSlice) {
    connect();

    haptics->slice_hovered(1, t0);
    haptics->reset_slices();
    haptics->slice_hovered(1, t0 + 25ms);
    EXPECT_EQ(played().size(), 2u);
}

TEST_F(HapticsTest, CustomPatternsAreUsed) {
    connect();
    HapticProfile profile;
    profile.menu_appear = HapticPattern::WhisperCollision;
    haptics->configure(profile);

    haptics->emit(HapticEvent::MenuAppear, t0);
    EXPECT_EQ(played(), (std::vector<uint8_t>{0x1B}));
}
