#include <gtest/gtest.h>

#include <gesture/gesture.hpp>

using namespace juhradial;
using namespace juhradial::gesture;
using namespace std::chrono_literals;

class GestureTest : public ::testing::Test {
protected:
    GestureTest() : machine(make_options()) {}

    static StateMachine::Options make_options() {
        StateMachine::Options options;
        options.hold_threshold = 300ms;
        options.tap_action = "screenshot";
        options.geometry = MenuGeometry{100, 10, 1920, 1080};
        return options;
    }

    Clock::time_point t0 = Clock::time_point{} + 10s;
    StateMachine machine;
};

TEST_F(GestureTest, QuickReleaseIsATap) {
    auto timer = machine.press(t0);
    ASSERT_TRUE(timer);
    EXPECT_EQ(timer->deadline, t0 + 300ms);
    EXPECT_EQ(machine.state(), State::Pressed);

    auto intents = machine.release(t0 + 120ms);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0], MenuIntent::select("screenshot"));
    EXPECT_EQ(machine.state(), State::Idle);
    EXPECT_FALSE(machine.menu_open());

    // The armed timer is stale now
    EXPECT_TRUE(machine.hold_elapsed(timer->generation).empty());
}

TEST_F(GestureTest, HoldOpensThenReleaseCloses) {
    machine.motion({800, 600});
    auto timer = machine.press(t0);
    ASSERT_TRUE(timer);

    auto opened = machine.hold_elapsed(timer->generation);
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0], MenuIntent::open_at({800, 600}));
    EXPECT_TRUE(machine.menu_open());

    auto closed = machine.release(t0 + 900ms);
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_EQ(closed[0], MenuIntent::close());
    EXPECT_EQ(machine.state(), State::Idle);
}

TEST_F(GestureTest, HeldPastThresholdNeverSelects) {
    auto timer = machine.press(t0);
    ASSERT_TRUE(timer);

    // Timer not delivered yet but the hold is long enough
    auto intents = machine.release(t0 + 450ms);
    ASSERT_EQ(intents.size(), 2u);
    EXPECT_EQ(intents[0].kind, MenuIntent::Kind::OpenAt);
    EXPECT_EQ(intents[1].kind, MenuIntent::Kind::Close);
    EXPECT_TRUE(machine.hold_elapsed(timer->generation).empty());
}

TEST_F(GestureTest, DuplicatePressIsIgnored) {
    auto first = machine.press(t0);
    ASSERT_TRUE(first);
    EXPECT_FALSE(machine.press(t0 + 10ms));

    auto opened = machine.hold_elapsed(first->generation);
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_FALSE(machine.press(t0 + 500ms));
    EXPECT_EQ(machine.state(), State::HoldOpen);

    EXPECT_EQ(machine.release(t0 + 600ms).size(), 1u);
    EXPECT_EQ(machine.state(), State::Idle);
}

TEST_F(GestureTest, ReleaseWhileIdleDoesNothing) {
    EXPECT_TRUE(machine.release(t0).empty());
    EXPECT_EQ(machine.state(), State::Idle);
}

TEST_F(GestureTest, MotionOnlyForwardedWhileOpen) {
    EXPECT_FALSE(machine.motion({10, 10}));

    auto timer = machine.press(t0);
    EXPECT_FALSE(machine.motion({20, 20}));

    machine.hold_elapsed(timer->generation);
    EXPECT_TRUE(machine.motion({30, 30}));
    EXPECT_EQ(machine.state(), State::HoldOpen);
    EXPECT_EQ(machine.position(), (Position{30, 30}));
}

TEST_F(GestureTest, OpenPositionIsClampedToScreen) {
    machine.motion({5, 1075});
    auto timer = machine.press(t0);

    auto opened = machine.hold_elapsed(timer->generation);
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0].position, (Position{110, 970}));
}

TEST_F(GestureTest, ResetClosesOpenMenu) {
    auto timer = machine.press(t0);
    machine.hold_elapsed(timer->generation);

    auto intents = machine.reset();
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0], MenuIntent::close());
    EXPECT_EQ(machine.state(), State::Idle);

    auto pressed = machine.press(t0 + 1s);
    ASSERT_TRUE(pressed);
    EXPECT_TRUE(machine.reset().empty());
    EXPECT_TRUE(machine.hold_elapsed(pressed->generation).empty());
}

TEST(MenuGeometryTest, TinyScreenCentres) {
    MenuGeometry geometry{300, 20, 400, 300};
    EXPECT_EQ(clamp_to_screen({0, 0}, geometry), (Position{200, 150}));
}
