#include "gesture_detector.h"

#include <linux/input.h>

#include "gtest/gtest.h"

namespace touchkbd {

namespace {

TimePoint at(int ms) {
	return TimePoint(std::chrono::milliseconds(500000 + ms));
}

} // namespace

TEST(GestureDetectorTest, HorizontalNeedsDistanceAndLowDrift) {
	GestureDetector g{GestureParams()};
	EXPECT_EQ(Swipe::Right, g.classify(80, 10));
	EXPECT_EQ(Swipe::Left, g.classify(-61, -69));
	EXPECT_EQ(Swipe::None, g.classify(60, 0));
	EXPECT_EQ(Swipe::None, g.classify(100, 70));
}

TEST(GestureDetectorTest, VerticalNeedsDistanceAndLowDrift) {
	GestureDetector g{GestureParams()};
	EXPECT_EQ(Swipe::Down, g.classify(0, 51));
	EXPECT_EQ(Swipe::Up, g.classify(-20, -90));
	EXPECT_EQ(Swipe::None, g.classify(0, 50));
	EXPECT_EQ(Swipe::None, g.classify(70, 90));
}

TEST(GestureDetectorTest, HorizontalWinsWhenBothQualify) {
	GestureDetector g{GestureParams()};
	EXPECT_EQ(Swipe::Right, g.classify(65, 55));
	EXPECT_EQ(Swipe::Left, g.classify(-65, -55));
}

TEST(GestureDetectorTest, SwipeKeys) {
	EXPECT_EQ(KEY_LEFT, GestureDetector::swipe_key(Swipe::Left));
	EXPECT_EQ(KEY_RIGHT, GestureDetector::swipe_key(Swipe::Right));
	EXPECT_EQ(KEY_UP, GestureDetector::swipe_key(Swipe::Up));
	EXPECT_EQ(KEY_DOWN, GestureDetector::swipe_key(Swipe::Down));
}

TEST(GestureDetectorTest, CooldownAndButtonsBlockSwipes) {
	GestureDetector g{GestureParams()};
	Slot s;
	EXPECT_TRUE(g.can_swipe(s, at(0)));

	s.swipe_detected = true;
	s.last_swipe_time = at(0);
	EXPECT_FALSE(g.can_swipe(s, at(300)));
	EXPECT_TRUE(g.can_swipe(s, at(301)));

	Slot pressed;
	pressed.button_pressed = true;
	EXPECT_FALSE(g.can_swipe(pressed, at(0)));

	Slot holding;
	holding.active_buttons.insert(0);
	EXPECT_FALSE(g.can_swipe(holding, at(0)));
}

TEST(GestureDetectorTest, TapWindowIsStrict) {
	GestureDetector g{GestureParams()};
	Slot s;
	s.started = true;
	s.in_viewport = true;
	s.touch_start_time = at(0);
	EXPECT_TRUE(g.is_tap(s, at(149)));
	EXPECT_FALSE(g.is_tap(s, at(150)));

	Slot swiped = s;
	swiped.swipe_detected = true;
	EXPECT_FALSE(g.is_tap(swiped, at(10)));

	Slot button = s;
	button.button_pressed = true;
	EXPECT_FALSE(g.is_tap(button, at(10)));

	Slot outside = s;
	outside.in_viewport = false;
	EXPECT_FALSE(g.is_tap(outside, at(10)));

	// Positions seen before any tracking id: no known start time.
	Slot lazy = s;
	lazy.started = false;
	EXPECT_FALSE(g.is_tap(lazy, at(10)));
}

} // namespace touchkbd
