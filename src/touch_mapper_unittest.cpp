#include "touch_mapper.h"

#include <linux/input.h>

#include "coordinate_mapper.h"
#include "fake_sinks.h"
#include "gtest/gtest.h"

namespace touchkbd {

namespace {

class TouchMapperTest : public ::testing::Test {
protected:
	TouchMapperTest()
		: layout_(CoordinateMapper(480, 800, 479, 799).to_touch(default_layout())),
		  hits_(layout_, 40),
		  gestures_(GestureParams()),
		  mapper_(hits_, gestures_, sink_, &haptic_) {}

	static TimePoint at(int ms) { return TimePoint(std::chrono::milliseconds(1000000 + ms)); }

	void send(TouchAxis axis, int value, int ms) {
		TouchEvent ev;
		ev.axis = axis;
		ev.value = value;
		ev.time = at(ms);
		mapper_.process(ev);
	}

	void down(int slot, int id, int x, int y, int ms, int size = 0) {
		send(TouchAxis::Slot, slot, ms);
		send(TouchAxis::TrackingId, id, ms);
		if (size) send(TouchAxis::ContactSize, size, ms);
		send(TouchAxis::PositionX, x, ms);
		send(TouchAxis::PositionY, y, ms);
	}

	void move_x(int slot, int x, int ms) {
		send(TouchAxis::Slot, slot, ms);
		send(TouchAxis::PositionX, x, ms);
	}

	void move_y(int slot, int y, int ms) {
		send(TouchAxis::Slot, slot, ms);
		send(TouchAxis::PositionY, y, ms);
	}

	void lift(int slot, int ms) {
		send(TouchAxis::Slot, slot, ms);
		send(TouchAxis::TrackingId, -1, ms);
	}

	const Slot& slot(int id) const { return mapper_.slots().at(id); }

	Layout layout_;
	HitTester hits_;
	GestureDetector gestures_;
	FakeKeySink sink_;
	FakeHaptic haptic_;
	TouchMapper mapper_;
};

} // namespace

TEST_F(TouchMapperTest, HeldButtonPressesOnceAndReleasesOnce) {
	down(0, 10, 400, 560, 0);
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_EQ(1, sink_.syncs);
	EXPECT_EQ(1, haptic_.pulses);

	for (int t = 100; t < 2000; t += 100) {
		move_x(0, 400 + (t / 100) % 3, t);
		move_y(0, 560 - (t / 100) % 2, t);
	}
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_EQ(0, sink_.releases(KEY_A));

	lift(0, 2000);
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_EQ(1, sink_.releases(KEY_A));
	EXPECT_EQ(2, sink_.syncs);
	EXPECT_EQ(1, haptic_.pulses);
	EXPECT_FALSE(slot(0).active());
}

TEST_F(TouchMapperTest, PairBindingMovesAsOneButton) {
	down(0, 1, 60, 400, 0);
	ASSERT_EQ(1u, sink_.calls.size());
	EXPECT_EQ(KeyBinding::pair(KEY_L, KEY_E), sink_.calls[0].keys);
	EXPECT_TRUE(sink_.calls[0].down);
	EXPECT_EQ(1, haptic_.pulses);

	lift(0, 50);
	ASSERT_EQ(2u, sink_.calls.size());
	EXPECT_EQ(KeyBinding::pair(KEY_L, KEY_E), sink_.calls[1].keys);
	EXPECT_FALSE(sink_.calls[1].down);
}

TEST_F(TouchMapperTest, LargeContactInComboBoxPressesBothButtons) {
	down(0, 1, 200, 560, 0, 50);
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));
	EXPECT_EQ(1, sink_.presses(KEY_B));
	EXPECT_EQ(1, sink_.syncs);
	EXPECT_EQ(2, haptic_.pulses);
	EXPECT_EQ(2u, slot(0).active_buttons.size());

	lift(0, 500);
	EXPECT_EQ(1, sink_.releases(KEY_RIGHT));
	EXPECT_EQ(1, sink_.releases(KEY_B));
}

TEST_F(TouchMapperTest, ContactSizeChangeReevaluatesCombo) {
	down(0, 1, 345, 560, 0);
	EXPECT_EQ(1, sink_.presses(KEY_B));
	EXPECT_EQ(0, sink_.presses(KEY_A));

	send(TouchAxis::ContactSize, 55, 20);
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_EQ(1, sink_.presses(KEY_B));

	send(TouchAxis::ContactSize, 10, 40);
	EXPECT_EQ(1, sink_.releases(KEY_A));
	EXPECT_EQ(0, sink_.releases(KEY_B));
}

TEST_F(TouchMapperTest, DirectionalReleasesComeFirst) {
	down(0, 1, 200, 560, 0, 50);
	sink_.clear();

	// Off the RIGHT+B box onto LEFT in one event.
	move_x(0, 60, 20);
	ASSERT_EQ(3u, sink_.calls.size());
	EXPECT_EQ(KeyBinding::single(KEY_RIGHT), sink_.calls[0].keys);
	EXPECT_FALSE(sink_.calls[0].down);
	EXPECT_EQ(KeyBinding::single(KEY_B), sink_.calls[1].keys);
	EXPECT_FALSE(sink_.calls[1].down);
	EXPECT_EQ(KeyBinding::single(KEY_LEFT), sink_.calls[2].keys);
	EXPECT_TRUE(sink_.calls[2].down);
	EXPECT_EQ(1, sink_.syncs);
	EXPECT_EQ(3, haptic_.pulses);
}

TEST_F(TouchMapperTest, SlidingBetweenFaceButtonsReleasesBeforePressing) {
	down(0, 1, 300, 560, 0);
	EXPECT_EQ(1, sink_.presses(KEY_B));
	sink_.clear();

	move_x(0, 400, 20);
	ASSERT_EQ(2u, sink_.calls.size());
	EXPECT_EQ(KeyBinding::single(KEY_B), sink_.calls[0].keys);
	EXPECT_FALSE(sink_.calls[0].down);
	EXPECT_EQ(KeyBinding::single(KEY_A), sink_.calls[1].keys);
	EXPECT_TRUE(sink_.calls[1].down);
	EXPECT_EQ(1, sink_.syncs);
}

TEST_F(TouchMapperTest, LeavingArrowReleasesImmediately) {
	down(0, 1, 150, 560, 0);
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));

	// Gap between LEFT and RIGHT, below the viewport.
	move_x(0, 105, 20);
	EXPECT_EQ(1, sink_.releases(KEY_RIGHT));
	EXPECT_FALSE(slot(0).button_pressed);
	EXPECT_TRUE(slot(0).active_buttons.empty());

	move_x(0, 60, 40);
	EXPECT_EQ(1, sink_.presses(KEY_LEFT));

	lift(0, 60);
	EXPECT_EQ(1, sink_.releases(KEY_LEFT));
	EXPECT_EQ(1, sink_.releases(KEY_RIGHT));
}

TEST_F(TouchMapperTest, SwipeRightFiresOnceAndRebasesOrigin) {
	down(0, 1, 100, 100, 0);
	EXPECT_TRUE(sink_.calls.empty());
	EXPECT_TRUE(slot(0).in_viewport);

	move_y(0, 110, 50);
	EXPECT_TRUE(sink_.calls.empty());
	move_x(0, 180, 60);
	ASSERT_EQ(2u, sink_.calls.size());
	EXPECT_EQ(KeyBinding::single(KEY_RIGHT), sink_.calls[0].keys);
	EXPECT_TRUE(sink_.calls[0].down);
	EXPECT_FALSE(sink_.calls[1].down);
	EXPECT_EQ(1, sink_.syncs);
	EXPECT_EQ(1, haptic_.pulses);

	EXPECT_EQ(180, slot(0).start_x);
	EXPECT_EQ(110, slot(0).start_y);
	EXPECT_TRUE(slot(0).swipe_detected);

	lift(0, 90);
	EXPECT_EQ(2u, sink_.calls.size());
	EXPECT_EQ(0, sink_.presses(KEY_ENTER));
}

TEST_F(TouchMapperTest, ContinuousDragChainsSwipesAfterCooldown) {
	down(0, 1, 60, 100, 0);
	move_x(0, 150, 50);
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));

	// Far enough, but inside the cooldown.
	move_x(0, 250, 200);
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));

	move_x(0, 350, 400);
	EXPECT_EQ(2, sink_.presses(KEY_RIGHT));
	EXPECT_EQ(2, sink_.releases(KEY_RIGHT));
	EXPECT_EQ(350, slot(0).start_x);

	// Back the other way from the new origin.
	move_x(0, 250, 800);
	EXPECT_EQ(1, sink_.presses(KEY_LEFT));
}

TEST_F(TouchMapperTest, VerticalSwipe) {
	down(0, 1, 200, 100, 0);
	move_y(0, 200, 40);
	EXPECT_EQ(1, sink_.presses(KEY_DOWN));
	move_y(0, 100, 400);
	EXPECT_EQ(1, sink_.presses(KEY_UP));
}

TEST_F(TouchMapperTest, CooldownIsPerSlot) {
	down(0, 1, 100, 100, 0);
	move_x(0, 200, 20);
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));

	down(1, 2, 300, 50, 30);
	move_y(1, 150, 40);
	EXPECT_EQ(1, sink_.presses(KEY_DOWN));

	// Slot 0 is still cooling down.
	move_x(0, 300, 60);
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));
}

TEST_F(TouchMapperTest, QuickTapInViewportEmitsViewportKey) {
	down(0, 1, 200, 200, 0);
	move_x(0, 203, 40);
	EXPECT_TRUE(sink_.calls.empty());

	lift(0, 100);
	ASSERT_EQ(2u, sink_.calls.size());
	EXPECT_EQ(KeyBinding::single(KEY_ENTER), sink_.calls[0].keys);
	EXPECT_TRUE(sink_.calls[0].down);
	EXPECT_FALSE(sink_.calls[1].down);
	EXPECT_EQ(1, sink_.syncs);
	EXPECT_EQ(1, haptic_.pulses);
}

TEST_F(TouchMapperTest, SlowTouchIsNotATap) {
	down(0, 1, 200, 200, 0);
	lift(0, 150);
	EXPECT_TRUE(sink_.calls.empty());

	down(0, 2, 200, 200, 1000);
	lift(0, 1400);
	EXPECT_TRUE(sink_.calls.empty());
}

TEST_F(TouchMapperTest, ButtonThenViewportSuppressesGestures) {
	down(0, 1, 400, 560, 0);
	EXPECT_EQ(1, sink_.presses(KEY_A));

	move_y(0, 300, 20);
	EXPECT_EQ(1, sink_.releases(KEY_A));
	EXPECT_TRUE(slot(0).in_viewport);
	EXPECT_TRUE(slot(0).button_pressed);

	move_x(0, 200, 40);
	EXPECT_EQ(0, sink_.presses(KEY_LEFT));

	lift(0, 60);
	EXPECT_EQ(0, sink_.presses(KEY_ENTER));
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_EQ(1, sink_.releases(KEY_A));
}

TEST_F(TouchMapperTest, OutsideEveryRegionDoesNothing) {
	down(0, 1, 470, 700, 0);
	EXPECT_TRUE(sink_.calls.empty());
	EXPECT_EQ(0, sink_.syncs);
	lift(0, 50);
	EXPECT_TRUE(sink_.calls.empty());
}

TEST_F(TouchMapperTest, SlotsAreIndependent) {
	down(0, 1, 400, 560, 0);
	down(1, 2, 150, 560, 10);
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));

	lift(0, 100);
	EXPECT_EQ(1, sink_.releases(KEY_A));
	EXPECT_EQ(0, sink_.releases(KEY_RIGHT));
	EXPECT_EQ(1u, slot(1).active_buttons.size());

	lift(1, 200);
	EXPECT_EQ(1, sink_.releases(KEY_RIGHT));
}

TEST_F(TouchMapperTest, PositionsBeforeTrackingIdCreateTheSlot) {
	send(TouchAxis::Slot, 3, 0);
	send(TouchAxis::PositionX, 400, 0);
	send(TouchAxis::PositionY, 560, 0);
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_FALSE(slot(3).active());

	send(TouchAxis::TrackingId, 7, 5);
	EXPECT_EQ(1u, sink_.calls.size());
	EXPECT_EQ(7, slot(3).tracking_id);

	send(TouchAxis::TrackingId, -1, 50);
	EXPECT_EQ(1, sink_.releases(KEY_A));
	EXPECT_EQ(0, sink_.presses(KEY_ENTER));
}

TEST_F(TouchMapperTest, NewTrackingIdWithoutEndReleasesOldContact) {
	down(0, 1, 400, 560, 0);
	send(TouchAxis::TrackingId, 1, 10);
	EXPECT_EQ(0, sink_.releases(KEY_A));

	send(TouchAxis::TrackingId, 2, 20);
	EXPECT_EQ(1, sink_.releases(KEY_A));
	EXPECT_EQ(2, slot(0).tracking_id);
	EXPECT_FALSE(slot(0).have_position());
}

TEST_F(TouchMapperTest, UnknownAxisIsIgnored) {
	send(TouchAxis::Other, 1234, 0);
	EXPECT_TRUE(mapper_.slots().empty());
	EXPECT_TRUE(sink_.calls.empty());
	EXPECT_EQ(0, sink_.syncs);
}

TEST_F(TouchMapperTest, ReleaseAllSurvivesFailingRelease) {
	down(0, 1, 400, 560, 0);
	down(1, 2, 120, 490, 0);
	EXPECT_EQ(1, sink_.presses(KEY_UP));
	sink_.clear();
	sink_.fail_codes.insert(KEY_A);

	mapper_.release_all();
	EXPECT_EQ(1, sink_.releases(KEY_A));
	EXPECT_EQ(1, sink_.releases(KEY_UP));
	EXPECT_EQ(1, sink_.syncs);
	EXPECT_TRUE(mapper_.slots().empty());

	sink_.clear();
	mapper_.release_all();
	EXPECT_EQ(0, sink_.syncs);
}

TEST_F(TouchMapperTest, FailingPressStillFlushesTheRest) {
	sink_.fail_codes.insert(KEY_RIGHT);
	down(0, 1, 200, 560, 0, 50);
	EXPECT_EQ(1, sink_.presses(KEY_RIGHT));
	EXPECT_EQ(1, sink_.presses(KEY_B));
	EXPECT_EQ(1, sink_.syncs);
}

TEST_F(TouchMapperTest, WorksWithoutHaptics) {
	TouchMapper quiet(hits_, gestures_, sink_, nullptr);
	TouchEvent ev;
	ev.axis = TouchAxis::PositionX;
	ev.value = 400;
	ev.time = at(0);
	quiet.process(ev);
	ev.axis = TouchAxis::PositionY;
	ev.value = 560;
	quiet.process(ev);
	EXPECT_EQ(1, sink_.presses(KEY_A));
	EXPECT_EQ(0, haptic_.pulses);
}

} // namespace touchkbd
