#include "gesture_recorder.h"

#include <linux/input.h>

#include "coordinate_mapper.h"
#include "gtest/gtest.h"
#include "touch_mapper.h"

namespace touchkbd {

namespace {

class GestureRecorderTest : public ::testing::Test {
protected:
	GestureRecorderTest()
		: layout_(CoordinateMapper(480, 800, 479, 799).to_touch(default_layout())),
		  hits_(layout_, 40),
		  gestures_(GestureParams()),
		  mapper_(hits_, gestures_, recorder_, nullptr) {}

	void send(TouchAxis axis, int value, int ms) {
		TouchEvent ev;
		ev.axis = axis;
		ev.value = value;
		ev.time = TimePoint(std::chrono::milliseconds(1000000 + ms));
		mapper_.process(ev);
	}

	void down(int x, int y, int ms) {
		send(TouchAxis::TrackingId, 1, ms);
		send(TouchAxis::PositionX, x, ms);
		send(TouchAxis::PositionY, y, ms);
	}

	Layout layout_;
	HitTester hits_;
	GestureDetector gestures_;
	GestureRecorder recorder_;
	TouchMapper mapper_;
};

} // namespace

TEST_F(GestureRecorderTest, HeldEnterRegionIsNotATap) {
	down(290, 700, 0);
	send(TouchAxis::TrackingId, -1, 50);
	EXPECT_EQ(0, recorder_.count());
}

TEST_F(GestureRecorderTest, ViewportTapIsRecorded) {
	down(200, 200, 0);
	send(TouchAxis::TrackingId, -1, 50);
	EXPECT_EQ(1, recorder_.count());
	EXPECT_EQ(KeyBinding::single(KEY_ENTER), recorder_.last());
}

TEST_F(GestureRecorderTest, SwipeIsRecorded) {
	down(100, 100, 0);
	send(TouchAxis::PositionX, 170, 20);
	EXPECT_EQ(1, recorder_.count());
	EXPECT_EQ(KeyBinding::single(KEY_RIGHT), recorder_.last());
}

} // namespace touchkbd
