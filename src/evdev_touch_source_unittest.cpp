#include "evdev_touch_source.h"

#include <csignal>
#include <cstring>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#include <vector>

#include "coordinate_mapper.h"
#include "fake_sinks.h"
#include "gtest/gtest.h"
#include "touch_mapper.h"

namespace touchkbd {

namespace {

input_event make_event(uint16_t type, uint16_t code, int32_t value) {
	input_event ev;
	std::memset(&ev, 0, sizeof(ev));
	ev.type = type;
	ev.code = code;
	ev.value = value;
	ev.input_event_sec = 12;
	ev.input_event_usec = 345000;
	return ev;
}

// Raw records through the decoder into a mapper over the 1:1 default layout.
class EvdevFrameDecoderTest : public ::testing::Test {
protected:
	EvdevFrameDecoderTest()
		: layout_(CoordinateMapper(480, 800, 479, 799).to_touch(default_layout())),
		  hits_(layout_, 40),
		  gestures_(GestureParams()),
		  mapper_(hits_, gestures_, sink_, nullptr) {}

	void feed(uint16_t type, uint16_t code, int32_t value) {
		std::vector<TouchEvent> out;
		decoder_.feed(make_event(type, code, value), out);
		for (const auto& ev : out) {
			mapper_.process(ev);
			seen_.push_back(ev);
		}
	}

	void abs(uint16_t code, int32_t value) { feed(EV_ABS, code, value); }
	void report() { feed(EV_SYN, SYN_REPORT, 0); }

	void lift() {
		abs(ABS_MT_TRACKING_ID, -1);
		report();
	}

	Layout layout_;
	HitTester hits_;
	GestureDetector gestures_;
	FakeKeySink sink_;
	TouchMapper mapper_;
	EvdevFrameDecoder decoder_;
	std::vector<TouchEvent> seen_;
};

void ignore_signal(int) {}

} // namespace

TEST_F(EvdevFrameDecoderTest, RetapAtSameXPressesAgain) {
	abs(ABS_MT_SLOT, 0);
	abs(ABS_MT_TRACKING_ID, 1);
	abs(ABS_MT_POSITION_X, 400);
	abs(ABS_MT_POSITION_Y, 560);
	report();
	lift();

	// X unchanged, so the kernel leaves it out of the frame.
	abs(ABS_MT_TRACKING_ID, 2);
	abs(ABS_MT_POSITION_Y, 562);
	report();
	lift();

	EXPECT_EQ(2, sink_.presses(KEY_A));
	EXPECT_EQ(2, sink_.releases(KEY_A));
}

TEST_F(EvdevFrameDecoderTest, RetapWithNoChangesKeepsContactSize) {
	abs(ABS_MT_TRACKING_ID, 1);
	abs(ABS_MT_TOUCH_MAJOR, 50);
	abs(ABS_MT_POSITION_X, 400);
	abs(ABS_MT_POSITION_Y, 560);
	report();
	lift();
	ASSERT_EQ(1, sink_.presses(KEY_B));

	abs(ABS_MT_TRACKING_ID, 2);
	report();

	EXPECT_EQ(2, sink_.presses(KEY_A));
	EXPECT_EQ(2, sink_.presses(KEY_B));
}

TEST_F(EvdevFrameDecoderTest, ReplaysIntoTheContactsOwnSlot) {
	abs(ABS_MT_SLOT, 1);
	abs(ABS_MT_TRACKING_ID, 1);
	abs(ABS_MT_TOUCH_MAJOR, 30);
	abs(ABS_MT_POSITION_X, 10);
	abs(ABS_MT_POSITION_Y, 20);
	report();
	lift();
	seen_.clear();

	abs(ABS_MT_TRACKING_ID, 6);
	abs(ABS_MT_SLOT, 0);
	abs(ABS_MT_TRACKING_ID, 5);
	abs(ABS_MT_POSITION_X, 1);
	abs(ABS_MT_POSITION_Y, 2);
	report();

	ASSERT_EQ(10u, seen_.size());
	EXPECT_EQ(TouchAxis::Slot, seen_[5].axis);
	EXPECT_EQ(1, seen_[5].value);
	EXPECT_EQ(TouchAxis::ContactSize, seen_[6].axis);
	EXPECT_EQ(30, seen_[6].value);
	EXPECT_EQ(TouchAxis::PositionX, seen_[7].axis);
	EXPECT_EQ(10, seen_[7].value);
	EXPECT_EQ(TouchAxis::PositionY, seen_[8].axis);
	EXPECT_EQ(20, seen_[8].value);
	EXPECT_EQ(TouchAxis::Slot, seen_[9].axis);
	EXPECT_EQ(0, seen_[9].value);
}

TEST_F(EvdevFrameDecoderTest, NothingIsReplayedWithoutANewContact) {
	abs(ABS_MT_TRACKING_ID, 1);
	abs(ABS_MT_POSITION_X, 10);
	abs(ABS_MT_POSITION_Y, 20);
	report();
	seen_.clear();

	abs(ABS_MT_POSITION_Y, 25);
	report();

	ASSERT_EQ(1u, seen_.size());
	EXPECT_EQ(TouchAxis::PositionY, seen_[0].axis);
}

TEST_F(EvdevFrameDecoderTest, DiscardsEverythingUpToReportAfterDrop) {
	abs(ABS_MT_TRACKING_ID, 1);
	feed(EV_SYN, SYN_DROPPED, 0);
	EXPECT_TRUE(decoder_.dropping());
	seen_.clear();

	abs(ABS_MT_POSITION_X, 400);
	abs(ABS_MT_POSITION_Y, 560);
	report();
	EXPECT_FALSE(decoder_.dropping());
	EXPECT_TRUE(seen_.empty());
	EXPECT_EQ(0, sink_.presses(KEY_A));

	abs(ABS_MT_POSITION_X, 401);
	abs(ABS_MT_POSITION_Y, 561);
	report();
	EXPECT_EQ(2u, seen_.size());
	EXPECT_EQ(1, sink_.presses(KEY_A));
}

TEST_F(EvdevFrameDecoderTest, NonAbsRecordsProduceNothing) {
	feed(EV_KEY, BTN_TOUCH, 1);
	feed(EV_MSC, MSC_TIMESTAMP, 7);
	abs(ABS_MT_PRESSURE, 90);
	EXPECT_TRUE(seen_.empty());
}

TEST(EvdevTouchSourceTest, TranslatesMultitouchAxes) {
	EXPECT_EQ(TouchAxis::Slot, EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_SLOT, 2)).axis);
	EXPECT_EQ(TouchAxis::TrackingId, EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_TRACKING_ID, -1)).axis);
	EXPECT_EQ(TouchAxis::PositionX, EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_POSITION_X, 5)).axis);
	EXPECT_EQ(TouchAxis::PositionY, EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_POSITION_Y, 5)).axis);
	EXPECT_EQ(TouchAxis::ContactSize, EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_TOUCH_MAJOR, 44)).axis);

	TouchEvent ev = EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_TRACKING_ID, -1));
	EXPECT_EQ(-1, ev.value);
}

TEST(EvdevTouchSourceTest, OtherCodesAreIgnoredAxes) {
	EXPECT_EQ(TouchAxis::Other, EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_PRESSURE, 90)).axis);
	EXPECT_EQ(TouchAxis::Other, EvdevTouchSource::translate(make_event(EV_ABS, ABS_X, 90)).axis);
	EXPECT_EQ(TouchAxis::Other, EvdevTouchSource::translate(make_event(EV_KEY, BTN_TOUCH, 1)).axis);
}

TEST(EvdevTouchSourceTest, KeepsKernelTimestamp) {
	TouchEvent ev = EvdevTouchSource::translate(make_event(EV_ABS, ABS_MT_POSITION_X, 1));
	EXPECT_EQ(std::chrono::microseconds(12345000),
			  std::chrono::duration_cast<std::chrono::microseconds>(ev.time.time_since_epoch()));
}

TEST(WaitReadableTest, ReadyWhenInputIsQueued) {
	int fds[2];
	ASSERT_EQ(0, pipe(fds));
	ASSERT_EQ(1, write(fds[1], "x", 1));
	EXPECT_EQ(WaitResult::Ready, wait_readable(fds[0], nullptr));
	close(fds[0]);
	close(fds[1]);
}

TEST(WaitReadableTest, SignalBlockedBeforeTheWaitStillInterruptsIt) {
	struct sigaction sa, old_sa;
	std::memset(&sa, 0, sizeof(sa));
	sa.sa_handler = ignore_signal;
	sigemptyset(&sa.sa_mask);
	ASSERT_EQ(0, sigaction(SIGUSR1, &sa, &old_sa));

	sigset_t usr1, old_mask;
	sigemptyset(&usr1);
	sigaddset(&usr1, SIGUSR1);
	ASSERT_EQ(0, pthread_sigmask(SIG_BLOCK, &usr1, &old_mask));

	// Arrives while blocked, as if between the stop-flag check and the wait.
	ASSERT_EQ(0, pthread_kill(pthread_self(), SIGUSR1));

	int fds[2];
	ASSERT_EQ(0, pipe(fds));
	sigset_t wait_mask = old_mask;
	sigdelset(&wait_mask, SIGUSR1);
	EXPECT_EQ(WaitResult::Interrupted, wait_readable(fds[0], &wait_mask));

	close(fds[0]);
	close(fds[1]);
	pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
	sigaction(SIGUSR1, &old_sa, nullptr);
}

TEST(EvdevTouchSourceTest, MissingDeviceFailsToOpen) {
	EvdevTouchSource src;
	EXPECT_FALSE(src.open("/nonexistent/event99", false, true));
	TouchEvent ev;
	EXPECT_FALSE(src.next(ev));
	EXPECT_TRUE(src.failed());
}

} // namespace touchkbd
