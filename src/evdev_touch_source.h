#ifndef TOUCHKBD_EVDEV_TOUCH_SOURCE_H
#define TOUCHKBD_EVDEV_TOUCH_SOURCE_H

#include <linux/input.h>
#include <signal.h>
#include <map>
#include <string>
#include <vector>

#include "touch_event.h"

namespace touchkbd {

enum class WaitResult {
	Ready,
	Interrupted,
	Failed,
};

// ppoll() on `fd` for input with `sigmask` installed for the duration of the
// wait. Signals blocked outside the call can only land here, so a stop
// request can't slip in between a flag check and the wait.
WaitResult wait_readable(int fd, const sigset_t* sigmask);

// Turns raw protocol B records into touch events, one record at a time.
//
// The kernel only reports an ABS_MT value when it changed, so a new contact
// landing where the last one in its slot lifted reports nothing for that
// axis. The decoder keeps the last position and size of every slot and, at
// the SYN_REPORT that closes a frame carrying a new tracking id, replays the
// axes the frame left out.
//
// After SYN_DROPPED every record up to and including the next SYN_REPORT is
// discarded.
class EvdevFrameDecoder {
public:
	void feed(const input_event& raw, std::vector<TouchEvent>& out);
	void reset();

	// Values already held by the kernel when the device was opened.
	void seed(int slot, TouchAxis axis, int value);
	void set_current_slot(int slot) { current_slot_ = slot; }

	bool dropping() const { return dropping_; }

private:
	// Indexed contact size, X, Y.
	enum { kAxes = 3 };

	struct SlotState {
		int value[kAxes] = {0, 0, 0};
		bool known[kAxes] = {false, false, false};
		bool reported[kAxes] = {false, false, false};
		bool fresh = false;
	};

	void replay(const TimePoint& time, std::vector<TouchEvent>& out);

	std::map<int, SlotState> slots_;
	int current_slot_ = 0;
	bool dropping_ = false;
};

// Multitouch (protocol B) events from /dev/input/eventN.
class EvdevTouchSource : public TouchEventSource {
public:
	EvdevTouchSource() {}
	~EvdevTouchSource() override;

	EvdevTouchSource(const EvdevTouchSource&) = delete;
	EvdevTouchSource& operator=(const EvdevTouchSource&) = delete;

	// `grab` takes the device away from other readers. `nonblocking` makes
	// next() return false instead of waiting when the queue is empty.
	bool open(const std::string& path, bool grab, bool nonblocking);
	void close();

	bool next(TouchEvent& ev) override;
	// For a nonblocking source: waits until next() has something to read.
	// Returns false on a signal or a device error; failed() tells them apart.
	bool wait(const sigset_t* sigmask);
	bool failed() const override { return failed_; }

	const std::string& name() const { return name_; }
	// ABS_MT_POSITION_X/Y maxima, 0 if the device didn't report them.
	int max_x() const { return max_x_; }
	int max_y() const { return max_y_; }

	// Exposed for tests: the record -> event translation.
	static TouchEvent translate(const input_event& raw);

private:
	bool fill();
	void seed_slots(int fd);

	int fd_ = -1;
	bool failed_ = false;
	bool grabbed_ = false;
	bool monotonic_ = false;
	std::string name_;
	int max_x_ = 0;
	int max_y_ = 0;

	input_event buf_[64];
	size_t count_ = 0;
	size_t pos_ = 0;

	EvdevFrameDecoder decoder_;
	std::vector<TouchEvent> pending_;
	size_t pending_pos_ = 0;
};

} // namespace touchkbd

#endif
