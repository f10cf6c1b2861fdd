#ifndef TOUCHKBD_TOUCH_EVENT_H
#define TOUCHKBD_TOUCH_EVENT_H

#include <chrono>

namespace touchkbd {

typedef std::chrono::steady_clock Clock;
typedef Clock::time_point TimePoint;

// Subset of the multitouch protocol the mapper understands. Anything else
// arrives as Other and is ignored.
enum class TouchAxis {
	Slot,
	TrackingId,
	PositionX,
	PositionY,
	ContactSize,
	Other,
};

struct TouchEvent {
	TouchAxis axis = TouchAxis::Other;
	int value = 0;
	TimePoint time;
};

class TouchEventSource {
public:
	virtual ~TouchEventSource() {}

	// Returns false when no event was produced: the read was interrupted,
	// would block, or the device is gone. failed() separates the last case.
	virtual bool next(TouchEvent& ev) = 0;
	virtual bool failed() const = 0;
};

} // namespace touchkbd

#endif
