#ifndef TOUCHKBD_SLOT_H
#define TOUCHKBD_SLOT_H

#include <cstddef>
#include <set>

#include "touch_event.h"

namespace touchkbd {

// State of one hardware multitouch slot. Reset to a default Slot when its
// contact ends.
struct Slot {
	int tracking_id = -1;

	// Latest position; meaningful once have_x/have_y. The first report of an
	// axis after contact start also sets the gesture origin.
	bool have_x = false;
	bool have_y = false;
	int x = 0;
	int y = 0;
	int start_x = 0;
	int start_y = 0;
	int touch_size = 0;

	// Indices into Layout::regions whose press has been emitted and whose
	// release has not.
	std::set<size_t> active_buttons;

	bool button_pressed = false;
	bool in_viewport = false;
	bool swipe_detected = false;

	bool started = false;
	TimePoint touch_start_time;
	TimePoint last_swipe_time;

	bool active() const { return tracking_id >= 0; }
	bool have_position() const { return have_x && have_y; }
};

} // namespace touchkbd

#endif
