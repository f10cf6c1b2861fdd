#ifndef TOUCHKBD_GESTURE_DETECTOR_H
#define TOUCHKBD_GESTURE_DETECTOR_H

#include <chrono>
#include <cstdint>

#include "slot.h"

namespace touchkbd {

enum class Swipe { None, Left, Right, Up, Down };

struct GestureParams {
	int min_distance = 60;
	int min_vertical = 50;
	int max_off_axis = 70;
	std::chrono::milliseconds cooldown{300};
	std::chrono::milliseconds tap_timeout{150};
};

// Swipe and tap rules for contacts inside the viewport.
class GestureDetector {
public:
	explicit GestureDetector(const GestureParams& params);

	// No button held or seen this contact, and the previous swipe (if any)
	// is more than the cooldown in the past.
	bool can_swipe(const Slot& slot, TimePoint now) const;

	// Displacement from the slot's origin. Horizontal wins when both axes
	// qualify.
	Swipe classify(int dx, int dy) const;

	// Evaluated when the contact ends.
	bool is_tap(const Slot& slot, TimePoint now) const;

	const GestureParams& params() const { return params_; }

	static uint16_t swipe_key(Swipe swipe);
	static const char* swipe_name(Swipe swipe);

private:
	GestureParams params_;
};

} // namespace touchkbd

#endif
