#include "gesture_detector.h"

#include <cstdlib>
#include <linux/input.h>

namespace touchkbd {

GestureDetector::GestureDetector(const GestureParams& params) : params_(params) {}

bool GestureDetector::can_swipe(const Slot& slot, TimePoint now) const {
	if (slot.button_pressed || !slot.active_buttons.empty()) return false;
	if (!slot.swipe_detected) return true;
	return now - slot.last_swipe_time > params_.cooldown;
}

Swipe GestureDetector::classify(int dx, int dy) const {
	const int adx = std::abs(dx);
	const int ady = std::abs(dy);
	if (adx > params_.min_distance && ady < params_.max_off_axis) {
		return dx > 0 ? Swipe::Right : Swipe::Left;
	}
	if (ady > params_.min_vertical && adx < params_.max_off_axis) {
		return dy > 0 ? Swipe::Down : Swipe::Up;
	}
	return Swipe::None;
}

bool GestureDetector::is_tap(const Slot& slot, TimePoint now) const {
	if (!slot.started || !slot.in_viewport) return false;
	if (slot.swipe_detected || slot.button_pressed) return false;
	return now - slot.touch_start_time < params_.tap_timeout;
}

uint16_t GestureDetector::swipe_key(Swipe swipe) {
	switch (swipe) {
	case Swipe::Left: return KEY_LEFT;
	case Swipe::Right: return KEY_RIGHT;
	case Swipe::Up: return KEY_UP;
	case Swipe::Down: return KEY_DOWN;
	case Swipe::None: break;
	}
	return KEY_RESERVED;
}

const char* GestureDetector::swipe_name(Swipe swipe) {
	switch (swipe) {
	case Swipe::Left: return "Swipe left";
	case Swipe::Right: return "Swipe right";
	case Swipe::Up: return "Swipe up";
	case Swipe::Down: return "Swipe down";
	case Swipe::None: break;
	}
	return "none";
}

} // namespace touchkbd
