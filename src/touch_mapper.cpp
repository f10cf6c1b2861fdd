#include "touch_mapper.h"

#include <ctime>
#include <iostream>

namespace touchkbd {

namespace {

std::string wall_clock_hms() {
	std::time_t t = std::time(nullptr);
	std::tm tm;
	localtime_r(&t, &tm);
	char buf[16];
	std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
	return buf;
}

} // namespace

TouchMapper::TouchMapper(const HitTester& hits, const GestureDetector& gestures, KeySink& keys, HapticSink* haptic)
	: hits_(hits), gestures_(gestures), keys_(keys), haptic_(haptic) {}

void TouchMapper::process(const TouchEvent& ev) {
	Batch batch;
	switch (ev.axis) {
	case TouchAxis::Slot:
		current_slot_ = ev.value;
		return;
	case TouchAxis::TrackingId: {
		Slot& slot = slots_[current_slot_];
		if (ev.value < 0) end_contact(slot, ev.time, batch);
		else start_contact(slot, ev.value, ev.time, batch);
		break;
	}
	case TouchAxis::PositionX: {
		Slot& slot = slots_[current_slot_];
		if (!slot.have_x) slot.start_x = ev.value;
		slot.x = ev.value;
		slot.have_x = true;
		evaluate(slot, ev.time, batch);
		break;
	}
	case TouchAxis::PositionY: {
		Slot& slot = slots_[current_slot_];
		if (!slot.have_y) slot.start_y = ev.value;
		slot.y = ev.value;
		slot.have_y = true;
		evaluate(slot, ev.time, batch);
		break;
	}
	case TouchAxis::ContactSize: {
		Slot& slot = slots_[current_slot_];
		slot.touch_size = ev.value;
		evaluate(slot, ev.time, batch);
		break;
	}
	case TouchAxis::Other:
		return;
	}
	flush(batch);
}

void TouchMapper::release_all() {
	Batch batch;
	for (auto& entry : slots_) release_buttons(entry.second, batch);
	slots_.clear();
	flush(batch);
}

void TouchMapper::start_contact(Slot& slot, int tracking_id, TimePoint now, Batch& out) {
	if (slot.active()) {
		if (slot.tracking_id == tracking_id) return;
		// Previous contact was never ended; it must not leave keys behind.
		release_buttons(slot, out);
		slot = Slot();
	}
	// An idle slot may already hold positions reported ahead of the id.
	slot.tracking_id = tracking_id;
	slot.started = true;
	slot.touch_start_time = now;
}

void TouchMapper::end_contact(Slot& slot, TimePoint now, Batch& out) {
	release_buttons(slot, out);
	if (gestures_.is_tap(slot, now)) {
		const Region& vp = hits_.layout().viewport;
		tap(vp.keys, vp.name, out);
	}
	slot = Slot();
}

void TouchMapper::evaluate(Slot& slot, TimePoint now, Batch& out) {
	if (!slot.have_position()) return;

	std::vector<size_t> hits = hits_.hit_test(slot.x, slot.y, slot.touch_size);
	if (!hits.empty()) {
		update_buttons(slot, hits, out);
		slot.button_pressed = true;
	} else if (hits_.in_viewport(slot.x, slot.y)) {
		release_buttons(slot, out);
		slot.in_viewport = true;
		if (gestures_.can_swipe(slot, now)) detect_swipe(slot, now, out);
	} else {
		release_buttons(slot, out);
		slot.button_pressed = false;
	}
}

void TouchMapper::update_buttons(Slot& slot, const std::vector<size_t>& hits, Batch& out) {
	const std::vector<Region>& regions = hits_.layout().regions;
	std::set<size_t> next(hits.begin(), hits.end());

	for (size_t idx : slot.active_buttons) {
		if (regions[idx].directional() && !next.count(idx)) {
			out.push_back(KeyChange{regions[idx].keys, false, regions[idx].name});
		}
	}
	for (size_t idx : slot.active_buttons) {
		if (!regions[idx].directional() && !next.count(idx)) {
			out.push_back(KeyChange{regions[idx].keys, false, regions[idx].name});
		}
	}
	for (size_t idx : next) {
		if (!slot.active_buttons.count(idx)) {
			out.push_back(KeyChange{regions[idx].keys, true, regions[idx].name});
		}
	}
	slot.active_buttons.swap(next);
}

void TouchMapper::release_buttons(Slot& slot, Batch& out) {
	const std::vector<Region>& regions = hits_.layout().regions;
	for (size_t idx : slot.active_buttons) {
		out.push_back(KeyChange{regions[idx].keys, false, regions[idx].name});
	}
	slot.active_buttons.clear();
}

void TouchMapper::detect_swipe(Slot& slot, TimePoint now, Batch& out) {
	Swipe swipe = gestures_.classify(slot.x - slot.start_x, slot.y - slot.start_y);
	if (swipe == Swipe::None) return;

	tap(KeyBinding::single(GestureDetector::swipe_key(swipe)), GestureDetector::swipe_name(swipe), out);
	slot.start_x = slot.x;
	slot.start_y = slot.y;
	slot.last_swipe_time = now;
	slot.swipe_detected = true;
}

void TouchMapper::tap(const KeyBinding& keys, const std::string& label, Batch& out) {
	out.push_back(KeyChange{keys, true, label});
	out.push_back(KeyChange{keys, false, label});
}

void TouchMapper::flush(const Batch& batch) {
	if (batch.empty()) return;

	int presses = 0;
	for (const auto& change : batch) {
		if (!keys_.set_key(change.keys, change.down)) {
			std::cerr << "[WARN] Key " << (change.down ? "press" : "release") << " failed: " << change.label
					  << " (" << format_key_binding(change.keys) << ")" << std::endl;
		}
		if (change.down) presses++;
		if (log_keys_) {
			std::cerr << "[KEY] " << wall_clock_hms() << " " << (change.down ? "Press" : "Release") << ": "
					  << change.label << " (" << format_key_binding(change.keys) << ")" << std::endl;
		}
	}

	if (haptic_) {
		for (int i = 0; i < presses; ++i) haptic_->pulse();
	}

	if (!keys_.sync()) std::cerr << "[WARN] Key sync failed" << std::endl;
}

} // namespace touchkbd
