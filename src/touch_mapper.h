#ifndef TOUCHKBD_TOUCH_MAPPER_H
#define TOUCHKBD_TOUCH_MAPPER_H

#include <map>
#include <string>
#include <vector>

#include "gesture_detector.h"
#include "hit_tester.h"
#include "key_sink.h"
#include "slot.h"
#include "touch_event.h"

namespace touchkbd {

// Folds multitouch events into per-slot state and turns state changes into
// key presses/releases. Single-threaded: call process() for each event in
// arrival order.
//
// Within one event the sink sees: directional releases, other releases,
// presses, then swipe/tap keys; then one haptic pulse per press, then
// sync(). Events that change no key do not touch the sink.
class TouchMapper {
public:
	TouchMapper(const HitTester& hits, const GestureDetector& gestures, KeySink& keys, HapticSink* haptic);

	void process(const TouchEvent& ev);

	// Releases every held button on every slot and flushes. Used on shutdown;
	// a failing release does not stop the others.
	void release_all();

	void set_log_keys(bool enabled) { log_keys_ = enabled; }

	const std::map<int, Slot>& slots() const { return slots_; }
	int current_slot() const { return current_slot_; }

private:
	struct KeyChange {
		KeyBinding keys;
		bool down;
		std::string label;
	};
	typedef std::vector<KeyChange> Batch;

	void start_contact(Slot& slot, int tracking_id, TimePoint now, Batch& out);
	void end_contact(Slot& slot, TimePoint now, Batch& out);
	void evaluate(Slot& slot, TimePoint now, Batch& out);
	void update_buttons(Slot& slot, const std::vector<size_t>& hits, Batch& out);
	void release_buttons(Slot& slot, Batch& out);
	void detect_swipe(Slot& slot, TimePoint now, Batch& out);
	void tap(const KeyBinding& keys, const std::string& label, Batch& out);
	void flush(const Batch& batch);

	const HitTester& hits_;
	const GestureDetector& gestures_;
	KeySink& keys_;
	HapticSink* haptic_;
	bool log_keys_ = false;

	std::map<int, Slot> slots_;
	int current_slot_ = 0;
};

} // namespace touchkbd

#endif
