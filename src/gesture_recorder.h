#ifndef TOUCHKBD_GESTURE_RECORDER_H
#define TOUCHKBD_GESTURE_RECORDER_H

#include <algorithm>
#include <vector>

#include "key_sink.h"

namespace touchkbd {

// Key sink for viewers. Injects nothing; remembers the last binding that was
// pressed and released within one report. Held regions never do that, only
// swipes and viewport taps.
class GestureRecorder : public KeySink {
public:
	bool set_key(const KeyBinding& keys, bool down) override {
		if (down) {
			pressed_.push_back(keys);
		} else if (std::find(pressed_.begin(), pressed_.end(), keys) != pressed_.end()) {
			last_ = keys;
			count_++;
		}
		return true;
	}

	bool sync() override {
		pressed_.clear();
		return true;
	}

	// Bumped once per gesture; callers compare to notice a new one.
	int count() const { return count_; }
	const KeyBinding& last() const { return last_; }

private:
	std::vector<KeyBinding> pressed_;
	KeyBinding last_;
	int count_ = 0;
};

} // namespace touchkbd

#endif
