#ifndef TOUCHKBD_FAKE_SINKS_H
#define TOUCHKBD_FAKE_SINKS_H

#include <set>
#include <vector>

#include "key_sink.h"

namespace touchkbd {

// Test doubles recording what the mapper asked for.
class FakeKeySink : public KeySink {
public:
	struct Call {
		KeyBinding keys;
		bool down;
	};

	bool set_key(const KeyBinding& keys, bool down) override {
		calls.push_back(Call{keys, down});
		for (int i = 0; i < keys.count(); ++i) {
			if (fail_codes.count(keys.codes[i])) return false;
		}
		return true;
	}

	bool sync() override {
		syncs++;
		return true;
	}

	int presses(uint16_t code) const { return count(code, true); }
	int releases(uint16_t code) const { return count(code, false); }

	void clear() {
		calls.clear();
		syncs = 0;
	}

	std::vector<Call> calls;
	int syncs = 0;
	std::set<uint16_t> fail_codes;

private:
	int count(uint16_t code, bool down) const {
		int n = 0;
		for (const auto& c : calls) {
			if (c.down == down && c.keys.contains(code)) n++;
		}
		return n;
	}
};

class FakeHaptic : public HapticSink {
public:
	void pulse() override { pulses++; }
	int pulses = 0;
};

} // namespace touchkbd

#endif
