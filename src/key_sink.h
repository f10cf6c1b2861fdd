#ifndef TOUCHKBD_KEY_SINK_H
#define TOUCHKBD_KEY_SINK_H

#include "key_codes.h"

namespace touchkbd {

// Virtual keyboard. set_key applies whatever state is requested; a batch of
// set_key calls becomes visible to readers on sync().
class KeySink {
public:
	virtual ~KeySink() {}
	virtual bool set_key(const KeyBinding& keys, bool down) = 0;
	virtual bool sync() = 0;
};

// Fire-and-forget vibration. Must not block the caller.
class HapticSink {
public:
	virtual ~HapticSink() {}
	virtual void pulse() = 0;
};

} // namespace touchkbd

#endif
