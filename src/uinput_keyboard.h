#ifndef TOUCHKBD_UINPUT_KEYBOARD_H
#define TOUCHKBD_UINPUT_KEYBOARD_H

#include <cstdint>
#include <string>
#include <vector>

#include "key_sink.h"

namespace touchkbd {

// Virtual keyboard on /dev/uinput.
class UinputKeyboard : public KeySink {
public:
	UinputKeyboard() {}
	~UinputKeyboard() override;

	UinputKeyboard(const UinputKeyboard&) = delete;
	UinputKeyboard& operator=(const UinputKeyboard&) = delete;

	// Advertises exactly `codes` as EV_KEY capabilities.
	bool create(const std::string& name, const std::vector<uint16_t>& codes);
	void destroy();
	bool is_open() const { return fd_ >= 0; }

	bool set_key(const KeyBinding& keys, bool down) override;
	bool sync() override;

private:
	bool emit(uint16_t type, uint16_t code, int32_t value);

	int fd_ = -1;
};

} // namespace touchkbd

#endif
