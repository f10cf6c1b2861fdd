#include "uinput_keyboard.h"

#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <linux/input.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace touchkbd {

UinputKeyboard::~UinputKeyboard() {
	destroy();
}

bool UinputKeyboard::create(const std::string& name, const std::vector<uint16_t>& codes) {
	destroy();

	int fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK | O_CLOEXEC);
	if (fd < 0) {
		std::perror("open(/dev/uinput)");
		return false;
	}

	uinput_user_dev uidev;

	if (ioctl(fd, UI_SET_EVBIT, EV_KEY) < 0) goto fail;
	for (uint16_t code : codes) {
		if (ioctl(fd, UI_SET_KEYBIT, code) < 0) goto fail;
	}
	if (ioctl(fd, UI_SET_EVBIT, EV_SYN) < 0) goto fail;

	std::memset(&uidev, 0, sizeof(uidev));
	std::snprintf(uidev.name, sizeof(uidev.name), "%s", name.c_str());
	uidev.id.bustype = BUS_VIRTUAL;
	uidev.id.vendor = 0x1234;
	uidev.id.product = 0x5679;
	uidev.id.version = 1;

	if (write(fd, &uidev, sizeof(uidev)) < 0) goto fail;
	if (ioctl(fd, UI_DEV_CREATE) < 0) goto fail;

	// Give the input subsystem a moment
	usleep(100000);
	fd_ = fd;
	return true;

fail:
	std::perror("uinput setup");
	close(fd);
	return false;
}

void UinputKeyboard::destroy() {
	if (fd_ < 0) return;
	ioctl(fd_, UI_DEV_DESTROY);
	close(fd_);
	fd_ = -1;
}

bool UinputKeyboard::set_key(const KeyBinding& keys, bool down) {
	bool ok = true;
	for (int i = 0; i < keys.count(); ++i) {
		if (!emit(EV_KEY, keys.codes[i], down ? 1 : 0)) ok = false;
	}
	return ok;
}

bool UinputKeyboard::sync() {
	return emit(EV_SYN, SYN_REPORT, 0);
}

bool UinputKeyboard::emit(uint16_t type, uint16_t code, int32_t value) {
	if (fd_ < 0) return false;
	input_event ev;
	std::memset(&ev, 0, sizeof(ev));
	ev.type = type;
	ev.code = code;
	ev.value = value;
	// time left as 0; kernel fills it in
	return write(fd_, &ev, sizeof(ev)) == (ssize_t)sizeof(ev);
}

} // namespace touchkbd
