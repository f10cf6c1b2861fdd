#include "evdev_touch_source.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace touchkbd {

namespace {

// Replay order: size first so the position that completes the contact is
// evaluated with its real size.
const TouchAxis kReplayAxes[] = {TouchAxis::ContactSize, TouchAxis::PositionX, TouchAxis::PositionY};

int axis_index(TouchAxis axis) {
	switch (axis) {
	case TouchAxis::ContactSize: return 0;
	case TouchAxis::PositionX: return 1;
	case TouchAxis::PositionY: return 2;
	default: return -1;
	}
}

TouchEvent make_touch_event(TouchAxis axis, int value, const TimePoint& time) {
	TouchEvent ev;
	ev.axis = axis;
	ev.value = value;
	ev.time = time;
	return ev;
}

} // namespace

WaitResult wait_readable(int fd, const sigset_t* sigmask) {
	pollfd pfd;
	pfd.fd = fd;
	pfd.events = POLLIN;
	pfd.revents = 0;
	int r = ppoll(&pfd, 1, nullptr, sigmask);
	if (r < 0) {
		if (errno == EINTR) return WaitResult::Interrupted;
		std::cerr << "[ERROR] Waiting on touch device failed: " << std::strerror(errno) << std::endl;
		return WaitResult::Failed;
	}
	if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
		std::cerr << "[ERROR] Touch device went away" << std::endl;
		return WaitResult::Failed;
	}
	return WaitResult::Ready;
}

void EvdevFrameDecoder::feed(const input_event& raw, std::vector<TouchEvent>& out) {
	if (raw.type == EV_SYN) {
		if (raw.code == SYN_DROPPED) {
			std::cerr << "[WARN] Touch events dropped by the kernel; skipping to next report" << std::endl;
			dropping_ = true;
		} else if (raw.code == SYN_REPORT) {
			if (dropping_) {
				dropping_ = false;
				for (auto& entry : slots_) {
					SlotState& st = entry.second;
					for (int i = 0; i < kAxes; ++i) st.reported[i] = false;
				}
			} else {
				replay(EvdevTouchSource::translate(raw).time, out);
			}
		}
		return;
	}
	if (dropping_ || raw.type != EV_ABS) return;

	TouchEvent ev = EvdevTouchSource::translate(raw);
	switch (ev.axis) {
	case TouchAxis::Slot:
		current_slot_ = ev.value;
		break;
	case TouchAxis::TrackingId:
		slots_[current_slot_].fresh = ev.value >= 0;
		break;
	case TouchAxis::PositionX:
	case TouchAxis::PositionY:
	case TouchAxis::ContactSize: {
		SlotState& st = slots_[current_slot_];
		int i = axis_index(ev.axis);
		st.value[i] = ev.value;
		st.known[i] = true;
		st.reported[i] = true;
		break;
	}
	case TouchAxis::Other:
		return;
	}
	out.push_back(ev);
}

void EvdevFrameDecoder::replay(const TimePoint& time, std::vector<TouchEvent>& out) {
	for (auto& entry : slots_) {
		SlotState& st = entry.second;
		if (st.fresh) {
			bool switched = false;
			for (TouchAxis axis : kReplayAxes) {
				int i = axis_index(axis);
				if (st.reported[i] || !st.known[i]) continue;
				if (!switched && entry.first != current_slot_) {
					out.push_back(make_touch_event(TouchAxis::Slot, entry.first, time));
					switched = true;
				}
				out.push_back(make_touch_event(axis, st.value[i], time));
			}
			if (switched) out.push_back(make_touch_event(TouchAxis::Slot, current_slot_, time));
		}
		st.fresh = false;
		for (int i = 0; i < kAxes; ++i) st.reported[i] = false;
	}
}

void EvdevFrameDecoder::seed(int slot, TouchAxis axis, int value) {
	int i = axis_index(axis);
	if (i < 0) return;
	SlotState& st = slots_[slot];
	st.value[i] = value;
	st.known[i] = true;
}

void EvdevFrameDecoder::reset() {
	slots_.clear();
	current_slot_ = 0;
	dropping_ = false;
}

EvdevTouchSource::~EvdevTouchSource() {
	close();
}

bool EvdevTouchSource::open(const std::string& path, bool grab, bool nonblocking) {
	close();
	failed_ = false;

	int flags = O_RDONLY | O_CLOEXEC;
	if (nonblocking) flags |= O_NONBLOCK;
	int fd = ::open(path.c_str(), flags);
	if (fd < 0) {
		std::cerr << "[ERROR] Cannot open touch device " << path << ": " << std::strerror(errno) << std::endl;
		return false;
	}

	char name[256] = {0};
	if (ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name) < 0) {
		std::cerr << "[ERROR] " << path << " is not an evdev device" << std::endl;
		::close(fd);
		return false;
	}
	name_ = name;

	input_absinfo abs;
	std::memset(&abs, 0, sizeof(abs));
	max_x_ = (ioctl(fd, EVIOCGABS(ABS_MT_POSITION_X), &abs) == 0) ? abs.maximum : 0;
	std::memset(&abs, 0, sizeof(abs));
	max_y_ = (ioctl(fd, EVIOCGABS(ABS_MT_POSITION_Y), &abs) == 0) ? abs.maximum : 0;

	// Event timestamps on the same clock as steady_clock.
	int clk = CLOCK_MONOTONIC;
	monotonic_ = ioctl(fd, EVIOCSCLOCKID, &clk) == 0;
	if (!monotonic_) {
		std::cerr << "[WARN] " << path << ": cannot switch event clock; stamping on read" << std::endl;
	}

	if (grab) {
		if (ioctl(fd, EVIOCGRAB, 1) == 0) {
			grabbed_ = true;
		} else {
			std::cerr << "[WARN] Could not grab " << path << ": " << std::strerror(errno) << std::endl;
		}
	}

	fd_ = fd;
	count_ = pos_ = 0;
	pending_.clear();
	pending_pos_ = 0;
	decoder_.reset();
	seed_slots(fd);
	return true;
}

void EvdevTouchSource::close() {
	if (fd_ < 0) return;
	if (grabbed_) ioctl(fd_, EVIOCGRAB, 0);
	grabbed_ = false;
	::close(fd_);
	fd_ = -1;
}

// Per-slot values the kernel already holds; it will not resend them while
// they stay unchanged.
void EvdevTouchSource::seed_slots(int fd) {
	input_absinfo abs;
	std::memset(&abs, 0, sizeof(abs));
	if (ioctl(fd, EVIOCGABS(ABS_MT_SLOT), &abs) < 0) return;
	decoder_.set_current_slot(abs.value);

	int num_slots = abs.maximum + 1;
	if (num_slots <= 0) return;

	const struct {
		unsigned code;
		TouchAxis axis;
	} axes[] = {
		{ABS_MT_POSITION_X, TouchAxis::PositionX},
		{ABS_MT_POSITION_Y, TouchAxis::PositionY},
		{ABS_MT_TOUCH_MAJOR, TouchAxis::ContactSize},
	};
	// EVIOCGMTSLOTS layout: the axis code followed by one value per slot.
	std::vector<int32_t> req(num_slots + 1);
	for (const auto& a : axes) {
		req[0] = (int32_t)a.code;
		if (ioctl(fd, EVIOCGMTSLOTS(req.size() * sizeof(int32_t)), req.data()) < 0) continue;
		for (int i = 0; i < num_slots; ++i) decoder_.seed(i, a.axis, req[i + 1]);
	}
}

TouchEvent EvdevTouchSource::translate(const input_event& raw) {
	TouchEvent ev;
	ev.value = raw.value;
	ev.time = TimePoint(std::chrono::duration_cast<Clock::duration>(
		std::chrono::seconds(raw.input_event_sec) + std::chrono::microseconds(raw.input_event_usec)));
	if (raw.type != EV_ABS) return ev;

	switch (raw.code) {
	case ABS_MT_SLOT: ev.axis = TouchAxis::Slot; break;
	case ABS_MT_TRACKING_ID: ev.axis = TouchAxis::TrackingId; break;
	case ABS_MT_POSITION_X: ev.axis = TouchAxis::PositionX; break;
	case ABS_MT_POSITION_Y: ev.axis = TouchAxis::PositionY; break;
	case ABS_MT_TOUCH_MAJOR: ev.axis = TouchAxis::ContactSize; break;
	default: break;
	}
	return ev;
}

bool EvdevTouchSource::fill() {
	ssize_t n = read(fd_, buf_, sizeof(buf_));
	if (n < 0) {
		if (errno == EINTR || errno == EAGAIN) return false;
		std::cerr << "[ERROR] Touch device read failed: " << std::strerror(errno) << std::endl;
		failed_ = true;
		return false;
	}
	if (n == 0 || (size_t)n % sizeof(input_event) != 0) {
		std::cerr << "[ERROR] Touch device returned a short read (" << n << " bytes)" << std::endl;
		failed_ = true;
		return false;
	}
	count_ = (size_t)n / sizeof(input_event);
	pos_ = 0;
	return true;
}

bool EvdevTouchSource::wait(const sigset_t* sigmask) {
	if (pending_pos_ < pending_.size() || pos_ < count_) return true;
	if (fd_ < 0) {
		failed_ = true;
		return false;
	}
	WaitResult r = wait_readable(fd_, sigmask);
	if (r == WaitResult::Failed) failed_ = true;
	return r == WaitResult::Ready;
}

bool EvdevTouchSource::next(TouchEvent& ev) {
	if (fd_ < 0) {
		failed_ = true;
		return false;
	}
	for (;;) {
		if (pending_pos_ < pending_.size()) {
			ev = pending_[pending_pos_++];
			if (!monotonic_) ev.time = Clock::now();
			return true;
		}
		pending_.clear();
		pending_pos_ = 0;

		if (pos_ == count_ && !fill()) return false;
		decoder_.feed(buf_[pos_++], pending_);
	}
}

} // namespace touchkbd
