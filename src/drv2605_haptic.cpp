#include "drv2605_haptic.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <linux/i2c-dev.h>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace touchkbd {

namespace {

const uint8_t kRegMode = 0x01;
const uint8_t kRegRtpIn = 0x02;
const uint8_t kRegLibrary = 0x03;
const uint8_t kRegWaveSeq1 = 0x04;
const uint8_t kRegWaveSeq2 = 0x05;
const uint8_t kRegGo = 0x0C;
const uint8_t kRegOverdrive = 0x0D;
const uint8_t kRegSustainPos = 0x0E;
const uint8_t kRegSustainNeg = 0x0F;
const uint8_t kRegBreak = 0x10;

const uint8_t kModeInternalTrigger = 0x00;

} // namespace

Drv2605Haptic::~Drv2605Haptic() {
	close();
}

bool Drv2605Haptic::open(int bus, int address, int effect) {
	close();

	std::string dev = "/dev/i2c-" + std::to_string(bus);
	int fd = ::open(dev.c_str(), O_RDWR | O_CLOEXEC);
	if (fd < 0) {
		std::cerr << "[WARN] Cannot open " << dev << ": " << std::strerror(errno) << std::endl;
		return false;
	}
	if (ioctl(fd, I2C_SLAVE, address) < 0) {
		std::cerr << "[WARN] Cannot select haptic driver at 0x" << std::hex << address << std::dec
				  << " on " << dev << ": " << std::strerror(errno) << std::endl;
		::close(fd);
		return false;
	}
	fd_ = fd;

	// Out of standby, internal trigger, one-effect sequence.
	bool ok = write_reg(kRegMode, kModeInternalTrigger) &&
			  write_reg(kRegRtpIn, 0) &&
			  write_reg(kRegLibrary, 1) &&
			  write_reg(kRegWaveSeq1, (uint8_t)effect) &&
			  write_reg(kRegWaveSeq2, 0) &&
			  write_reg(kRegOverdrive, 0) &&
			  write_reg(kRegSustainPos, 0) &&
			  write_reg(kRegSustainNeg, 0) &&
			  write_reg(kRegBreak, 0);
	if (!ok) {
		std::cerr << "[WARN] Haptic driver did not accept setup on " << dev << std::endl;
		::close(fd_);
		fd_ = -1;
		return false;
	}

	stop_ = false;
	pending_ = false;
	worker_ = std::thread(&Drv2605Haptic::worker_loop, this);
	return true;
}

void Drv2605Haptic::close() {
	if (worker_.joinable()) {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			stop_ = true;
		}
		cv_.notify_one();
		worker_.join();
	}
	if (fd_ >= 0) {
		::close(fd_);
		fd_ = -1;
	}
}

void Drv2605Haptic::pulse() {
	if (fd_ < 0) return;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		pending_ = true;
	}
	cv_.notify_one();
}

bool Drv2605Haptic::write_reg(uint8_t reg, uint8_t value) {
	uint8_t buf[2] = {reg, value};
	return write(fd_, buf, sizeof(buf)) == (ssize_t)sizeof(buf);
}

void Drv2605Haptic::worker_loop() {
	std::unique_lock<std::mutex> lock(mutex_);
	for (;;) {
		cv_.wait(lock, [this] { return pending_ || stop_; });
		if (stop_) return;
		pending_ = false;
		lock.unlock();
		if (!write_reg(kRegGo, 1)) {
			std::cerr << "[WARN] Haptic error: " << std::strerror(errno) << std::endl;
		}
		lock.lock();
	}
}

} // namespace touchkbd
