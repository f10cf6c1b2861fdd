#ifndef TOUCHKBD_DRV2605_HAPTIC_H
#define TOUCHKBD_DRV2605_HAPTIC_H

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "key_sink.h"

namespace touchkbd {

// TI DRV2605 haptic driver on an i2c-dev bus, ERM motor, ROM library 1.
// pulse() only flags a request; a worker thread talks to the bus, so a
// stalled bus never holds up the caller. Requests arriving while one is
// pending collapse into it.
class Drv2605Haptic : public HapticSink {
public:
	Drv2605Haptic() {}
	~Drv2605Haptic() override;

	Drv2605Haptic(const Drv2605Haptic&) = delete;
	Drv2605Haptic& operator=(const Drv2605Haptic&) = delete;

	bool open(int bus, int address, int effect);
	void close();
	bool is_open() const { return fd_ >= 0; }

	void pulse() override;

private:
	bool write_reg(uint8_t reg, uint8_t value);
	void worker_loop();

	int fd_ = -1;
	std::thread worker_;
	std::mutex mutex_;
	std::condition_variable cv_;
	bool pending_ = false;
	bool stop_ = false;
};

} // namespace touchkbd

#endif
