#ifndef TOUCHKBD_CONFIG_H
#define TOUCHKBD_CONFIG_H

#include <string>
#include <vector>

#include "gesture_detector.h"
#include "layout.h"

namespace touchkbd {

struct Config {
	std::string touch_device = "/dev/input/event0";
	std::string keyboard_name = "Virtual-Touch-Keyboard";

	// 0 = ask the device (EVIOCGABS).
	int touch_max_x = 0;
	int touch_max_y = 0;
	int physical_w = kDefaultPhysicalWidth;
	int physical_h = kDefaultPhysicalHeight;

	int combo_size_threshold = 40;
	int swipe_min_distance = 60;
	int swipe_min_vertical = 50;
	int swipe_max_off_axis = 70;
	int swipe_cooldown_ms = 300;
	int viewport_tap_timeout_ms = 150;

	int grab = 0;
	int haptic = 1;
	int haptic_i2c_bus = 1;
	int haptic_i2c_addr = 0x5A;
	int haptic_effect = 1;
	int log_keys = 0;

	// Physical pixels.
	Layout layout = default_layout();

	GestureParams gesture_params() const;
};

// Empty string when no file exists in any searched location.
std::string find_config_path();

// Unknown keys and unparsable scalars are skipped; malformed layout lines
// are reported in `errors`. Returns false only when the file can't be read.
bool load_config(const std::string& path, Config& cfg, std::vector<std::string>& errors);

// TOUCHKBD_<KEY> environment variables.
void apply_env_overrides(Config& cfg);

void sanitize_config(Config& cfg);

} // namespace touchkbd

#endif
