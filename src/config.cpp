#include "config.h"

#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace touchkbd {

namespace {

std::string get_exe_dir() {
	char buf[4096];
	ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
	if (n <= 0) return std::string();
	buf[n] = '\0';
	std::string path(buf);
	size_t pos = path.find_last_of('/');
	if (pos == std::string::npos) return std::string();
	return path.substr(0, pos);
}

bool parse_int(const std::string& s, int& out, int base = 10) {
	char* end = nullptr;
	long v = std::strtol(s.c_str(), &end, base);
	if (end == s.c_str()) return false;
	out = (int)v;
	return true;
}

template <typename T>
T clamp_val(T v, T lo, T hi) {
	return (v < lo) ? lo : ((v > hi) ? hi : v);
}

void trim(std::string& s) {
	s.erase(0, s.find_first_not_of(" \t\r"));
	s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // namespace

GestureParams Config::gesture_params() const {
	GestureParams p;
	p.min_distance = swipe_min_distance;
	p.min_vertical = swipe_min_vertical;
	p.max_off_axis = swipe_max_off_axis;
	p.cooldown = std::chrono::milliseconds(swipe_cooldown_ms);
	p.tap_timeout = std::chrono::milliseconds(viewport_tap_timeout_ms);
	return p;
}

std::string find_config_path() {
	const char* envPath = getenv("TOUCHKBD_CONFIG_PATH");
	if (envPath && *envPath) {
		std::ifstream f(envPath);
		if (f.good()) return std::string(envPath);
	}

	std::vector<std::string> candidates;
	// System-wide config (service install)
	candidates.push_back("/etc/touchkbd/touch_keyboard.txt");
	candidates.push_back("touch_keyboard.txt");
	candidates.push_back("installation/touch_keyboard.txt");

	std::string exeDir = get_exe_dir();
	if (!exeDir.empty()) {
		candidates.push_back(exeDir + "/touch_keyboard.txt");
		candidates.push_back(exeDir + "/installation/touch_keyboard.txt");
		candidates.push_back(exeDir + "/../installation/touch_keyboard.txt");
	}

	for (const auto& p : candidates) {
		std::ifstream f(p);
		if (f.good()) return p;
	}
	return std::string();
}

bool load_config(const std::string& path, Config& cfg, std::vector<std::string>& errors) {
	std::ifstream file(path);
	if (!file.good()) return false;

	// The first region=/combo= line replaces the built-in list.
	bool own_regions = false;
	bool own_combos = false;

	std::string line;
	int lineno = 0;
	while (std::getline(file, line)) {
		lineno++;
		trim(line);
		if (line.empty() || line[0] == '#') continue;
		auto eq = line.find('=');
		if (eq == std::string::npos) continue;
		std::string key = line.substr(0, eq);
		std::string val = line.substr(eq + 1);
		trim(key);
		trim(val);
		int iv = 0;
		std::string err;

		if (key == "touch_device") cfg.touch_device = val;
		else if (key == "keyboard_name") cfg.keyboard_name = val;
		else if (key == "touch_max_x" && parse_int(val, iv)) cfg.touch_max_x = iv;
		else if (key == "touch_max_y" && parse_int(val, iv)) cfg.touch_max_y = iv;
		else if (key == "physical_w" && parse_int(val, iv)) cfg.physical_w = iv;
		else if (key == "physical_h" && parse_int(val, iv)) cfg.physical_h = iv;
		else if (key == "combo_size_threshold" && parse_int(val, iv)) cfg.combo_size_threshold = iv;
		else if (key == "swipe_min_distance" && parse_int(val, iv)) cfg.swipe_min_distance = iv;
		else if (key == "swipe_min_vertical" && parse_int(val, iv)) cfg.swipe_min_vertical = iv;
		else if (key == "swipe_max_off_axis" && parse_int(val, iv)) cfg.swipe_max_off_axis = iv;
		else if (key == "swipe_cooldown_ms" && parse_int(val, iv)) cfg.swipe_cooldown_ms = iv;
		else if (key == "viewport_tap_timeout_ms" && parse_int(val, iv)) cfg.viewport_tap_timeout_ms = iv;
		else if (key == "grab" && parse_int(val, iv)) cfg.grab = iv;
		else if (key == "haptic" && parse_int(val, iv)) cfg.haptic = iv;
		else if (key == "haptic_i2c_bus" && parse_int(val, iv)) cfg.haptic_i2c_bus = iv;
		else if (key == "haptic_i2c_addr" && parse_int(val, iv, 0)) cfg.haptic_i2c_addr = iv;
		else if (key == "haptic_effect" && parse_int(val, iv)) cfg.haptic_effect = iv;
		else if (key == "log_keys" && parse_int(val, iv)) cfg.log_keys = iv;
		else if (key == "region") {
			Region r;
			if (!parse_region_line(val, r, err)) {
				errors.push_back(path + ":" + std::to_string(lineno) + ": " + err);
				continue;
			}
			if (!own_regions) {
				cfg.layout.regions.clear();
				own_regions = true;
			}
			cfg.layout.regions.push_back(r);
		} else if (key == "viewport") {
			Region r;
			if (!parse_region_line(val, r, err)) {
				errors.push_back(path + ":" + std::to_string(lineno) + ": " + err);
				continue;
			}
			cfg.layout.viewport = r;
		} else if (key == "combo") {
			ComboRule c;
			if (!parse_combo_line(val, c, err)) {
				errors.push_back(path + ":" + std::to_string(lineno) + ": " + err);
				continue;
			}
			if (!own_combos) {
				cfg.layout.combos.clear();
				own_combos = true;
			}
			cfg.layout.combos.push_back(c);
		}
	}
	return true;
}

void apply_env_overrides(Config& cfg) {
	auto env_i = [](const char* name, int& dst) {
		const char* v = getenv(name);
		if (v && *v) dst = (int)std::strtol(v, nullptr, 0);
	};

	if (const char* v = getenv("TOUCHKBD_TOUCH_DEVICE")) {
		if (*v) cfg.touch_device = v;
	}
	if (const char* v = getenv("TOUCHKBD_KEYBOARD_NAME")) {
		if (*v) cfg.keyboard_name = v;
	}

	env_i("TOUCHKBD_TOUCH_MAX_X", cfg.touch_max_x);
	env_i("TOUCHKBD_TOUCH_MAX_Y", cfg.touch_max_y);
	env_i("TOUCHKBD_PHYSICAL_W", cfg.physical_w);
	env_i("TOUCHKBD_PHYSICAL_H", cfg.physical_h);
	env_i("TOUCHKBD_COMBO_SIZE_THRESHOLD", cfg.combo_size_threshold);
	env_i("TOUCHKBD_SWIPE_MIN_DISTANCE", cfg.swipe_min_distance);
	env_i("TOUCHKBD_SWIPE_MIN_VERTICAL", cfg.swipe_min_vertical);
	env_i("TOUCHKBD_SWIPE_MAX_OFF_AXIS", cfg.swipe_max_off_axis);
	env_i("TOUCHKBD_SWIPE_COOLDOWN_MS", cfg.swipe_cooldown_ms);
	env_i("TOUCHKBD_VIEWPORT_TAP_TIMEOUT_MS", cfg.viewport_tap_timeout_ms);
	env_i("TOUCHKBD_GRAB", cfg.grab);
	env_i("TOUCHKBD_HAPTIC", cfg.haptic);
	env_i("TOUCHKBD_HAPTIC_I2C_BUS", cfg.haptic_i2c_bus);
	env_i("TOUCHKBD_HAPTIC_I2C_ADDR", cfg.haptic_i2c_addr);
	env_i("TOUCHKBD_HAPTIC_EFFECT", cfg.haptic_effect);
	env_i("TOUCHKBD_LOG_KEYS", cfg.log_keys);
}

void sanitize_config(Config& cfg) {
	cfg.touch_max_x = clamp_val(cfg.touch_max_x, 0, 65535);
	cfg.touch_max_y = clamp_val(cfg.touch_max_y, 0, 65535);
	cfg.physical_w = clamp_val(cfg.physical_w, 1, 8192);
	cfg.physical_h = clamp_val(cfg.physical_h, 1, 8192);
	cfg.combo_size_threshold = clamp_val(cfg.combo_size_threshold, 0, 65535);
	cfg.swipe_min_distance = clamp_val(cfg.swipe_min_distance, 0, 65535);
	cfg.swipe_min_vertical = clamp_val(cfg.swipe_min_vertical, 0, 65535);
	cfg.swipe_max_off_axis = clamp_val(cfg.swipe_max_off_axis, 0, 65535);
	cfg.swipe_cooldown_ms = clamp_val(cfg.swipe_cooldown_ms, 0, 10000);
	cfg.viewport_tap_timeout_ms = clamp_val(cfg.viewport_tap_timeout_ms, 0, 10000);
	cfg.grab = cfg.grab ? 1 : 0;
	cfg.haptic = cfg.haptic ? 1 : 0;
	cfg.log_keys = cfg.log_keys ? 1 : 0;
	cfg.haptic_i2c_bus = clamp_val(cfg.haptic_i2c_bus, 0, 255);
	// 7-bit addresses outside the reserved ranges
	cfg.haptic_i2c_addr = clamp_val(cfg.haptic_i2c_addr, 0x03, 0x77);
	// DRV2605 ROM library effect ids
	cfg.haptic_effect = clamp_val(cfg.haptic_effect, 1, 123);
}

} // namespace touchkbd
