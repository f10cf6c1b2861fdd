#include <atomic>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "config.h"
#include "coordinate_mapper.h"
#include "drv2605_haptic.h"
#include "evdev_touch_source.h"
#include "gesture_detector.h"
#include "hit_tester.h"
#include "touch_mapper.h"
#include "uinput_keyboard.h"

using namespace touchkbd;

static std::atomic<bool> g_running{true};

static void handle_signal(int) {
	g_running = false;
}

// SIGINT/SIGTERM stay blocked except inside the device wait, where they
// interrupt ppoll(). `wait_mask` receives the mask to wait with.
static void install_signal_handlers(sigset_t* wait_mask) {
	sigset_t stop;
	sigemptyset(&stop);
	sigaddset(&stop, SIGINT);
	sigaddset(&stop, SIGTERM);
	sigprocmask(SIG_BLOCK, &stop, wait_mask);
	sigdelset(wait_mask, SIGINT);
	sigdelset(wait_mask, SIGTERM);

	struct sigaction sa;
	std::memset(&sa, 0, sizeof(sa));
	sa.sa_handler = handle_signal;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;
	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
}

static void usage(const char* argv0) {
	std::cerr << "Usage: " << argv0 << " [--device /dev/input/eventN] [--config FILE] [--log_keys] [--no_haptic]" << std::endl;
}

static void log_region(const char* what, const Region& physical, const Region& touch) {
	const Rect& p = physical.rect;
	const Rect& t = touch.rect;
	std::cerr << "[INFO] " << what << " " << physical.name << " [" << format_key_binding(physical.keys) << "]: Physical ("
			  << p.x1 << "," << p.y1 << ")-(" << p.x2 << "," << p.y2 << ") -> Touch ("
			  << t.x1 << "," << t.y1 << ")-(" << t.x2 << "," << t.y2 << ")" << std::endl;
}

int main(int argc, char* argv[]) {
	std::string device_arg;
	std::string config_arg;
	bool log_keys_arg = false;
	bool no_haptic_arg = false;
	for (int i = 1; i < argc; ++i) {
		if (strcmp(argv[i], "--device") == 0 && i + 1 < argc) device_arg = argv[++i];
		else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) config_arg = argv[++i];
		else if (strcmp(argv[i], "--log_keys") == 0) log_keys_arg = true;
		else if (strcmp(argv[i], "--no_haptic") == 0) no_haptic_arg = true;
		else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
			usage(argv[0]);
			return 0;
		} else if (argv[i][0] != '-') {
			device_arg = argv[i];
		} else {
			usage(argv[0]);
			return 1;
		}
	}

	// Before any thread starts, so they all inherit the blocked mask.
	sigset_t wait_mask;
	install_signal_handlers(&wait_mask);

	Config cfg;
	std::string cfgPath = config_arg.empty() ? find_config_path() : config_arg;
	std::vector<std::string> errors;
	if (!cfgPath.empty() && !load_config(cfgPath, cfg, errors)) {
		std::cerr << "[ERROR] Cannot read config " << cfgPath << std::endl;
		return 1;
	}
	apply_env_overrides(cfg);
	if (!device_arg.empty()) cfg.touch_device = device_arg;
	if (log_keys_arg) cfg.log_keys = 1;
	if (no_haptic_arg) cfg.haptic = 0;
	sanitize_config(cfg);

	validate_layout(cfg.layout, errors);
	if (!errors.empty()) {
		for (const auto& e : errors) std::cerr << "[ERROR] Layout: " << e << std::endl;
		return 1;
	}

	EvdevTouchSource touch;
	if (!touch.open(cfg.touch_device, cfg.grab != 0, true)) return 1;
	std::cerr << "[INFO] Touch device: " << touch.name() << " (" << cfg.touch_device << ")" << std::endl;

	const int touch_max_x = cfg.touch_max_x > 0 ? cfg.touch_max_x : touch.max_x();
	const int touch_max_y = cfg.touch_max_y > 0 ? cfg.touch_max_y : touch.max_y();
	if (touch_max_x <= 0 || touch_max_y <= 0) {
		std::cerr << "[ERROR] Touch device reports no multitouch range; set touch_max_x/touch_max_y." << std::endl;
		return 1;
	}

	CoordinateMapper mapper(cfg.physical_w, cfg.physical_h, touch_max_x, touch_max_y);
	const Layout touch_layout = mapper.to_touch(cfg.layout);
	for (size_t i = 0; i < cfg.layout.regions.size(); ++i) {
		log_region("Region", cfg.layout.regions[i], touch_layout.regions[i]);
	}
	log_region("Viewport", cfg.layout.viewport, touch_layout.viewport);

	UinputKeyboard keyboard;
	if (!keyboard.create(cfg.keyboard_name, layout_key_codes(cfg.layout))) {
		std::cerr << "[ERROR] Failed to create virtual keyboard." << std::endl;
		return 1;
	}

	Drv2605Haptic haptic;
	if (cfg.haptic) {
		if (haptic.open(cfg.haptic_i2c_bus, cfg.haptic_i2c_addr, cfg.haptic_effect)) {
			std::cerr << "[INFO] Haptic controller initialized" << std::endl;
		} else {
			std::cerr << "[WARN] Haptic feedback unavailable; continuing without it." << std::endl;
		}
	}

	HitTester hits(touch_layout, cfg.combo_size_threshold);
	GestureDetector gestures(cfg.gesture_params());
	TouchMapper keys(hits, gestures, keyboard, haptic.is_open() ? &haptic : nullptr);
	keys.set_log_keys(cfg.log_keys != 0);

	std::cerr << "[INFO] touchkbd_uinputd started. cfg=" << (cfgPath.empty() ? "<none>" : cfgPath)
			  << " device=" << cfg.touch_device
			  << " touch_max=" << touch_max_x << "x" << touch_max_y
			  << " scale=" << mapper.x_scale() << "x" << mapper.y_scale()
			  << " combo_size_threshold=" << cfg.combo_size_threshold
			  << " haptic=" << (haptic.is_open() ? "on" : "off")
			  << std::endl;

	while (g_running) {
		TouchEvent ev;
		if (touch.next(ev)) {
			keys.process(ev);
			continue;
		}
		if (touch.failed()) break;
		if (!touch.wait(&wait_mask) && touch.failed()) break;
	}

	keys.release_all();
	haptic.close();
	keyboard.destroy();
	touch.close();
	std::cerr << "[INFO] touchkbd_uinputd exiting." << std::endl;
	return 0;
}
