#include <SDL.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <vector>

#include "config.h"
#include "coordinate_mapper.h"
#include "evdev_touch_source.h"
#include "gesture_detector.h"
#include "gesture_recorder.h"
#include "hit_tester.h"
#include "touch_mapper.h"

using namespace touchkbd;

static SDL_Rect to_sdl(const Rect& r) {
	SDL_Rect out{r.x1, r.y1, r.x2 - r.x1, r.y2 - r.y1};
	return out;
}

static void draw_button(SDL_Renderer* r, SDL_Rect rect, bool active, SDL_Color base, SDL_Color border) {
	SDL_SetRenderDrawColor(r, active ? 48 : base.r, active ? 173 : base.g, active ? 86 : base.b, 255);
	SDL_RenderFillRect(r, &rect);
	SDL_SetRenderDrawColor(r, border.r, border.g, border.b, 255);
	SDL_RenderDrawRect(r, &rect);
}

static void draw_pointer(SDL_Renderer* r, int x, int y, SDL_Color col, SDL_Color border) {
	SDL_Rect dot{x - 6, y - 6, 12, 12};
	SDL_SetRenderDrawColor(r, col.r, col.g, col.b, 255);
	SDL_RenderFillRect(r, &dot);
	SDL_SetRenderDrawColor(r, border.r, border.g, border.b, 255);
	SDL_RenderDrawRect(r, &dot);
}

// Arrow-ish marker in the middle of the viewport for the last swipe or tap.
static void draw_gesture(SDL_Renderer* r, const Rect& vp, uint16_t code, bool tap, SDL_Color col) {
	const int cx = (vp.x1 + vp.x2) / 2;
	const int cy = (vp.y1 + vp.y2) / 2;
	const int len = 60;
	SDL_SetRenderDrawColor(r, col.r, col.g, col.b, 255);
	if (tap) {
		SDL_Rect dot{cx - 20, cy - 20, 40, 40};
		SDL_RenderFillRect(r, &dot);
		return;
	}
	int dx = 0, dy = 0;
	if (code == GestureDetector::swipe_key(Swipe::Left)) dx = -1;
	else if (code == GestureDetector::swipe_key(Swipe::Right)) dx = 1;
	else if (code == GestureDetector::swipe_key(Swipe::Up)) dy = -1;
	else if (code == GestureDetector::swipe_key(Swipe::Down)) dy = 1;
	const int tx = cx + dx * len;
	const int ty = cy + dy * len;
	SDL_RenderDrawLine(r, cx - dx * len, cy - dy * len, tx, ty);
	SDL_RenderDrawLine(r, tx, ty, tx - dx * 15 - dy * 15, ty - dy * 15 - dx * 15);
	SDL_RenderDrawLine(r, tx, ty, tx - dx * 15 + dy * 15, ty - dy * 15 + dx * 15);
}

int main(int argc, char** argv) {
	Config cfg;
	std::string cfgPath = find_config_path();
	std::vector<std::string> errors;
	if (!cfgPath.empty()) load_config(cfgPath, cfg, errors);
	apply_env_overrides(cfg);
	if (argc > 1) cfg.touch_device = argv[1];
	sanitize_config(cfg);
	validate_layout(cfg.layout, errors);
	if (!errors.empty()) {
		for (const auto& e : errors) std::fprintf(stderr, "[ERROR] Layout: %s\n", e.c_str());
		return 1;
	}

	// Never grab: the daemon may be reading the same device.
	EvdevTouchSource touch;
	if (!touch.open(cfg.touch_device, false, true)) return 1;
	const int touch_max_x = cfg.touch_max_x > 0 ? cfg.touch_max_x : touch.max_x();
	const int touch_max_y = cfg.touch_max_y > 0 ? cfg.touch_max_y : touch.max_y();
	if (touch_max_x <= 0 || touch_max_y <= 0) {
		std::fprintf(stderr, "[ERROR] Touch device reports no multitouch range; set touch_max_x/touch_max_y.\n");
		return 1;
	}

	CoordinateMapper mapper(cfg.physical_w, cfg.physical_h, touch_max_x, touch_max_y);
	HitTester hits(mapper.to_touch(cfg.layout), cfg.combo_size_threshold);
	GestureDetector gestures(cfg.gesture_params());
	// Records instead of injecting, so the viewer can run next to the daemon.
	GestureRecorder sink;
	TouchMapper keys(hits, gestures, sink, nullptr);
	int gestures_seen = 0;
	Uint32 gesture_ticks = 0;

	const int width = cfg.physical_w;
	const int height = cfg.physical_h;
	SDL_Window* win = nullptr;
	SDL_Renderer* ren = nullptr;

	const char* disp = getenv("DISPLAY");
	if (disp && *disp) setenv("SDL_VIDEO_X11_XSHM", "0", 0);

	if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
		std::fprintf(stderr, "[ERROR] SDL_Init failed: %s\n", SDL_GetError());
		return 1;
	}
	win = SDL_CreateWindow("touchkbd layout", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, width, height, 0);
	if (!win) {
		std::fprintf(stderr, "[ERROR] Failed to create window: %s\n", SDL_GetError());
		std::fprintf(stderr, "Hints: Set SDL_VIDEODRIVER=kmsdrm or fbcon when running on console.\n");
		SDL_Quit();
		return 1;
	}
	ren = SDL_CreateRenderer(win, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
	if (!ren) {
		ren = SDL_CreateRenderer(win, -1, SDL_RENDERER_SOFTWARE);
	}
	if (!ren) {
		std::fprintf(stderr, "[ERROR] Failed to create renderer: %s\n", SDL_GetError());
		SDL_DestroyWindow(win);
		SDL_Quit();
		return 1;
	}

	SDL_Color BLACK{0, 0, 0, 255};
	SDL_Color GRAY{180, 180, 180, 255};
	SDL_Color BLUE{66, 135, 245, 255};
	SDL_Color RED{220, 68, 68, 255};
	SDL_Color ORANGE{245, 161, 66, 255};

	std::fprintf(stderr, "[INFO] Layout viewer on %s (%s), touch %dx%d, press q to quit\n",
				 cfg.touch_device.c_str(), touch.name().c_str(), touch_max_x, touch_max_y);

	bool running = true;
	while (running) {
		SDL_Event e;
		while (SDL_PollEvent(&e)) {
			if (e.type == SDL_QUIT) running = false;
			if (e.type == SDL_KEYDOWN) {
				SDL_Keycode k = e.key.keysym.sym;
				if (k == SDLK_ESCAPE || k == SDLK_q) running = false;
			}
		}

		TouchEvent ev;
		while (touch.next(ev)) keys.process(ev);
		if (touch.failed()) running = false;
		if (sink.count() != gestures_seen) {
			gestures_seen = sink.count();
			gesture_ticks = SDL_GetTicks();
		}

		std::set<size_t> active;
		for (const auto& entry : keys.slots()) {
			active.insert(entry.second.active_buttons.begin(), entry.second.active_buttons.end());
		}

		SDL_SetRenderDrawColor(ren, 250, 250, 250, 255);
		SDL_RenderClear(ren);

		const Rect& vp = cfg.layout.viewport.rect;
		SDL_Rect vpRect = to_sdl(vp);
		SDL_SetRenderDrawColor(ren, 230, 230, 230, 255);
		SDL_RenderFillRect(ren, &vpRect);
		SDL_SetRenderDrawColor(ren, GRAY.r, GRAY.g, GRAY.b, 255);
		SDL_RenderDrawRect(ren, &vpRect);

		for (const auto& c : cfg.layout.combos) {
			SDL_Rect box = to_sdl(c.box);
			SDL_SetRenderDrawColor(ren, ORANGE.r, ORANGE.g, ORANGE.b, 255);
			SDL_RenderDrawRect(ren, &box);
		}
		for (size_t i = 0; i < cfg.layout.regions.size(); ++i) {
			const Region& r = cfg.layout.regions[i];
			draw_button(ren, to_sdl(r.rect), active.count(i) > 0, r.directional() ? GRAY : BLUE, BLACK);
		}

		// Swipes and taps are instantaneous; keep them on screen briefly.
		if (gesture_ticks != 0 && SDL_GetTicks() - gesture_ticks < 300) {
			const KeyBinding& g = sink.last();
			const bool tap = !(g.count() == 1 && is_arrow_key(g.codes[0]));
			draw_gesture(ren, vp, g.codes[0], tap, RED);
		}

		for (const auto& entry : keys.slots()) {
			const Slot& s = entry.second;
			if (!s.active() || !s.have_position()) continue;
			draw_pointer(ren, mapper.to_physical_x(s.x), mapper.to_physical_y(s.y), RED, BLACK);
		}

		SDL_RenderPresent(ren);
		SDL_Delay(16);
	}

	touch.close();
	SDL_DestroyRenderer(ren);
	SDL_DestroyWindow(win);
	SDL_Quit();
	return 0;
}
