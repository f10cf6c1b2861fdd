#ifndef TOUCHKBD_LAYOUT_H
#define TOUCHKBD_LAYOUT_H

#include <string>
#include <vector>

#include "key_codes.h"

namespace touchkbd {

// Inclusive on all four edges.
struct Rect {
	int x1 = 0;
	int y1 = 0;
	int x2 = 0;
	int y2 = 0;

	bool contains(int x, int y) const {
		return x1 <= x && x <= x2 && y1 <= y && y <= y2;
	}
	bool valid() const { return x1 <= x2 && y1 <= y2; }
};

bool operator==(const Rect& a, const Rect& b);

struct Region {
	std::string name;
	KeyBinding keys;
	Rect rect;

	// Arrow buttons are released the moment the contact leaves them.
	bool directional() const {
		return keys.kind == KeyBinding::Single && is_arrow_key(keys.codes[0]);
	}
};

// A large contact anywhere inside `box` activates both regions.
struct ComboRule {
	std::string first;
	std::string second;
	Rect box;
};

struct Layout {
	std::vector<Region> regions;
	Region viewport;
	std::vector<ComboRule> combos;

	// -1 when absent.
	int find(const std::string& name) const;
};

// Handheld shell layout, portrait 480x800 physical pixels.
Layout default_layout();

const int kDefaultPhysicalWidth = 480;
const int kDefaultPhysicalHeight = 800;

// Collects one message per problem; true when the layout is usable.
bool validate_layout(const Layout& layout, std::vector<std::string>& errors);

// Config line payloads:
//   region   NAME,KEY[+KEY],x1,y1,x2,y2
//   viewport NAME,KEY,x1,y1,x2,y2
//   combo    NAME_A,NAME_B,x1,y1,x2,y2
bool parse_region_line(const std::string& text, Region& out, std::string& error);
bool parse_combo_line(const std::string& text, ComboRule& out, std::string& error);

// Every key code the layout (and the swipe arrows) can emit, deduplicated.
std::vector<uint16_t> layout_key_codes(const Layout& layout);

} // namespace touchkbd

#endif
