#include "layout.h"

#include <algorithm>
#include <cstdlib>
#include <linux/input.h>
#include <sstream>

namespace touchkbd {

namespace {

std::vector<std::string> split_fields(const std::string& text) {
	std::vector<std::string> out;
	std::stringstream ss(text);
	std::string field;
	while (std::getline(ss, field, ',')) {
		size_t b = field.find_first_not_of(" \t");
		size_t e = field.find_last_not_of(" \t");
		out.push_back(b == std::string::npos ? std::string() : field.substr(b, e - b + 1));
	}
	return out;
}

bool parse_coord(const std::string& s, int& out) {
	char* end = nullptr;
	long v = std::strtol(s.c_str(), &end, 10);
	if (s.empty() || *end != '\0') return false;
	out = (int)v;
	return true;
}

bool parse_rect(const std::vector<std::string>& f, size_t first, Rect& r) {
	return parse_coord(f[first], r.x1) && parse_coord(f[first + 1], r.y1) &&
		   parse_coord(f[first + 2], r.x2) && parse_coord(f[first + 3], r.y2);
}

Region make_region(const char* name, KeyBinding keys, int x1, int y1, int x2, int y2) {
	Region r;
	r.name = name;
	r.keys = keys;
	r.rect.x1 = x1;
	r.rect.y1 = y1;
	r.rect.x2 = x2;
	r.rect.y2 = y2;
	return r;
}

ComboRule make_combo(const char* first, const char* second, int x1, int y1, int x2, int y2) {
	ComboRule c;
	c.first = first;
	c.second = second;
	c.box.x1 = x1;
	c.box.y1 = y1;
	c.box.x2 = x2;
	c.box.y2 = y2;
	return c;
}

std::string rect_text(const Rect& r) {
	std::ostringstream os;
	os << "(" << r.x1 << "," << r.y1 << ")-(" << r.x2 << "," << r.y2 << ")";
	return os.str();
}

} // namespace

bool operator==(const Rect& a, const Rect& b) {
	return a.x1 == b.x1 && a.y1 == b.y1 && a.x2 == b.x2 && a.y2 == b.y2;
}

int Layout::find(const std::string& name) const {
	for (size_t i = 0; i < regions.size(); ++i) {
		if (regions[i].name == name) return (int)i;
	}
	return -1;
}

Layout default_layout() {
	typedef KeyBinding K;
	Layout l;
	l.regions.push_back(make_region("LOAD", K::pair(KEY_L, KEY_E), 39, 388, 159, 437));
	l.regions.push_back(make_region("A BTN", K::single(KEY_A), 355, 508, 458, 609));
	l.regions.push_back(make_region("B BTN", K::single(KEY_B), 250, 509, 351, 608));
	l.regions.push_back(make_region("START", K::single(KEY_ENTER), 240, 685, 337, 728));
	l.regions.push_back(make_region("SELECT", K::single(KEY_LEFTCTRL), 156, 686, 240, 731));
	l.regions.push_back(make_region("RIGHT", K::single(KEY_RIGHT), 117, 534, 218, 594));
	l.regions.push_back(make_region("UP", K::single(KEY_UP), 79, 464, 162, 522));
	l.regions.push_back(make_region("LEFT", K::single(KEY_LEFT), 22, 523, 96, 594));
	l.regions.push_back(make_region("DOWN", K::single(KEY_DOWN), 87, 594, 159, 658));
	l.regions.push_back(make_region("SAVE", K::pair(KEY_S, KEY_E), 168, 388, 309, 437));
	l.regions.push_back(make_region("EXIT", K::pair(KEY_ENTER, KEY_E), 319, 388, 456, 438));

	l.viewport = make_region("VIEWPORT", K::single(KEY_ENTER), 0, 0, 480, 388);

	// Face buttons share an edge; the box spans both plus the gap between them.
	l.combos.push_back(make_combo("A BTN", "B BTN", 250, 508, 458, 609));
	l.combos.push_back(make_combo("RIGHT", "B BTN", 138, 505, 339, 607));
	return l;
}

bool validate_layout(const Layout& layout, std::vector<std::string>& errors) {
	const size_t before = errors.size();
	if (layout.regions.empty()) errors.push_back("layout has no regions");

	for (size_t i = 0; i < layout.regions.size(); ++i) {
		const Region& r = layout.regions[i];
		if (r.name.empty()) errors.push_back("region #" + std::to_string(i) + " has no name");
		if (!r.rect.valid()) errors.push_back("region " + r.name + " has inverted rectangle " + rect_text(r.rect));
		if (r.keys.kind == KeyBinding::Pair && r.keys.codes[0] == r.keys.codes[1]) {
			errors.push_back("region " + r.name + " binds " + key_code_name(r.keys.codes[0]) + " twice");
		}
		for (size_t j = 0; j < i; ++j) {
			const Region& o = layout.regions[j];
			if (o.name == r.name) errors.push_back("duplicate region name " + r.name);
			else if (o.keys.same_keys(r.keys)) {
				errors.push_back("regions " + o.name + " and " + r.name + " share binding " + format_key_binding(r.keys));
			}
		}
	}

	if (!layout.viewport.rect.valid()) {
		errors.push_back("viewport has inverted rectangle " + rect_text(layout.viewport.rect));
	}

	for (const auto& c : layout.combos) {
		if (layout.find(c.first) < 0) errors.push_back("combo references unknown region " + c.first);
		if (layout.find(c.second) < 0) errors.push_back("combo references unknown region " + c.second);
		if (c.first == c.second) errors.push_back("combo pairs " + c.first + " with itself");
		if (!c.box.valid()) errors.push_back("combo " + c.first + "+" + c.second + " has inverted box " + rect_text(c.box));
	}
	return errors.size() == before;
}

bool parse_region_line(const std::string& text, Region& out, std::string& error) {
	std::vector<std::string> f = split_fields(text);
	if (f.size() != 6) {
		error = "expected NAME,KEY,x1,y1,x2,y2: " + text;
		return false;
	}
	if (f[0].empty()) {
		error = "empty region name: " + text;
		return false;
	}
	Region r;
	r.name = f[0];
	if (!parse_key_binding(f[1], r.keys)) {
		error = "unknown key '" + f[1] + "' in " + text;
		return false;
	}
	if (!parse_rect(f, 2, r.rect)) {
		error = "bad coordinates in " + text;
		return false;
	}
	out = r;
	return true;
}

bool parse_combo_line(const std::string& text, ComboRule& out, std::string& error) {
	std::vector<std::string> f = split_fields(text);
	if (f.size() != 6) {
		error = "expected NAME_A,NAME_B,x1,y1,x2,y2: " + text;
		return false;
	}
	ComboRule c;
	c.first = f[0];
	c.second = f[1];
	if (!parse_rect(f, 2, c.box)) {
		error = "bad coordinates in " + text;
		return false;
	}
	out = c;
	return true;
}

std::vector<uint16_t> layout_key_codes(const Layout& layout) {
	std::vector<uint16_t> codes = {KEY_UP, KEY_DOWN, KEY_LEFT, KEY_RIGHT};
	auto add = [&codes](const KeyBinding& k) {
		for (int i = 0; i < k.count(); ++i) codes.push_back(k.codes[i]);
	};
	for (const auto& r : layout.regions) add(r.keys);
	add(layout.viewport.keys);
	std::sort(codes.begin(), codes.end());
	codes.erase(std::unique(codes.begin(), codes.end()), codes.end());
	return codes;
}

} // namespace touchkbd
