#ifndef TOUCHKBD_KEY_CODES_H
#define TOUCHKBD_KEY_CODES_H

#include <cstdint>
#include <string>

namespace touchkbd {

// One logical button's key codes: a single key, or two keys that go down
// and up together.
struct KeyBinding {
	enum Kind { Single, Pair };

	Kind kind = Single;
	uint16_t codes[2] = {0, 0};

	static KeyBinding single(uint16_t code);
	static KeyBinding pair(uint16_t first, uint16_t second);

	int count() const { return kind == Pair ? 2 : 1; }
	bool contains(uint16_t code) const;
	bool same_keys(const KeyBinding& other) const;
};

bool operator==(const KeyBinding& a, const KeyBinding& b);
bool operator!=(const KeyBinding& a, const KeyBinding& b);

// Names are the linux KEY_* identifiers without the prefix ("A", "ENTER").
bool key_code_from_name(const std::string& name, uint16_t& out);
std::string key_code_name(uint16_t code);

// "L+E" / "ENTER"
bool parse_key_binding(const std::string& text, KeyBinding& out);
std::string format_key_binding(const KeyBinding& keys);

bool is_arrow_key(uint16_t code);

} // namespace touchkbd

#endif
