#include "key_codes.h"

#include <cctype>
#include <cstring>
#include <linux/input.h>

namespace touchkbd {

namespace {

struct KeyName {
	const char* name;
	uint16_t code;
};

const KeyName kKeyNames[] = {
	{"ESC", KEY_ESC},
	{"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4}, {"5", KEY_5},
	{"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9}, {"0", KEY_0},
	{"MINUS", KEY_MINUS}, {"EQUAL", KEY_EQUAL}, {"BACKSPACE", KEY_BACKSPACE},
	{"TAB", KEY_TAB},
	{"Q", KEY_Q}, {"W", KEY_W}, {"E", KEY_E}, {"R", KEY_R}, {"T", KEY_T},
	{"Y", KEY_Y}, {"U", KEY_U}, {"I", KEY_I}, {"O", KEY_O}, {"P", KEY_P},
	{"LEFTBRACE", KEY_LEFTBRACE}, {"RIGHTBRACE", KEY_RIGHTBRACE},
	{"ENTER", KEY_ENTER}, {"LEFTCTRL", KEY_LEFTCTRL},
	{"A", KEY_A}, {"S", KEY_S}, {"D", KEY_D}, {"F", KEY_F}, {"G", KEY_G},
	{"H", KEY_H}, {"J", KEY_J}, {"K", KEY_K}, {"L", KEY_L},
	{"SEMICOLON", KEY_SEMICOLON}, {"APOSTROPHE", KEY_APOSTROPHE},
	{"GRAVE", KEY_GRAVE}, {"LEFTSHIFT", KEY_LEFTSHIFT}, {"BACKSLASH", KEY_BACKSLASH},
	{"Z", KEY_Z}, {"X", KEY_X}, {"C", KEY_C}, {"V", KEY_V}, {"B", KEY_B},
	{"N", KEY_N}, {"M", KEY_M},
	{"COMMA", KEY_COMMA}, {"DOT", KEY_DOT}, {"SLASH", KEY_SLASH},
	{"RIGHTSHIFT", KEY_RIGHTSHIFT}, {"LEFTALT", KEY_LEFTALT}, {"SPACE", KEY_SPACE},
	{"F1", KEY_F1}, {"F2", KEY_F2}, {"F3", KEY_F3}, {"F4", KEY_F4},
	{"F5", KEY_F5}, {"F6", KEY_F6}, {"F7", KEY_F7}, {"F8", KEY_F8},
	{"F9", KEY_F9}, {"F10", KEY_F10}, {"F11", KEY_F11}, {"F12", KEY_F12},
	{"RIGHTCTRL", KEY_RIGHTCTRL}, {"RIGHTALT", KEY_RIGHTALT},
	{"HOME", KEY_HOME}, {"UP", KEY_UP}, {"PAGEUP", KEY_PAGEUP},
	{"LEFT", KEY_LEFT}, {"RIGHT", KEY_RIGHT}, {"END", KEY_END},
	{"DOWN", KEY_DOWN}, {"PAGEDOWN", KEY_PAGEDOWN},
	{"INSERT", KEY_INSERT}, {"DELETE", KEY_DELETE},
	{"VOLUMEDOWN", KEY_VOLUMEDOWN}, {"VOLUMEUP", KEY_VOLUMEUP},
	{"POWER", KEY_POWER}, {"PAUSE", KEY_PAUSE}, {"MENU", KEY_MENU},
	{"BACK", KEY_BACK},
};

std::string trimmed_upper(const std::string& s) {
	size_t b = s.find_first_not_of(" \t");
	if (b == std::string::npos) return std::string();
	size_t e = s.find_last_not_of(" \t");
	std::string out = s.substr(b, e - b + 1);
	for (auto& c : out) c = (char)std::toupper((unsigned char)c);
	if (out.compare(0, 4, "KEY_") == 0) out.erase(0, 4);
	return out;
}

} // namespace

KeyBinding KeyBinding::single(uint16_t code) {
	KeyBinding k;
	k.kind = Single;
	k.codes[0] = code;
	return k;
}

KeyBinding KeyBinding::pair(uint16_t first, uint16_t second) {
	KeyBinding k;
	k.kind = Pair;
	k.codes[0] = first;
	k.codes[1] = second;
	return k;
}

bool KeyBinding::contains(uint16_t code) const {
	for (int i = 0; i < count(); ++i) {
		if (codes[i] == code) return true;
	}
	return false;
}

// Order-insensitive: L+E and E+L are the same button.
bool KeyBinding::same_keys(const KeyBinding& other) const {
	if (count() != other.count()) return false;
	for (int i = 0; i < count(); ++i) {
		if (!other.contains(codes[i])) return false;
	}
	return true;
}

bool operator==(const KeyBinding& a, const KeyBinding& b) {
	if (a.kind != b.kind || a.codes[0] != b.codes[0]) return false;
	return a.kind == KeyBinding::Single || a.codes[1] == b.codes[1];
}

bool operator!=(const KeyBinding& a, const KeyBinding& b) {
	return !(a == b);
}

bool key_code_from_name(const std::string& name, uint16_t& out) {
	std::string n = trimmed_upper(name);
	if (n.empty()) return false;
	for (const auto& k : kKeyNames) {
		if (n == k.name) {
			out = k.code;
			return true;
		}
	}
	return false;
}

std::string key_code_name(uint16_t code) {
	for (const auto& k : kKeyNames) {
		if (k.code == code) return k.name;
	}
	return std::to_string(code);
}

bool parse_key_binding(const std::string& text, KeyBinding& out) {
	auto plus = text.find('+');
	uint16_t first = 0;
	if (plus == std::string::npos) {
		if (!key_code_from_name(text, first)) return false;
		out = KeyBinding::single(first);
		return true;
	}
	uint16_t second = 0;
	if (!key_code_from_name(text.substr(0, plus), first)) return false;
	if (!key_code_from_name(text.substr(plus + 1), second)) return false;
	out = KeyBinding::pair(first, second);
	return true;
}

std::string format_key_binding(const KeyBinding& keys) {
	std::string s = key_code_name(keys.codes[0]);
	if (keys.kind == KeyBinding::Pair) s += "+" + key_code_name(keys.codes[1]);
	return s;
}

bool is_arrow_key(uint16_t code) {
	return code == KEY_UP || code == KEY_DOWN || code == KEY_LEFT || code == KEY_RIGHT;
}

} // namespace touchkbd
