#include "key_codes.h"

#include <linux/input.h>

#include "gtest/gtest.h"

namespace touchkbd {

TEST(KeyCodesTest, NamesResolveWithOrWithoutPrefix) {
	uint16_t code = 0;
	EXPECT_TRUE(key_code_from_name("ENTER", code));
	EXPECT_EQ(KEY_ENTER, code);
	EXPECT_TRUE(key_code_from_name("key_leftctrl", code));
	EXPECT_EQ(KEY_LEFTCTRL, code);
	EXPECT_TRUE(key_code_from_name(" a ", code));
	EXPECT_EQ(KEY_A, code);
	EXPECT_FALSE(key_code_from_name("NOT_A_KEY", code));
	EXPECT_FALSE(key_code_from_name("", code));
}

TEST(KeyCodesTest, ParsesSingleAndPairBindings) {
	KeyBinding k;
	ASSERT_TRUE(parse_key_binding("B", k));
	EXPECT_EQ(KeyBinding::single(KEY_B), k);
	EXPECT_EQ(1, k.count());

	ASSERT_TRUE(parse_key_binding("L+E", k));
	EXPECT_EQ(KeyBinding::pair(KEY_L, KEY_E), k);
	EXPECT_EQ(2, k.count());
	EXPECT_EQ("L+E", format_key_binding(k));

	EXPECT_FALSE(parse_key_binding("L+", k));
	EXPECT_FALSE(parse_key_binding("+E", k));
	EXPECT_FALSE(parse_key_binding("WHAT", k));
}

TEST(KeyCodesTest, SameKeysIgnoresOrder) {
	EXPECT_TRUE(KeyBinding::pair(KEY_L, KEY_E).same_keys(KeyBinding::pair(KEY_E, KEY_L)));
	EXPECT_NE(KeyBinding::pair(KEY_L, KEY_E), KeyBinding::pair(KEY_E, KEY_L));
	EXPECT_FALSE(KeyBinding::single(KEY_E).same_keys(KeyBinding::pair(KEY_E, KEY_L)));
	EXPECT_FALSE(KeyBinding::single(KEY_A).same_keys(KeyBinding::single(KEY_B)));
}

TEST(KeyCodesTest, ArrowKeys) {
	EXPECT_TRUE(is_arrow_key(KEY_UP));
	EXPECT_TRUE(is_arrow_key(KEY_LEFT));
	EXPECT_FALSE(is_arrow_key(KEY_ENTER));
}

} // namespace touchkbd
