#include "layout.h"

#include <algorithm>
#include <linux/input.h>

#include "coordinate_mapper.h"
#include "gtest/gtest.h"

namespace touchkbd {

namespace {

Rect make_rect(int x1, int y1, int x2, int y2) {
	Rect r;
	r.x1 = x1;
	r.y1 = y1;
	r.x2 = x2;
	r.y2 = y2;
	return r;
}

} // namespace

TEST(LayoutTest, DefaultLayoutIsValid) {
	std::vector<std::string> errors;
	EXPECT_TRUE(validate_layout(default_layout(), errors));
	EXPECT_TRUE(errors.empty());
}

TEST(LayoutTest, ArrowRegionsAreDirectional) {
	Layout l = default_layout();
	EXPECT_TRUE(l.regions[l.find("UP")].directional());
	EXPECT_TRUE(l.regions[l.find("RIGHT")].directional());
	EXPECT_FALSE(l.regions[l.find("A BTN")].directional());
	EXPECT_FALSE(l.regions[l.find("LOAD")].directional());
	EXPECT_EQ(-1, l.find("VIEWPORT"));
}

TEST(LayoutTest, RejectsDuplicateNamesAndBindings) {
	Layout l = default_layout();
	Region dup = l.regions[0];
	dup.keys = KeyBinding::single(KEY_Z);
	dup.rect = make_rect(0, 700, 10, 710);
	l.regions.push_back(dup);

	Region swapped;
	swapped.name = "LOAD2";
	swapped.keys = KeyBinding::pair(KEY_E, KEY_L);
	swapped.rect = make_rect(0, 720, 10, 730);
	l.regions.push_back(swapped);

	std::vector<std::string> errors;
	EXPECT_FALSE(validate_layout(l, errors));
	EXPECT_EQ(2u, errors.size());
}

TEST(LayoutTest, RejectsBrokenRegionsAndCombos) {
	Layout l = default_layout();
	l.regions[1].rect = make_rect(50, 50, 10, 10);
	l.regions[2].keys = KeyBinding::pair(KEY_B, KEY_B);
	ComboRule c;
	c.first = "A BTN";
	c.second = "NOWHERE";
	c.box = make_rect(0, 0, 5, 5);
	l.combos.push_back(c);

	std::vector<std::string> errors;
	EXPECT_FALSE(validate_layout(l, errors));
	EXPECT_EQ(3u, errors.size());

	Layout empty;
	errors.clear();
	EXPECT_FALSE(validate_layout(empty, errors));
}

TEST(LayoutTest, ParsesRegionAndComboLines) {
	Region r;
	std::string err;
	ASSERT_TRUE(parse_region_line("FIRE, SPACE, 10, 20, 30, 40", r, err));
	EXPECT_EQ("FIRE", r.name);
	EXPECT_EQ(KeyBinding::single(KEY_SPACE), r.keys);
	EXPECT_EQ(make_rect(10, 20, 30, 40), r.rect);

	EXPECT_FALSE(parse_region_line("FIRE,SPACE,10,20,30", r, err));
	EXPECT_FALSE(parse_region_line("FIRE,NOPE,10,20,30,40", r, err));
	EXPECT_FALSE(parse_region_line("FIRE,SPACE,10,20,30,4x", r, err));
	EXPECT_FALSE(parse_region_line(",SPACE,10,20,30,40", r, err));
	EXPECT_FALSE(err.empty());

	ComboRule c;
	ASSERT_TRUE(parse_combo_line("A BTN,B BTN,250,508,458,609", c, err));
	EXPECT_EQ("A BTN", c.first);
	EXPECT_EQ("B BTN", c.second);
	EXPECT_EQ(make_rect(250, 508, 458, 609), c.box);
}

TEST(LayoutTest, KeyCodesCoverLayoutAndSwipes) {
	std::vector<uint16_t> codes = layout_key_codes(default_layout());
	for (uint16_t code : {KEY_L, KEY_E, KEY_A, KEY_B, KEY_ENTER, KEY_LEFTCTRL, KEY_S,
						  KEY_UP, KEY_DOWN, KEY_LEFT, KEY_RIGHT}) {
		EXPECT_EQ(1, std::count(codes.begin(), codes.end(), code)) << code;
	}
	EXPECT_EQ(11u, codes.size());
}

TEST(CoordinateMapperTest, ScalesPortraitLayoutOntoLandscapePanel) {
	CoordinateMapper m(480, 800, 799, 479);
	EXPECT_DOUBLE_EQ(800.0 / 480.0, m.x_scale());
	EXPECT_DOUBLE_EQ(480.0 / 800.0, m.y_scale());

	Layout touch = m.to_touch(default_layout());
	EXPECT_EQ(make_rect(65, 232, 265, 262), touch.regions[touch.find("LOAD")].rect);
	EXPECT_EQ(make_rect(0, 0, 800, 232), touch.viewport.rect);
	EXPECT_EQ(make_rect(230, 303, 565, 364), touch.combos[1].box);
}

TEST(CoordinateMapperTest, IdentityWhenRangesMatch) {
	CoordinateMapper m(480, 800, 479, 799);
	Layout physical = default_layout();
	Layout touch = m.to_touch(physical);
	for (size_t i = 0; i < physical.regions.size(); ++i) {
		EXPECT_EQ(physical.regions[i].rect, touch.regions[i].rect) << physical.regions[i].name;
	}
	EXPECT_EQ(123, m.to_physical_x(m.to_touch_x(123)));
}

} // namespace touchkbd
