#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <linux/input.h>
#include <unistd.h>

#include "gtest/gtest.h"

namespace touchkbd {

namespace {

class ConfigTest : public ::testing::Test {
protected:
	void SetUp() override {
		char tmpl[] = "/tmp/touchkbd_config_XXXXXX";
		int fd = mkstemp(tmpl);
		ASSERT_GE(fd, 0);
		close(fd);
		path_ = tmpl;
	}

	void TearDown() override {
		std::remove(path_.c_str());
		unsetenv("TOUCHKBD_CONFIG_PATH");
		unsetenv("TOUCHKBD_TOUCH_DEVICE");
		unsetenv("TOUCHKBD_SWIPE_COOLDOWN_MS");
		unsetenv("TOUCHKBD_HAPTIC_I2C_ADDR");
	}

	void write(const std::string& text) {
		std::ofstream out(path_);
		out << text;
	}

	std::string path_;
};

} // namespace

TEST_F(ConfigTest, DefaultsMatchBuiltInLayout) {
	Config cfg;
	EXPECT_EQ(40, cfg.combo_size_threshold);
	EXPECT_EQ(480, cfg.physical_w);
	EXPECT_EQ(800, cfg.physical_h);
	EXPECT_EQ(11u, cfg.layout.regions.size());
	EXPECT_EQ(2u, cfg.layout.combos.size());

	GestureParams p = cfg.gesture_params();
	EXPECT_EQ(60, p.min_distance);
	EXPECT_EQ(50, p.min_vertical);
	EXPECT_EQ(70, p.max_off_axis);
	EXPECT_EQ(std::chrono::milliseconds(300), p.cooldown);
	EXPECT_EQ(std::chrono::milliseconds(150), p.tap_timeout);
}

TEST_F(ConfigTest, LoadsScalarsAndIgnoresNoise) {
	write("# handheld\n"
		  "touch_device = /dev/input/event3\n"
		  "touch_max_x=1279\n"
		  "swipe_cooldown_ms=450\n"
		  "haptic_i2c_addr=0x5b\n"
		  "log_keys=1\n"
		  "combo_size_threshold=abc\n"
		  "no_such_key=5\n"
		  "not a key value line\n");
	Config cfg;
	std::vector<std::string> errors;
	ASSERT_TRUE(load_config(path_, cfg, errors));
	EXPECT_TRUE(errors.empty());
	EXPECT_EQ("/dev/input/event3", cfg.touch_device);
	EXPECT_EQ(1279, cfg.touch_max_x);
	EXPECT_EQ(450, cfg.swipe_cooldown_ms);
	EXPECT_EQ(0x5b, cfg.haptic_i2c_addr);
	EXPECT_EQ(1, cfg.log_keys);
	EXPECT_EQ(40, cfg.combo_size_threshold);
	EXPECT_EQ(11u, cfg.layout.regions.size());
}

TEST_F(ConfigTest, LayoutLinesReplaceBuiltInCatalog) {
	write("region=FIRE,SPACE,0,400,100,500\n"
		  "region=JUMP,Z+X,100,400,200,500\n"
		  "viewport=SCREEN,ESC,0,0,480,399\n"
		  "combo=FIRE,JUMP,80,400,120,500\n");
	Config cfg;
	std::vector<std::string> errors;
	ASSERT_TRUE(load_config(path_, cfg, errors));
	EXPECT_TRUE(errors.empty());
	ASSERT_EQ(2u, cfg.layout.regions.size());
	EXPECT_EQ("FIRE", cfg.layout.regions[0].name);
	EXPECT_EQ(KeyBinding::pair(KEY_Z, KEY_X), cfg.layout.regions[1].keys);
	EXPECT_EQ("SCREEN", cfg.layout.viewport.name);
	EXPECT_EQ(399, cfg.layout.viewport.rect.y2);
	ASSERT_EQ(1u, cfg.layout.combos.size());
	EXPECT_EQ("JUMP", cfg.layout.combos[0].second);
	EXPECT_TRUE(validate_layout(cfg.layout, errors));
}

TEST_F(ConfigTest, MalformedLayoutLinesAreReported) {
	write("region=FIRE,NOTAKEY,0,0,10,10\n"
		  "combo=A BTN,B BTN\n");
	Config cfg;
	std::vector<std::string> errors;
	ASSERT_TRUE(load_config(path_, cfg, errors));
	ASSERT_EQ(2u, errors.size());
	EXPECT_NE(std::string::npos, errors[0].find(":1:"));
	EXPECT_NE(std::string::npos, errors[1].find(":2:"));
	// Nothing valid was read, so the built-in catalog stays.
	EXPECT_EQ(11u, cfg.layout.regions.size());
}

TEST_F(ConfigTest, MissingFileFails) {
	Config cfg;
	std::vector<std::string> errors;
	EXPECT_FALSE(load_config("/nonexistent/touch_keyboard.txt", cfg, errors));
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
	write("touch_device=/dev/input/event3\nswipe_cooldown_ms=450\n");
	setenv("TOUCHKBD_TOUCH_DEVICE", "/dev/input/event9", 1);
	setenv("TOUCHKBD_SWIPE_COOLDOWN_MS", "500", 1);
	setenv("TOUCHKBD_HAPTIC_I2C_ADDR", "0x59", 1);
	Config cfg;
	std::vector<std::string> errors;
	ASSERT_TRUE(load_config(path_, cfg, errors));
	apply_env_overrides(cfg);
	EXPECT_EQ("/dev/input/event9", cfg.touch_device);
	EXPECT_EQ(500, cfg.swipe_cooldown_ms);
	EXPECT_EQ(0x59, cfg.haptic_i2c_addr);
}

TEST_F(ConfigTest, SanitizeClampsOutOfRangeValues) {
	Config cfg;
	cfg.physical_w = 0;
	cfg.swipe_cooldown_ms = -5;
	cfg.haptic_i2c_addr = 0x200;
	cfg.haptic_effect = 0;
	cfg.grab = 7;
	sanitize_config(cfg);
	EXPECT_EQ(1, cfg.physical_w);
	EXPECT_EQ(0, cfg.swipe_cooldown_ms);
	EXPECT_EQ(0x77, cfg.haptic_i2c_addr);
	EXPECT_EQ(1, cfg.haptic_effect);
	EXPECT_EQ(1, cfg.grab);
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
	write("grab=1\n");
	setenv("TOUCHKBD_CONFIG_PATH", path_.c_str(), 1);
	EXPECT_EQ(path_, find_config_path());
}

} // namespace touchkbd
