#include "hit_tester.h"

#include <algorithm>
#include <initializer_list>

#include "coordinate_mapper.h"
#include "gtest/gtest.h"

namespace touchkbd {

namespace {

const int kComboThreshold = 40;

// Touch space equal to physical pixels keeps the coordinates readable.
Layout identity_layout() {
	return CoordinateMapper(480, 800, 479, 799).to_touch(default_layout());
}

class HitTesterTest : public ::testing::Test {
protected:
	HitTesterTest() : hits_(identity_layout(), kComboThreshold) {}

	std::vector<size_t> indices(std::initializer_list<const char*> names) const {
		std::vector<size_t> out;
		for (const char* n : names) out.push_back((size_t)hits_.layout().find(n));
		std::sort(out.begin(), out.end());
		return out;
	}

	HitTester hits_;
};

} // namespace

TEST_F(HitTesterTest, RegionCentreSelectsOnlyThatRegion) {
	const Layout& l = hits_.layout();
	for (size_t i = 0; i < l.regions.size(); ++i) {
		const Rect& r = l.regions[i].rect;
		std::vector<size_t> hit = hits_.hit_test((r.x1 + r.x2) / 2, (r.y1 + r.y2) / 2, 0);
		ASSERT_EQ(1u, hit.size()) << l.regions[i].name;
		EXPECT_EQ(i, hit[0]) << l.regions[i].name;
	}
}

TEST_F(HitTesterTest, HeaderBandSmallContact) {
	EXPECT_EQ(indices({"LOAD"}), hits_.hit_test(60, 400, 0));
	EXPECT_EQ(indices({"SAVE"}), hits_.hit_test(200, 400, 0));
}

TEST_F(HitTesterTest, LargeContactInRightBBoxPressesBoth) {
	// Geometrically only inside RIGHT.
	EXPECT_EQ(indices({"RIGHT"}), hits_.hit_test(200, 560, 0));
	EXPECT_EQ(indices({"RIGHT"}), hits_.hit_test(200, 560, kComboThreshold - 1));
	EXPECT_EQ(indices({"RIGHT", "B BTN"}), hits_.hit_test(200, 560, 50));
	EXPECT_EQ(indices({"RIGHT", "B BTN"}), hits_.hit_test(200, 560, kComboThreshold));
}

TEST_F(HitTesterTest, LargeContactBetweenFaceButtons) {
	// x=353 falls in the gap between B (..351) and A (355..).
	EXPECT_TRUE(hits_.hit_test(353, 560, 0).empty());
	EXPECT_EQ(indices({"A BTN", "B BTN"}), hits_.hit_test(353, 560, 60));
	EXPECT_EQ(indices({"A BTN", "B BTN"}), hits_.hit_test(420, 560, 60));
}

TEST_F(HitTesterTest, OverlappingCombosAreDeduplicated) {
	// Inside B and inside both combo boxes.
	EXPECT_EQ(indices({"A BTN", "B BTN", "RIGHT"}), hits_.hit_test(300, 560, 60));
}

TEST_F(HitTesterTest, ViewportIsSeparateFromButtons) {
	EXPECT_TRUE(hits_.hit_test(100, 100, 80).empty());
	EXPECT_TRUE(hits_.in_viewport(100, 100));
	EXPECT_TRUE(hits_.in_viewport(480, 388));
	EXPECT_FALSE(hits_.in_viewport(100, 500));
	EXPECT_TRUE(hits_.hit_test(470, 700, 0).empty());
}

TEST(HitTesterScaledTest, UsesTouchCoordinates) {
	HitTester hits(CoordinateMapper(480, 800, 799, 479).to_touch(default_layout()), kComboThreshold);
	std::vector<size_t> hit = hits.hit_test(100, 250, 0);
	ASSERT_EQ(1u, hit.size());
	EXPECT_EQ("LOAD", hits.layout().regions[hit[0]].name);
	EXPECT_TRUE(hits.in_viewport(700, 200));
	EXPECT_FALSE(hits.in_viewport(700, 300));
}

} // namespace touchkbd
