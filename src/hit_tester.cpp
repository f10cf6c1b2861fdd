#include "hit_tester.h"

#include <algorithm>

namespace touchkbd {

HitTester::HitTester(const Layout& touch_layout, int combo_size_threshold)
	: layout_(touch_layout), combo_size_threshold_(combo_size_threshold) {
	// validate_layout() has rejected unknown names before we get here.
	for (const auto& c : layout_.combos) {
		int a = layout_.find(c.first);
		int b = layout_.find(c.second);
		if (a < 0 || b < 0) continue;
		ResolvedCombo rc;
		rc.first = (size_t)a;
		rc.second = (size_t)b;
		rc.box = c.box;
		combos_.push_back(rc);
	}
}

std::vector<size_t> HitTester::hit_test(int x, int y, int touch_size) const {
	std::vector<size_t> hits;
	for (size_t i = 0; i < layout_.regions.size(); ++i) {
		if (layout_.regions[i].rect.contains(x, y)) hits.push_back(i);
	}

	if (touch_size >= combo_size_threshold_) {
		for (const auto& c : combos_) {
			if (!c.box.contains(x, y)) continue;
			hits.push_back(c.first);
			hits.push_back(c.second);
		}
		std::sort(hits.begin(), hits.end());
		hits.erase(std::unique(hits.begin(), hits.end()), hits.end());
	}
	return hits;
}

bool HitTester::in_viewport(int x, int y) const {
	return layout_.viewport.rect.contains(x, y);
}

} // namespace touchkbd
