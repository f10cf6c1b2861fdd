#ifndef TOUCHKBD_HIT_TESTER_H
#define TOUCHKBD_HIT_TESTER_H

#include <cstddef>
#include <utility>
#include <vector>

#include "layout.h"

namespace touchkbd {

// Resolves a contact to the buttons under it. Works on a layout already in
// touch device coordinates.
class HitTester {
public:
	HitTester(const Layout& touch_layout, int combo_size_threshold);

	// Region indices in catalog order, no duplicates. Empty when the point is
	// not over any button (the viewport never appears here).
	std::vector<size_t> hit_test(int x, int y, int touch_size) const;
	bool in_viewport(int x, int y) const;

	const Layout& layout() const { return layout_; }
	int combo_size_threshold() const { return combo_size_threshold_; }

private:
	struct ResolvedCombo {
		size_t first;
		size_t second;
		Rect box;
	};

	Layout layout_;
	int combo_size_threshold_;
	std::vector<ResolvedCombo> combos_;
};

} // namespace touchkbd

#endif
