#include "coordinate_mapper.h"

namespace touchkbd {

namespace {

// Integer form of int(v * num / den) so that exact multiples stay exact.
int scale_axis(int v, int num, int den) {
	return (int)((long long)v * num / den);
}

} // namespace

CoordinateMapper::CoordinateMapper(int physical_w, int physical_h, int touch_max_x, int touch_max_y)
	: physical_w_(physical_w),
	  physical_h_(physical_h),
	  touch_w_(touch_max_x + 1),
	  touch_h_(touch_max_y + 1) {}

double CoordinateMapper::x_scale() const {
	return (double)touch_w_ / physical_w_;
}

double CoordinateMapper::y_scale() const {
	return (double)touch_h_ / physical_h_;
}

int CoordinateMapper::to_touch_x(int px) const {
	return scale_axis(px, touch_w_, physical_w_);
}

int CoordinateMapper::to_touch_y(int py) const {
	return scale_axis(py, touch_h_, physical_h_);
}

int CoordinateMapper::to_physical_x(int tx) const {
	return scale_axis(tx, physical_w_, touch_w_);
}

int CoordinateMapper::to_physical_y(int ty) const {
	return scale_axis(ty, physical_h_, touch_h_);
}

Rect CoordinateMapper::to_touch(const Rect& physical) const {
	Rect r;
	r.x1 = to_touch_x(physical.x1);
	r.y1 = to_touch_y(physical.y1);
	r.x2 = to_touch_x(physical.x2);
	r.y2 = to_touch_y(physical.y2);
	return r;
}

Layout CoordinateMapper::to_touch(const Layout& physical) const {
	Layout out = physical;
	for (auto& r : out.regions) r.rect = to_touch(r.rect);
	out.viewport.rect = to_touch(physical.viewport.rect);
	for (auto& c : out.combos) c.box = to_touch(c.box);
	return out;
}

} // namespace touchkbd
