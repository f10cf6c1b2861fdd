#ifndef TOUCHKBD_COORDINATE_MAPPER_H
#define TOUCHKBD_COORDINATE_MAPPER_H

#include "layout.h"

namespace touchkbd {

// Physical pixel layout -> touch device coordinates. Each axis scales by
// (touch_max + 1) / physical_size; corners are truncated toward zero.
class CoordinateMapper {
public:
	CoordinateMapper(int physical_w, int physical_h, int touch_max_x, int touch_max_y);

	double x_scale() const;
	double y_scale() const;

	int to_touch_x(int px) const;
	int to_touch_y(int py) const;
	int to_physical_x(int tx) const;
	int to_physical_y(int ty) const;

	Rect to_touch(const Rect& physical) const;
	Layout to_touch(const Layout& physical) const;

private:
	int physical_w_;
	int physical_h_;
	int touch_w_;
	int touch_h_;
};

} // namespace touchkbd

#endif
