// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/color/hsl.h"

namespace wavatar {
namespace color {

namespace {

struct Channels {
	int r;
	int g;
	int b;
};

// Width of one of the six hue sectors
constexpr int SECTOR = 40;
constexpr int HALF_LIGHTNESS = 120;

Channels hueChannels(int h)
{
	// The interpolated channel only ever takes the values 0 or 256, since the
	// sector offset is divided before it is scaled.
	if(h <= SECTOR) {
		return {255, h / SECTOR * 256, 0};
	} else if(h <= 2 * SECTOR) {
		return {(1 - (h - SECTOR) / SECTOR) * 256, 255, 0};
	} else if(h <= 3 * SECTOR) {
		return {0, 255, (h - 2 * SECTOR) / SECTOR * 256};
	} else if(h <= 4 * SECTOR) {
		return {0, (1 - (h - 3 * SECTOR) / SECTOR) * 256, 255};
	} else if(h <= 5 * SECTOR) {
		return {(h - 4 * SECTOR) / SECTOR * 256, 0, 255};
	} else {
		return {255, 0, (1 - (h - 5 * SECTOR) / SECTOR) * 256};
	}
}

int desaturate(int c, int s)
{
	return c + (HSL_MAX - s) / HSL_MAX * (128 - c);
}

int applyLightness(int c, int l)
{
	if(l < HALF_LIGHTNESS) {
		return (c / HALF_LIGHTNESS) * l;
	} else {
		return l * ((256 - c) / HALF_LIGHTNESS) + 2 * c - 256;
	}
}

int clamp8(int v)
{
	return qBound(0, v, 255);
}

bool inRange(int v)
{
	return v >= 0 && v <= HSL_MAX;
}

}

QColor hslToRgb(int h, int s, int l)
{
	if(!inRange(h) || !inRange(s) || !inRange(l)) {
		return QColor(0, 0, 0);
	}

	Channels c = hueChannels(h);

	c.r = applyLightness(desaturate(c.r, s), l);
	c.g = applyLightness(desaturate(c.g, s), l);
	c.b = applyLightness(desaturate(c.b, s), l);

	return QColor(clamp8(c.r), clamp8(c.g), clamp8(c.b));
}

}
}
