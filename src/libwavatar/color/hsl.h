// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_COLOR_HSL_H
#define LIBWAVATAR_COLOR_HSL_H
#include <QColor>

namespace wavatar {
namespace color {

//! Upper bound of each hue, saturation and lightness component
static constexpr int HSL_MAX = 240;

/**
 * @brief Convert an integer HSL triple to an opaque RGB color
 *
 * All three components use the 0..240 range. The conversion uses truncating
 * integer arithmetic in a fixed order and is not equivalent to
 * QColor::fromHsl: its quantization is part of every generated avatar, so
 * the arithmetic must not be rearranged.
 *
 * If any component is outside 0..240, black is returned.
 */
QColor hslToRgb(int h, int s, int l);

}
}

#endif
