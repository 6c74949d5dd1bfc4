// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_PAINT_FLOODFILL_H
#define LIBWAVATAR_PAINT_FLOODFILL_H

class QColor;
class QImage;
class QPoint;

namespace wavatar {
namespace paint {

/**
 * @brief Recolor the 4-connected region of uniform color around a point
 *
 * Every pixel that is reachable from the seed point through horizontal and
 * vertical steps over pixels exactly matching the seed pixel is set to the
 * given color. Diagonal neighbors are not connected.
 *
 * Does nothing if the seed pixel already has the fill color, the seed point
 * is outside the image or the image is null.
 *
 * @param image a 32 bit image (ARGB32 or ARGB32_Premultiplied)
 * @param point fill seed point
 * @param color fill color
 * @return number of pixels recolored
 */
int floodFill(QImage &image, const QPoint &point, const QColor &color);

}
}

#endif
