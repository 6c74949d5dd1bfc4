// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/paint/floodfill.h"
#include <QColor>
#include <QImage>
#include <QPoint>
#include <QQueue>

namespace wavatar {
namespace paint {

namespace {

class Floodfill {
public:
	Floodfill(QImage &image, const QColor &color)
		: m_image(image)
		, m_fillColor(
			  m_image.format() == QImage::Format_ARGB32_Premultiplied
				  ? qPremultiply(color.rgba())
				  : color.rgba())
		, m_oldColor(0)
		, m_filled(0)
	{
	}

	int start(const QPoint &startPoint)
	{
		if(!m_image.valid(startPoint)) {
			return 0;
		}

		m_oldColor = colorAt(startPoint.x(), startPoint.y());
		if(m_oldColor == m_fillColor) {
			return 0;
		}

		QQueue<QPoint> queue;
		queue.enqueue(startPoint);

		while(!queue.isEmpty()) {
			const QPoint p = queue.dequeue();

			// Pixels are checked when dequeued rather than when queued, so
			// points queued twice are skipped the second time around.
			if(!m_image.valid(p) || colorAt(p.x(), p.y()) != m_oldColor) {
				continue;
			}

			setPixel(p.x(), p.y());

			queue.enqueue(QPoint(p.x() + 1, p.y()));
			queue.enqueue(QPoint(p.x() - 1, p.y()));
			queue.enqueue(QPoint(p.x(), p.y() + 1));
			queue.enqueue(QPoint(p.x(), p.y() - 1));
		}

		return m_filled;
	}

private:
	QRgb colorAt(int x, int y) const
	{
		return reinterpret_cast<const QRgb *>(m_image.constScanLine(y))[x];
	}

	void setPixel(int x, int y)
	{
		reinterpret_cast<QRgb *>(m_image.scanLine(y))[x] = m_fillColor;
		++m_filled;
	}

	QImage &m_image;

	// Fill color, in the image's pixel format
	const QRgb m_fillColor;

	// Seed color
	QRgb m_oldColor;

	int m_filled;
};

}

int floodFill(QImage &image, const QPoint &point, const QColor &color)
{
	if(image.isNull()) {
		return 0;
	}

	Q_ASSERT(
		image.format() == QImage::Format_ARGB32 ||
		image.format() == QImage::Format_ARGB32_Premultiplied);

	return Floodfill(image, color).start(point);
}

}
}
