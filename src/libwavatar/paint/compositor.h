// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_PAINT_COMPOSITOR_H
#define LIBWAVATAR_PAINT_COMPOSITOR_H
#include "libwavatar/assets/layerid.h"
#include "libwavatar/generator/parameters.h"
#include <QColor>
#include <QImage>
#include <QPoint>
#include <QVector>

class QByteArray;

namespace wavatar {

namespace assets {
class AssetProvider;
}

namespace paint {

struct AvatarResult {
	//! The finished avatar. Null if generation failed
	QImage image;

	//! The layer that couldn't be loaded, if any
	assets::LayerId failedLayer;

	//! Error message, empty on success
	QString error;

	bool isOk() const { return !image.isNull(); }
};

/**
 * @brief Builds avatars by stacking layers from an asset provider
 *
 * The stacking order is: background color, fade, mask, wave color fill,
 * shine, brow, eyes, pupils and mouth. The wave color is flood filled
 * from the center of the image, so the center of every mask layer must be
 * inside the face outline.
 *
 * A compositor holds no mutable state: generate() may be called from
 * several threads at once, as long as the asset provider allows it.
 */
class LayerCompositor final {
public:
	static constexpr int SIZE = assets::LAYER_SIZE;
	static constexpr int BACKGROUND_LIGHTNESS = 50;
	static constexpr int WAVE_LIGHTNESS = 170;

	explicit LayerCompositor(const assets::AssetProvider *provider);

	//! Generate the avatar for the given input (usually an email hash)
	AvatarResult generate(const QByteArray &input) const;

	//! Generate the avatar for already derived parameters
	AvatarResult compose(const generator::AvatarParameters &params) const;

	//! The layers used for the given parameters, in stacking order
	static QVector<assets::LayerId>
	layerSequence(const generator::AvatarParameters &params);

	static QColor backgroundColor(const generator::AvatarParameters &params);
	static QColor waveColor(const generator::AvatarParameters &params);

	//! Point the wave color is flood filled from
	static QPoint fillPoint() { return QPoint(SIZE / 2, SIZE / 2); }

private:
	bool applyLayer(
		QImage &canvas, const assets::LayerId &id, AvatarResult &result) const;

	const assets::AssetProvider *m_provider;
};

//! Convenience wrapper around LayerCompositor::generate
AvatarResult
generate(const QByteArray &input, const assets::AssetProvider &provider);

}
}

#endif
