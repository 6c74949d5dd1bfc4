// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_ASSETS_ASSETPROVIDER_H
#define LIBWAVATAR_ASSETS_ASSETPROVIDER_H
#include "libwavatar/assets/layerid.h"
#include <QImage>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcWavatarAssets)

class QIODevice;

namespace wavatar {
namespace assets {

/**
 * @brief Source of the pre-drawn avatar layer images
 *
 * Implementations must allow concurrent calls to layer() once they have
 * been set up, since avatars may be generated on several threads at once.
 */
class AssetProvider {
public:
	virtual ~AssetProvider();

	/**
	 * @brief Get the image of the given layer
	 *
	 * The returned image is LAYER_SIZE pixels square and in
	 * QImage::Format_ARGB32_Premultiplied format.
	 *
	 * @param id the layer to get
	 * @param error if not null, set to an error message on failure
	 * @return the layer image or a null image on failure
	 */
	virtual QImage layer(const LayerId &id, QString *error) const = 0;

	//! Short description of where layers come from, for log messages
	virtual QString describe() const = 0;
};

/**
 * @brief Decode a layer image from the given device
 *
 * The image format is detected from the content. The image is checked with
 * validateLayer.
 */
QImage decodeLayer(QIODevice *device, const LayerId &id, QString *error);

/**
 * @brief Check that the image can be used as a layer
 *
 * @return the image converted to ARGB32_Premultiplied or a null image if
 *         the image is null or not LAYER_SIZE pixels square
 */
QImage validateLayer(const QImage &image, const LayerId &id, QString *error);

}
}

#endif
