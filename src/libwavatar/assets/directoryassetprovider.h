// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_ASSETS_DIRECTORYASSETPROVIDER_H
#define LIBWAVATAR_ASSETS_DIRECTORYASSETPROVIDER_H
#include "libwavatar/assets/assetprovider.h"

namespace wavatar {
namespace assets {

/**
 * @brief Reads layer images from a directory on demand
 *
 * The root may also be a Qt resource path (e.g. ":/wavatar/parts") to serve
 * layers compiled into the application.
 */
class DirectoryAssetProvider final : public AssetProvider {
public:
	explicit DirectoryAssetProvider(const QString &root);

	const QString &root() const { return m_root; }

	//! Full path of the given layer's image file
	QString layerPath(const LayerId &id) const;

	QImage layer(const LayerId &id, QString *error) const override;
	QString describe() const override;

private:
	QString m_root;
};

}
}

#endif
