// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_ASSETS_MEMORYASSETPROVIDER_H
#define LIBWAVATAR_ASSETS_MEMORYASSETPROVIDER_H
#include "libwavatar/assets/assetprovider.h"
#include <QHash>

namespace wavatar {
namespace assets {

/**
 * @brief A bundle of layer images held in memory
 *
 * Fill the bundle before sharing it between threads: layer() may be called
 * concurrently, insert() and loadDirectory() may not.
 */
class MemoryAssetProvider final : public AssetProvider {
public:
	MemoryAssetProvider();

	/**
	 * @brief Add or replace a layer
	 *
	 * @return false (and leaves the bundle unchanged) if the id or the image
	 *         is not valid
	 */
	bool insert(const LayerId &id, const QImage &image, QString *error = nullptr);

	void remove(const LayerId &id);

	/**
	 * @brief Load every layer image file found in the given directory
	 *
	 * Files that are not named like layers are ignored. A layer file that
	 * can't be loaded is an error, but the rest of the directory is still
	 * loaded.
	 *
	 * @return number of layers loaded, or -1 if the directory can't be read
	 */
	int loadDirectory(const QString &path, QString *error = nullptr);

	int count() const { return m_layers.size(); }
	bool contains(const LayerId &id) const { return m_layers.contains(id); }

	QImage layer(const LayerId &id, QString *error) const override;
	QString describe() const override;

private:
	QHash<LayerId, QImage> m_layers;
};

}
}

#endif
