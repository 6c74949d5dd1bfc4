// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_ASSETS_CACHINGASSETPROVIDER_H
#define LIBWAVATAR_ASSETS_CACHINGASSETPROVIDER_H
#include "libwavatar/assets/assetprovider.h"
#include <QHash>
#include <QMutex>
#include <memory>

namespace wavatar {
namespace assets {

/**
 * @brief Keeps the layers loaded by another provider in memory
 *
 * Only successfully loaded layers are cached, so a failed load is retried
 * the next time the layer is requested.
 */
class CachingAssetProvider final : public AssetProvider {
public:
	explicit CachingAssetProvider(std::unique_ptr<AssetProvider> source);

	const AssetProvider *source() const { return m_source.get(); }

	int cachedCount() const;
	void clear();

	QImage layer(const LayerId &id, QString *error) const override;
	QString describe() const override;

private:
	std::unique_ptr<AssetProvider> m_source;
	mutable QMutex m_mutex;
	mutable QHash<LayerId, QImage> m_cache;
};

}
}

#endif
