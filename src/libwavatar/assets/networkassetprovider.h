// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_ASSETS_NETWORKASSETPROVIDER_H
#define LIBWAVATAR_ASSETS_NETWORKASSETPROVIDER_H
#include "libwavatar/assets/assetprovider.h"
#include <QUrl>

namespace wavatar {
namespace assets {

/**
 * @brief Fetches layer images from a URL
 *
 * The layer's file name is appended to the base URL. Each request blocks
 * the calling thread, running a local event loop until the reply finishes
 * or the timeout expires. Wrap this in a CachingAssetProvider to avoid
 * fetching the same layer over and over.
 */
class NetworkAssetProvider final : public AssetProvider {
public:
	static constexpr int DEFAULT_TIMEOUT_MSEC = 10000;

	explicit NetworkAssetProvider(
		const QUrl &baseUrl, int timeoutMsec = DEFAULT_TIMEOUT_MSEC);

	const QUrl &baseUrl() const { return m_baseUrl; }
	int timeout() const { return m_timeoutMsec; }

	//! Full URL of the given layer's image
	QUrl layerUrl(const LayerId &id) const;

	QImage layer(const LayerId &id, QString *error) const override;
	QString describe() const override;

private:
	QUrl m_baseUrl;
	int m_timeoutMsec;
};

}
}

#endif
