// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/cachingassetprovider.h"
#include <QMutexLocker>

namespace wavatar {
namespace assets {

CachingAssetProvider::CachingAssetProvider(
	std::unique_ptr<AssetProvider> source)
	: m_source(std::move(source))
{
	Q_ASSERT(m_source);
}

int CachingAssetProvider::cachedCount() const
{
	QMutexLocker locker{&m_mutex};
	return m_cache.size();
}

void CachingAssetProvider::clear()
{
	QMutexLocker locker{&m_mutex};
	m_cache.clear();
}

QImage CachingAssetProvider::layer(const LayerId &id, QString *error) const
{
	{
		QMutexLocker locker{&m_mutex};
		const auto i = m_cache.constFind(id);
		if(i != m_cache.constEnd()) {
			return i.value();
		}
	}

	// Not holding the lock while loading. Two threads may load the same
	// layer concurrently, the result is the same either way.
	const QImage image = m_source->layer(id, error);
	if(!image.isNull()) {
		QMutexLocker locker{&m_mutex};
		m_cache.insert(id, image);
	}
	return image;
}

QString CachingAssetProvider::describe() const
{
	return QStringLiteral("cached %1").arg(m_source->describe());
}

}
}
