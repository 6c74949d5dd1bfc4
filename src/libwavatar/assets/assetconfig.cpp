// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/assetconfig.h"
#include "libwavatar/assets/cachingassetprovider.h"
#include "libwavatar/assets/directoryassetprovider.h"
#include "libwavatar/assets/memoryassetprovider.h"
#include "libwavatar/assets/networkassetprovider.h"
#include <QCoreApplication>
#include <QSettings>

namespace wavatar {
namespace assets {

const char DEFAULT_ASSET_PATH[] = "parts";
const char DEFAULT_RESOURCE_PATH[] = ":/wavatar/parts";

AssetConfig::AssetConfig()
	: timeoutMsec(NetworkAssetProvider::DEFAULT_TIMEOUT_MSEC)
{
}

QString AssetConfig::effectivePath() const
{
	if(!path.isEmpty()) {
		return path;
	} else if(source == Source::Resource) {
		return QString::fromUtf8(DEFAULT_RESOURCE_PATH);
	} else {
		return QString::fromUtf8(DEFAULT_ASSET_PATH);
	}
}

AssetConfig AssetConfig::load(QSettings &settings)
{
	AssetConfig config;
	settings.beginGroup(QStringLiteral("assets"));

	const QString name = settings.value(QStringLiteral("source")).toString();
	if(!name.isEmpty()) {
		config.source = sourceFromName(name);
		if(config.source == Source::Unknown) {
			qWarning("Unknown asset source '%s'", qUtf8Printable(name));
		}
	}

	config.path = settings.value(QStringLiteral("path")).toString();
	config.url = settings.value(QStringLiteral("url")).toUrl();

	bool ok;
	const int timeout =
		settings.value(QStringLiteral("timeout"), config.timeoutMsec)
			.toInt(&ok);
	if(ok && timeout > 0) {
		config.timeoutMsec = timeout;
	} else {
		qWarning("Invalid asset timeout, using %d ms", config.timeoutMsec);
	}

	config.cache =
		settings.value(QStringLiteral("cache"), config.cache).toBool();

	settings.endGroup();
	return config;
}

void AssetConfig::save(QSettings &settings) const
{
	settings.beginGroup(QStringLiteral("assets"));
	settings.setValue(QStringLiteral("source"), sourceName(source));
	settings.setValue(QStringLiteral("path"), path);
	settings.setValue(QStringLiteral("url"), url.toString());
	settings.setValue(QStringLiteral("timeout"), timeoutMsec);
	settings.setValue(QStringLiteral("cache"), cache);
	settings.endGroup();
}

QString sourceName(AssetConfig::Source source)
{
	switch(source) {
	case AssetConfig::Source::Unknown:
		return QString();
	case AssetConfig::Source::Directory:
		return QStringLiteral("directory");
	case AssetConfig::Source::Resource:
		return QStringLiteral("resource");
	case AssetConfig::Source::Network:
		return QStringLiteral("network");
	case AssetConfig::Source::Memory:
		return QStringLiteral("memory");
	}
	qWarning("Unhandled asset source %d in %s", int(source), __func__);
	return QString();
}

AssetConfig::Source sourceFromName(const QString &name)
{
	const QString n = name.trimmed().toLower();
	if(n == QStringLiteral("directory")) {
		return AssetConfig::Source::Directory;
	} else if(n == QStringLiteral("resource")) {
		return AssetConfig::Source::Resource;
	} else if(n == QStringLiteral("network")) {
		return AssetConfig::Source::Network;
	} else if(n == QStringLiteral("memory")) {
		return AssetConfig::Source::Memory;
	} else {
		return AssetConfig::Source::Unknown;
	}
}

static std::unique_ptr<AssetProvider>
withCache(const AssetConfig &config, std::unique_ptr<AssetProvider> provider)
{
	if(config.cache) {
		return std::unique_ptr<AssetProvider>(
			new CachingAssetProvider(std::move(provider)));
	} else {
		return provider;
	}
}

std::unique_ptr<AssetProvider>
makeAssetProvider(const AssetConfig &config, QString *error)
{
	switch(config.source) {
	case AssetConfig::Source::Directory:
	case AssetConfig::Source::Resource:
		return withCache(
			config, std::unique_ptr<AssetProvider>(
						new DirectoryAssetProvider(config.effectivePath())));

	case AssetConfig::Source::Network:
		if(!config.url.isValid() || config.url.isEmpty()) {
			if(error) {
				*error = QCoreApplication::translate(
					"AssetProvider", "No valid URL set for network assets");
			}
			return nullptr;
		}
		return withCache(
			config,
			std::unique_ptr<AssetProvider>(
				new NetworkAssetProvider(config.url, config.timeoutMsec)));

	case AssetConfig::Source::Memory: {
		// Already in memory, no point in caching it again
		std::unique_ptr<MemoryAssetProvider> bundle(new MemoryAssetProvider);
		QString loadError;
		if(bundle->loadDirectory(config.effectivePath(), &loadError) < 0) {
			if(error) {
				*error = loadError;
			}
			return nullptr;
		}
		return std::unique_ptr<AssetProvider>(bundle.release());
	}

	case AssetConfig::Source::Unknown:
		break;
	}

	if(error) {
		*error = QCoreApplication::translate(
			"AssetProvider", "Unknown asset source");
	}
	return nullptr;
}

}
}
