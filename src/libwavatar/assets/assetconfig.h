// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_ASSETS_ASSETCONFIG_H
#define LIBWAVATAR_ASSETS_ASSETCONFIG_H
#include <QString>
#include <QUrl>
#include <memory>

class QSettings;

namespace wavatar {
namespace assets {

class AssetProvider;

//! Where avatar layers are loaded from, stored in the "assets" group
struct AssetConfig {
	enum class Source {
		Unknown,
		Directory,
		Resource,
		Network,
		Memory,
	};

	Source source = Source::Directory;

	//! Layer directory. Empty means the source's default
	QString path;

	//! Base URL for the network source
	QUrl url;

	//! Network request timeout in milliseconds
	int timeoutMsec;

	//! Keep loaded layers in memory
	bool cache = true;

	AssetConfig();

	//! The configured path or the default for the source
	QString effectivePath() const;

	/**
	 * @brief Read the configuration from the settings
	 *
	 * Missing values get their defaults. An unrecognized source name is
	 * read as Source::Unknown.
	 */
	static AssetConfig load(QSettings &settings);
	void save(QSettings &settings) const;
};

QString sourceName(AssetConfig::Source source);
AssetConfig::Source sourceFromName(const QString &name);

//! Default layer directory for the directory and memory sources
extern const char DEFAULT_ASSET_PATH[];

//! Default Qt resource path for the resource source
extern const char DEFAULT_RESOURCE_PATH[];

/**
 * @brief Construct the asset provider described by the configuration
 *
 * @return the provider, or null if the configuration is not usable
 */
std::unique_ptr<AssetProvider>
makeAssetProvider(const AssetConfig &config, QString *error = nullptr);

}
}

#endif
