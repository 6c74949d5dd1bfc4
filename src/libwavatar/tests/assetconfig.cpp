// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/assetconfig.h"
#include "libwavatar/assets/assetprovider.h"
#include "libwavatar/assets/cachingassetprovider.h"
#include "libwavatar/assets/directoryassetprovider.h"
#include "libwavatar/assets/memoryassetprovider.h"
#include "libwavatar/assets/networkassetprovider.h"
#include "libwavatar/utils/logging.h"
#include "testassets.h"

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>

using namespace wavatar::assets;

Q_DECLARE_METATYPE(AssetConfig::Source)

class TestAssetConfig final : public QObject
{
	Q_OBJECT
private slots:
	void initTestCase()
	{
		QVERIFY(m_dir.isValid());
	}

	void cleanup()
	{
		utils::disableLogFile();
		QLoggingCategory::setFilterRules(QString());
	}

	void testDefaults()
	{
		const AssetConfig config;
		QCOMPARE(config.source, AssetConfig::Source::Directory);
		QCOMPARE(config.timeoutMsec, NetworkAssetProvider::DEFAULT_TIMEOUT_MSEC);
		QVERIFY(config.cache);
		QCOMPARE(config.effectivePath(), QStringLiteral("parts"));

		AssetConfig resource;
		resource.source = AssetConfig::Source::Resource;
		QCOMPARE(resource.effectivePath(), QStringLiteral(":/wavatar/parts"));
		resource.path = QStringLiteral("/tmp/layers");
		QCOMPARE(resource.effectivePath(), QStringLiteral("/tmp/layers"));
	}

	void testSourceNames_data()
	{
		QTest::addColumn<QString>("name");
		QTest::addColumn<AssetConfig::Source>("source");

		QTest::newRow("directory") << "directory" << AssetConfig::Source::Directory;
		QTest::newRow("resource") << "resource" << AssetConfig::Source::Resource;
		QTest::newRow("network") << "network" << AssetConfig::Source::Network;
		QTest::newRow("memory") << "memory" << AssetConfig::Source::Memory;
		QTest::newRow("mixed case") << " Network " << AssetConfig::Source::Network;
		QTest::newRow("unknown") << "ftp" << AssetConfig::Source::Unknown;
	}

	void testSourceNames()
	{
		QFETCH(QString, name);
		QFETCH(AssetConfig::Source, source);

		QCOMPARE(sourceFromName(name), source);
		if(source != AssetConfig::Source::Unknown) {
			QCOMPARE(sourceFromName(sourceName(source)), source);
		}
	}

	void testRoundTrip()
	{
		const QString path = QDir(m_dir.path()).filePath(QStringLiteral("roundtrip.ini"));

		AssetConfig config;
		config.source = AssetConfig::Source::Network;
		config.url = QUrl(QStringLiteral("https://example.com/wavatar/parts/"));
		config.timeoutMsec = 2500;
		config.cache = false;

		utils::LogConfig log;
		log.rules = QStringLiteral("wavatar.*.debug=true");
		log.file = QStringLiteral("/tmp/wavatar.log");

		{
			QSettings settings(path, QSettings::IniFormat);
			config.save(settings);
			log.save(settings);
			settings.sync();
			QCOMPARE(settings.status(), QSettings::NoError);
		}

		QSettings settings(path, QSettings::IniFormat);
		const AssetConfig loaded = AssetConfig::load(settings);
		QCOMPARE(loaded.source, config.source);
		QCOMPARE(loaded.url, config.url);
		QCOMPARE(loaded.timeoutMsec, 2500);
		QCOMPARE(loaded.cache, false);

		const utils::LogConfig loadedLog = utils::LogConfig::load(settings);
		QCOMPARE(loadedLog.rules, log.rules);
		QCOMPARE(loadedLog.file, log.file);
	}

	void testLoadBadValues()
	{
		const QString path = QDir(m_dir.path()).filePath(QStringLiteral("bad.ini"));
		QFile f(path);
		QVERIFY(f.open(QIODevice::WriteOnly));
		QVERIFY(f.write("[assets]\nsource=gopher\ntimeout=-5\n") > 0);
		f.close();

		QSettings settings(path, QSettings::IniFormat);
		QTest::ignoreMessage(QtWarningMsg, "Unknown asset source 'gopher'");
		QTest::ignoreMessage(QtWarningMsg, "Invalid asset timeout, using 10000 ms");
		const AssetConfig config = AssetConfig::load(settings);
		QCOMPARE(config.source, AssetConfig::Source::Unknown);
		QCOMPARE(config.timeoutMsec, NetworkAssetProvider::DEFAULT_TIMEOUT_MSEC);

		QString error;
		QVERIFY(!makeAssetProvider(config, &error));
		QVERIFY(!error.isEmpty());
	}

	void testMakeDirectory()
	{
		AssetConfig config;
		config.path = m_dir.path();

		std::unique_ptr<AssetProvider> cached = makeAssetProvider(config);
		QVERIFY(cached);
		const CachingAssetProvider *cache = dynamic_cast<const CachingAssetProvider *>(cached.get());
		QVERIFY(cache);
		QVERIFY(dynamic_cast<const DirectoryAssetProvider *>(cache->source()));

		config.cache = false;
		std::unique_ptr<AssetProvider> plain = makeAssetProvider(config);
		QVERIFY(dynamic_cast<DirectoryAssetProvider *>(plain.get()));
	}

	void testMakeNetwork()
	{
		AssetConfig config;
		config.source = AssetConfig::Source::Network;

		QString error;
		QVERIFY(!makeAssetProvider(config, &error));
		QVERIFY(!error.isEmpty());

		config.url = QUrl(QStringLiteral("https://example.com/parts/"));
		config.timeoutMsec = 1234;
		config.cache = false;
		std::unique_ptr<AssetProvider> provider = makeAssetProvider(config, &error);
		const NetworkAssetProvider *network = dynamic_cast<NetworkAssetProvider *>(provider.get());
		QVERIFY(network);
		QCOMPARE(network->timeout(), 1234);
		QCOMPARE(network->baseUrl(), config.url);
	}

	void testMakeMemory()
	{
		QTemporaryDir dir;
		QVERIFY(dir.isValid());
		const LayerId id(LayerCategory::Shine, 7);
		QVERIFY(testassets::makeLayer(id).save(QDir(dir.path()).filePath(id.fileName()), "PNG"));

		AssetConfig config;
		config.source = AssetConfig::Source::Memory;
		config.path = dir.path();

		QString error;
		std::unique_ptr<AssetProvider> provider = makeAssetProvider(config, &error);
		const MemoryAssetProvider *bundle = dynamic_cast<MemoryAssetProvider *>(provider.get());
		QVERIFY2(bundle, qPrintable(error));
		QCOMPARE(bundle->count(), 1);
		QVERIFY(bundle->contains(id));

		config.path = QDir(dir.path()).filePath(QStringLiteral("nowhere"));
		QVERIFY(!makeAssetProvider(config, &error));
		QVERIFY(error.contains(QStringLiteral("nowhere")));
	}

	void testLogFile()
	{
		const QString path = QDir(m_dir.path()).filePath(QStringLiteral("wavatar.log"));

		utils::LogConfig config;
		config.rules = QStringLiteral("wavatar.assets.debug=true;wavatar.compositor.debug=false");
		config.file = path;
		QVERIFY(utils::applyLogConfig(config));
		QVERIFY(utils::isLogFileEnabled());

		qCDebug(lcWavatarAssets) << "debug message from the asset loader";

		config.file.clear();
		QVERIFY(utils::applyLogConfig(config));
		QVERIFY(!utils::isLogFileEnabled());

		QFile f(path);
		QVERIFY(f.open(QIODevice::ReadOnly));
		const QString log = QString::fromUtf8(f.readAll());
		QVERIFY(log.contains(QStringLiteral("file logging started")));
		QVERIFY(log.contains(QStringLiteral("DEBUG] debug message from the asset loader")));
		QVERIFY(log.contains(QStringLiteral("File logging stopped")));
	}

	void testLogFileUnwritable()
	{
		const QString path = QDir(m_dir.path()).filePath(QStringLiteral("missing/dir/wavatar.log"));
		QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("^Unable to open log file")));
		QVERIFY(!utils::enableLogFile(path));
		QVERIFY(!utils::isLogFileEnabled());
	}

private:
	QTemporaryDir m_dir;
};

QTEST_GUILESS_MAIN(TestAssetConfig)
#include "assetconfig.moc"
