// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/memoryassetprovider.h"
#include <QCoreApplication>
#include <QDir>
#include <QFile>

namespace wavatar {
namespace assets {

MemoryAssetProvider::MemoryAssetProvider() {}

bool MemoryAssetProvider::insert(
	const LayerId &id, const QImage &image, QString *error)
{
	if(!id.isValid()) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Invalid layer %1")
						 .arg(id.toString());
		}
		return false;
	}

	const QImage validated = validateLayer(image, id, error);
	if(validated.isNull()) {
		return false;
	}

	m_layers.insert(id, validated);
	return true;
}

void MemoryAssetProvider::remove(const LayerId &id)
{
	m_layers.remove(id);
}

int MemoryAssetProvider::loadDirectory(const QString &path, QString *error)
{
	const QDir dir(path);
	if(!dir.exists()) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Directory %1 does not exist")
						 .arg(path);
		}
		return -1;
	}

	int loaded = 0;
	const QStringList files =
		dir.entryList({QStringLiteral("*.png")}, QDir::Files, QDir::Name);
	for(const QString &file : files) {
		const LayerId id = LayerId::fromFileName(file);
		if(!id.isValid()) {
			qCDebug(lcWavatarAssets) << "Skipping" << file;
			continue;
		}

		QFile f(dir.filePath(file));
		if(!f.open(QIODevice::ReadOnly)) {
			qCWarning(lcWavatarAssets) << "Can't open" << f.fileName() << ":"
									   << f.errorString();
			if(error) {
				*error = f.errorString();
			}
			continue;
		}

		QString decodeError;
		const QImage image = decodeLayer(&f, id, &decodeError);
		if(image.isNull()) {
			qCWarning(lcWavatarAssets) << decodeError;
			if(error) {
				*error = decodeError;
			}
			continue;
		}

		m_layers.insert(id, image);
		++loaded;
	}

	qCDebug(lcWavatarAssets)
		<< "Loaded" << loaded << "layers from" << dir.absolutePath();
	return loaded;
}

QImage MemoryAssetProvider::layer(const LayerId &id, QString *error) const
{
	const auto i = m_layers.constFind(id);
	if(i == m_layers.constEnd()) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Layer %1 is not in the bundle")
						 .arg(id.toString());
		}
		return QImage();
	}
	return i.value();
}

QString MemoryAssetProvider::describe() const
{
	return QStringLiteral("memory bundle (%1 layers)").arg(m_layers.size());
}

}
}
