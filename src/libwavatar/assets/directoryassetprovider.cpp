// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/directoryassetprovider.h"
#include <QCoreApplication>
#include <QDir>
#include <QFile>

namespace wavatar {
namespace assets {

DirectoryAssetProvider::DirectoryAssetProvider(const QString &root)
	: m_root(root)
{
}

QString DirectoryAssetProvider::layerPath(const LayerId &id) const
{
	return QDir(m_root).filePath(id.fileName());
}

QImage DirectoryAssetProvider::layer(const LayerId &id, QString *error) const
{
	if(!id.isValid()) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Invalid layer %1")
						 .arg(id.toString());
		}
		return QImage();
	}

	QFile f(layerPath(id));
	if(!f.open(QIODevice::ReadOnly)) {
		qCWarning(lcWavatarAssets)
			<< "Can't open" << f.fileName() << ":" << f.errorString();
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Can't open %1: %2")
						 .arg(f.fileName(), f.errorString());
		}
		return QImage();
	}

	return decodeLayer(&f, id, error);
}

QString DirectoryAssetProvider::describe() const
{
	return QStringLiteral("directory %1").arg(m_root);
}

}
}
