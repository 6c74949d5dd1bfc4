// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/assetprovider.h"
#include <QCoreApplication>
#include <QImageReader>
#include <QIODevice>

Q_LOGGING_CATEGORY(lcWavatarAssets, "wavatar.assets", QtWarningMsg)

namespace wavatar {
namespace assets {

AssetProvider::~AssetProvider() {}

QImage decodeLayer(QIODevice *device, const LayerId &id, QString *error)
{
	Q_ASSERT(device);
	QImageReader reader(device);
	reader.setDecideFormatFromContent(true);

	QImage image;
	if(!reader.read(&image)) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Can't decode %1: %2")
						 .arg(id.fileName(), reader.errorString());
		}
		return QImage();
	}

	return validateLayer(image, id, error);
}

QImage validateLayer(const QImage &image, const LayerId &id, QString *error)
{
	if(image.isNull()) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Layer %1 is empty")
						 .arg(id.toString());
		}
		return QImage();
	}

	if(image.width() != LAYER_SIZE || image.height() != LAYER_SIZE) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider",
						 "Layer %1 is %2x%3 pixels, expected %4x%4")
						 .arg(id.toString())
						 .arg(image.width())
						 .arg(image.height())
						 .arg(LAYER_SIZE);
		}
		return QImage();
	}

	return image.convertToFormat(QImage::Format_ARGB32_Premultiplied);
}

}
}
