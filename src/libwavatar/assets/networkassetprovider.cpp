// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/networkassetprovider.h"
#include "libwavatar/utils/networkaccess.h"
#include <QBuffer>
#include <QCoreApplication>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QScopedPointer>
#include <QTimer>

namespace wavatar {
namespace assets {

NetworkAssetProvider::NetworkAssetProvider(
	const QUrl &baseUrl, int timeoutMsec)
	: m_baseUrl(baseUrl)
	, m_timeoutMsec(timeoutMsec)
{
}

QUrl NetworkAssetProvider::layerUrl(const LayerId &id) const
{
	QUrl url = m_baseUrl;
	QString path = url.path();
	if(!path.endsWith('/')) {
		path.append('/');
	}
	url.setPath(path + id.fileName());
	return url;
}

QImage NetworkAssetProvider::layer(const LayerId &id, QString *error) const
{
	if(!id.isValid()) {
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Invalid layer %1")
						 .arg(id.toString());
		}
		return QImage();
	}

	const QUrl url = layerUrl(id);
	qCDebug(lcWavatarAssets) << "Fetching" << url;

	QScopedPointer<QNetworkReply> reply{
		networkaccess::threadManager()->get(QNetworkRequest(url))};

	QEventLoop loop;
	QTimer timer;
	timer.setSingleShot(true);
	QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
	QObject::connect(
		reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

	if(!reply->isFinished()) {
		timer.start(m_timeoutMsec);
		loop.exec();
	}

	if(!reply->isFinished()) {
		reply->abort();
		qCWarning(lcWavatarAssets) << url << "timed out";
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Timed out fetching %1")
						 .arg(url.toString());
		}
		return QImage();
	}

	if(reply->error() != QNetworkReply::NoError) {
		qCWarning(lcWavatarAssets) << url << "error:" << reply->errorString();
		if(error) {
			*error = QCoreApplication::translate(
						 "AssetProvider", "Can't fetch %1: %2")
						 .arg(url.toString(), reply->errorString());
		}
		return QImage();
	}

	QByteArray data = reply->readAll();
	QBuffer buffer(&data);
	if(!buffer.open(QIODevice::ReadOnly)) {
		if(error) {
			*error = buffer.errorString();
		}
		return QImage();
	}
	return decodeLayer(&buffer, id, error);
}

QString NetworkAssetProvider::describe() const
{
	return QStringLiteral("network %1").arg(m_baseUrl.toString());
}

}
}
