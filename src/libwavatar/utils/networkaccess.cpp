// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/utils/networkaccess.h"
#include "libwavatar/assets/assetprovider.h"
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QThread>

namespace wavatar {
namespace networkaccess {

namespace {

QMutex managerMutex;
QHash<QThread *, QNetworkAccessManager *> managers;

void forgetManager(QThread *thread)
{
	QMutexLocker locker{&managerMutex};
	QNetworkAccessManager *nam = managers.take(thread);
	if(nam) {
		qCDebug(lcWavatarAssets)
			<< "Thread" << thread << "finished, dropping its network manager";
		nam->deleteLater();
	}
}

}

QNetworkAccessManager *threadManager()
{
	QThread *thread = QThread::currentThread();
	QMutexLocker locker{&managerMutex};

	QNetworkAccessManager *nam = managers.value(thread);
	if(!nam) {
		qCDebug(lcWavatarAssets)
			<< "Creating network manager for thread" << thread;
		nam = new QNetworkAccessManager;
		// Layer servers may redirect, but never from https to http
		nam->setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
		QObject::connect(
			thread, &QThread::finished, nam,
			[thread]() {
				forgetManager(thread);
			},
			Qt::DirectConnection);
		managers.insert(thread, nam);
	}
	return nam;
}

int managerCount()
{
	QMutexLocker locker{&managerMutex};
	return managers.size();
}

}
}
