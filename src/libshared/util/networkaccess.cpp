// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/util/networkaccess.h"
#include "cmake-config/config.h"
#include <QDebug>
#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QThread>

namespace networkaccess {

namespace {
struct Managers {
	QMutex mutex;
	QHash<QThread *, QNetworkAccessManager *> byThread;
};

Managers MANAGERS;
}

QNetworkAccessManager *getInstance()
{
	QMutexLocker lock(&MANAGERS.mutex);

	QThread *thread = QThread::currentThread();
	QNetworkAccessManager *nam = MANAGERS.byThread.value(thread);
	if(nam)
		return nam;

	qDebug() << "Network access manager created for thread" << thread;
	nam = new QNetworkAccessManager;
	nam->setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
	nam->setStrictTransportSecurityEnabled(true);

	QObject::connect(
		thread, &QThread::finished, nam,
		[nam, thread]() {
			nam->deleteLater();
			QMutexLocker guard(&MANAGERS.mutex);
			MANAGERS.byThread.remove(thread);
		},
		Qt::DirectConnection);

	MANAGERS.byThread.insert(thread, nam);
	return nam;
}

QNetworkRequest jsonRequest(const QUrl &url, int timeout)
{
	static const QString USER_AGENT =
		QStringLiteral("NoteRelayHost/%1").arg(cmake_config::version());

	QNetworkRequest req(url);
	req.setHeader(QNetworkRequest::UserAgentHeader, USER_AGENT);
	req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
	req.setRawHeader("Accept", "application/json");
	req.setMaximumRedirectsAllowed(2);
	req.setTransferTimeout(timeout);
	return req;
}

QNetworkReply *postJson(const QNetworkRequest &req, const QJsonObject &body)
{
	QNetworkReply *reply = getInstance()->post(
		req, QJsonDocument(body).toJson(QJsonDocument::Compact));
	QObject::connect(reply, &QNetworkReply::finished, reply, &QObject::deleteLater);
	return reply;
}

int httpStatus(const QNetworkReply *reply)
{
	return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

}
