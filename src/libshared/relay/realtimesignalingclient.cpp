// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/relay/realtimesignalingclient.h"
#include "libshared/util/networkaccess.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimerEvent>
#include <QUrlQuery>
#include <QWebSocket>

namespace relay {

namespace {
const QString CHANNEL_TOPIC = QStringLiteral("realtime:host-channel");
const QString PHOENIX_TOPIC = QStringLiteral("phoenix");
}

RealtimeSignalingClient::RealtimeSignalingClient(
	const RelayCredentials &credentials, const QString &table, QObject *parent)
	: SignalingClient(parent)
	, m_credentials(credentials)
	, m_table(table)
	, m_socket(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
	, m_ref(0)
	, m_heartbeatTimer(0)
	, m_joined(false)
	, m_closing(false)
{
	connect(
		m_socket, &QWebSocket::connected, this,
		&RealtimeSignalingClient::onConnected);
	connect(
		m_socket, &QWebSocket::disconnected, this,
		&RealtimeSignalingClient::onDisconnected);
	connect(
		m_socket, &QWebSocket::textMessageReceived, this,
		&RealtimeSignalingClient::onTextMessage);
#if QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
	connect(
		m_socket, &QWebSocket::errorOccurred, this,
		&RealtimeSignalingClient::onSocketError);
#else
	connect(
		m_socket,
		QOverload<QAbstractSocket::SocketError>::of(&QWebSocket::error), this,
		&RealtimeSignalingClient::onSocketError);
#endif
}

RealtimeSignalingClient::~RealtimeSignalingClient()
{
	m_closing = true;
	m_socket->abort();
}

QUrl RealtimeSignalingClient::websocketUrl() const
{
	QUrl url = m_credentials.url;
	url.setScheme(
		url.scheme() == QStringLiteral("http") ? QStringLiteral("ws")
											   : QStringLiteral("wss"));
	QString path = url.path();
	if(path.endsWith('/'))
		path.chop(1);
	url.setPath(path + QStringLiteral("/realtime/v1/websocket"));

	QUrlQuery q;
	q.addQueryItem(QStringLiteral("apikey"), m_credentials.key);
	q.addQueryItem(QStringLiteral("vsn"), QStringLiteral("1.0.0"));
	url.setQuery(q);
	return url;
}

QUrl RealtimeSignalingClient::restUrl() const
{
	QUrl url = m_credentials.url;
	QString path = url.path();
	if(path.endsWith('/'))
		path.chop(1);
	url.setPath(path + QStringLiteral("/rest/v1/") + m_table);
	return url;
}

QString RealtimeSignalingClient::nextRef()
{
	return QString::number(++m_ref);
}

void RealtimeSignalingClient::publish(
	const QString &type, const QString &source, const QString &target,
	const QJsonObject &payload)
{
	QNetworkRequest req =
		networkaccess::jsonRequest(restUrl(), RegistrationApi::DEFAULT_TIMEOUT);
	req.setRawHeader("apikey", m_credentials.key.toUtf8());
	req.setRawHeader("Authorization", "Bearer " + m_credentials.key.toUtf8());
	req.setRawHeader("Prefer", "return=minimal");

	const SignalRow row{source, target, type, payload};
	QNetworkReply *reply = networkaccess::postJson(req, row.toJson());
	connect(reply, &QNetworkReply::finished, this, [this, reply, type, target]() {
		if(reply->error() != QNetworkReply::NoError) {
			const int status = networkaccess::httpStatus(reply);
			const QString error =
				QStringLiteral("publishing %1 to %2 failed (%3): %4")
					.arg(type, target)
					.arg(status)
					.arg(reply->errorString());
			emit publishFailed(error);
		}
	});
}

QJsonObject RealtimeSignalingClient::makeJoinMessage(
	const QString &targetId, const QString &ref) const
{
	const QJsonObject change{
		{QStringLiteral("event"), QStringLiteral("INSERT")},
		{QStringLiteral("schema"), QStringLiteral("public")},
		{QStringLiteral("table"), m_table},
		{QStringLiteral("filter"), QStringLiteral("target=eq.%1").arg(targetId)},
	};

	const QJsonObject config{
		{QStringLiteral("broadcast"), QJsonObject{{QStringLiteral("self"), false}}},
		{QStringLiteral("presence"), QJsonObject{{QStringLiteral("key"), QString()}}},
		{QStringLiteral("postgres_changes"), QJsonArray{change}},
	};

	return QJsonObject{
		{QStringLiteral("topic"), CHANNEL_TOPIC},
		{QStringLiteral("event"), QStringLiteral("phx_join")},
		{QStringLiteral("payload"),
		 QJsonObject{
			 {QStringLiteral("config"), config},
			 {QStringLiteral("access_token"), m_credentials.key},
		 }},
		{QStringLiteral("ref"), ref},
		{QStringLiteral("join_ref"), ref},
	};
}

void RealtimeSignalingClient::subscribe(const QString &targetId)
{
	unsubscribe();
	m_target = targetId;
	m_closing = false;
	m_socket->open(websocketUrl());
}

void RealtimeSignalingClient::unsubscribe()
{
	if(m_heartbeatTimer) {
		killTimer(m_heartbeatTimer);
		m_heartbeatTimer = 0;
	}

	m_joined = false;
	m_joinRef.clear();
	if(m_socket->state() != QAbstractSocket::UnconnectedState) {
		m_closing = true;
		m_socket->close();
	}
}

void RealtimeSignalingClient::send(const QJsonObject &message)
{
	m_socket->sendTextMessage(QString::fromUtf8(
		QJsonDocument(message).toJson(QJsonDocument::Compact)));
}

void RealtimeSignalingClient::onConnected()
{
	m_joinRef = nextRef();
	send(makeJoinMessage(m_target, m_joinRef));
	m_heartbeatTimer = startTimer(HEARTBEAT_INTERVAL);
}

void RealtimeSignalingClient::onDisconnected()
{
	if(m_heartbeatTimer) {
		killTimer(m_heartbeatTimer);
		m_heartbeatTimer = 0;
	}
	m_joined = false;

	if(!m_closing) {
		emit connectionLost(
			QStringLiteral("relay connection closed: %1")
				.arg(m_socket->closeReason()));
	}
}

void RealtimeSignalingClient::onSocketError(QAbstractSocket::SocketError error)
{
	Q_UNUSED(error);
	if(!m_closing) {
		qWarning(
			"Signaling socket error: %s", qUtf8Printable(m_socket->errorString()));
	}
}

void RealtimeSignalingClient::timerEvent(QTimerEvent *e)
{
	if(e->timerId() == m_heartbeatTimer) {
		send(QJsonObject{
			{QStringLiteral("topic"), PHOENIX_TOPIC},
			{QStringLiteral("event"), QStringLiteral("heartbeat")},
			{QStringLiteral("payload"), QJsonObject()},
			{QStringLiteral("ref"), nextRef()},
		});
	} else {
		SignalingClient::timerEvent(e);
	}
}

void RealtimeSignalingClient::onTextMessage(const QString &text)
{
	QJsonParseError err;
	const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
	if(err.error != QJsonParseError::NoError || !doc.isObject()) {
		qWarning("Unparseable relay message: %s", qUtf8Printable(err.errorString()));
		return;
	}

	const QJsonObject msg = doc.object();
	const QString topic = msg.value(QStringLiteral("topic")).toString();
	const QString event = msg.value(QStringLiteral("event")).toString();
	const QJsonObject payload = msg.value(QStringLiteral("payload")).toObject();

	if(topic != CHANNEL_TOPIC)
		return;

	if(event == QStringLiteral("phx_reply")) {
		if(msg.value(QStringLiteral("ref")).toString() != m_joinRef)
			return;

		if(payload.value(QStringLiteral("status")).toString() ==
		   QStringLiteral("ok")) {
			m_joined = true;
			emit subscribed();
		} else {
			const QString reason = QString::fromUtf8(
				QJsonDocument(payload.value(QStringLiteral("response")).toObject())
					.toJson(QJsonDocument::Compact));
			unsubscribe();
			emit connectionLost(
				QStringLiteral("relay refused subscription: %1").arg(reason));
		}

	} else if(event == QStringLiteral("postgres_changes")) {
		handleChange(payload);

	} else if(event == QStringLiteral("phx_error") || event == QStringLiteral("phx_close")) {
		unsubscribe();
		emit connectionLost(QStringLiteral("relay channel closed (%1)").arg(event));
	}
}

void RealtimeSignalingClient::handleChange(const QJsonObject &payload)
{
	const QJsonObject data = payload.value(QStringLiteral("data")).toObject();
	QJsonObject record = data.value(QStringLiteral("record")).toObject();
	if(record.isEmpty())
		record = data.value(QStringLiteral("new")).toObject();

	if(record.isEmpty()) {
		qWarning("Relay change event without a record");
		return;
	}

	const SignalRow row = SignalRow::fromJson(record);
	if(row.target != m_target)
		return;

	emit rowInserted(row);
}

}
