// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_RELAY_REALTIMESIGNALINGCLIENT_H
#define NR_SHARED_RELAY_REALTIMESIGNALINGCLIENT_H
#include "libshared/relay/registrationapi.h"
#include "libshared/relay/signalingclient.h"
#include <QAbstractSocket>

class QWebSocket;

namespace relay {

/**
 * @brief Signaling client for a hosted realtime database relay
 *
 * Rows are appended with a plain REST insert into the signaling table.
 * New rows are received by joining a realtime channel over a WebSocket
 * (Phoenix channel protocol) with a change filter on the target column.
 */
class RealtimeSignalingClient final : public SignalingClient {
	Q_OBJECT
public:
	//! How often the channel heartbeat is sent (milliseconds)
	static constexpr int HEARTBEAT_INTERVAL = 25000;

	RealtimeSignalingClient(
		const RelayCredentials &credentials, const QString &table,
		QObject *parent = nullptr);
	~RealtimeSignalingClient() override;

	void publish(
		const QString &type, const QString &source, const QString &target,
		const QJsonObject &payload) override;

	void subscribe(const QString &targetId) override;
	void unsubscribe() override;
	bool isSubscribed() const override { return m_joined; }
	QString targetId() const override { return m_target; }

	//! Address of the realtime WebSocket endpoint
	QUrl websocketUrl() const;

	//! Address of the REST endpoint rows are inserted into
	QUrl restUrl() const;

	//! The channel join message for the given target
	QJsonObject makeJoinMessage(const QString &targetId, const QString &ref) const;

protected:
	void timerEvent(QTimerEvent *e) override;

private slots:
	void onConnected();
	void onDisconnected();
	void onTextMessage(const QString &text);
	void onSocketError(QAbstractSocket::SocketError error);

private:
	void send(const QJsonObject &message);
	void handleChange(const QJsonObject &payload);
	QString nextRef();

	RelayCredentials m_credentials;
	QString m_table;
	QWebSocket *m_socket;
	QString m_target;
	QString m_joinRef;
	int m_ref;
	int m_heartbeatTimer;
	bool m_joined;
	bool m_closing;
};

}

#endif
