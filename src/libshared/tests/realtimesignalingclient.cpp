// SPDX-License-Identifier: GPL-3.0-or-later

#include "libshared/relay/realtimesignalingclient.h"

#include <QtTest/QtTest>

using relay::RealtimeSignalingClient;
using relay::RelayCredentials;

class TestRealtimeSignalingClient final : public QObject
{
	Q_OBJECT
private slots:
	void testUrls()
	{
		RelayCredentials c;
		c.url = QUrl("https://relay.example.com/");
		c.key = "anon-key";

		RealtimeSignalingClient client(c, "signaling");
		QVERIFY(!client.isSubscribed());

		const QUrl ws = client.websocketUrl();
		QCOMPARE(ws.scheme(), QString("wss"));
		QCOMPARE(ws.host(), QString("relay.example.com"));
		QCOMPARE(ws.path(), QString("/realtime/v1/websocket"));
		const QUrlQuery q(ws);
		QCOMPARE(q.queryItemValue("apikey"), QString("anon-key"));
		QCOMPARE(q.queryItemValue("vsn"), QString("1.0.0"));

		QCOMPARE(client.restUrl(), QUrl("https://relay.example.com/rest/v1/signaling"));

		c.url = QUrl("http://localhost:54321");
		RealtimeSignalingClient local(c, "signals");
		QCOMPARE(local.websocketUrl().scheme(), QString("ws"));
		QCOMPARE(local.restUrl(), QUrl("http://localhost:54321/rest/v1/signals"));
	}

	void testJoinMessage()
	{
		RelayCredentials c;
		c.url = QUrl("https://relay.example.com");
		c.key = "anon-key";
		RealtimeSignalingClient client(c, "signaling");

		const QJsonObject join = client.makeJoinMessage("node-42", "7");
		QCOMPARE(join["event"].toString(), QString("phx_join"));
		QCOMPARE(join["topic"].toString(), QString("realtime:host-channel"));
		QCOMPARE(join["ref"].toString(), QString("7"));

		const QJsonObject payload = join["payload"].toObject();
		QCOMPARE(payload["access_token"].toString(), QString("anon-key"));

		const QJsonArray changes = payload["config"].toObject()["postgres_changes"].toArray();
		QCOMPARE(changes.size(), 1);
		const QJsonObject change = changes.first().toObject();
		QCOMPARE(change["event"].toString(), QString("INSERT"));
		QCOMPARE(change["table"].toString(), QString("signaling"));
		QCOMPARE(change["filter"].toString(), QString("target=eq.node-42"));
	}

	void testSignalRow()
	{
		const relay::SignalRow row = relay::SignalRow::fromJson(QJsonObject{
			{"source", "peer-1"}, {"target", "host"}, {"type", "offer"},
			{"payload", QJsonObject{{"sdp", "v=0"}}},
		});
		QVERIFY(row.isOffer());
		QCOMPARE(row.payload["sdp"].toString(), QString("v=0"));
		QCOMPARE(row.toJson()["source"].toString(), QString("peer-1"));
	}
};


QTEST_MAIN(TestRealtimeSignalingClient)
#include "realtimesignalingclient.moc"
