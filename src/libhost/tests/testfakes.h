// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_TESTS_TESTFAKES_H
#define NR_HOST_TESTS_TESTFAKES_H

#include "libhost/notemetadata.h"
#include "libhost/vaultstorage.h"
#include "libshared/net/peerchannel.h"
#include "libshared/relay/registrationapi.h"
#include "libshared/relay/signalingclient.h"
#include "libshared/util/vaultpath.h"

#include <QJsonDocument>
#include <QMap>
#include <QQueue>
#include <QSet>
#include <QTimer>

namespace testfakes {

/**
 * @brief Vault kept in memory that counts every modification
 */
class MemoryVault final : public host::VaultStorage {
public:
	void put(const QString &path, const QString &text) { m_files[path] = text.toUtf8(); }
	void putBinary(const QString &path, const QByteArray &data) { m_files[path] = data; }
	void putFolder(const QString &path) { m_folders.insert(path); }

	int writeCount() const { return m_writes; }
	QString content(const QString &path) const { return QString::fromUtf8(m_files.value(path)); }

	bool exists(const QString &path) const override
	{
		return m_files.contains(path) || isFolder(path);
	}

	bool isFolder(const QString &path) const override
	{
		if(m_folders.contains(path))
			return true;
		const QString prefix = path + '/';
		for(const QString &f : m_files.keys()) {
			if(f.startsWith(prefix))
				return true;
		}
		return false;
	}

	QStringList files() const override
	{
		++listings;
		return m_files.keys();
	}

	QStringList folders() const override
	{
		QSet<QString> all = m_folders;
		for(const QString &f : m_files.keys()) {
			QString parent = vaultpath::parentPath(f);
			while(!parent.isEmpty()) {
				all.insert(parent);
				parent = vaultpath::parentPath(parent);
			}
		}
		QStringList list = all.values();
		list.sort();
		return list;
	}

	bool readText(const QString &path, QString &text, QString *errorMessage) const override
	{
		if(!m_files.contains(path)) {
			if(errorMessage)
				*errorMessage = "no such file";
			return false;
		}
		text = QString::fromUtf8(m_files.value(path));
		return true;
	}

	bool readBinary(const QString &path, QByteArray &data, QString *errorMessage) const override
	{
		if(!m_files.contains(path)) {
			if(errorMessage)
				*errorMessage = "no such file";
			return false;
		}
		data = m_files.value(path);
		return true;
	}

	bool writeText(const QString &path, const QString &text, QString *) override
	{
		++m_writes;
		m_files[path] = text.toUtf8();
		return true;
	}

	bool createFile(const QString &path, const QString &text, QString *) override
	{
		++m_writes;
		m_files[path] = text.toUtf8();
		return true;
	}

	bool createFolder(const QString &path, QString *) override
	{
		++m_writes;
		m_folders.insert(path);
		return true;
	}

	bool rename(const QString &path, const QString &newPath, QString *errorMessage) override
	{
		++m_writes;
		if(!m_files.contains(path)) {
			if(errorMessage)
				*errorMessage = "no such file";
			return false;
		}
		m_files[newPath] = m_files.take(path);
		return true;
	}

	bool remove(const QString &path, QString *) override
	{
		++m_writes;
		m_files.remove(path);
		m_folders.remove(path);
		return true;
	}

	host::FileMetadata metadata(const QString &path) const override
	{
		return host::notemeta::extract(QString::fromUtf8(m_files.value(path)));
	}

	QString resolveLink(const QString &link, const QString &) const override
	{
		const QString target = link.section('#', 0, 0).section('|', 0, 0);
		if(m_files.contains(target))
			return target;
		if(m_files.contains(target + ".md"))
			return target + ".md";
		for(const QString &f : m_files.keys()) {
			if(vaultpath::fileName(f) == target || vaultpath::fileName(f) == target + ".md")
				return f;
		}
		return QString();
	}

	//! Number of times the whole vault was listed
	mutable int listings = 0;

private:
	QMap<QString, QByteArray> m_files;
	QSet<QString> m_folders;
	int m_writes = 0;
};

/**
 * @brief Peer channel that records what is sent
 *
 * The answer is produced as soon as the offer is accepted. The test opens
 * the channel and delivers messages explicitly.
 */
class FakePeerChannel final : public net::PeerChannel {
	Q_OBJECT
public:
	explicit FakePeerChannel(QObject *parent = nullptr) : net::PeerChannel(parent) { }

	void acceptOffer(const QJsonObject &offer) override
	{
		acceptedOffer = offer;
		setState(State::Connecting);
		emit answerReady(QJsonObject{{"sdp", "answer-sdp"}});
	}

	bool sendMessage(const QByteArray &message, QString *) override
	{
		sent << message;
		return true;
	}

	int maxMessageSize() const override { return 65000; }

	void open() { setState(State::Open); }

	void deliver(const QJsonObject &obj)
	{
		emit messageReceived(QJsonDocument(obj).toJson(QJsonDocument::Compact));
	}

	void deliverRaw(const QByteArray &data) { emit messageReceived(data); }

	QList<QJsonObject> sentObjects() const
	{
		QList<QJsonObject> objs;
		for(const QByteArray &m : sent)
			objs << QJsonDocument::fromJson(m).object();
		return objs;
	}

	QJsonObject lastSent() const
	{
		return sent.isEmpty() ? QJsonObject() : QJsonDocument::fromJson(sent.last()).object();
	}

	QJsonObject acceptedOffer;
	QList<QByteArray> sent;
	int closeCount = 0;

protected:
	void closeTransport() override { ++closeCount; }
};

/**
 * @brief Signaling relay that records publications
 */
class FakeSignalingClient final : public relay::SignalingClient {
	Q_OBJECT
public:
	struct Published {
		QString type;
		QString source;
		QString target;
		QJsonObject payload;
	};

	explicit FakeSignalingClient(QObject *parent = nullptr) : relay::SignalingClient(parent) { }

	void publish(const QString &type, const QString &source, const QString &target, const QJsonObject &payload) override
	{
		published << Published{type, source, target, payload};
	}

	void subscribe(const QString &targetId) override
	{
		m_target = targetId;
		m_subscribed = true;
		++subscribeCount;
		emit subscribed();
	}

	void unsubscribe() override { m_subscribed = false; }
	bool isSubscribed() const override { return m_subscribed; }
	QString targetId() const override { return m_target; }

	void offer(const QString &source, const QJsonObject &payload = QJsonObject{{"sdp", "offer-sdp"}})
	{
		emit rowInserted(relay::SignalRow{source, m_target, "offer", payload});
	}

	void loseConnection() { m_subscribed = false; emit connectionLost("socket closed"); }

	QList<Published> published;
	int subscribeCount = 0;

private:
	QString m_target;
	bool m_subscribed = false;
};

/**
 * @brief Registration service with scripted replies
 *
 * Replies are delivered from the event loop, never synchronously. Calls
 * without a scripted reply succeed with a default result.
 */
class FakeRegistrationApi final : public relay::RegistrationApi {
	Q_OBJECT
public:
	struct Reply {
		QVariant result;
		QString error;
		int httpStatus = 0;
	};

	FakeRegistrationApi() : relay::RegistrationApi(QUrl("https://api.test/")) { }

	static Reply ok(const QVariant &result = true) { return Reply{result, QString(), 200}; }
	static Reply fail(const QString &error, int status = 0) { return Reply{QVariant(), error, status}; }

	relay::ApiResponse *registerVault(const relay::VaultRegistration &reg) override
	{
		registrations << reg;
		relay::RegistrationResult r{reg.signalId, reg.vaultId, "user-1"};
		return respond(registerReplies, ok(QVariant::fromValue(r)));
	}

	relay::ApiResponse *heartbeat(const QString &, const QString &, const QString &signalId) override
	{
		heartbeatSignalIds << signalId;
		return respond(heartbeatReplies, ok());
	}

	relay::ApiResponse *fetchTurnCredentials(const QString &) override
	{
		++turnRequests;
		return respond(turnReplies, ok(QJsonArray{QJsonObject{{"urls", "turn:turn.test:3478"}}}));
	}

	relay::ApiResponse *fetchRelayCredentials(const QString &, const QString &) override
	{
		++relayRequests;
		relay::RelayCredentials c;
		c.url = QUrl("https://relay.test");
		c.key = "anon";
		return respond(relayReplies, ok(QVariant::fromValue(c)));
	}

	QQueue<Reply> registerReplies;
	QQueue<Reply> heartbeatReplies;
	QQueue<Reply> turnReplies;
	QQueue<Reply> relayReplies;

	QList<relay::VaultRegistration> registrations;
	QStringList heartbeatSignalIds;
	int turnRequests = 0;
	int relayRequests = 0;

private:
	relay::ApiResponse *respond(QQueue<Reply> &queue, const Reply &fallback)
	{
		const Reply reply = queue.isEmpty() ? fallback : queue.dequeue();
		relay::ApiResponse *res = new relay::ApiResponse(baseUrl());
		QTimer::singleShot(0, res, [res, reply]() {
			if(reply.error.isEmpty())
				res->setResult(reply.result);
			else
				res->setError(reply.error, reply.httpStatus);
		});
		return res;
	}
};

}

#endif
