// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_RELAY_SIGNALINGCLIENT_H
#define NR_SHARED_RELAY_SIGNALINGCLIENT_H
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace relay {

//! Source identifier used for every row this host publishes
extern const char HOST_SOURCE_ID[];

//! Signal ID subscribed to when the host is not registered
extern const char FALLBACK_SIGNAL_ID[];

/**
 * @brief One row of the shared signaling store
 */
struct SignalRow {
	QString source;
	QString target;
	QString type; // "offer" or "answer"
	QJsonObject payload;

	bool isOffer() const { return type == QStringLiteral("offer"); }

	QJsonObject toJson() const;
	static SignalRow fromJson(const QJsonObject &obj);
};

/**
 * @brief Client of the signaling relay
 *
 * The relay is an append-only message store. Publishing appends a row,
 * subscribing delivers every row appended afterwards whose target matches
 * the subscribed ID. Nothing is acknowledged and delivery isn't
 * guaranteed.
 */
class SignalingClient : public QObject {
	Q_OBJECT
public:
	explicit SignalingClient(QObject *parent = nullptr)
		: QObject(parent)
	{
	}

	/**
	 * @brief Append a row to the relay store
	 *
	 * Emits publishFailed if the row couldn't be stored.
	 */
	virtual void publish(
		const QString &type, const QString &source, const QString &target,
		const QJsonObject &payload) = 0;

	/**
	 * @brief Start receiving rows addressed to the given target
	 *
	 * Replaces any previous subscription. Emits subscribed() once rows
	 * are being delivered, or connectionLost() if that failed.
	 */
	virtual void subscribe(const QString &targetId) = 0;

	//! Stop receiving rows
	virtual void unsubscribe() = 0;

	virtual bool isSubscribed() const = 0;

	//! Currently subscribed target ID
	virtual QString targetId() const = 0;

signals:
	//! A new row addressed to the subscribed target was appended
	void rowInserted(const relay::SignalRow &row);

	void subscribed();
	void publishFailed(const QString &errorMessage);
	void connectionLost(const QString &errorMessage);
};

}

Q_DECLARE_METATYPE(relay::SignalRow)

#endif
