// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_NET_PEERCHANNEL_H
#define NR_SHARED_NET_PEERCHANNEL_H
#include <QByteArray>
#include <QJsonObject>
#include <QObject>

namespace net {

/**
 * @brief A direct message channel to one remote peer
 *
 * The channel is set up from the remote side's connection offer. Once the
 * local answer is ready it must be delivered to the remote side through
 * the signaling relay, after which the channel eventually opens (or fails).
 *
 * Messages are delivered whole, but a single message may be at most
 * maxMessageSize() bytes long. Larger payloads must be split into frames.
 */
class PeerChannel : public QObject {
	Q_OBJECT
public:
	enum class State {
		New,		// offer not yet accepted
		Connecting, // negotiating the connection
		Open,		// messages can be sent
		Closed,		// closed or failed, this channel cannot be reused
	};
	Q_ENUM(State)

	explicit PeerChannel(QObject *parent = nullptr);

	State state() const { return m_state; }

	/**
	 * @brief Start negotiating a connection from a remote offer
	 *
	 * Emits answerReady when the local connection descriptor has been
	 * generated, or channelError if the offer was unusable.
	 */
	virtual void acceptOffer(const QJsonObject &offer) = 0;

	/**
	 * @brief Send one message
	 *
	 * @return false if the message couldn't be sent
	 */
	virtual bool sendMessage(const QByteArray &message, QString *errorMessage) = 0;

	//! Largest message that can be passed to sendMessage
	virtual int maxMessageSize() const = 0;

	//! Close the channel. Emits closed() if it wasn't closed already.
	void close();

signals:
	void answerReady(const QJsonObject &answer);
	void opened();
	void messageReceived(const QByteArray &message);
	void channelError(const QString &message);
	void closed();

protected:
	void setState(State state);

	//! Release transport resources. Called once when the channel closes.
	virtual void closeTransport() = 0;

private:
	State m_state;
};

}

#endif
