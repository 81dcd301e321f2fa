// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_PEERSESSION_H
#define NR_HOST_PEERSESSION_H
#include "libhost/accesscontrol.h"
#include "libhost/hostlog.h"
#include "libshared/net/envelope.h"
#include <QJsonObject>
#include <QObject>

namespace net {
class PeerChannel;
}

namespace relay {
class SignalingClient;
}

namespace host {

class CommandDispatcher;

/**
 * @brief One remote peer's connection
 *
 * A session starts from a connection offer. The answer is published through
 * the signaling relay and, once the direct channel is open, the first
 * command must be a handshake. Until the handshake succeeds, nothing but
 * the handshake is processed. Authentication happens at most once per
 * session and can't be undone: a session that has been granted access
 * keeps that access level until it closes.
 *
 * Handshake acknowledgements and errors sent before authentication are
 * sent as single unframed messages. Every command response is sent as
 * chunked frames.
 */
class PeerSession final : public QObject {
	Q_OBJECT
public:
	enum class AuthState {
		Unauthenticated,
		AuthenticatedReadWrite,
		AuthenticatedReadOnly,
	};
	Q_ENUM(AuthState)

	static constexpr int DEFAULT_IDLE_TIMEOUT = 30000;
	static constexpr int DEFAULT_DENY_GRACE = 1000;

	/**
	 * @brief Create a new session
	 *
	 * The session takes ownership of the channel. The other collaborators
	 * must outlive the session.
	 */
	PeerSession(
		const QString &remoteId, net::PeerChannel *channel,
		relay::SignalingClient *signaling, const AuthResolver *auth,
		CommandDispatcher *dispatcher, HostLog *logger,
		QObject *parent = nullptr);
	~PeerSession() override;

	//! Time an unauthenticated session may stay open (milliseconds)
	void setIdleTimeout(int msecs);

	//! Time between sending a denial and closing the session (milliseconds)
	void setDenyGraceDelay(int msecs);

	//! Pause between outbound frames (milliseconds)
	void setFrameInterval(int msecs);

	//! Maximum amount of partially received message text
	void setMaxReassemblySize(qint64 size);

	/**
	 * @brief Accept the remote offer and start connecting
	 */
	void start(const QJsonObject &offer);

	//! Correspondent address this session answers to
	QString remoteId() const;

	AuthState authState() const;
	bool isAuthenticated() const;
	bool isReadOnly() const;
	bool isClosed() const;

	//! Authenticated identity, or "unknown"
	QString identity() const;

	/**
	 * @brief Send a single unframed envelope
	 *
	 * This works in every state, so errors can always reach the peer.
	 */
	bool sendControl(const net::Envelope &envelope);

	/**
	 * @brief Send an envelope as paced PART frames
	 *
	 * Only ERROR envelopes may be sent before the session is authenticated.
	 */
	bool sendChunked(const net::Envelope &envelope);

	net::PeerChannel *channel() const;

public slots:
	//! Close the session and its channel
	void close(const QString &reason);

signals:
	void authenticated(const QString &identity, bool readOnly);
	void closed(host::PeerSession *session);

private slots:
	void onAnswerReady(const QJsonObject &answer);
	void onChannelOpened();
	void onMessageReceived(const QByteArray &message);
	void onChannelError(const QString &message);
	void onChannelClosed();
	void onSendFailed(const QString &message);
	void onIdleTimeout();

private:
	void handleCommand(const net::Command &command);
	void handleHandshake(const net::Command &command);
	void sendError(const QString &message, const QJsonValue &requestId);
	void log(Log entry) const;

	struct Private;
	Private *d;
};

}

#endif
