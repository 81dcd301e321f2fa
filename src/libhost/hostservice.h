// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_HOSTSERVICE_H
#define NR_HOST_HOSTSERVICE_H
#include "libshared/relay/registrationapi.h"
#include "libshared/relay/signalingclient.h"
#include <QList>
#include <QObject>
#include <functional>

class QTimer;

namespace net {
class PeerChannel;
}

namespace host {

class AuthResolver;
class CommandDispatcher;
class ContentRenderer;
class HostConfig;
class HostLog;
class LivenessManager;
class PeerSession;
class VaultStorage;

/**
 * @brief The remote access host
 *
 * Bootstraps the relay credentials, registers the vault, subscribes to
 * connection offers and runs one peer session per accepted offer. If
 * registration fails the host still listens under the fallback signal ID
 * and keeps retrying the registration in the background, unless the
 * registration service rejected the owner's credentials.
 */
class HostService final : public QObject {
	Q_OBJECT
public:
	enum class Status {
		NotConfigured,
		Verifying,
		Active,	   // listening under the fallback ID
		ProActive, // listening under a registered signal ID
		Linked,	   // at least one peer is authenticated
		Error,
		Disconnected,
	};
	Q_ENUM(Status)

	//! Delay before retrying a failed relay bootstrap
	static constexpr int RETRY_DELAY = 30 * 1000;

	using ChannelFactory = std::function<net::PeerChannel *(
		const relay::RelayCredentials &credentials)>;
	using SignalingFactory = std::function<relay::SignalingClient *(
		const relay::RelayCredentials &credentials)>;

	HostService(
		HostConfig *config, VaultStorage *storage, relay::RegistrationApi *api,
		QObject *parent = nullptr);
	~HostService() override;

	void setChannelFactory(const ChannelFactory &factory) { m_channelFactory = factory; }
	void setSignalingFactory(const SignalingFactory &factory) { m_signalingFactory = factory; }
	void setRenderer(ContentRenderer *renderer);

	//! Set the delay before a failed bootstrap or registration is retried
	void setRetryDelay(int msecs);
	int retryDelay() const;

	/**
	 * @brief Start the host
	 *
	 * @return false if remote access is disabled or not configured
	 */
	bool start();

	//! Close all sessions and stop listening
	void stop();

	Status status() const { return m_status; }
	QString statusText() const;

	QString signalId() const { return m_signalId; }
	bool isRegistered() const { return m_registered; }

	relay::RelayCredentials relayCredentials() const { return m_credentials; }

	int sessionCount() const { return m_sessions.size(); }
	QList<PeerSession *> sessions() const { return m_sessions; }

	AuthResolver *authResolver() const { return m_auth; }
	CommandDispatcher *dispatcher() const { return m_dispatcher; }
	LivenessManager *liveness() const { return m_liveness; }
	relay::SignalingClient *signaling() const { return m_signaling; }

public slots:
	/**
	 * @brief Tear down registration and signaling and set them up again
	 *
	 * Open peer sessions are left alone.
	 */
	void reconnect();

	//! Forget the relay credentials and fetch them again
	void refreshRelayCredentials();

	//! The host woke up from suspend or was asked to check its health
	void wake();

signals:
	void statusChanged(host::HostService::Status status, const QString &text);

private slots:
	void onRowInserted(const relay::SignalRow &row);
	void onSubscribed();
	void onConnectionLost(const QString &message);
	void onPublishFailed(const QString &message);
	void onRegistrationRejected(const QString &message);
	void onSessionAuthenticated(const QString &identity, bool readOnly);
	void onSessionClosed(host::PeerSession *session);
	void reloadAccess();
	void retry();

private:
	void connectRelay();
	void registerVault();
	void refreshTurnCredentials();
	void subscribe();
	void teardown();
	void scheduleRetry();
	void retryRegistrationNow();
	void updateListeningStatus();
	const PeerSession *linkedSession() const;
	void setStatus(Status status, const QString &detail = QString());
	HostLog *logger() const;

	HostConfig *m_config;
	VaultStorage *m_storage;
	relay::RegistrationApi *m_api;
	AuthResolver *m_auth;
	CommandDispatcher *m_dispatcher;
	LivenessManager *m_liveness;
	relay::SignalingClient *m_signaling;
	QList<relay::SignalingClient *> m_retiredSignaling;
	QTimer *m_retryTimer;

	ChannelFactory m_channelFactory;
	SignalingFactory m_signalingFactory;

	relay::RelayCredentials m_credentials;
	QList<PeerSession *> m_sessions;
	QString m_signalId;
	QString m_statusDetail;
	Status m_status;
	int m_generation;
	bool m_registered;
	bool m_running;
};

}

#endif
