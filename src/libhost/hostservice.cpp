// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/hostservice.h"
#include "libhost/accesscontrol.h"
#include "libhost/commanddispatcher.h"
#include "libhost/hostconfig.h"
#include "libhost/hostlog.h"
#include "libhost/livenessmanager.h"
#include "libhost/peersession.h"
#include "libhost/vaultstorage.h"
#include "libshared/net/iceserver.h"
#include "libshared/net/datachannelpeer.h"
#include "libshared/relay/realtimesignalingclient.h"
#include "libshared/util/credentials.h"
#include <QDir>
#include <QSysInfo>
#include <QTimer>

namespace host {

HostService::HostService(
	HostConfig *config, VaultStorage *storage, relay::RegistrationApi *api,
	QObject *parent)
	: QObject(parent)
	, m_config(config)
	, m_storage(storage)
	, m_api(api)
	, m_signaling(nullptr)
	, m_status(Status::Disconnected)
	, m_generation(0)
	, m_registered(false)
	, m_running(false)
{
	m_auth = new AuthResolver(this);
	m_dispatcher = new CommandDispatcher(storage, nullptr, config->logger());
	m_liveness = new LivenessManager(api, config->logger(), this);

	m_retryTimer = new QTimer(this);
	m_retryTimer->setSingleShot(true);
	m_retryTimer->setInterval(RETRY_DELAY);
	connect(m_retryTimer, &QTimer::timeout, this, &HostService::retry);

	connect(m_liveness, &LivenessManager::reconnectRequired, this, &HostService::reconnect);
	connect(m_liveness, &LivenessManager::registrationRejected, this, &HostService::onRegistrationRejected);
	// The liveness manager checks its own registration after waking up
	connect(m_liveness, &LivenessManager::wokeUp, this, &HostService::retryRegistrationNow);

	connect(m_config, &HostConfig::guestsChanged, this, &HostService::reloadAccess);
	connect(m_config, &HostConfig::configValueChanged, this, [this](int key) {
		if(key == config::Email.index || key == config::OwnerHash.index)
			reloadAccess();
		else if(key == config::AutoCreateMissing.index)
			m_dispatcher->setAutoCreateMissing(m_config->getConfigBool(config::AutoCreateMissing));
	});

	m_channelFactory = [this](const relay::RelayCredentials &credentials) -> net::PeerChannel* {
		QVector<net::IceServer> servers = net::parseIceServers(credentials.iceServers);
		if(servers.isEmpty()) {
			const QString stun = m_config->getConfigString(config::StunServer);
			const net::IceServer fallback = net::IceServer::stunFromHostPort(stun);
			if(!fallback.host.isEmpty())
				servers << fallback;
		}
		return new net::DataChannelPeer(servers);
	};

	m_signalingFactory = [this](const relay::RelayCredentials &credentials) -> relay::SignalingClient* {
		return new relay::RealtimeSignalingClient(
			credentials, m_config->getConfigString(config::SignalTable));
	};
}

HostService::~HostService()
{
	// Sessions refer to the dispatcher and the signaling client
	for(PeerSession *s : m_sessions) {
		s->disconnect(this);
		delete s;
	}
	m_sessions.clear();
	delete m_signaling;
	delete m_dispatcher;
}

HostLog *HostService::logger() const
{
	return m_config->logger();
}

void HostService::setRenderer(ContentRenderer *renderer)
{
	m_dispatcher->setRenderer(renderer);
}

void HostService::setRetryDelay(int msecs)
{
	m_retryTimer->setInterval(qMax(0, msecs));
}

int HostService::retryDelay() const
{
	return m_retryTimer->interval();
}

bool HostService::start()
{
	if(m_running)
		return true;

	if(!m_config->getConfigBool(config::EnableRemoteAccess)) {
		Log()
			.about(Log::Level::Info, Log::Topic::Status)
			.message(QStringLiteral("Remote access is disabled"))
			.to(logger());
		setStatus(Status::Disconnected);
		return false;
	}

	const IdentityRecord owner = m_config->ownerRecord();
	if(!owner.isConfigured()) {
		Log()
			.about(Log::Level::Error, Log::Topic::Status)
			.message(QStringLiteral("Owner identity or credential not configured"))
			.to(logger());
		setStatus(Status::NotConfigured);
		return false;
	}

	m_running = true;
	m_dispatcher->setAutoCreateMissing(m_config->getConfigBool(config::AutoCreateMissing));
	m_api->setRequestTimeout(m_config->getConfigTime(config::RequestTimeout) * 1000);
	m_liveness->setHeartbeatInterval(m_config->getConfigTime(config::HeartbeatInterval) * 1000);
	m_liveness->setStaleAfter(m_config->getConfigTime(config::StaleAfter) * 1000);
	m_liveness->setMaxConsecutiveFailures(m_config->getConfigInt(config::MaxHeartbeatFailures));
	m_liveness->setWakeDetectionEnabled(true);

	reloadAccess();
	connectRelay();
	return true;
}

void HostService::stop()
{
	if(!m_running)
		return;

	m_running = false;
	teardown();

	const QList<PeerSession *> sessions = m_sessions;
	for(PeerSession *s : sessions)
		s->close(QStringLiteral("host stopped"));

	m_liveness->setWakeDetectionEnabled(false);
	m_credentials = relay::RelayCredentials();
	setStatus(Status::Disconnected);
}

void HostService::teardown()
{
	// Responses to requests made before this point are ignored
	++m_generation;
	m_retryTimer->stop();
	m_liveness->stop();
	m_registered = false;
	m_signalId.clear();

	if(m_signaling) {
		m_signaling->disconnect(this);
		m_signaling->unsubscribe();
		// Open sessions still hold a pointer to the old client
		if(m_sessions.isEmpty())
			m_signaling->deleteLater();
		else
			m_retiredSignaling << m_signaling;
		m_signaling = nullptr;
	}
}

void HostService::reconnect()
{
	if(!m_running)
		return;

	Log()
		.about(Log::Level::Info, Log::Topic::Liveness)
		.message(QStringLiteral("Rebuilding registration and signaling"))
		.to(logger());

	teardown();
	connectRelay();
}

void HostService::refreshRelayCredentials()
{
	m_credentials = relay::RelayCredentials();
	reconnect();
}

void HostService::wake()
{
	if(!m_running)
		return;

	if(m_registered)
		m_liveness->checkHealth();
	else
		retryRegistrationNow();
}

void HostService::scheduleRetry()
{
	if(m_running)
		m_retryTimer->start();
}

void HostService::retryRegistrationNow()
{
	// Only a pending retry is brought forward
	if(m_running && m_retryTimer->isActive()) {
		m_retryTimer->stop();
		retry();
	}
}

void HostService::retry()
{
	if(!m_running)
		return;

	// While listening under the fallback ID only the registration is redone
	if(m_signaling && m_credentials.isValid() && !m_registered) {
		Log()
			.about(Log::Level::Info, Log::Topic::Liveness)
			.message(QStringLiteral("Retrying registration"))
			.to(logger());
		registerVault();
	} else {
		connectRelay();
	}
}

void HostService::reloadAccess()
{
	m_auth->setOwner(m_config->ownerRecord());
	m_auth->setGuests(m_config->guests());
}

void HostService::connectRelay()
{
	if(!m_running)
		return;

	if(!linkedSession())
		setStatus(Status::Verifying);

	if(m_credentials.isValid()) {
		registerVault();
		return;
	}

	const int generation = m_generation;
	relay::ApiResponse *res = m_api->fetchRelayCredentials(
		m_config->getConfigString(config::Email),
		m_config->getConfigString(config::VaultId));

	connect(
		res, &relay::ApiResponse::finished, this,
		[this, res, generation](const QVariant &result, const QString &, const QString &error) {
			res->deleteLater();
			if(generation != m_generation || !m_running)
				return;

			if(!error.isEmpty()) {
				Log()
					.about(Log::Level::Warn, Log::Topic::Signal)
					.message(QStringLiteral("Couldn't fetch relay credentials: %1").arg(error))
					.to(logger());
				setStatus(Status::Error, error);
				scheduleRetry();
				return;
			}

			m_credentials = result.value<relay::RelayCredentials>();
			if(!m_credentials.isValid()) {
				Log()
					.about(Log::Level::Warn, Log::Topic::Signal)
					.message(QStringLiteral("Registration service returned unusable relay credentials"))
					.to(logger());
				setStatus(Status::Error, QStringLiteral("bad relay credentials"));
				scheduleRetry();
				return;
			}

			registerVault();
		});
}

void HostService::registerVault()
{
	const IdentityRecord owner = m_config->ownerRecord();

	relay::VaultRegistration reg;
	reg.email = owner.email;
	reg.vaultId = owner.vaultId;
	reg.nodeId = owner.nodeId;
	reg.signalId = owner.nodeId;
	reg.hostname = QSysInfo::machineHostName();
	reg.vaultName = m_config->getConfigString(config::VaultName);
	if(reg.vaultName.isEmpty())
		reg.vaultName = QDir(m_config->getConfigString(config::VaultPath)).dirName();

	const int generation = m_generation;
	relay::ApiResponse *res = m_api->registerVault(reg);

	connect(
		res, &relay::ApiResponse::finished, this,
		[this, res, generation](const QVariant &result, const QString &, const QString &error) {
			res->deleteLater();
			if(generation != m_generation || !m_running)
				return;

			const QString previousSignalId = m_signalId;
			if(error.isEmpty()) {
				const relay::RegistrationResult r = result.value<relay::RegistrationResult>();
				m_signalId = r.signalId;
				m_registered = !m_signalId.isEmpty();
			}

			if(!m_registered) {
				m_signalId = QString::fromLatin1(relay::FALLBACK_SIGNAL_ID);
				if(res->isAuthRejection()) {
					Log()
						.about(Log::Level::Error, Log::Topic::Liveness)
						.message(QStringLiteral("Registration rejected, listening as \"%1\": %2")
									 .arg(m_signalId, error))
						.to(logger());
				} else {
					Log()
						.about(Log::Level::Warn, Log::Topic::Liveness)
						.message(QStringLiteral("Registration failed, listening as \"%1\" "
												"and retrying in %2 s: %3")
									 .arg(m_signalId)
									 .arg(m_retryTimer->interval() / 1000)
									 .arg(error.isEmpty() ? QStringLiteral("no signal ID") : error))
						.to(logger());
					scheduleRetry();
				}
			} else {
				Log()
					.about(Log::Level::Info, Log::Topic::Liveness)
					.message(QStringLiteral("Registered with signal ID %1").arg(m_signalId))
					.to(logger());
			}

			if(!m_signaling || m_signalId != previousSignalId) {
				refreshTurnCredentials();
				subscribe();
			}

			if(m_registered) {
				const IdentityRecord o = m_config->ownerRecord();
				m_liveness->start(o.email, o.vaultId, m_signalId);
			}
		});
}

void HostService::refreshTurnCredentials()
{
	const int generation = m_generation;
	relay::ApiResponse *res =
		m_api->fetchTurnCredentials(m_config->getConfigString(config::Email));

	connect(
		res, &relay::ApiResponse::finished, this,
		[this, res, generation](const QVariant &result, const QString &, const QString &error) {
			res->deleteLater();
			if(generation != m_generation)
				return;

			if(!error.isEmpty()) {
				// Not fatal: the relay's own ICE servers still work
				Log()
					.about(Log::Level::Warn, Log::Topic::Signal)
					.message(QStringLiteral("Couldn't fetch TURN credentials: %1").arg(error))
					.to(logger());
				return;
			}

			const QJsonArray servers = result.toJsonArray();
			if(!servers.isEmpty())
				m_credentials.iceServers = servers;
		});
}

void HostService::subscribe()
{
	if(!m_signaling) {
		m_signaling = m_signalingFactory(m_credentials);
		m_signaling->setParent(this);
		connect(m_signaling, &relay::SignalingClient::rowInserted, this, &HostService::onRowInserted);
		connect(m_signaling, &relay::SignalingClient::subscribed, this, &HostService::onSubscribed);
		connect(m_signaling, &relay::SignalingClient::connectionLost, this, &HostService::onConnectionLost);
		connect(m_signaling, &relay::SignalingClient::publishFailed, this, &HostService::onPublishFailed);
	}

	Log()
		.about(Log::Level::Debug, Log::Topic::Signal)
		.message(QStringLiteral("Subscribing to offers for %1").arg(m_signalId))
		.to(logger());
	m_signaling->subscribe(m_signalId);
}

void HostService::onSubscribed()
{
	Log()
		.about(Log::Level::Info, Log::Topic::Signal)
		.message(QStringLiteral("Listening for connections as %1").arg(m_signalId))
		.to(logger());
	updateListeningStatus();
}

void HostService::onConnectionLost(const QString &message)
{
	Log()
		.about(Log::Level::Warn, Log::Topic::Signal)
		.message(QStringLiteral("Signaling connection lost: %1").arg(message))
		.to(logger());

	if(m_sessions.isEmpty())
		setStatus(Status::Disconnected, message);

	// Resubscribe later with the same registration
	const int generation = m_generation;
	QTimer::singleShot(m_retryTimer->interval(), this, [this, generation]() {
		if(generation == m_generation && m_running && m_signaling)
			m_signaling->subscribe(m_signalId);
	});
}

void HostService::onPublishFailed(const QString &message)
{
	Log()
		.about(Log::Level::Warn, Log::Topic::Signal)
		.message(QStringLiteral("Couldn't publish answer: %1").arg(message))
		.to(logger());
}

void HostService::onRegistrationRejected(const QString &message)
{
	m_registered = false;
	setStatus(Status::Error, message);
}

void HostService::onRowInserted(const relay::SignalRow &row)
{
	if(!row.isOffer() || row.source.isEmpty())
		return;

	const int maxSessions = m_config->getConfigInt(config::MaxSessions);
	if(maxSessions > 0 && m_sessions.size() >= maxSessions) {
		Log()
			.about(Log::Level::Warn, Log::Topic::Session)
			.session(row.source)
			.message(QStringLiteral("Session limit (%1) reached, ignoring offer").arg(maxSessions))
			.to(logger());
		return;
	}

	for(const PeerSession *s : m_sessions) {
		if(s->remoteId() == row.source && !s->isClosed()) {
			Log()
				.about(Log::Level::Debug, Log::Topic::Session)
				.session(row.source)
				.message(QStringLiteral("Duplicate offer ignored"))
				.to(logger());
			return;
		}
	}

	net::PeerChannel *channel = m_channelFactory(m_credentials);
	PeerSession *session = new PeerSession(
		row.source, channel, m_signaling, m_auth, m_dispatcher, logger(), this);
	session->setIdleTimeout(m_config->getConfigTime(config::SessionIdleTimeout) * 1000);
	session->setDenyGraceDelay(m_config->getConfigInt(config::DenyGraceMs));
	session->setFrameInterval(m_config->getConfigInt(config::FrameIntervalMs));
	session->setMaxReassemblySize(m_config->getConfigSize(config::MaxReassemblySize));

	connect(session, &PeerSession::authenticated, this, &HostService::onSessionAuthenticated);
	connect(session, &PeerSession::closed, this, &HostService::onSessionClosed);

	m_sessions << session;

	Log()
		.about(Log::Level::Info, Log::Topic::Session)
		.session(row.source)
		.message(QStringLiteral("New connection offer (%1 sessions)").arg(m_sessions.size()))
		.to(logger());

	session->start(row.payload);
}

void HostService::onSessionAuthenticated(const QString &identity, bool readOnly)
{
	setStatus(
		Status::Linked,
		readOnly ? QStringLiteral("%1 (RO)").arg(identity) : identity);
}

void HostService::onSessionClosed(PeerSession *session)
{
	m_sessions.removeAll(session);
	session->disconnect(this);
	session->deleteLater();

	if(m_sessions.isEmpty()) {
		for(relay::SignalingClient *c : m_retiredSignaling)
			c->deleteLater();
		m_retiredSignaling.clear();
	}

	if(m_status == Status::Linked)
		updateListeningStatus();
}

void HostService::updateListeningStatus()
{
	if(!m_running)
		return;

	if(const PeerSession *s = linkedSession()) {
		setStatus(
			Status::Linked, s->isReadOnly()
								? QStringLiteral("%1 (RO)").arg(s->identity())
								: s->identity());
		return;
	}

	if(m_signaling && m_signaling->isSubscribed())
		setStatus(m_registered ? Status::ProActive : Status::Active);
	else
		setStatus(Status::Verifying);
}

const PeerSession *HostService::linkedSession() const
{
	for(const PeerSession *s : m_sessions) {
		if(s->isAuthenticated())
			return s;
	}
	return nullptr;
}

void HostService::setStatus(Status status, const QString &detail)
{
	if(status == m_status && detail == m_statusDetail)
		return;
	m_status = status;
	m_statusDetail = detail;
	emit statusChanged(status, statusText());
}

QString HostService::statusText() const
{
	switch(m_status) {
	case Status::NotConfigured:
		return QStringLiteral("Note Relay: Not configured");
	case Status::Verifying:
		return QStringLiteral("Note Relay: Verifying...");
	case Status::Active:
		return QStringLiteral("Note Relay: Active");
	case Status::ProActive:
		return QStringLiteral("Note Relay: Pro Active (%1...)").arg(m_signalId.left(8));
	case Status::Linked:
		return QStringLiteral("Linked: %1").arg(m_statusDetail);
	case Status::Error:
		return QStringLiteral("Note Relay: Error");
	case Status::Disconnected:
		return QStringLiteral("Note Relay: Disconnected");
	}
	return QString();
}

}
