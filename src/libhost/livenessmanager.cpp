// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/livenessmanager.h"
#include "libhost/hostlog.h"
#include "libshared/relay/registrationapi.h"
#include <QTimer>

namespace host {

LivenessManager::LivenessManager(
	relay::RegistrationApi *api, HostLog *logger, QObject *parent)
	: QObject(parent)
	, m_api(api)
	, m_logger(logger)
	, m_heartbeatTimer(new QTimer(this))
	, m_wakeTimer(new QTimer(this))
	, m_lastWallClock(QDateTime::currentMSecsSinceEpoch())
	, m_staleAfter(DEFAULT_STALE_AFTER)
	, m_maxFailures(DEFAULT_MAX_FAILURES)
	, m_attempts(0)
	, m_failures(0)
	, m_running(false)
{
	m_heartbeatTimer->setInterval(DEFAULT_HEARTBEAT_INTERVAL);
	connect(m_heartbeatTimer, &QTimer::timeout, this, &LivenessManager::sendHeartbeat);

	m_wakeTimer->setInterval(WAKE_CHECK_INTERVAL);
	connect(m_wakeTimer, &QTimer::timeout, this, &LivenessManager::checkWallClock);
}

void LivenessManager::setHeartbeatInterval(int msecs)
{
	m_heartbeatTimer->setInterval(msecs);
}

int LivenessManager::heartbeatInterval() const
{
	return m_heartbeatTimer->interval();
}

void LivenessManager::setWakeDetectionEnabled(bool enabled)
{
	if(enabled) {
		m_lastWallClock = QDateTime::currentMSecsSinceEpoch();
		m_wakeTimer->start();
	} else {
		m_wakeTimer->stop();
	}
}

void LivenessManager::start(
	const QString &email, const QString &vaultId, const QString &signalId)
{
	m_email = email;
	m_vaultId = vaultId;
	m_signalId = signalId;
	m_failures = 0;
	m_running = true;

	// Starting counts as contact: the registration was just made
	m_lastContact = QDateTime::currentDateTimeUtc();

	Log()
		.about(Log::Level::Info, Log::Topic::Liveness)
		.message(QStringLiteral("Heartbeat every %1 s for signal ID %2")
					 .arg(m_heartbeatTimer->interval() / 1000)
					 .arg(signalId))
		.to(m_logger);

	sendHeartbeat();
	m_heartbeatTimer->start();
}

void LivenessManager::stop()
{
	m_running = false;
	m_heartbeatTimer->stop();
}

bool LivenessManager::isStale() const
{
	return !m_lastContact.isValid() ||
		   m_lastContact.msecsTo(QDateTime::currentDateTimeUtc()) > m_staleAfter;
}

void LivenessManager::recordAttempt()
{
	++m_attempts;
	const QDateTime now = QDateTime::currentDateTimeUtc();
	if(!m_lastContact.isValid() || now > m_lastContact)
		m_lastContact = now;
}

void LivenessManager::sendHeartbeat()
{
	if(!m_running)
		return;

	relay::ApiResponse *res = m_api->heartbeat(m_email, m_vaultId, m_signalId);
	const QString signalId = m_signalId;

	connect(
		res, &relay::ApiResponse::finished, this,
		[this, res, signalId](const QVariant &, const QString &, const QString &error) {
			res->deleteLater();

			// A reply for a registration we already gave up on
			if(!m_running || signalId != m_signalId)
				return;

			recordAttempt();

			if(error.isEmpty()) {
				m_failures = 0;
				Log()
					.about(Log::Level::Debug, Log::Topic::Liveness)
					.message(QStringLiteral("Heartbeat OK"))
					.to(m_logger);
				emit heartbeatSucceeded();
				return;
			}

			if(res->isAuthRejection()) {
				Log()
					.about(Log::Level::Error, Log::Topic::Liveness)
					.message(QStringLiteral("Registration rejected: %1").arg(error))
					.to(m_logger);
				stop();
				emit registrationRejected(error);
				return;
			}

			++m_failures;
			Log()
				.about(Log::Level::Warn, Log::Topic::Liveness)
				.message(QStringLiteral("Heartbeat failed (%1 in a row): %2")
							 .arg(m_failures)
							 .arg(error))
				.to(m_logger);
			emit heartbeatFailed(error);

			if(m_maxFailures > 0 && m_failures >= m_maxFailures) {
				m_failures = 0;
				emit reconnectRequired();
			}
		});
}

void LivenessManager::checkHealth()
{
	if(!m_running && !m_lastContact.isValid())
		return;

	if(isStale()) {
		Log()
			.about(Log::Level::Info, Log::Topic::Liveness)
			.message(QStringLiteral("Last heartbeat attempt was %1 s ago, reconnecting")
						 .arg(m_lastContact.isValid()
								  ? m_lastContact.secsTo(QDateTime::currentDateTimeUtc())
								  : -1))
			.to(m_logger);
		emit reconnectRequired();
	} else {
		Log()
			.about(Log::Level::Debug, Log::Topic::Liveness)
			.message(QStringLiteral("Registration still fresh"))
			.to(m_logger);
	}
}

void LivenessManager::checkWallClock()
{
	const qint64 now = QDateTime::currentMSecsSinceEpoch();
	const qint64 elapsed = now - m_lastWallClock;
	m_lastWallClock = now;

	if(elapsed > m_wakeTimer->interval() + WAKE_JUMP_THRESHOLD) {
		Log()
			.about(Log::Level::Info, Log::Topic::Liveness)
			.message(QStringLiteral("Woke up after %1 s").arg(elapsed / 1000))
			.to(m_logger);
		emit wokeUp();
		checkHealth();
	}
}

}
