// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_LIVENESSMANAGER_H
#define NR_HOST_LIVENESSMANAGER_H
#include <QDateTime>
#include <QObject>

class QTimer;

namespace relay {
class RegistrationApi;
}

namespace host {

class HostLog;

/**
 * @brief Keeps the host's registration alive
 *
 * A heartbeat is sent right away when started and then on a fixed
 * interval. Every finished attempt updates the last contact time, whatever
 * its outcome: the timestamp records attempted contact, not confirmed
 * health. Runs of failed attempts are tracked separately.
 *
 * When the host wakes up (from system suspend, or when told so), the
 * registration is considered stale if no heartbeat was attempted recently
 * and a full rebuild is requested.
 */
class LivenessManager final : public QObject {
	Q_OBJECT
public:
	static constexpr int DEFAULT_HEARTBEAT_INTERVAL = 5 * 60 * 1000;
	static constexpr int DEFAULT_STALE_AFTER = 6 * 60 * 1000;
	static constexpr int DEFAULT_MAX_FAILURES = 3;

	//! How often the wall clock is checked for jumps
	static constexpr int WAKE_CHECK_INTERVAL = 30 * 1000;

	//! A wall clock jump bigger than this (beyond the check interval) is a wake up
	static constexpr int WAKE_JUMP_THRESHOLD = 60 * 1000;

	LivenessManager(
		relay::RegistrationApi *api, HostLog *logger, QObject *parent = nullptr);

	void setHeartbeatInterval(int msecs);
	int heartbeatInterval() const;

	void setStaleAfter(int msecs) { m_staleAfter = msecs; }
	int staleAfter() const { return m_staleAfter; }

	//! Consecutive failed heartbeats after which a rebuild is requested (0 for never)
	void setMaxConsecutiveFailures(int count) { m_maxFailures = count; }

	void setWakeDetectionEnabled(bool enabled);

	/**
	 * @brief Start the heartbeat loop for the given registration
	 *
	 * The first heartbeat is sent immediately.
	 */
	void start(const QString &email, const QString &vaultId, const QString &signalId);

	//! Stop the heartbeat loop
	void stop();

	bool isRunning() const { return m_running; }

	//! Time of the most recently finished heartbeat attempt
	QDateTime lastContact() const { return m_lastContact; }

	int attemptCount() const { return m_attempts; }
	int consecutiveFailures() const { return m_failures; }

	//! Has it been too long since the last heartbeat attempt?
	bool isStale() const;

public slots:
	void sendHeartbeat();

	/**
	 * @brief Check the registration's health after waking up
	 *
	 * Emits reconnectRequired if the registration has gone stale.
	 */
	void checkHealth();

signals:
	void heartbeatSucceeded();
	void heartbeatFailed(const QString &message);

	//! The registration service refused our credentials. The loop has stopped.
	void registrationRejected(const QString &message);

	//! Registration and signaling must be torn down and set up again
	void reconnectRequired();

	//! The system appears to have been suspended
	void wokeUp();

private slots:
	void checkWallClock();

private:
	void recordAttempt();

	relay::RegistrationApi *m_api;
	HostLog *m_logger;
	QTimer *m_heartbeatTimer;
	QTimer *m_wakeTimer;

	QString m_email;
	QString m_vaultId;
	QString m_signalId;

	QDateTime m_lastContact;
	qint64 m_lastWallClock;
	int m_staleAfter;
	int m_maxFailures;
	int m_attempts;
	int m_failures;
	bool m_running;
};

}

#endif
