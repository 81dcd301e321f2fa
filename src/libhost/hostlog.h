// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef NR_HOST_HOSTLOG_H
#define NR_HOST_HOSTLOG_H

#include <QDateTime>
#include <QList>
#include <QLoggingCategory>
#include <QObject>

Q_DECLARE_LOGGING_CATEGORY(lcNrHost)

namespace host {

class HostLog;

/**
 * @brief Host log entry
 *
 * An entry can be tied to a peer session (the remote peer's ID) and to the
 * identity that session authenticated as. Credential hashes never make it
 * into the message: anything that looks like one is masked when the
 * message is set.
 */
class Log {
	Q_GADGET
public:
	enum class Level {
		Error, // the host cannot continue without attention
		Warn,  // recoverable errors
		Info,  // normal lifecycle events
		Debug, // protocol level detail
	};
	Q_ENUM(Level)

	enum class Topic {
		Status,    // general host lifecycle
		Signal,    // relay signaling
		Session,   // peer session lifecycle
		Auth,      // handshake and access control
		Command,   // command execution
		Liveness,  // heartbeat and reconnect
		BadData,   // received an invalid message from a peer
		RuleBreak, // peer tried something it's not allowed to
	};
	Q_ENUM(Topic)

	enum class Access {
		None,	   // not authenticated (yet)
		ReadOnly,
		ReadWrite,
	};
	Q_ENUM(Access)

	Log();

	QDateTime timestamp() const { return m_timestamp; }

	//! The remote peer's ID (blank if not about a session)
	QString session() const { return m_session; }

	//! The identity the peer claimed or authenticated as
	QString identity() const { return m_identity; }

	Access access() const { return m_access; }
	Level level() const { return m_level; }
	Topic topic() const { return m_topic; }
	QString message() const { return m_message; }

	Log &about(Level l, Topic t) { m_level=l; m_topic=t; return *this; }
	Log &session(const QString &remoteId) { m_session = remoteId; return *this; }
	Log &identity(const QString &identity) { m_identity = identity; return *this; }
	Log &access(Access a) { m_access = a; return *this; }
	Log &at(const QDateTime &ts) { m_timestamp = ts; return *this; }
	Log &message(const QString &msg);

	inline void to(HostLog *logger);

	/**
	 * @brief Get the log message as a string
	 *
	 * Format: `[timestamp level] topic [session identity (access)]: message`
	 *
	 * @param abridged if true, the timestamp and log level are omitted
	 */
	QString toString(bool abridged=false) const;

	//! Mask credential hashes in the text
	static QString redact(const QString &text);

private:
	QDateTime m_timestamp;
	QString m_session;
	QString m_identity;
	Access m_access;
	Level m_level;
	Topic m_topic;
	QString m_message;
};

/**
 * @brief Which log entries to fetch
 */
struct LogFilter {
	QString session;
	QString identity;
	int topic = -1;
	Log::Level atleast = Log::Level::Debug;
	QDateTime after;
	int offset = 0;
	int limit = 0;

	//! Does the entry pass every criterion except offset and limit?
	bool matches(const Log &entry) const;
};

/**
 * @brief Log query builder
 */
class HostLogQuery {
public:
	explicit HostLogQuery(const HostLog &log) : m_log(log) { }

	HostLogQuery &session(const QString &remoteId) { m_filter.session = remoteId; return *this; }
	HostLogQuery &identity(const QString &identity) { m_filter.identity = identity; return *this; }
	HostLogQuery &topic(Log::Topic t) { m_filter.topic = int(t); return *this; }
	HostLogQuery &page(int page, int entriesPerPage) { m_filter.offset = page*entriesPerPage; m_filter.limit = entriesPerPage; return *this; }
	HostLogQuery &after(const QDateTime &ts) { m_filter.after = ts; return *this; }
	HostLogQuery &atleast(Log::Level level) { m_filter.atleast = level; return *this; }

	QList<Log> get() const;

private:
	const HostLog &m_log;
	LogFilter m_filter;
};

/**
 * @brief Abstract base class for host logger implementations
 *
 * Every entry is echoed to the `noterelay.host` logging category unless
 * the logger has been silenced.
 */
class HostLog
{
public:
	HostLog() : m_silent(false) { }
	virtual ~HostLog() = default;

	//! Don't echo messages to the logging category
	void setSilent(bool silent) { m_silent = silent; }
	bool isSilent() const { return m_silent; }

	void logMessage(const Log &entry);

	//! Get the stored entries that pass the filter, newest first
	virtual QList<Log> getLogEntries(const LogFilter &filter) const = 0;

	HostLogQuery query() const { return HostLogQuery(*this); }

protected:
	virtual void storeMessage(const Log &entry) = 0;

private:
	bool m_silent;
};

inline QList<Log> HostLogQuery::get() const {
	return m_log.getLogEntries(m_filter);
}

void Log::to(HostLog *logger)
{
	if(logger)
		logger->logMessage(*this);
	else
		qCWarning(lcNrHost, "logger(null): %s", qUtf8Printable(toString()));
}

/**
 * @brief Keeps the latest entries in memory
 */
class InMemoryLog final : public HostLog
{
public:
	InMemoryLog() : m_limit(1000) { }

	//! Maximum number of entries kept (0 for unlimited)
	void setHistoryLimit(int limit);
	int historySize() const { return m_history.size(); }

	QList<Log> getLogEntries(const LogFilter &filter) const override;

protected:
	void storeMessage(const Log &entry) override;

private:
	// Oldest first
	QList<Log> m_history;
	int m_limit;
};

}

#endif
