// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/hostlog.h"
#include <QMetaEnum>
#include <QRegularExpression>

Q_LOGGING_CATEGORY(lcNrHost, "noterelay.host")

namespace host {

namespace {

const QString REDACTED = QStringLiteral("[redacted]");

const char *levelName(Log::Level level)
{
	return QMetaEnum::fromType<Log::Level>().valueToKey(int(level));
}

const char *topicName(Log::Topic topic)
{
	return QMetaEnum::fromType<Log::Topic>().valueToKey(int(topic));
}

}

Log::Log()
	: m_timestamp(QDateTime::currentDateTimeUtc())
	, m_access(Access::None)
	, m_level(Level::Warn)
	, m_topic(Topic::Status)
{
}

Log &Log::message(const QString &msg)
{
	m_message = redact(msg);
	return *this;
}

QString Log::redact(const QString &text)
{
	// The value of an authHash field, quoted or not
	static const QRegularExpression field(
		QStringLiteral("(\"?authHash\"?\\s*[:=]\\s*)(\"[^\"]*\"|[^\\s,}]+)"),
		QRegularExpression::CaseInsensitiveOption);
	// A bare SHA-256 hex digest
	static const QRegularExpression digest(
		QStringLiteral("\\b[0-9a-fA-F]{64}\\b"));

	QString out = text;
	out.replace(field, QStringLiteral("\\1") + REDACTED);
	out.replace(digest, REDACTED);
	return out;
}

QString Log::toString(bool abridged) const
{
	QString msg;
	if(!abridged) {
		msg += m_timestamp.toString(Qt::ISODateWithMs);
		msg += ' ';
		msg += QString::fromLatin1(levelName(m_level)).toUpper();
		msg += ' ';
	}

	msg += QString::fromLatin1(topicName(m_topic));

	if(!m_session.isEmpty() || !m_identity.isEmpty()) {
		QStringList who;
		if(!m_session.isEmpty())
			who << m_session;
		if(!m_identity.isEmpty())
			who << m_identity;
		if(m_access == Access::ReadOnly)
			who << QStringLiteral("(RO)");
		else if(m_access == Access::ReadWrite)
			who << QStringLiteral("(RW)");
		msg += QStringLiteral(" [%1]").arg(who.join(' '));
	}

	msg += QStringLiteral(": ");
	msg += m_message;
	return msg;
}

bool LogFilter::matches(const Log &entry) const
{
	if(after.isValid() && entry.timestamp() <= after)
		return false;
	if(!session.isEmpty() && session != entry.session())
		return false;
	if(!identity.isEmpty() &&
	   identity.compare(entry.identity(), Qt::CaseInsensitive) != 0)
		return false;
	if(topic >= 0 && topic != int(entry.topic()))
		return false;
	return entry.level() <= atleast;
}

void HostLog::logMessage(const Log &entry)
{
	if(!m_silent) {
		const QByteArray text = entry.toString(true).toUtf8();
		switch(entry.level()) {
		case Log::Level::Error:
			qCCritical(lcNrHost, "%s", text.constData());
			break;
		case Log::Level::Warn:
			qCWarning(lcNrHost, "%s", text.constData());
			break;
		case Log::Level::Info:
			qCInfo(lcNrHost, "%s", text.constData());
			break;
		case Log::Level::Debug:
			qCDebug(lcNrHost, "%s", text.constData());
			break;
		}
	}
	storeMessage(entry);
}

void InMemoryLog::setHistoryLimit(int limit)
{
	m_limit = limit;
	if(limit > 0 && m_history.size() > limit)
		m_history.erase(m_history.begin(), m_history.end() - limit);
}

void InMemoryLog::storeMessage(const Log &entry)
{
	m_history.append(entry);
	if(m_limit > 0 && m_history.size() > m_limit)
		m_history.removeFirst();
}

QList<Log> InMemoryLog::getLogEntries(const LogFilter &filter) const
{
	QList<Log> entries;
	int skip = filter.offset;
	for(auto i = m_history.crbegin(); i != m_history.crend(); ++i) {
		if(!filter.matches(*i))
			continue;
		if(skip > 0) {
			--skip;
			continue;
		}
		entries << *i;
		if(filter.limit > 0 && entries.size() >= filter.limit)
			break;
	}
	return entries;
}

}
