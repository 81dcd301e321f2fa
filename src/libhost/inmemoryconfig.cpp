// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/inmemoryconfig.h"
#include "libhost/hostlog.h"

namespace host {

InMemoryConfig::InMemoryConfig(QObject *parent)
	: HostConfig(parent)
	, m_logger(new InMemoryLog)
{
}

InMemoryConfig::~InMemoryConfig()
{
	delete m_logger;
}

void InMemoryConfig::setGuests(const QVector<GuestEntry> &guests)
{
	m_guests = guests;
	emit guestsChanged();
}

QString InMemoryConfig::getConfigValue(const ConfigKey key, bool &found) const
{
	QHash<int, QString>::const_iterator it = m_config.constFind(key.index);
	if(it == m_config.constEnd()) {
		found = false;
		return QString();
	} else {
		found = true;
		return *it;
	}
}

void InMemoryConfig::setConfigValue(const ConfigKey key, const QString &value)
{
	m_config[key.index] = value;
}

}
