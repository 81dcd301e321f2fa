// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_INMEMORYCONFIG_H
#define NR_HOST_INMEMORYCONFIG_H
#include "libhost/hostconfig.h"
#include <QHash>

namespace host {

class InMemoryConfig final : public HostConfig {
	Q_OBJECT
public:
	explicit InMemoryConfig(QObject *parent = nullptr);
	~InMemoryConfig() override;

	HostLog *logger() const override { return m_logger; }

	QVector<GuestEntry> guests() const override { return m_guests; }
	void setGuests(const QVector<GuestEntry> &guests);

protected:
	QString getConfigValue(const ConfigKey key, bool &found) const override;
	void setConfigValue(const ConfigKey key, const QString &value) override;

private:
	QHash<int, QString> m_config;
	QVector<GuestEntry> m_guests;
	HostLog *m_logger;
};

}

#endif
