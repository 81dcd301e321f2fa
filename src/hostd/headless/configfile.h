// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOSTD_CONFIGFILE_H
#define NR_HOSTD_CONFIGFILE_H

#include "libhost/hostconfig.h"

#include <QDateTime>
#include <QHash>

class QFileSystemWatcher;

namespace host {

/**
 * @brief Host configuration read from a text file.
 *
 * The file is automatically reloaded if it has changed.
 *
 * Format is simple:
 *
 *     [config]
 *     email = owner@example.com
 *     ownerHash = 5e884898da28047151d0e56f8dc6292773603d0d6aabbdd62a11ef721d1542d8
 *     vaultPath = /home/owner/notes
 *
 *     [guests]
 *     friend@example.com:<sha256 hex>:ro:verified
 *
 * The default section is [config], so the header can be omitted.
 * Values set at runtime (e.g. from the command line) override the file.
 */
class ConfigFile final : public HostConfig
{
	Q_OBJECT
public:
	explicit ConfigFile(const QString &path, QObject *parent=nullptr);
	~ConfigFile() override;

	QString path() const { return m_path; }

	bool isModified() const;

	QVector<GuestEntry> guests() const override;

	HostLog *logger() const override { return m_logger; }

protected:
	QString getConfigValue(const ConfigKey key, bool &found) const override;
	void setConfigValue(const ConfigKey key, const QString &value) override;

private slots:
	void onFileChanged();

private:
	void reloadFile() const;

	QString m_path;
	HostLog *m_logger;
	QFileSystemWatcher *m_watcher;

	QHash<QString, QString> m_overrides;

	// Cached settings:
	mutable QHash<QString, QString> m_config;
	mutable QVector<GuestEntry> m_guests;
	mutable QDateTime m_lastmod;
};

}

#endif
