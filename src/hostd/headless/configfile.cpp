// SPDX-License-Identifier: GPL-3.0-or-later

#include "hostd/headless/configfile.h"
#include "libhost/hostlog.h"

#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QTextStream>

namespace host {

ConfigFile::ConfigFile(const QString &path, QObject *parent)
	: HostConfig(parent),
	  m_path(path),
	  m_logger(new InMemoryLog),
	  m_watcher(new QFileSystemWatcher(this))
{
	// A file compiled in as a qresource has no modification time, but
	// should still be read once.
	m_lastmod = QDateTime::fromMSecsSinceEpoch(1);

	if(QFileInfo::exists(path))
		m_watcher->addPath(path);
	connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &ConfigFile::onFileChanged);
}

ConfigFile::~ConfigFile()
{
	delete m_logger;
}

bool ConfigFile::isModified() const
{
	QFileInfo f(m_path);
	if(!f.exists())
		return false;

	return f.lastModified() != m_lastmod;
}

void ConfigFile::onFileChanged()
{
	// Editors that replace the file remove it from the watch list
	if(!m_watcher->files().contains(m_path) && QFileInfo::exists(m_path))
		m_watcher->addPath(m_path);

	if(!isModified())
		return;

	reloadFile();
	qInfo("%s: configuration reloaded", qPrintable(m_path));
	emit guestsChanged();
}

void ConfigFile::reloadFile() const
{
	QFile f(m_path);
	if(!f.open(QFile::ReadOnly | QFile::Text)) {
		qCritical("%s: Error %s", qPrintable(m_path), qPrintable(f.errorString()));
		return;
	}

	m_lastmod = QFileInfo(f).lastModified();

	QTextStream in(&f);

	m_config.clear();
	m_guests.clear();

	enum { CONFIG, GUESTS } section = CONFIG;

	int lineNumber = 0;
	while(!in.atEnd()) {
		QString line = in.readLine().trimmed();
		++lineNumber;
		if(line.isEmpty() || line.at(0) == '#')
			continue;

		if(line.at(0) == '[') {
			if(line.compare("[config]", Qt::CaseInsensitive)==0)
				section = CONFIG;
			else if(line.compare("[guests]", Qt::CaseInsensitive)==0)
				section = GUESTS;
			else
				qWarning("Unknown configuration file section: %s", qPrintable(line));
			continue;
		}

		if(section == CONFIG) {
			int sep = line.indexOf('=');
			if(sep<1) {
				qWarning("Invalid setting line: %s", qPrintable(line));
				continue;
			}

			QString key = line.left(sep).trimmed();
			QString value = line.mid(sep+1).trimmed();

			m_config[key] = value;

		} else if(section == GUESTS) {
			GuestEntry guest;
			QString error;
			if(!GuestEntry::fromString(line, guest, &error)) {
				qWarning("%s:%d: %s", qPrintable(m_path), lineNumber, qPrintable(error));
				continue;
			}
			m_guests << guest;
		}
	}
}

QVector<GuestEntry> ConfigFile::guests() const
{
	if(isModified())
		reloadFile();

	return m_guests;
}

QString ConfigFile::getConfigValue(const ConfigKey key, bool &found) const
{
	const QString name = QString::fromLatin1(key.name);
	if(m_overrides.contains(name)) {
		found = true;
		return m_overrides[name];
	}

	if(isModified())
		reloadFile();

	if(m_config.count(name)==0) {
		found = false;
		return QString();
	} else {
		found = true;
		return m_config[name];
	}
}

void ConfigFile::setConfigValue(const ConfigKey key, const QString &value)
{
	m_overrides[QString::fromLatin1(key.name)] = value;
}

}
