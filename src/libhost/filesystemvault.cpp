// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/filesystemvault.h"
#include "libhost/notemetadata.h"
#include "libshared/util/vaultpath.h"
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace host {

FilesystemVault::FilesystemVault(const QString &rootPath)
	: m_root(rootPath)
	, m_useTrash(true)
{
}

QString FilesystemVault::absolute(const QString &path) const
{
	return m_root.absoluteFilePath(path);
}

bool FilesystemVault::exists(const QString &path) const
{
	return !path.isEmpty() && QFileInfo::exists(absolute(path));
}

bool FilesystemVault::isFolder(const QString &path) const
{
	return !path.isEmpty() && QFileInfo(absolute(path)).isDir();
}

void FilesystemVault::walk(
	const QString &relativeDir, QStringList *files, QStringList *folders) const
{
	const QDir dir(absolute(relativeDir));
	const QFileInfoList entries = dir.entryInfoList(
		QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot,
		QDir::Name | QDir::DirsLast);

	for(const QFileInfo &entry : entries) {
		if(entry.fileName().startsWith('.'))
			continue;

		const QString path = relativeDir.isEmpty()
								 ? entry.fileName()
								 : relativeDir + '/' + entry.fileName();

		if(entry.isDir()) {
			// Don't follow links out of the vault
			if(entry.isSymLink())
				continue;
			if(folders)
				*folders << path;
			walk(path, files, folders);
		} else if(files) {
			*files << path;
		}
	}
}

QStringList FilesystemVault::files() const
{
	QStringList list;
	walk(QString(), &list, nullptr);
	return list;
}

QStringList FilesystemVault::folders() const
{
	QStringList list;
	walk(QString(), nullptr, &list);
	return list;
}

bool FilesystemVault::readText(
	const QString &path, QString &text, QString *errorMessage) const
{
	QByteArray data;
	if(!readBinary(path, data, errorMessage))
		return false;
	text = QString::fromUtf8(data);
	return true;
}

bool FilesystemVault::readBinary(
	const QString &path, QByteArray &data, QString *errorMessage) const
{
	QFile f(absolute(path));
	if(!f.open(QFile::ReadOnly)) {
		if(errorMessage)
			*errorMessage = f.errorString();
		return false;
	}
	data = f.readAll();
	return true;
}

bool FilesystemVault::writeText(
	const QString &path, const QString &text, QString *errorMessage)
{
	QSaveFile f(absolute(path));
	if(!f.open(QFile::WriteOnly)) {
		if(errorMessage)
			*errorMessage = f.errorString();
		return false;
	}

	f.write(text.toUtf8());
	if(!f.commit()) {
		if(errorMessage)
			*errorMessage = f.errorString();
		return false;
	}
	return true;
}

bool FilesystemVault::createFile(
	const QString &path, const QString &text, QString *errorMessage)
{
	const QString parent = vaultpath::parentPath(path);
	if(!parent.isEmpty() && !m_root.mkpath(parent)) {
		if(errorMessage)
			*errorMessage = QStringLiteral("Couldn't create folder %1").arg(parent);
		return false;
	}

	QFile f(absolute(path));
	if(!f.open(QFile::WriteOnly | QFile::NewOnly)) {
		if(errorMessage)
			*errorMessage = f.errorString();
		return false;
	}
	if(f.write(text.toUtf8()) < 0) {
		if(errorMessage)
			*errorMessage = f.errorString();
		return false;
	}
	return true;
}

bool FilesystemVault::createFolder(const QString &path, QString *errorMessage)
{
	if(!m_root.mkpath(path)) {
		if(errorMessage)
			*errorMessage = QStringLiteral("Couldn't create folder %1").arg(path);
		return false;
	}
	return true;
}

bool FilesystemVault::rename(
	const QString &path, const QString &newPath, QString *errorMessage)
{
	const QString parent = vaultpath::parentPath(newPath);
	if(!parent.isEmpty() && !m_root.mkpath(parent)) {
		if(errorMessage)
			*errorMessage = QStringLiteral("Couldn't create folder %1").arg(parent);
		return false;
	}

	if(!m_root.rename(path, newPath)) {
		if(errorMessage)
			*errorMessage = QStringLiteral("Couldn't rename %1 to %2").arg(path, newPath);
		return false;
	}
	return true;
}

bool FilesystemVault::remove(const QString &path, QString *errorMessage)
{
	const QString abs = absolute(path);

	if(m_useTrash) {
		if(!QFile::moveToTrash(abs)) {
			if(errorMessage)
				*errorMessage = QStringLiteral("Couldn't move %1 to trash").arg(path);
			return false;
		}
		return true;
	}

	bool ok;
	if(QFileInfo(abs).isDir())
		ok = QDir(abs).removeRecursively();
	else
		ok = QFile::remove(abs);

	if(!ok && errorMessage)
		*errorMessage = QStringLiteral("Couldn't delete %1").arg(path);
	return ok;
}

FileMetadata FilesystemVault::metadata(const QString &path) const
{
	if(!vaultpath::isMarkdown(path))
		return FileMetadata();

	QString text;
	if(!readText(path, text, nullptr))
		return FileMetadata();

	return notemeta::extract(text);
}

QString FilesystemVault::resolveLink(const QString &link, const QString &sourcePath) const
{
	const QStringList candidates = LinkIndex::candidates(link, sourcePath);
	if(candidates.isEmpty())
		return QString();

	for(const QString &candidate : candidates) {
		if(QFileInfo(absolute(candidate)).isFile())
			return candidate;
	}

	return LinkIndex(files()).resolveByName(link);
}

}
