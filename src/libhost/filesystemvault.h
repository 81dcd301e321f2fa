// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_FILESYSTEMVAULT_H
#define NR_HOST_FILESYSTEMVAULT_H
#include "libhost/vaultstorage.h"
#include <QDir>

namespace host {

/**
 * @brief Vault storage backed by a directory tree
 *
 * Hidden files and folders (names starting with a dot) are not part of the
 * vault. Deleted files are moved to the system trash unless permanent
 * deletion has been enabled.
 */
class FilesystemVault final : public VaultStorage {
public:
	explicit FilesystemVault(const QString &rootPath);

	QString rootPath() const { return m_root.absolutePath(); }
	bool isValid() const { return m_root.exists(); }

	void setUseTrash(bool useTrash) { m_useTrash = useTrash; }
	bool useTrash() const { return m_useTrash; }

	bool exists(const QString &path) const override;
	bool isFolder(const QString &path) const override;
	QStringList files() const override;
	QStringList folders() const override;

	bool readText(
		const QString &path, QString &text, QString *errorMessage) const override;
	bool readBinary(
		const QString &path, QByteArray &data,
		QString *errorMessage) const override;

	bool writeText(
		const QString &path, const QString &text,
		QString *errorMessage) override;
	bool createFile(
		const QString &path, const QString &text,
		QString *errorMessage) override;
	bool createFolder(const QString &path, QString *errorMessage) override;
	bool rename(
		const QString &path, const QString &newPath,
		QString *errorMessage) override;
	bool remove(const QString &path, QString *errorMessage) override;

	FileMetadata metadata(const QString &path) const override;
	QString resolveLink(const QString &link, const QString &sourcePath) const override;

private:
	QString absolute(const QString &path) const;
	void walk(const QString &relativeDir, QStringList *files, QStringList *folders) const;

	QDir m_root;
	bool m_useTrash;
};

}

#endif
