// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_VAULTSTORAGE_H
#define NR_HOST_VAULTSTORAGE_H
#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QStringList>

namespace host {

/**
 * @brief Metadata derived from the content of one note
 */
struct FileMetadata {
	//! Parsed front-matter block (empty if there is none)
	QJsonObject frontmatter;

	//! Was there a front-matter block at all?
	bool hasFrontmatter = false;

	//! Tags from front-matter and inline hashtags, with the leading '#'
	QStringList tags;

	//! Outbound link targets as written (without alias or heading)
	QStringList links;

	//! Embedded resources (![[target]])
	QStringList embeds;
};

/**
 * @brief Resolves links against one listing of the vault's files
 *
 * A link is tried as a path relative to the vault root, then relative to
 * the linking note's folder, each time also with ".md" appended when it has
 * no extension. Failing that, the file with the same (case insensitive)
 * name and the shortest path is the target.
 */
class LinkIndex {
public:
	explicit LinkIndex(const QStringList &files);

	//! The listing, in the order it was given
	const QStringList &files() const { return m_files; }

	//! Markdown notes of the listing
	QStringList notes() const;

	QString resolve(const QString &link, const QString &sourcePath) const;

	//! Paths to try before falling back to a name match
	static QStringList candidates(const QString &link, const QString &sourcePath);

	//! Shortest path whose file name matches the link's
	QString resolveByName(const QString &link) const;

private:
	static QString linkTarget(const QString &link);
	static QString wantedName(const QString &target);

	QStringList m_files;
	QSet<QString> m_lookup;
	QHash<QString, QString> m_byName;
};

/**
 * @brief The note storage a host exposes to its peers
 *
 * All paths are relative to the vault root and must have been sanitized
 * before they reach the storage. Operations that can fail return false
 * and set the error message.
 */
class VaultStorage {
public:
	virtual ~VaultStorage() = default;

	virtual bool exists(const QString &path) const = 0;
	virtual bool isFolder(const QString &path) const = 0;

	//! All files, in depth first traversal order
	virtual QStringList files() const = 0;

	//! All folders, including empty ones, in depth first traversal order
	virtual QStringList folders() const = 0;

	//! All Markdown notes, in traversal order
	QStringList markdownFiles() const;

	virtual bool
	readText(const QString &path, QString &text, QString *errorMessage) const = 0;

	virtual bool readBinary(
		const QString &path, QByteArray &data, QString *errorMessage) const = 0;

	//! Replace the content of an existing file
	virtual bool
	writeText(const QString &path, const QString &text, QString *errorMessage) = 0;

	//! Create a new file. Missing parent folders are created too.
	virtual bool createFile(
		const QString &path, const QString &text, QString *errorMessage) = 0;

	virtual bool createFolder(const QString &path, QString *errorMessage) = 0;

	virtual bool
	rename(const QString &path, const QString &newPath, QString *errorMessage) = 0;

	virtual bool remove(const QString &path, QString *errorMessage) = 0;

	virtual FileMetadata metadata(const QString &path) const = 0;

	/**
	 * @brief Resolve a link as written in a note into a file path
	 * @return the target file's path or an empty string if it doesn't exist
	 */
	virtual QString
	resolveLink(const QString &link, const QString &sourcePath) const = 0;

	/**
	 * @brief Index of resolved links
	 *
	 * Maps each note's path to the paths of the files it links to. The
	 * vault is listed once for the whole index.
	 */
	QHash<QString, QStringList> resolvedLinks() const;
	QHash<QString, QStringList> resolvedLinks(const LinkIndex &links) const;
};

/**
 * @brief Turns note content into display HTML
 *
 * Internal embeds must be emitted as `<img class="internal-embed"
 * data-src="linktext" ...>` so they can be resolved and inlined.
 */
class ContentRenderer {
public:
	virtual ~ContentRenderer() = default;

	virtual bool render(
		const QString &markdown, const QString &sourcePath, QString &html,
		QString *errorMessage) = 0;
};

}

#endif
