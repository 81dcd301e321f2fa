// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/vaultstorage.h"
#include "libshared/util/vaultpath.h"

namespace host {

QStringList VaultStorage::markdownFiles() const
{
	QStringList notes;
	for(const QString &path : files()) {
		if(vaultpath::isMarkdown(path))
			notes << path;
	}
	return notes;
}

QHash<QString, QStringList> VaultStorage::resolvedLinks() const
{
	return resolvedLinks(LinkIndex(files()));
}

QHash<QString, QStringList>
VaultStorage::resolvedLinks(const LinkIndex &links) const
{
	QHash<QString, QStringList> index;
	for(const QString &source : links.notes()) {
		QStringList targets;
		for(const QString &link : metadata(source).links) {
			const QString target = links.resolve(link, source);
			if(!target.isEmpty() && !targets.contains(target))
				targets << target;
		}
		index.insert(source, targets);
	}
	return index;
}

LinkIndex::LinkIndex(const QStringList &files)
	: m_files(files)
{
	m_lookup.reserve(files.size());
	for(const QString &file : files) {
		m_lookup.insert(file);
		const QString name = vaultpath::fileName(file).toLower();
		const auto i = m_byName.find(name);
		if(i == m_byName.end())
			m_byName.insert(name, file);
		else if(file.length() < i->length())
			*i = file;
	}
}

QStringList LinkIndex::notes() const
{
	QStringList notes;
	for(const QString &path : m_files) {
		if(vaultpath::isMarkdown(path))
			notes << path;
	}
	return notes;
}

QString LinkIndex::linkTarget(const QString &link)
{
	return vaultpath::sanitize(link.section('#', 0, 0).section('|', 0, 0));
}

QString LinkIndex::wantedName(const QString &target)
{
	const QString name = vaultpath::fileName(target);
	if(vaultpath::extension(target).isEmpty())
		return name + QStringLiteral(".md");
	return name;
}

QStringList LinkIndex::candidates(const QString &link, const QString &sourcePath)
{
	const QString target = linkTarget(link);
	if(target.isEmpty())
		return QStringList();

	QStringList candidates;
	const QString sourceDir = vaultpath::parentPath(sourcePath);
	const bool hasExtension = !vaultpath::extension(target).isEmpty();

	candidates << target;
	if(!hasExtension)
		candidates << target + QStringLiteral(".md");
	if(!sourceDir.isEmpty()) {
		candidates << vaultpath::sanitize(sourceDir + '/' + target);
		if(!hasExtension)
			candidates << vaultpath::sanitize(sourceDir + '/' + target + QStringLiteral(".md"));
	}
	return candidates;
}

QString LinkIndex::resolveByName(const QString &link) const
{
	const QString target = linkTarget(link);
	if(target.isEmpty())
		return QString();
	return m_byName.value(wantedName(target).toLower());
}

QString LinkIndex::resolve(const QString &link, const QString &sourcePath) const
{
	for(const QString &candidate : candidates(link, sourcePath)) {
		if(m_lookup.contains(candidate))
			return candidate;
	}
	return resolveByName(link);
}

}
