// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/util/vaultpath.h"
#include <QString>
#include <QStringList>

namespace vaultpath {

QString sanitize(const QString &unsafePath)
{
	QString clean = unsafePath;
	clean.replace(QChar('\\'), QChar('/'));
	clean.remove(QChar('\0'));
	clean = clean.trimmed();

	while(clean.contains(QStringLiteral("..")))
		clean.remove(QStringLiteral(".."));

	QStringList segments;
	const QStringList parts = clean.split(QChar('/'), Qt::SkipEmptyParts);
	for(const QString &part : parts) {
		if(part != QStringLiteral("."))
			segments << part;
	}

	return segments.join(QChar('/')).trimmed();
}

QString fileName(const QString &path)
{
	const int slash = path.lastIndexOf(QChar('/'));
	return slash < 0 ? path : path.mid(slash + 1);
}

QString baseName(const QString &path)
{
	const QString name = fileName(path);
	const int dot = name.lastIndexOf(QChar('.'));
	return dot <= 0 ? name : name.left(dot);
}

QString extension(const QString &path)
{
	const QString name = fileName(path);
	const int dot = name.lastIndexOf(QChar('.'));
	return dot <= 0 ? QString() : name.mid(dot + 1).toLower();
}

QString parentPath(const QString &path)
{
	const int slash = path.lastIndexOf(QChar('/'));
	return slash < 0 ? QString() : path.left(slash);
}

bool isMarkdown(const QString &path)
{
	return extension(path) == QStringLiteral("md");
}

}
