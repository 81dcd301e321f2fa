// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/notemetadata.h"
#include <QJsonArray>
#include <QRegularExpression>
#include <QUrl>

namespace host {
namespace notemeta {

namespace {

QJsonValue parseScalar(const QString &raw)
{
	const QString value = raw.trimmed();
	if(value.isEmpty() || value == QStringLiteral("~") ||
	   value == QStringLiteral("null"))
		return QJsonValue();

	if((value.startsWith('"') && value.endsWith('"') && value.length() >= 2) ||
	   (value.startsWith('\'') && value.endsWith('\'') && value.length() >= 2))
		return value.mid(1, value.length() - 2);

	const QString lower = value.toLower();
	if(lower == QStringLiteral("true"))
		return true;
	if(lower == QStringLiteral("false"))
		return false;

	bool ok;
	const double number = value.toDouble(&ok);
	if(ok)
		return number;

	return value;
}

QJsonArray parseInlineList(const QString &raw)
{
	QJsonArray list;
	const QString inner = raw.trimmed().mid(1, raw.trimmed().length() - 2);
	for(const QString &item : inner.split(',', Qt::SkipEmptyParts)) {
		const QJsonValue v = parseScalar(item);
		if(!v.isNull())
			list.append(v);
	}
	return list;
}

QString stripCode(const QString &body)
{
	static const QRegularExpression fenced(
		QStringLiteral("^(```|~~~)[^\\n]*\\n[\\s\\S]*?^\\1[^\\n]*$"),
		QRegularExpression::MultilineOption);
	static const QRegularExpression inlineCode(QStringLiteral("`[^`\\n]*`"));

	QString stripped = body;
	stripped.replace(fenced, QString());
	stripped.replace(inlineCode, QString());
	return stripped;
}

}

bool splitFrontmatter(const QString &text, QString &yaml, QString &body)
{
	static const QRegularExpression re(
		QStringLiteral("\\A---\\r?\\n([\\s\\S]*?)\\r?\\n---(?:\\r?\\n|\\z)"));

	const QRegularExpressionMatch m = re.match(text);
	if(!m.hasMatch()) {
		yaml.clear();
		body = text;
		return false;
	}

	yaml = m.captured(1);
	body = text.mid(m.capturedLength(0));
	return true;
}

QJsonObject parseFrontmatter(const QString &yaml)
{
	static const QRegularExpression keyLine(
		QStringLiteral("\\A([^\\s:#][^:]*):(?:\\s+(.*))?\\z"));
	static const QRegularExpression listItem(QStringLiteral("\\A\\s*-\\s*(.*)\\z"));

	QJsonObject obj;
	QString listKey;
	QJsonArray list;

	const auto flushList = [&]() {
		if(!listKey.isEmpty()) {
			obj[listKey] = list.isEmpty() ? QJsonValue() : QJsonValue(list);
			listKey.clear();
			list = QJsonArray();
		}
	};

	for(const QString &rawLine : yaml.split('\n')) {
		const QString line = rawLine.endsWith('\r') ? rawLine.chopped(1) : rawLine;
		if(line.trimmed().isEmpty() || line.trimmed().startsWith('#'))
			continue;

		if(!listKey.isEmpty()) {
			const QRegularExpressionMatch item = listItem.match(line);
			if(item.hasMatch()) {
				const QJsonValue v = parseScalar(item.captured(1));
				if(!v.isNull())
					list.append(v);
				continue;
			}
		}

		// Nested structures are not supported, skip their content
		if(line.startsWith(' ') || line.startsWith('\t'))
			continue;

		flushList();

		const QRegularExpressionMatch m = keyLine.match(line);
		if(!m.hasMatch())
			continue;

		const QString key = m.captured(1).trimmed();
		const QString value = m.captured(2).trimmed();
		if(value.isEmpty()) {
			listKey = key;
		} else if(value.startsWith('[') && value.endsWith(']')) {
			obj[key] = parseInlineList(value);
		} else {
			obj[key] = parseScalar(value);
		}
	}
	flushList();

	return obj;
}

QStringList frontmatterTags(const QJsonObject &frontmatter)
{
	QStringList tags;
	const QJsonValue value = frontmatter.value(QStringLiteral("tags"));

	QJsonArray items;
	if(value.isArray()) {
		items = value.toArray();
	} else if(value.isString()) {
		for(const QString &t : value.toString().split(
				QRegularExpression(QStringLiteral("[,\\s]+")), Qt::SkipEmptyParts))
			items.append(t);
	}

	for(const QJsonValue &item : items) {
		QString tag = item.isString() ? item.toString().trimmed()
									  : item.toVariant().toString();
		if(tag.isEmpty())
			continue;
		if(!tag.startsWith('#'))
			tag.prepend('#');
		tags << tag;
	}
	return tags;
}

FileMetadata extract(const QString &text)
{
	static const QRegularExpression inlineTag(
		QStringLiteral("(?:^|\\s)#([\\p{L}\\p{N}_/-]*[\\p{L}_/-][\\p{L}\\p{N}_/-]*)"),
		QRegularExpression::MultilineOption);
	static const QRegularExpression wikiLink(
		QStringLiteral("(!?)\\[\\[([^\\]|#\\n]+)(?:#[^\\]|\\n]*)?(?:\\|[^\\]\\n]*)?\\]\\]"));
	static const QRegularExpression mdLink(
		QStringLiteral("(?<!!)\\[[^\\]\\n]*\\]\\(([^)\\s]+)\\)"));

	FileMetadata meta;

	QString yaml, body;
	if(splitFrontmatter(text, yaml, body)) {
		meta.hasFrontmatter = true;
		meta.frontmatter = parseFrontmatter(yaml);
		meta.tags = frontmatterTags(meta.frontmatter);
	}

	const QString prose = stripCode(body);

	auto tags = inlineTag.globalMatch(prose);
	while(tags.hasNext())
		meta.tags << '#' + tags.next().captured(1);

	auto links = wikiLink.globalMatch(prose);
	while(links.hasNext()) {
		const QRegularExpressionMatch m = links.next();
		const QString target = m.captured(2).trimmed();
		if(target.isEmpty())
			continue;
		if(m.captured(1).isEmpty())
			meta.links << target;
		else
			meta.embeds << target;
	}

	auto mdLinks = mdLink.globalMatch(prose);
	while(mdLinks.hasNext()) {
		const QString href = mdLinks.next().captured(1);
		if(href.contains(QStringLiteral("://")) || href.startsWith('#'))
			continue;
		const QString target =
			QUrl::fromPercentEncoding(href.section('#', 0, 0).toUtf8());
		if(!target.isEmpty())
			meta.links << target;
	}

	meta.tags.removeDuplicates();
	meta.links.removeDuplicates();
	meta.embeds.removeDuplicates();
	return meta;
}

}
}
