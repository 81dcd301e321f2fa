// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/markdownrenderer.h"
#include <QRegularExpression>
#include <QStringList>
#include <functional>

namespace host {

namespace {

QString embedTag(const QString &target, const QString &alt)
{
	const QString escaped = target.toHtmlEscaped();
	return QStringLiteral(
			   "<img class=\"internal-embed\" data-src=\"%1\" "
			   "src=\"app://local/%1\" alt=\"%2\">")
		.arg(escaped, alt.toHtmlEscaped());
}

QString wikiLinkTag(const QString &target, const QString &label)
{
	return QStringLiteral(
			   "<a class=\"internal-link\" data-href=\"%1\" href=\"%1\">%2</a>")
		.arg(target.toHtmlEscaped(), label.toHtmlEscaped());
}

}

QString MarkdownRenderer::renderInline(const QString &text)
{
	static const QRegularExpression codeSpan(QStringLiteral("`([^`]+)`"));
	static const QRegularExpression embed(
		QStringLiteral("!\\[\\[([^\\]|]+)(?:\\|([^\\]]*))?\\]\\]"));
	static const QRegularExpression wiki(
		QStringLiteral("\\[\\[([^\\]|]+)(?:\\|([^\\]]*))?\\]\\]"));
	static const QRegularExpression image(
		QStringLiteral("!\\[([^\\]]*)\\]\\(([^)\\s]+)\\)"));
	static const QRegularExpression link(
		QStringLiteral("\\[([^\\]]+)\\]\\(([^)\\s]+)\\)"));
	static const QRegularExpression bold(QStringLiteral("\\*\\*(.+?)\\*\\*|__(.+?)__"));
	static const QRegularExpression italic(
		QStringLiteral("(?<![*\\w])\\*(?!\\s)(.+?)(?<!\\s)\\*(?!\\*)|(?<![_\\w])_(?!\\s)(.+?)(?<!\\s)_(?![_\\w])"));
	static const QRegularExpression strike(QStringLiteral("~~(.+?)~~"));
	static const QRegularExpression highlight(QStringLiteral("==(.+?)=="));
	static const QRegularExpression tag(
		QStringLiteral("(^|\\s)#([\\p{L}\\p{N}_/-]*[\\p{L}_/-][\\p{L}\\p{N}_/-]*)"));

	// Pull out the parts that must not be processed further and put
	// placeholders in their place.
	QStringList protectedParts;
	const auto protect = [&protectedParts](const QString &html) {
		protectedParts << html;
		return QStringLiteral("\x01%1\x02").arg(protectedParts.size() - 1);
	};

	QString out;
	QString rest = text;

	const auto replaceAll =
		[&](const QRegularExpression &re,
			const std::function<QString(const QRegularExpressionMatch &)> &fn) {
			QString result;
			int pos = 0;
			auto it = re.globalMatch(rest);
			while(it.hasNext()) {
				const QRegularExpressionMatch m = it.next();
				result += rest.mid(pos, m.capturedStart() - pos);
				result += fn(m);
				pos = m.capturedEnd();
			}
			result += rest.mid(pos);
			rest = result;
		};

	replaceAll(codeSpan, [&](const QRegularExpressionMatch &m) {
		return protect(
			QStringLiteral("<code>%1</code>").arg(m.captured(1).toHtmlEscaped()));
	});
	replaceAll(embed, [&](const QRegularExpressionMatch &m) {
		return protect(embedTag(m.captured(1).trimmed(), m.captured(2)));
	});
	replaceAll(wiki, [&](const QRegularExpressionMatch &m) {
		const QString target = m.captured(1).trimmed();
		const QString label =
			m.captured(2).isEmpty() ? target : m.captured(2).trimmed();
		return protect(wikiLinkTag(target, label));
	});
	replaceAll(image, [&](const QRegularExpressionMatch &m) {
		const QString src = m.captured(2);
		if(src.contains(QStringLiteral("://")) || src.startsWith(QStringLiteral("data:"))) {
			return protect(QStringLiteral("<img src=\"%1\" alt=\"%2\">")
							   .arg(src.toHtmlEscaped(), m.captured(1).toHtmlEscaped()));
		}
		return protect(embedTag(src, m.captured(1)));
	});
	replaceAll(link, [&](const QRegularExpressionMatch &m) {
		const QString href = m.captured(2);
		if(href.contains(QStringLiteral("://")) || href.startsWith(QStringLiteral("mailto:"))) {
			return protect(QStringLiteral("<a class=\"external-link\" href=\"%1\">%2</a>")
							   .arg(href.toHtmlEscaped(), m.captured(1).toHtmlEscaped()));
		}
		return protect(wikiLinkTag(href, m.captured(1)));
	});

	rest = rest.toHtmlEscaped();

	rest.replace(bold, QStringLiteral("<strong>\\1\\2</strong>"));
	rest.replace(italic, QStringLiteral("<em>\\1\\2</em>"));
	rest.replace(strike, QStringLiteral("<del>\\1</del>"));
	rest.replace(highlight, QStringLiteral("<mark>\\1</mark>"));
	rest.replace(
		tag, QStringLiteral("\\1<a class=\"tag\" href=\"#\\2\">#\\2</a>"));

	static const QRegularExpression placeholder(QStringLiteral("\x01(\\d+)\x02"));
	auto it = placeholder.globalMatch(rest);
	int pos = 0;
	while(it.hasNext()) {
		const QRegularExpressionMatch m = it.next();
		out += rest.mid(pos, m.capturedStart() - pos);
		out += protectedParts.value(m.captured(1).toInt());
		pos = m.capturedEnd();
	}
	out += rest.mid(pos);
	return out;
}

bool MarkdownRenderer::render(
	const QString &markdown, const QString &sourcePath, QString &html,
	QString *errorMessage)
{
	Q_UNUSED(sourcePath);
	Q_UNUSED(errorMessage);

	static const QRegularExpression heading(QStringLiteral("\\A(#{1,6})\\s+(.*?)\\s*#*\\s*\\z"));
	static const QRegularExpression rule(QStringLiteral("\\A\\s*([-*_])(\\s*\\1){2,}\\s*\\z"));
	static const QRegularExpression bullet(QStringLiteral("\\A\\s*[-*+]\\s+(.*)\\z"));
	static const QRegularExpression numbered(QStringLiteral("\\A\\s*\\d+[.)]\\s+(.*)\\z"));
	static const QRegularExpression task(QStringLiteral("\\A\\[([ xX])\\]\\s+(.*)\\z"));
	static const QRegularExpression fence(QStringLiteral("\\A\\s*(```|~~~)\\s*([\\w+-]*)"));

	QString out;
	QStringList paragraph;
	QStringList quote;
	QString listTag;

	const auto closeParagraph = [&]() {
		if(!paragraph.isEmpty()) {
			out += QStringLiteral("<p>") + renderInline(paragraph.join('\n')).replace('\n', QStringLiteral("<br>")) +
				   QStringLiteral("</p>\n");
			paragraph.clear();
		}
	};
	const auto closeList = [&]() {
		if(!listTag.isEmpty()) {
			out += QStringLiteral("</%1>\n").arg(listTag);
			listTag.clear();
		}
	};
	const auto closeQuote = [&]() {
		if(!quote.isEmpty()) {
			QString inner;
			render(quote.join('\n'), sourcePath, inner, nullptr);
			out += QStringLiteral("<blockquote>\n") + inner + QStringLiteral("</blockquote>\n");
			quote.clear();
		}
	};
	const auto closeAll = [&]() {
		closeParagraph();
		closeList();
		closeQuote();
	};

	const QStringList lines = QString(markdown).replace(QStringLiteral("\r\n"), QStringLiteral("\n")).split('\n');
	for(int i = 0; i < lines.size(); ++i) {
		const QString &line = lines.at(i);

		const QRegularExpressionMatch f = fence.match(line);
		if(f.hasMatch()) {
			closeAll();
			const QString marker = f.captured(1);
			QStringList code;
			++i;
			while(i < lines.size() && !lines.at(i).trimmed().startsWith(marker))
				code << lines.at(i++);

			const QString lang = f.captured(2);
			out += lang.isEmpty()
					   ? QStringLiteral("<pre><code>")
					   : QStringLiteral("<pre><code class=\"language-%1\">").arg(lang.toHtmlEscaped());
			out += code.join('\n').toHtmlEscaped() + QStringLiteral("</code></pre>\n");
			continue;
		}

		if(line.startsWith('>')) {
			closeParagraph();
			closeList();
			QString q = line.mid(1);
			if(q.startsWith(' '))
				q.remove(0, 1);
			quote << q;
			continue;
		}
		closeQuote();

		if(line.trimmed().isEmpty()) {
			closeParagraph();
			closeList();
			continue;
		}

		const QRegularExpressionMatch h = heading.match(line);
		if(h.hasMatch()) {
			closeAll();
			const int level = h.captured(1).length();
			out += QStringLiteral("<h%1>%2</h%1>\n").arg(level).arg(renderInline(h.captured(2)));
			continue;
		}

		if(rule.match(line).hasMatch()) {
			closeAll();
			out += QStringLiteral("<hr>\n");
			continue;
		}

		QRegularExpressionMatch item = bullet.match(line);
		QString itemTag = QStringLiteral("ul");
		if(!item.hasMatch()) {
			item = numbered.match(line);
			itemTag = QStringLiteral("ol");
		}
		if(item.hasMatch()) {
			closeParagraph();
			if(listTag != itemTag) {
				closeList();
				listTag = itemTag;
				out += QStringLiteral("<%1>\n").arg(listTag);
			}

			const QRegularExpressionMatch t = task.match(item.captured(1));
			if(t.hasMatch()) {
				const bool checked = t.captured(1) != QStringLiteral(" ");
				out += QStringLiteral(
						   "<li class=\"task-list-item\"><input type=\"checkbox\" disabled%1> %2</li>\n")
						   .arg(checked ? QStringLiteral(" checked") : QString(), renderInline(t.captured(2)));
			} else {
				out += QStringLiteral("<li>%1</li>\n").arg(renderInline(item.captured(1)));
			}
			continue;
		}

		closeList();
		paragraph << line.trimmed();
	}
	closeAll();

	html = out;
	return true;
}

}
