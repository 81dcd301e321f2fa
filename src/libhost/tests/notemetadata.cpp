// SPDX-License-Identifier: GPL-3.0-or-later

#include "libhost/notemetadata.h"

#include <QJsonArray>
#include <QtTest/QtTest>

using namespace host;

class TestNoteMetadata final : public QObject {
	Q_OBJECT
private slots:
	void testSplitFrontmatter()
	{
		QString yaml, body;
		QVERIFY(notemeta::splitFrontmatter(
			"---\ntitle: Hello\n---\nBody text", yaml, body));
		QCOMPARE(yaml, QString("title: Hello"));
		QCOMPARE(body, QString("Body text"));

		QVERIFY(notemeta::splitFrontmatter(
			"---\r\ntitle: Hello\r\n---\r\nBody", yaml, body));
		QCOMPARE(body, QString("Body"));

		// Must be at the very beginning
		QVERIFY(!notemeta::splitFrontmatter(
			"Intro\n---\ntitle: x\n---\n", yaml, body));
		QCOMPARE(body, QString("Intro\n---\ntitle: x\n---\n"));
		QVERIFY(yaml.isEmpty());
	}

	void testParseFrontmatter()
	{
		const QJsonObject fm = notemeta::parseFrontmatter(
			"title: Hello world\n"
			"count: 3\n"
			"draft: true\n"
			"quoted: \"42\"\n"
			"# a comment\n"
			"inline: [one, two]\n"
			"aliases:\n"
			"  - first\n"
			"  - second\n"
			"nested:\n"
			"  key: value\n"
			"empty:\n");

		QCOMPARE(fm.value("title").toString(), QString("Hello world"));
		QCOMPARE(fm.value("count").toDouble(), 3.0);
		QCOMPARE(fm.value("draft").toBool(), true);
		QCOMPARE(fm.value("quoted").toString(), QString("42"));
		QCOMPARE(fm.value("inline").toArray(), (QJsonArray{"one", "two"}));
		QCOMPARE(fm.value("aliases").toArray(), (QJsonArray{"first", "second"}));
		QVERIFY(fm.contains("nested"));
		QVERIFY(fm.value("nested").isNull());
		QVERIFY(fm.contains("empty"));
		QVERIFY(fm.value("empty").isNull());
		QVERIFY(!fm.contains("key"));
	}

	void testFrontmatterTags()
	{
		QCOMPARE(
			notemeta::frontmatterTags(QJsonObject{{"tags", QJsonArray{"a", "#b"}}}),
			(QStringList{"#a", "#b"}));
		QCOMPARE(
			notemeta::frontmatterTags(QJsonObject{{"tags", "one, two three"}}),
			(QStringList{"#one", "#two", "#three"}));
		QVERIFY(notemeta::frontmatterTags(QJsonObject{}).isEmpty());
	}

	void testExtract()
	{
		const FileMetadata meta = notemeta::extract(
			"---\n"
			"tags: [project]\n"
			"---\n"
			"See [[Other|the other one]] and [[Other#Section]].\n"
			"Embedded ![[diagram.png]] here.\n"
			"A [markdown link](Folder/Note%20One.md#part) and [web](https://example.com).\n"
			"Tagged #inline and #nested/tag but not #2024 or a#b.\n"
			"`[[NotALink]] #notatag`\n"
			"```\n"
			"[[AlsoNot]] #neither\n"
			"```\n");

		QVERIFY(meta.hasFrontmatter);
		QCOMPARE(meta.frontmatter.value("tags").toArray(), QJsonArray{"project"});
		QCOMPARE(meta.tags, (QStringList{"#project", "#inline", "#nested/tag"}));
		QCOMPARE(meta.links, (QStringList{"Other", "Folder/Note One.md"}));
		QCOMPARE(meta.embeds, QStringList{"diagram.png"});
	}

	void testExtractPlain()
	{
		const FileMetadata meta = notemeta::extract("Just text");
		QVERIFY(!meta.hasFrontmatter);
		QVERIFY(meta.frontmatter.isEmpty());
		QVERIFY(meta.tags.isEmpty());
		QVERIFY(meta.links.isEmpty());
	}
};


QTEST_MAIN(TestNoteMetadata)
#include "notemetadata.moc"
