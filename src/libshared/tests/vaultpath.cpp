// SPDX-License-Identifier: GPL-3.0-or-later

#include "libshared/util/vaultpath.h"

#include <QtTest/QtTest>

class TestVaultPath final : public QObject
{
	Q_OBJECT
private slots:
	void testSanitize_data()
	{
		QTest::addColumn<QString>("input");
		QTest::addColumn<QString>("expected");

		QTest::newRow("plain") << "Notes/Today.md" << "Notes/Today.md";
		QTest::newRow("backslashes") << "Notes\\Sub\\a.md" << "Notes/Sub/a.md";
		QTest::newRow("leading slash") << "/etc/passwd" << "etc/passwd";
		QTest::newRow("parent") << "../../secret.md" << "secret.md";
		QTest::newRow("embedded parent") << "a/../b.md" << "a/b.md";
		QTest::newRow("windows parent") << "..\\..\\x.md" << "x.md";
		QTest::newRow("hidden dots") << "....//x.md" << "x.md";
		QTest::newRow("dot segments") << "./a/./b.md" << "a/b.md";
		QTest::newRow("null byte") << QString(QString("a.md") + QChar(0) + QString(".png")) << "a.md.png";
		QTest::newRow("only dots") << ".." << "";
		QTest::newRow("empty") << "" << "";
		QTest::newRow("whitespace") << "  a.md  " << "a.md";
	}

	void testSanitize()
	{
		QFETCH(QString, input);
		QFETCH(QString, expected);

		const QString clean = vaultpath::sanitize(input);
		QCOMPARE(clean, expected);
		QVERIFY(!clean.contains(".."));
		QVERIFY(!clean.startsWith('/'));
	}

	void testComponents()
	{
		QCOMPARE(vaultpath::fileName("a/b/Note.MD"), QString("Note.MD"));
		QCOMPARE(vaultpath::baseName("a/b/Note.MD"), QString("Note"));
		QCOMPARE(vaultpath::extension("a/b/Note.MD"), QString("md"));
		QCOMPARE(vaultpath::parentPath("a/b/Note.md"), QString("a/b"));
		QCOMPARE(vaultpath::parentPath("Note.md"), QString());
		QCOMPARE(vaultpath::extension(".hidden"), QString());
		QVERIFY(vaultpath::isMarkdown("x/y.md"));
		QVERIFY(!vaultpath::isMarkdown("x/y.png"));
	}
};


QTEST_MAIN(TestVaultPath)
#include "vaultpath.moc"
