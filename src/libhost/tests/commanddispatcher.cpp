// SPDX-License-Identifier: GPL-3.0-or-later

#include "libhost/commanddispatcher.h"
#include "libhost/hostlog.h"
#include "testfakes.h"

#include <QtTest/QtTest>

using host::CommandDispatcher;
using host::Permission;
using net::Command;
using net::Envelope;
using testfakes::MemoryVault;

namespace {

Command cmd(const QString &name, const QJsonObject &args = QJsonObject(), const QJsonValue &requestId = QJsonValue())
{
	Command c;
	c.cmd = name;
	c.args = args;
	c.requestId = requestId;
	return c;
}

class ThrowingRenderer final : public host::ContentRenderer
{
public:
	bool render(const QString &, const QString &, QString &, QString *) override
	{
		throw std::runtime_error("renderer exploded");
	}
};

}

class TestCommandDispatcher final : public QObject
{
	Q_OBJECT
private slots:
	void init()
	{
		m_vault.reset(new MemoryVault);
		m_vault->put("Home.md", "---\ntags: [start]\n---\n# Home\nSee [[Projects/Plan]] and [[Missing]].\n#inbox\n");
		m_vault->put("Projects/Plan.md", "Back to [[Home]]\n![[diagram.png]]\n");
		m_vault->put("Journal.md", "Nothing about home here. Except Home.\n");
		m_vault->putBinary("diagram.png", QByteArray("\x89PNG\r\n", 6));
		m_dispatcher.reset(new CommandDispatcher(m_vault.data()));
	}

	void testCommandTable()
	{
		const QStringList names = CommandDispatcher::commandNames();
		for(const char *n : {"GET_TREE", "GET_RENDERED_FILE", "OPEN_FILE", "GET_FILE", "SEARCH", "SAVE_FILE", "CREATE_FILE", "CREATE_FOLDER", "RENAME_FILE", "DELETE_FILE"})
			QVERIFY2(names.contains(n), n);

		QVERIFY(CommandDispatcher::isMutating("SAVE_FILE"));
		QVERIFY(CommandDispatcher::isMutating("DELETE_FILE"));
		QVERIFY(!CommandDispatcher::isMutating("GET_FILE"));
		QVERIFY(!CommandDispatcher::isKnownCommand("FORMAT_DISK"));
	}

	void testUnknownCommand()
	{
		const Envelope e = m_dispatcher->dispatch(cmd("FORMAT_DISK", {}, "r9"), Permission::ReadWrite);
		QVERIFY(e.isError());
		QCOMPARE(e.errorMessage(), QString("Unknown command: FORMAT_DISK"));
		QCOMPARE(e.requestId().toString(), QString("r9"));
	}

	void testReadOnlyRefusesEveryWrite_data()
	{
		QTest::addColumn<QString>("name");
		QTest::addColumn<QJsonObject>("args");

		QTest::newRow("save") << "SAVE_FILE" << QJsonObject{{"path", "Home.md"}, {"data", "x"}};
		QTest::newRow("create") << "CREATE_FILE" << QJsonObject{{"path", "New.md"}};
		QTest::newRow("folder") << "CREATE_FOLDER" << QJsonObject{{"path", "Dir"}};
		QTest::newRow("rename") << "RENAME_FILE" << QJsonObject{{"path", "Home.md"}, {"data", QJsonObject{{"newPath", "H.md"}}}};
		QTest::newRow("delete") << "DELETE_FILE" << QJsonObject{{"path", "Home.md"}};
		QTest::newRow("bad path") << "DELETE_FILE" << QJsonObject{{"path", "../../etc/passwd"}};
	}

	void testReadOnlyRefusesEveryWrite()
	{
		QFETCH(QString, name);
		QFETCH(QJsonObject, args);

		const Envelope e = m_dispatcher->dispatch(cmd(name, args, 5), Permission::ReadOnly);
		QVERIFY(e.isError());
		QCOMPARE(e.errorMessage(), QString(host::READ_ONLY_ERROR));
		QCOMPARE(e.requestId().toInt(), 5);
		QCOMPARE(m_vault->writeCount(), 0);
	}

	void testReadOnlyMayRead()
	{
		QVERIFY(!m_dispatcher->dispatch(cmd("GET_TREE"), Permission::ReadOnly).isError());
		QVERIFY(!m_dispatcher->dispatch(cmd("GET_FILE", {{"path", "Home.md"}}), Permission::ReadOnly).isError());
		QVERIFY(!m_dispatcher->dispatch(cmd("SEARCH", {{"query", "home"}}), Permission::ReadOnly).isError());
		QCOMPARE(m_vault->writeCount(), 0);
	}

	void testReadOnlyNeverCreatesMissingNotes()
	{
		m_dispatcher->setAutoCreateMissing(true);
		const Envelope e = m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Ghost.md"}}), Permission::ReadOnly);
		QVERIFY(e.isError());
		QCOMPARE(e.errorMessage(), QString("File not found"));
		QCOMPARE(m_vault->writeCount(), 0);

		const Envelope rw = m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Ghost.md"}}), Permission::ReadWrite);
		QCOMPARE(rw.type, QString("RENDERED_FILE"));
		QVERIFY(m_vault->exists("Ghost.md"));

		m_dispatcher->setAutoCreateMissing(false);
		QVERIFY(m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Ghost2.md"}}), Permission::ReadWrite).isError());
		QVERIFY(!m_vault->exists("Ghost2.md"));
	}

	void testTree()
	{
		const Envelope e = m_dispatcher->dispatch(cmd("GET_TREE"), Permission::ReadWrite);
		QCOMPARE(e.type, QString("TREE"));

		const QJsonArray files = e.payload.toObject()["files"].toArray();
		QCOMPARE(files.size(), 3); // the image isn't a note

		QJsonObject home;
		for(const QJsonValue &f : files) {
			if(f.toObject()["path"].toString() == "Home.md")
				home = f.toObject();
		}
		const QJsonArray tags = home["tags"].toArray();
		QVERIFY(tags.contains("#start"));
		QVERIFY(tags.contains("#inbox"));
		QVERIFY(home["links"].toArray().contains("Projects/Plan"));

		QVERIFY(e.payload.toObject()["folders"].toArray().contains("Projects"));
	}

	void testGetFile()
	{
		Envelope e = m_dispatcher->dispatch(cmd("GET_FILE", {{"path", "Projects/Plan.md"}}, "a"), Permission::ReadWrite);
		QCOMPARE(e.type, QString("FILE"));
		QCOMPARE(e.payload.toObject()["data"].toString(), QString("Back to [[Home]]\n![[diagram.png]]\n"));
		QCOMPARE(e.meta["path"].toString(), QString("Projects/Plan.md"));
		QCOMPARE(e.requestId().toString(), QString("a"));

		e = m_dispatcher->dispatch(cmd("GET_FILE", {{"path", "diagram.png"}}), Permission::ReadWrite);
		QCOMPARE(e.type, QString("FILE"));
		QCOMPARE(QByteArray::fromBase64(e.payload.toString().toLatin1()), QByteArray("\x89PNG\r\n", 6));
		QCOMPARE(e.meta["isImage"].toBool(), true);
		QCOMPARE(e.meta["ext"].toString(), QString("png"));

		e = m_dispatcher->dispatch(cmd("GET_FILE", {{"path", "nope.md"}}), Permission::ReadWrite);
		QCOMPARE(e.errorMessage(), QString("File not found"));

		e = m_dispatcher->dispatch(cmd("GET_FILE", {{"path", ".."}}), Permission::ReadWrite);
		QCOMPARE(e.errorMessage(), QString("Invalid path"));
	}

	void testPathTraversalIsConfined()
	{
		const Envelope e = m_dispatcher->dispatch(cmd("GET_FILE", {{"path", "../../Home.md"}}), Permission::ReadWrite);
		QCOMPARE(e.type, QString("FILE"));
		QCOMPARE(e.meta["path"].toString(), QString("Home.md"));
	}

	void testRenderedFileAndGraph()
	{
		const Envelope e = m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Projects/Plan.md"}}), Permission::ReadOnly);
		QCOMPARE(e.type, QString("RENDERED_FILE"));

		const QJsonObject p = e.payload.toObject();
		const QString html = p["html"].toString();
		QVERIFY(html.contains("class=\"internal-link\""));
		// The embedded image was inlined
		QVERIFY(html.contains("src=\"data:image/png;base64,"));
		QVERIFY(!html.contains("app://local/"));

		QCOMPARE(p["backlinks"].toArray(), QJsonArray{"Home.md"});

		const QJsonObject graph = p["graph"].toObject();
		const QJsonArray nodes = graph["nodes"].toArray();
		QCOMPARE(nodes.first().toObject()["id"].toString(), QString("Projects/Plan.md"));
		QCOMPARE(nodes.first().toObject()["group"].toString(), QString("center"));

		QStringList ids;
		for(const QJsonValue &n : nodes)
			ids << n.toObject()["id"].toString();
		QVERIFY(ids.contains("Home.md"));
		QCOMPARE(ids.count("Home.md"), 1);
		QCOMPARE(graph["edges"].toArray().size(), 2);
	}

	void testLinkIndexListsVaultOnce()
	{
		for(int i=0;i<40;++i) {
			m_vault->put(
				QString("Notes/N%1.md").arg(i),
				QString("[[Home]] [[N%1]] [[Gone%2]] [[Projects/Plan|plan]]").arg((i + 1) % 40).arg(i));
		}

		m_vault->listings = 0;
		const QHash<QString, QStringList> index = m_vault->resolvedLinks();
		QCOMPARE(m_vault->listings, 1);
		QCOMPARE(
			index.value("Notes/N3.md"),
			(QStringList{"Home.md", "Notes/N4.md", "Projects/Plan.md"}));

		const Envelope e = m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Home.md"}}), Permission::ReadOnly);
		QCOMPARE(e.type, QString("RENDERED_FILE"));
		QCOMPARE(e.payload.toObject()["backlinks"].toArray().size(), 41);
	}

	void testFrontmatterInRenderedFile()
	{
		const Envelope e = m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Home.md"}}), Permission::ReadOnly);
		const QJsonObject p = e.payload.toObject();
		QCOMPARE(p["yaml"].toObject()["tags"].toArray(), QJsonArray{"start"});
		QVERIFY(!p["html"].toString().contains("tags:"));

		// Unresolved links still show up in the graph under their own name
		QStringList ids;
		for(const QJsonValue &n : p["graph"].toObject()["nodes"].toArray())
			ids << n.toObject()["id"].toString();
		QVERIFY(ids.contains("Missing"));
	}

	void testOpenFile()
	{
		Envelope e = m_dispatcher->dispatch(cmd("OPEN_FILE", {{"path", "Home.md"}}), Permission::ReadOnly);
		QCOMPARE(e.type, QString("OPEN_FILE"));
		QVERIFY(e.payload.toObject().contains("html"));

		m_dispatcher->setAutoCreateMissing(true);
		e = m_dispatcher->dispatch(cmd("OPEN_FILE", {{"path", "Nothing.md"}}), Permission::ReadWrite);
		QVERIFY(e.isError());
		QCOMPARE(m_vault->writeCount(), 0);
	}

	void testSearch()
	{
		Envelope e = m_dispatcher->dispatch(cmd("SEARCH", {{"query", "HOME"}}), Permission::ReadOnly);
		QCOMPARE(e.type, QString("SEARCH_RESULTS"));
		QCOMPARE(e.payload.toObject()["query"].toString(), QString("HOME"));

		const QJsonArray results = e.payload.toObject()["results"].toArray();
		QStringList paths;
		for(const QJsonValue &r : results)
			paths << r.toObject()["path"].toString();
		QVERIFY(paths.contains("Home.md"));
		QVERIFY(paths.contains("Journal.md"));
		QVERIFY(paths.contains("Projects/Plan.md"));

		for(const QJsonValue &r : results) {
			if(r.toObject()["path"].toString() == "Journal.md") {
				const QJsonObject m = r.toObject()["matches"].toArray().first().toObject();
				QCOMPARE(m["lineNum"].toInt(), 1);
				QCOMPARE(m["text"].toString(), QString("Nothing about home here. Except Home."));
			}
		}

		e = m_dispatcher->dispatch(cmd("SEARCH", {{"query", "zebra"}}), Permission::ReadOnly);
		QVERIFY(e.payload.toObject()["results"].toArray().isEmpty());

		e = m_dispatcher->dispatch(cmd("SEARCH", {{"query", "  "}}), Permission::ReadOnly);
		QCOMPARE(e.errorMessage(), QString("Missing search query"));
	}

	void testSave()
	{
		Envelope e = m_dispatcher->dispatch(cmd("SAVE_FILE", {{"path", "Journal.md"}, {"data", "new text"}}), Permission::ReadWrite);
		QCOMPARE(e.type, QString("SAVED"));
		QCOMPARE(e.payload.toObject()["path"].toString(), QString("Journal.md"));
		QCOMPARE(m_vault->content("Journal.md"), QString("new text"));

		e = m_dispatcher->dispatch(cmd("SAVE_FILE", {{"path", "Journal.md"}}), Permission::ReadWrite);
		QCOMPARE(e.errorMessage(), QString("Missing file content"));

		e = m_dispatcher->dispatch(cmd("SAVE_FILE", {{"path", "New.md"}, {"data", "x"}}), Permission::ReadWrite);
		QCOMPARE(e.errorMessage(), QString("File not found"));
	}

	void testCreateChain()
	{
		Envelope e = m_dispatcher->dispatch(cmd("CREATE_FILE", {{"path", "Ideas/New.md"}, {"data", "Link to [[Home]]"}}), Permission::ReadWrite);
		QCOMPARE(e.type, QString("RENDERED_FILE"));
		QCOMPARE(e.meta["path"].toString(), QString("Ideas/New.md"));

		// The reply carries the new file list
		QStringList paths;
		for(const QJsonValue &f : e.payload.toObject()["files"].toArray())
			paths << f.toObject()["path"].toString();
		QVERIFY(paths.contains("Ideas/New.md"));
		QVERIFY(paths.contains("diagram.png"));

		e = m_dispatcher->dispatch(cmd("CREATE_FILE", {{"path", "Ideas/New.md"}}), Permission::ReadWrite);
		QCOMPARE(e.errorMessage(), QString("File already exists"));

		e = m_dispatcher->dispatch(cmd("CREATE_FOLDER", {{"path", "Archive"}}), Permission::ReadWrite);
		QCOMPARE(e.type, QString("SAVED"));
		QVERIFY(m_vault->isFolder("Archive"));
		e = m_dispatcher->dispatch(cmd("CREATE_FOLDER", {{"path", "Archive"}}), Permission::ReadWrite);
		QCOMPARE(e.errorMessage(), QString("Folder already exists"));
	}

	void testRenameAndDelete()
	{
		Envelope e = m_dispatcher->dispatch(cmd("RENAME_FILE", {{"path", "Journal.md"}, {"data", QJsonObject{{"newPath", "Diary.md"}}}}), Permission::ReadWrite);
		QCOMPARE(e.type, QString("SAVED"));
		QCOMPARE(e.payload.toObject()["path"].toString(), QString("Diary.md"));
		QVERIFY(!m_vault->exists("Journal.md"));
		QVERIFY(m_vault->exists("Diary.md"));

		// Never overwrite
		const int writes = m_vault->writeCount();
		e = m_dispatcher->dispatch(cmd("RENAME_FILE", {{"path", "Diary.md"}, {"newPath", "Home.md"}}), Permission::ReadWrite);
		QVERIFY(e.isError());
		QCOMPARE(m_vault->writeCount(), writes);

		e = m_dispatcher->dispatch(cmd("DELETE_FILE", {{"path", "Diary.md"}}), Permission::ReadWrite);
		QCOMPARE(e.type, QString("SAVED"));
		QVERIFY(!m_vault->exists("Diary.md"));

		e = m_dispatcher->dispatch(cmd("DELETE_FILE", {{"path", "Diary.md"}}), Permission::ReadWrite);
		QCOMPARE(e.errorMessage(), QString("File not found"));
	}

	void testHandlerExceptionBecomesError()
	{
		ThrowingRenderer renderer;
		host::InMemoryLog log;
		log.setSilent(true);
		m_dispatcher->setRenderer(&renderer);
		m_dispatcher->setLogger(&log);

		const Envelope e = m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Home.md"}}, 3), Permission::ReadWrite);
		QVERIFY(e.isError());
		QCOMPARE(e.errorMessage(), QString("GET_RENDERED_FILE failed"));
		QCOMPARE(e.requestId().toInt(), 3);
		QCOMPARE(log.query().atleast(host::Log::Level::Error).get().size(), 1);

		m_dispatcher->setRenderer(nullptr);
		QVERIFY(!m_dispatcher->dispatch(cmd("GET_RENDERED_FILE", {{"path", "Home.md"}}), Permission::ReadWrite).isError());
	}

private:
	QScopedPointer<MemoryVault> m_vault;
	QScopedPointer<CommandDispatcher> m_dispatcher;
};


QTEST_MAIN(TestCommandDispatcher)
#include "commanddispatcher.moc"
