// SPDX-License-Identifier: GPL-3.0-or-later

#include "libhost/hostlog.h"
#include "libshared/util/credentials.h"

#include <QtTest/QtTest>

using host::InMemoryLog;
using host::Log;

class TestHostLog final : public QObject
{
	Q_OBJECT
private slots:
	void testSessionEntry()
	{
		const Log e = Log()
			.about(Log::Level::Info, Log::Topic::Auth)
			.session("peer-1234")
			.identity("alice@example.com")
			.access(Log::Access::ReadOnly)
			.message("Handshake accepted");

		QCOMPARE(e.toString(true), QString("Auth [peer-1234 alice@example.com (RO)]: Handshake accepted"));
	}

	void testUnauthenticatedEntry()
	{
		const Log e = Log()
			.about(Log::Level::Warn, Log::Topic::BadData)
			.session("peer-1234")
			.message("Unparseable message");

		QCOMPARE(e.toString(true), QString("BadData [peer-1234]: Unparseable message"));
		QVERIFY(e.toString().contains(" WARN BadData"));
	}

	void testHostEntry()
	{
		const Log e = Log().about(Log::Level::Debug, Log::Topic::Liveness).message("Heartbeat OK");
		QCOMPARE(e.toString(true), QString("Liveness: Heartbeat OK"));
		QCOMPARE(e.access(), Log::Access::None);
	}

	void testCredentialHashesAreMasked_data()
	{
		const QString hash = credentials::sha256Hex("hunter2");

		QTest::addColumn<QString>("message");
		QTest::addColumn<QString>("expected");

		QTest::newRow("bare digest")
			<< QString("Owner hash %1 rejected").arg(hash)
			<< QString("Owner hash [redacted] rejected");
		QTest::newRow("json field")
			<< QString("{\"cmd\":\"HANDSHAKE\",\"authHash\":\"%1\"}").arg(hash)
			<< QString("{\"cmd\":\"HANDSHAKE\",\"authHash\":[redacted]}");
		QTest::newRow("short field value")
			<< QString("authHash=abc123, retrying")
			<< QString("authHash=[redacted], retrying");
		QTest::newRow("uppercase digest")
			<< hash.toUpper()
			<< QString("[redacted]");
		QTest::newRow("too short to be a digest")
			<< QString("request deadbeef failed")
			<< QString("request deadbeef failed");
		QTest::newRow("longer hex run")
			<< hash + "00"
			<< hash + "00";
	}

	void testCredentialHashesAreMasked()
	{
		QFETCH(QString, message);
		QFETCH(QString, expected);

		const Log e = Log().message(message);
		QCOMPARE(e.message(), expected);
	}

	void testStoredEntriesAreMasked()
	{
		InMemoryLog hostlog;
		hostlog.setSilent(true);

		const QString hash = credentials::sha256Hex("ownerpass");
		Log().about(Log::Level::Warn, Log::Topic::Auth).message("bad hash " + hash).to(&hostlog);

		const QList<Log> entries = hostlog.query().get();
		QCOMPARE(entries.size(), 1);
		QVERIFY(!entries.first().message().contains(hash));
		QVERIFY(!entries.first().toString().contains(hash));
	}

	void testQueries()
	{
		InMemoryLog hostlog;
		hostlog.setSilent(true);

		hostlog.logMessage(Log().about(Log::Level::Info, Log::Topic::Status).message("Host started"));
		hostlog.logMessage(Log().about(Log::Level::Info, Log::Topic::Session).session("peer-1").message("Offer"));
		hostlog.logMessage(Log().about(Log::Level::Info, Log::Topic::Auth).session("peer-1").identity("Alice@Example.com").message("Linked"));
		hostlog.logMessage(Log().about(Log::Level::Debug, Log::Topic::Command).session("peer-1").identity("alice@example.com").message("GET_TREE"));
		hostlog.logMessage(Log().about(Log::Level::Warn, Log::Topic::Auth).session("peer-2").identity("mallory@example.com").message("Denied"));

		QCOMPARE(hostlog.query().get().size(), 5);
		QCOMPARE(hostlog.query().get().first().message(), QString("Denied"));
		QCOMPARE(hostlog.query().session("peer-1").get().size(), 3);
		QCOMPARE(hostlog.query().identity("alice@example.com").get().size(), 2);
		QCOMPARE(hostlog.query().topic(Log::Topic::Auth).get().size(), 2);
		QCOMPARE(hostlog.query().atleast(Log::Level::Info).get().size(), 4);
		QCOMPARE(hostlog.query().atleast(Log::Level::Warn).get().size(), 1);

		const QList<Log> second = hostlog.query().page(1, 2).get();
		QCOMPARE(second.size(), 2);
		QCOMPARE(second.first().message(), QString("Linked"));
	}

	void testAfter()
	{
		InMemoryLog hostlog;
		hostlog.setSilent(true);

		const QDateTime base = QDateTime::currentDateTimeUtc();
		hostlog.logMessage(Log().at(base.addSecs(-10)).message("old"));
		hostlog.logMessage(Log().at(base.addSecs(5)).message("new"));

		const QList<Log> recent = hostlog.query().after(base).get();
		QCOMPARE(recent.size(), 1);
		QCOMPARE(recent.first().message(), QString("new"));
	}

	void testHistoryLimit()
	{
		InMemoryLog hostlog;
		hostlog.setSilent(true);
		for(int i=1;i<=5;++i)
			hostlog.logMessage(Log().message(QString("Entry %1").arg(i)));

		hostlog.setHistoryLimit(3);
		QCOMPARE(hostlog.historySize(), 3);
		QCOMPARE(hostlog.query().get().first().message(), QString("Entry 5"));
		QCOMPARE(hostlog.query().get().last().message(), QString("Entry 3"));

		hostlog.logMessage(Log().message("Entry 6"));
		QCOMPARE(hostlog.historySize(), 3);
		QCOMPARE(hostlog.query().get().last().message(), QString("Entry 4"));
	}
};


QTEST_MAIN(TestHostLog)
#include "hostlog.moc"
