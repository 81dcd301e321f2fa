// SPDX-License-Identifier: GPL-3.0-or-later

#include "libhost/inmemoryconfig.h"

#include <QSignalSpy>
#include <QtTest/QtTest>

using namespace host;

class TestHostConfig final : public QObject {
	Q_OBJECT
private slots:
	void testParseTime_data()
	{
		QTest::addColumn<QString>("str");
		QTest::addColumn<int>("seconds");

		QTest::newRow("plain") << "30" << 30;
		QTest::newRow("seconds") << "45s" << 45;
		QTest::newRow("minutes") << "5m" << 300;
		QTest::newRow("fraction") << "1.5m" << 90;
		QTest::newRow("hours") << "2h" << 7200;
		QTest::newRow("days") << "1d" << 86400;
		QTest::newRow("spaced") << " 6 M " << 360;
		QTest::newRow("negative") << "-5" << -1;
		QTest::newRow("garbage") << "soon" << -1;
		QTest::newRow("unit") << "5w" << -1;
	}

	void testParseTime()
	{
		QFETCH(QString, str);
		QFETCH(int, seconds);
		QCOMPARE(HostConfig::parseTimeString(str), seconds);
	}

	void testParseSize_data()
	{
		QTest::addColumn<QString>("str");
		QTest::addColumn<int>("bytes");

		QTest::newRow("plain") << "10" << 10;
		QTest::newRow("bytes") << "10b" << 10;
		QTest::newRow("kb") << "550kb" << 563200;
		QTest::newRow("fraction") << "1.5kb" << 1536;
		QTest::newRow("mb") << "32MB" << 33554432;
		QTest::newRow("garbage") << "big" << -1;
	}

	void testParseSize()
	{
		QFETCH(QString, str);
		QFETCH(int, bytes);
		QCOMPARE(HostConfig::parseSizeString(str), bytes);
	}

	void testDefaults()
	{
		InMemoryConfig cfg;
		QCOMPARE(cfg.getConfigTime(config::HeartbeatInterval), 300);
		QCOMPARE(cfg.getConfigTime(config::StaleAfter), 360);
		QCOMPARE(cfg.getConfigTime(config::SessionIdleTimeout), 30);
		QCOMPARE(cfg.getConfigInt(config::DenyGraceMs), 1000);
		QCOMPARE(cfg.getConfigInt(config::MaxSessions), 10);
		QCOMPARE(cfg.getConfigSize(config::MaxReassemblySize), 32 * 1024 * 1024);
		QCOMPARE(cfg.getConfigBool(config::EnableRemoteAccess), true);
		QCOMPARE(cfg.getConfigBool(config::AutoCreateMissing), false);
		QCOMPARE(cfg.getConfigString(config::Email), QString());
		QVERIFY(!cfg.ownerRecord().isConfigured());
		QVERIFY(cfg.logger());
	}

	void testSetValues()
	{
		InMemoryConfig cfg;
		QSignalSpy spy(&cfg, &HostConfig::configValueChanged);

		QVERIFY(cfg.setConfigString(config::HeartbeatInterval, "2m"));
		QCOMPARE(cfg.getConfigTime(config::HeartbeatInterval), 120);
		QCOMPARE(spy.count(), 1);
		QCOMPARE(spy.at(0).at(0).toInt(), config::HeartbeatInterval.index);

		cfg.setConfigInt(config::MaxSessions, 3);
		QCOMPARE(cfg.getConfigInt(config::MaxSessions), 3);
		QCOMPARE(cfg.getConfigVariant(config::MaxSessions), QVariant(3));

		cfg.setConfigBool(config::AutoCreateMissing, true);
		QVERIFY(cfg.getConfigBool(config::AutoCreateMissing));
		QCOMPARE(cfg.getConfigString(config::AutoCreateMissing), QString("true"));
		QCOMPARE(spy.count(), 3);
	}

	void testInvalidValuesRejected()
	{
		InMemoryConfig cfg;
		QSignalSpy spy(&cfg, &HostConfig::configValueChanged);

		QVERIFY(!cfg.setConfigString(config::HeartbeatInterval, "often"));
		QVERIFY(!cfg.setConfigString(config::MaxReassemblySize, "lots"));
		QVERIFY(!cfg.setConfigString(config::MaxSessions, "ten"));
		QCOMPARE(spy.count(), 0);

		QCOMPARE(cfg.getConfigTime(config::HeartbeatInterval), 300);
		QCOMPARE(cfg.getConfigInt(config::MaxSessions), 10);
	}

	void testOwnerRecord()
	{
		InMemoryConfig cfg;
		cfg.setConfigString(config::Email, "  owner@example.com ");
		QVERIFY(!cfg.ownerRecord().isConfigured());

		cfg.setConfigString(config::OwnerHash, "abc123");
		cfg.setConfigString(config::VaultId, "vault-1");
		cfg.setConfigString(config::VaultPath, "/tmp/vault");

		const IdentityRecord owner = cfg.ownerRecord();
		QVERIFY(owner.isConfigured());
		QCOMPARE(owner.email, QString("owner@example.com"));
		QCOMPARE(owner.credentialHash, QString("abc123"));
		QCOMPARE(owner.vaultId, QString("vault-1"));
		QVERIFY(!owner.nodeId.isEmpty());
		QCOMPARE(owner.nodeId, cfg.ownerRecord().nodeId);
	}

	void testGuestsChanged()
	{
		InMemoryConfig cfg;
		QSignalSpy spy(&cfg, &HostConfig::guestsChanged);

		GuestEntry g;
		QVERIFY(GuestEntry::fromString("guest@example.com:ff00:rw:verified", g, nullptr));
		cfg.setGuests({g});

		QCOMPARE(spy.count(), 1);
		QCOMPARE(cfg.guests().size(), 1);
		QCOMPARE(cfg.guests().first().permission, Permission::ReadWrite);
	}
};


QTEST_MAIN(TestHostConfig)
#include "hostconfig.moc"
