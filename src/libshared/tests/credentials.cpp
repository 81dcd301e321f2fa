// SPDX-License-Identifier: GPL-3.0-or-later

#include "libshared/util/credentials.h"

#include <QtTest/QtTest>

class TestCredentials final : public QObject
{
	Q_OBJECT
private slots:
	void testSha256()
	{
		QCOMPARE(credentials::sha256Hex("password"), QString("5e884898da28047151d0e56f8dc6292773603d0d6aabbdd62a11ef721d1542d8"));
		QCOMPARE(credentials::sha256Hex(""), QString("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
	}

	void testMatches()
	{
		const QString hash = credentials::sha256Hex("hunter2");
		QVERIFY(credentials::matches(hash, hash));
		QVERIFY(credentials::matches(hash.toUpper(), hash));
		QVERIFY(credentials::matches(" " + hash + "\n", hash));
		QVERIFY(!credentials::matches(credentials::sha256Hex("hunter3"), hash));
		QVERIFY(!credentials::matches(hash.left(63), hash));
		QVERIFY(!credentials::matches("", hash));

		// An unset credential never matches, not even an empty proof
		QVERIFY(!credentials::matches("", ""));
		QVERIFY(!credentials::matches(hash, ""));
	}

	void testIsValidHash()
	{
		QVERIFY(credentials::isValidHash(credentials::sha256Hex("x")));
		QVERIFY(credentials::isValidHash(credentials::sha256Hex("x").toUpper()));
		QVERIFY(!credentials::isValidHash("abc"));
		QVERIFY(!credentials::isValidHash(QString(64, QChar('g'))));
	}

	void testNodeId()
	{
		const QString a = credentials::deriveNodeId("/home/u/vault", "linux", "box");
		QCOMPARE(a, credentials::sha256Hex("/home/u/vault|linux|box"));
		QCOMPARE(a, credentials::deriveNodeId("/home/u/vault", "linux", "box"));
		QVERIFY(a != credentials::deriveNodeId("/home/u/other", "linux", "box"));
		QVERIFY(a != credentials::deriveNodeId("/home/u/vault", "linux", "laptop"));

		QCOMPARE(credentials::localNodeId("/v"), credentials::localNodeId("/v"));
		QVERIFY(credentials::isValidHash(credentials::localNodeId("/v")));
	}
};


QTEST_MAIN(TestCredentials)
#include "credentials.moc"
