// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/util/credentials.h"
#include <QByteArray>
#include <QCryptographicHash>
#include <QRegularExpression>
#include <QString>
#include <QSysInfo>
#include <sodium.h>

namespace credentials {

QString sha256Hex(const QString &input)
{
	return QString::fromLatin1(
		QCryptographicHash::hash(input.toUtf8(), QCryptographicHash::Sha256)
			.toHex());
}

bool matches(const QString &proof, const QString &expected)
{
	if(expected.isEmpty())
		return false;

	const QByteArray a = proof.trimmed().toLower().toUtf8();
	const QByteArray b = expected.trimmed().toLower().toUtf8();
	if(a.length() != b.length())
		return false;

	return sodium_memcmp(a.constData(), b.constData(), size_t(a.length())) ==
		   0;
}

bool isValidHash(const QString &hash)
{
	static const QRegularExpression re(QStringLiteral("\\A[0-9a-fA-F]{64}\\z"));
	return re.match(hash).hasMatch();
}

QString deriveNodeId(
	const QString &vaultPath, const QString &platform, const QString &hostname)
{
	return sha256Hex(
		QStringLiteral("%1|%2|%3").arg(vaultPath, platform, hostname));
}

QString platformName()
{
#if defined(Q_OS_WIN)
	return QStringLiteral("win32");
#elif defined(Q_OS_MACOS)
	return QStringLiteral("darwin");
#elif defined(Q_OS_LINUX)
	return QStringLiteral("linux");
#elif defined(Q_OS_FREEBSD)
	return QStringLiteral("freebsd");
#else
	return QSysInfo::kernelType();
#endif
}

QString localNodeId(const QString &vaultPath)
{
	return deriveNodeId(
		vaultPath, platformName(), QSysInfo::machineHostName());
}

}
