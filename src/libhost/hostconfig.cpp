// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/hostconfig.h"
#include "libshared/util/credentials.h"
#include <QRegularExpression>

namespace host {

QString HostConfig::getConfigString(ConfigKey key) const
{
	bool found = false;
	const QString val = getConfigValue(key, found);
	if(!found)
		return key.defaultValue;
	return val;
}

int HostConfig::getConfigTime(ConfigKey key) const
{
	Q_ASSERT(key.type == ConfigKey::TIME);
	const int t = parseTimeString(getConfigString(key));
	return t < 0 ? parseTimeString(key.defaultValue) : t;
}

int HostConfig::getConfigSize(ConfigKey key) const
{
	Q_ASSERT(key.type == ConfigKey::SIZE);
	const int s = parseSizeString(getConfigString(key));
	return s < 0 ? parseSizeString(key.defaultValue) : s;
}

int HostConfig::getConfigInt(ConfigKey key) const
{
	Q_ASSERT(key.type == ConfigKey::INT);
	bool ok;
	const int i = getConfigString(key).toInt(&ok);
	return ok ? i : QString(key.defaultValue).toInt();
}

bool HostConfig::getConfigBool(ConfigKey key) const
{
	Q_ASSERT(key.type == ConfigKey::BOOL);
	const QString val = getConfigString(key).trimmed().toLower();
	return val == QStringLiteral("1") || val == QStringLiteral("true");
}

QVariant HostConfig::getConfigVariant(ConfigKey key) const
{
	switch(key.type) {
	case ConfigKey::STRING:
		return getConfigString(key);
	case ConfigKey::TIME:
		return getConfigTime(key);
	case ConfigKey::SIZE:
		return getConfigSize(key);
	case ConfigKey::INT:
		return getConfigInt(key);
	case ConfigKey::BOOL:
		return getConfigBool(key);
	}
	return QVariant();
}

bool HostConfig::setConfigString(ConfigKey key, const QString &value)
{
	switch(key.type) {
	case ConfigKey::STRING:
	case ConfigKey::BOOL:
		break;
	case ConfigKey::SIZE:
		if(parseSizeString(value) < 0)
			return false;
		break;
	case ConfigKey::TIME:
		if(parseTimeString(value) < 0)
			return false;
		break;
	case ConfigKey::INT: {
		bool ok;
		value.toInt(&ok);
		if(!ok)
			return false;
		break;
	}
	}

	setConfigValue(key, value);
	emit configValueChanged(key.index);
	return true;
}

void HostConfig::setConfigInt(ConfigKey key, int value)
{
	Q_ASSERT(
		key.type == ConfigKey::INT || key.type == ConfigKey::SIZE ||
		key.type == ConfigKey::TIME);
	setConfigString(key, QString::number(value));
}

void HostConfig::setConfigBool(ConfigKey key, bool value)
{
	Q_ASSERT(key.type == ConfigKey::BOOL);
	setConfigString(
		key, value ? QStringLiteral("true") : QStringLiteral("false"));
}

IdentityRecord HostConfig::ownerRecord() const
{
	IdentityRecord owner;
	owner.email = getConfigString(config::Email).trimmed();
	owner.credentialHash = getConfigString(config::OwnerHash).trimmed();
	owner.vaultId = getConfigString(config::VaultId).trimmed();

	const QString vaultPath = getConfigString(config::VaultPath);
	if(!vaultPath.isEmpty())
		owner.nodeId = credentials::localNodeId(vaultPath);

	return owner;
}

int HostConfig::parseTimeString(const QString &str)
{
	static const QRegularExpression re(
		QStringLiteral("\\A(\\d+(?:\\.\\d+)?)\\s*([dhms]?)\\z"));
	const QRegularExpressionMatch m = re.match(str.trimmed().toLower());
	if(!m.hasMatch())
		return -1;

	float t = m.captured(1).toFloat();
	if(m.captured(2) == QStringLiteral("d"))
		t *= 24 * 60 * 60;
	else if(m.captured(2) == QStringLiteral("h"))
		t *= 60 * 60;
	else if(m.captured(2) == QStringLiteral("m"))
		t *= 60;

	return t;
}

int HostConfig::parseSizeString(const QString &str)
{
	static const QRegularExpression re(
		QStringLiteral("\\A(\\d+(?:\\.\\d+)?)\\s*(gb|mb|kb|b)?\\z"));
	const QRegularExpressionMatch m = re.match(str.trimmed().toLower());
	if(!m.hasMatch())
		return -1;

	float s = m.captured(1).toFloat();
	if(m.captured(2) == QStringLiteral("gb"))
		s *= 1024 * 1024 * 1024;
	else if(m.captured(2) == QStringLiteral("mb"))
		s *= 1024 * 1024;
	else if(m.captured(2) == QStringLiteral("kb"))
		s *= 1024;

	return s;
}

}
