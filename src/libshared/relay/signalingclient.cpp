// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/relay/signalingclient.h"

namespace relay {

const char HOST_SOURCE_ID[] = "host";
const char FALLBACK_SIGNAL_ID[] = "host";

QJsonObject SignalRow::toJson() const
{
	return QJsonObject{
		{QStringLiteral("source"), source},
		{QStringLiteral("target"), target},
		{QStringLiteral("type"), type},
		{QStringLiteral("payload"), payload},
	};
}

SignalRow SignalRow::fromJson(const QJsonObject &obj)
{
	return SignalRow{
		obj.value(QStringLiteral("source")).toString(),
		obj.value(QStringLiteral("target")).toString(),
		obj.value(QStringLiteral("type")).toString(),
		obj.value(QStringLiteral("payload")).toObject(),
	};
}

}
