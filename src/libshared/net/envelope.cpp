// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/envelope.h"
#include <QJsonDocument>
#include <QJsonParseError>

namespace net {

const char PROTOCOL_VERSION[] = "v2.0-host";

bool Command::isHandshake() const
{
	return cmd == QStringLiteral("PING") || cmd == QStringLiteral("HANDSHAKE");
}

QString Command::stringArg(const QString &key) const
{
	return args.value(key).toString();
}

Command Command::fromJson(const QJsonObject &obj)
{
	Command c;
	c.cmd = obj.value(QStringLiteral("cmd")).toString();
	c.requestId = obj.value(QStringLiteral("requestId"));
	c.args = obj;
	c.args.remove(QStringLiteral("cmd"));
	c.args.remove(QStringLiteral("requestId"));
	return c;
}

Command Command::fromBytes(const QByteArray &data, QString *errorMessage)
{
	QJsonParseError err;
	const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
	if(err.error != QJsonParseError::NoError) {
		if(errorMessage)
			*errorMessage = err.errorString();
		return Command();
	}

	if(!doc.isObject()) {
		if(errorMessage)
			*errorMessage = QStringLiteral("expected a JSON object");
		return Command();
	}

	const QJsonObject obj = doc.object();
	if(!obj.value(QStringLiteral("cmd")).isString()) {
		if(errorMessage)
			*errorMessage = QStringLiteral("missing command name");
		return Command();
	}

	return fromJson(obj);
}

QJsonObject Command::toJson() const
{
	QJsonObject obj = args;
	obj[QStringLiteral("cmd")] = cmd;
	if(!requestId.isUndefined() && !requestId.isNull())
		obj[QStringLiteral("requestId")] = requestId;
	return obj;
}

QString Envelope::errorMessage() const
{
	return payload.toObject().value(QStringLiteral("message")).toString();
}

QJsonValue Envelope::requestId() const
{
	return meta.value(QStringLiteral("requestId"));
}

QJsonObject Envelope::toJson() const
{
	QJsonObject obj;
	if(payload.isObject()) {
		obj = payload.toObject();
	} else if(!payload.isUndefined() && !payload.isNull()) {
		obj[QStringLiteral("data")] = payload;
	}

	for(auto i = meta.constBegin(); i != meta.constEnd(); ++i)
		obj[i.key()] = i.value();

	obj[QStringLiteral("type")] = type;
	return obj;
}

QByteArray Envelope::toBytes() const
{
	return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

QString Envelope::serializePayload(const QJsonValue &value)
{
	// QJsonDocument only serializes containers, so wrap the value in an
	// array and strip the brackets off again.
	const QByteArray wrapped =
		QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
	return QString::fromUtf8(wrapped.mid(1, wrapped.length() - 2));
}

bool Envelope::parsePayload(const QString &text, QJsonValue &value)
{
	QJsonParseError err;
	const QJsonDocument doc = QJsonDocument::fromJson(
		QStringLiteral("[%1]").arg(text).toUtf8(), &err);
	if(err.error != QJsonParseError::NoError || !doc.isArray())
		return false;

	const QJsonArray array = doc.array();
	if(array.size() != 1)
		return false;

	value = array.first();
	return true;
}

Envelope Envelope::make(
	const QString &type, const QJsonValue &payload, const QJsonObject &meta)
{
	return Envelope{type, payload, meta};
}

Envelope Envelope::makeError(const QString &message)
{
	return make(
		QStringLiteral("ERROR"), QJsonObject{{QStringLiteral("message"), message}});
}

Envelope Envelope::makeHandshakeAck(bool pong, bool readOnly)
{
	return make(
		pong ? QStringLiteral("PONG") : QStringLiteral("HANDSHAKE_ACK"),
		QJsonObject{
			{QStringLiteral("version"), QString::fromLatin1(PROTOCOL_VERSION)},
			{QStringLiteral("readOnly"), readOnly},
		});
}

Envelope Envelope::makeSaved(const QString &path)
{
	return make(
		QStringLiteral("SAVED"), QJsonObject{{QStringLiteral("path"), path}});
}

Envelope
Envelope::makeSearchResults(const QJsonArray &results, const QString &query)
{
	return make(
		QStringLiteral("SEARCH_RESULTS"),
		QJsonObject{
			{QStringLiteral("results"), results},
			{QStringLiteral("query"), query},
		});
}

}
