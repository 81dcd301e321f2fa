// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/iceserver.h"
#include <QJsonObject>
#include <QRegularExpression>
#include <QStringList>

namespace net {

namespace {
constexpr quint16 DEFAULT_PORT = 3478;
constexpr quint16 DEFAULT_TLS_PORT = 5349;

bool parseHostPort(
	const QString &s, QString &host, quint16 &port,
	quint16 defaultPort = DEFAULT_PORT)
{
	static const QRegularExpression re(
		QStringLiteral("\\A(\\[[^\\]]+\\]|[^:\\[\\]]+)(?::(\\d{1,5}))?\\z"));
	const QRegularExpressionMatch m = re.match(s);
	if(!m.hasMatch())
		return false;

	host = m.captured(1);
	if(host.startsWith('['))
		host = host.mid(1, host.length() - 2);

	if(m.captured(2).isEmpty()) {
		port = defaultPort;
	} else {
		const int p = m.captured(2).toInt();
		if(p <= 0 || p > 65535)
			return false;
		port = quint16(p);
	}
	return true;
}

bool parseUrl(
	const QString &url, const QString &username, const QString &password,
	IceServer &out)
{
	const int colon = url.indexOf(':');
	if(colon < 1)
		return false;

	const QString scheme = url.left(colon).toLower();
	QString rest = url.mid(colon + 1);
	QString query;
	const int q = rest.indexOf('?');
	if(q >= 0) {
		query = rest.mid(q + 1).toLower();
		rest.truncate(q);
	}

	quint16 defaultPort = DEFAULT_PORT;
	if(scheme == QStringLiteral("stun")) {
		out.kind = IceServer::Kind::Stun;
	} else if(scheme == QStringLiteral("turn") || scheme == QStringLiteral("turns")) {
		out.kind = IceServer::Kind::Turn;
		out.username = username;
		out.password = password;
		if(scheme == QStringLiteral("turns")) {
			out.transport = IceServer::Transport::Tls;
			defaultPort = DEFAULT_TLS_PORT;
		} else if(query == QStringLiteral("transport=tcp")) {
			out.transport = IceServer::Transport::Tcp;
		} else if(query.isEmpty() || query == QStringLiteral("transport=udp")) {
			out.transport = IceServer::Transport::Udp;
		} else {
			return false;
		}
	} else {
		return false;
	}

	return parseHostPort(rest, out.host, out.port, defaultPort);
}
}

IceServer IceServer::stunFromHostPort(const QString &hostPort)
{
	IceServer s{Kind::Stun, QString(), DEFAULT_PORT, QString(), QString(), Transport::Udp};
	if(!parseHostPort(hostPort.trimmed(), s.host, s.port))
		s.host.clear();
	return s;
}

QVector<IceServer> parseIceServers(const QJsonArray &servers)
{
	QVector<IceServer> result;
	for(const QJsonValue &v : servers) {
		const QJsonObject o = v.toObject();
		const QString username = o.value(QStringLiteral("username")).toString();
		const QString password =
			o.value(QStringLiteral("credential")).toString();

		QStringList urls;
		const QJsonValue u = o.value(QStringLiteral("urls"));
		if(u.isArray()) {
			for(const QJsonValue &url : u.toArray())
				urls << url.toString();
		} else {
			urls << u.toString();
		}

		for(const QString &url : urls) {
			IceServer s{
				IceServer::Kind::Stun, QString(), DEFAULT_PORT, QString(),
				QString(), IceServer::Transport::Udp};
			if(parseUrl(url, username, password, s))
				result << s;
			else
				qDebug("Skipping unusable ICE server URL '%s'", qUtf8Printable(url));
		}
	}
	return result;
}

}
