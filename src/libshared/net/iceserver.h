// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_NET_ICESERVER_H
#define NR_SHARED_NET_ICESERVER_H
#include <QJsonArray>
#include <QString>
#include <QVector>

namespace net {

struct IceServer {
	enum class Kind { Stun, Turn };

	//! How a TURN relay is reached
	enum class Transport { Udp, Tcp, Tls };

	Kind kind;
	QString host;
	quint16 port;
	QString username;
	QString password;
	Transport transport = Transport::Udp;

	bool isTurn() const { return kind == Kind::Turn; }

	/**
	 * @brief Parse a single "host[:port]" string into a STUN server entry
	 */
	static IceServer stunFromHostPort(const QString &hostPort);
};

/**
 * @brief Parse a list of ICE server descriptions
 *
 * The input is the usual `[{urls, username?, credential?}]` array where
 * `urls` is either a string or an array of strings like
 * `stun:host:port`, `turn:host:port?transport=tcp` or `turns:host:port`.
 * Entries that don't parse are skipped.
 */
QVector<IceServer> parseIceServers(const QJsonArray &servers);

}

#endif
