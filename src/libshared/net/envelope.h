// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_NET_ENVELOPE_H
#define NR_SHARED_NET_ENVELOPE_H
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace net {

//! Version string reported to clients in handshake acknowledgements
extern const char PROTOCOL_VERSION[];

/**
 * @brief A command received from a remote peer
 *
 * On the wire a command is a flat JSON object: `{cmd, requestId?, ...}`.
 * Everything except the command name and the correlation ID ends up in
 * `args`.
 */
struct Command {
	QString cmd;
	QJsonObject args;
	QJsonValue requestId;

	bool isNull() const { return cmd.isEmpty(); }

	//! Is this a PING or HANDSHAKE command?
	bool isHandshake() const;

	//! Get a string argument (empty if missing or not a string)
	QString stringArg(const QString &key) const;

	static Command fromJson(const QJsonObject &obj);

	/**
	 * @brief Parse a command from raw message bytes
	 *
	 * Returns a null command and sets the error message if the message
	 * isn't a JSON object with a string "cmd" field.
	 */
	static Command fromBytes(const QByteArray &data, QString *errorMessage);

	QJsonObject toJson() const;
};

/**
 * @brief A typed message sent to a remote peer
 *
 * The payload can be any JSON value. When an envelope is sent in a single
 * unframed message, the payload's fields (if it is an object) and the meta
 * fields are flattened into one object next to `type`. When it is sent as
 * chunked frames, the serialized payload is what gets split and the meta
 * fields are copied into every frame.
 */
struct Envelope {
	QString type;
	QJsonValue payload;
	QJsonObject meta;

	bool isNull() const { return type.isEmpty(); }
	bool isError() const { return type == QStringLiteral("ERROR"); }

	//! Get the error message of an ERROR envelope
	QString errorMessage() const;

	//! Get the correlation ID carried in the meta fields
	QJsonValue requestId() const;

	QJsonObject toJson() const;
	QByteArray toBytes() const;

	/**
	 * @brief Serialize any JSON value (including scalars) into compact text
	 */
	static QString serializePayload(const QJsonValue &value);

	/**
	 * @brief Parse text produced by serializePayload
	 * @return false if the text is not valid JSON
	 */
	static bool parsePayload(const QString &text, QJsonValue &value);

	static Envelope
	make(const QString &type, const QJsonValue &payload,
		 const QJsonObject &meta = QJsonObject());

	static Envelope makeError(const QString &message);

	//! Reply to a successful PING (pong=true) or HANDSHAKE
	static Envelope makeHandshakeAck(bool pong, bool readOnly);

	static Envelope makeSaved(const QString &path);

	static Envelope
	makeSearchResults(const QJsonArray &results, const QString &query);
};

}

#endif
