// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/peersession.h"
#include "libhost/commanddispatcher.h"
#include "libshared/net/chunkedtransport.h"
#include "libshared/net/peerchannel.h"
#include "libshared/relay/signalingclient.h"
#include <QJsonDocument>
#include <QTimer>

namespace host {

struct PeerSession::Private {
	QString remoteId;
	net::PeerChannel *channel;
	relay::SignalingClient *signaling;
	const AuthResolver *auth;
	CommandDispatcher *dispatcher;
	HostLog *logger;

	net::Reassembler reassembler;
	net::FrameSender *sender;
	QTimer *idleTimer;
	QTimer *graceTimer;

	AuthState authState = AuthState::Unauthenticated;
	QString identity = QStringLiteral("unknown");
	bool denied = false;
	bool closed = false;
};

PeerSession::PeerSession(
	const QString &remoteId, net::PeerChannel *channel,
	relay::SignalingClient *signaling, const AuthResolver *auth,
	CommandDispatcher *dispatcher, HostLog *logger, QObject *parent)
	: QObject(parent)
	, d(new Private)
{
	d->remoteId = remoteId;
	d->channel = channel;
	d->signaling = signaling;
	d->auth = auth;
	d->dispatcher = dispatcher;
	d->logger = logger;

	channel->setParent(this);
	d->sender = new net::FrameSender(channel, this);

	d->idleTimer = new QTimer(this);
	d->idleTimer->setSingleShot(true);
	d->idleTimer->setInterval(DEFAULT_IDLE_TIMEOUT);

	d->graceTimer = new QTimer(this);
	d->graceTimer->setSingleShot(true);
	d->graceTimer->setInterval(DEFAULT_DENY_GRACE);

	connect(channel, &net::PeerChannel::answerReady, this, &PeerSession::onAnswerReady);
	connect(channel, &net::PeerChannel::opened, this, &PeerSession::onChannelOpened);
	connect(channel, &net::PeerChannel::messageReceived, this, &PeerSession::onMessageReceived);
	connect(channel, &net::PeerChannel::channelError, this, &PeerSession::onChannelError);
	connect(channel, &net::PeerChannel::closed, this, &PeerSession::onChannelClosed);
	connect(d->sender, &net::FrameSender::sendFailed, this, &PeerSession::onSendFailed);
	connect(d->idleTimer, &QTimer::timeout, this, &PeerSession::onIdleTimeout);
	connect(d->graceTimer, &QTimer::timeout, this, [this]() {
		close(QStringLiteral("access denied"));
	});
}

PeerSession::~PeerSession()
{
	delete d;
}

void PeerSession::setIdleTimeout(int msecs)
{
	d->idleTimer->setInterval(msecs);
}

void PeerSession::setDenyGraceDelay(int msecs)
{
	d->graceTimer->setInterval(qMax(0, msecs));
}

void PeerSession::setFrameInterval(int msecs)
{
	d->sender->setInterval(msecs);
}

void PeerSession::setMaxReassemblySize(qint64 size)
{
	d->reassembler.setMaxBuffered(size);
}

QString PeerSession::remoteId() const { return d->remoteId; }
PeerSession::AuthState PeerSession::authState() const { return d->authState; }
bool PeerSession::isClosed() const { return d->closed; }
QString PeerSession::identity() const { return d->identity; }
net::PeerChannel *PeerSession::channel() const { return d->channel; }

bool PeerSession::isAuthenticated() const
{
	return d->authState != AuthState::Unauthenticated;
}

bool PeerSession::isReadOnly() const
{
	return d->authState == AuthState::AuthenticatedReadOnly;
}

void PeerSession::start(const QJsonObject &offer)
{
	log(Log()
			.about(Log::Level::Info, Log::Topic::Session)
			.message(QStringLiteral("Accepting connection offer")));

	if(d->idleTimer->interval() > 0)
		d->idleTimer->start();

	d->channel->acceptOffer(offer);
}

void PeerSession::onAnswerReady(const QJsonObject &answer)
{
	if(d->closed)
		return;

	log(Log()
			.about(Log::Level::Debug, Log::Topic::Signal)
			.message(QStringLiteral("Publishing answer")));

	d->signaling->publish(
		QStringLiteral("answer"), QString::fromLatin1(relay::HOST_SOURCE_ID),
		d->remoteId, answer);
}

void PeerSession::onChannelOpened()
{
	log(Log()
			.about(Log::Level::Info, Log::Topic::Session)
			.message(QStringLiteral("Direct channel open")));
}

void PeerSession::onMessageReceived(const QByteArray &message)
{
	if(d->closed || d->denied)
		return;

	QJsonParseError parseError;
	const QJsonDocument doc = QJsonDocument::fromJson(message, &parseError);
	if(parseError.error != QJsonParseError::NoError || !doc.isObject()) {
		log(Log()
				.about(Log::Level::Warn, Log::Topic::BadData)
				.message(QStringLiteral("Unparseable message: %1")
							 .arg(parseError.errorString())));
		close(QStringLiteral("malformed message"));
		return;
	}

	const QJsonObject obj = doc.object();
	if(!net::isFrame(obj)) {
		const net::Command command = net::Command::fromJson(obj);
		if(command.isNull()) {
			log(Log()
					.about(Log::Level::Warn, Log::Topic::BadData)
					.message(QStringLiteral("Message without a command")));
			sendError(QStringLiteral("Missing command"), command.requestId);
			return;
		}
		handleCommand(command);
		return;
	}

	// Nothing is buffered for a peer that hasn't authenticated. The
	// handshake itself is never framed.
	if(!isAuthenticated()) {
		if(obj.value(QStringLiteral("end")).toBool()) {
			log(Log()
					.about(Log::Level::Warn, Log::Topic::RuleBreak)
					.message(QStringLiteral("Framed %1 before handshake")
								 .arg(obj.value(QStringLiteral("cat")).toString())));
			sendError(
				QStringLiteral("AUTH_REQUIRED: Handshake required"),
				obj.value(QStringLiteral("requestId")));
		}
		return;
	}

	switch(d->reassembler.addFrame(obj)) {
	case net::Reassembler::Status::Incomplete:
	case net::Reassembler::Status::Ignored:
		return;

	case net::Reassembler::Status::BadFrame:
		log(Log()
				.about(Log::Level::Warn, Log::Topic::BadData)
				.message(d->reassembler.errorString()));
		close(QStringLiteral("malformed frame"));
		return;

	case net::Reassembler::Status::Gap:
	case net::Reassembler::Status::TooLarge:
		log(Log()
				.about(Log::Level::Warn, Log::Topic::BadData)
				.message(d->reassembler.errorString()));
		sendError(
			QStringLiteral("Message discarded: %1").arg(d->reassembler.errorString()),
			obj.value(QStringLiteral("requestId")));
		return;

	case net::Reassembler::Status::Complete:
		break;
	}

	const net::Reassembler::Message whole = d->reassembler.takeMessage();

	QJsonValue payload;
	if(!net::Envelope::parsePayload(whole.text, payload) || !payload.isObject()) {
		log(Log()
				.about(Log::Level::Warn, Log::Topic::BadData)
				.message(QStringLiteral("Reassembled %1 is not a JSON object").arg(whole.category)));
		close(QStringLiteral("malformed message"));
		return;
	}

	QJsonObject commandObj = payload.toObject();
	if(!commandObj.contains(QStringLiteral("cmd")))
		commandObj[QStringLiteral("cmd")] = whole.category;
	if(!commandObj.contains(QStringLiteral("requestId")) &&
	   whole.meta.contains(QStringLiteral("requestId")))
		commandObj[QStringLiteral("requestId")] = whole.meta.value(QStringLiteral("requestId"));

	handleCommand(net::Command::fromJson(commandObj));
}

void PeerSession::handleCommand(const net::Command &command)
{
	if(d->authState == AuthState::Unauthenticated) {
		if(command.isHandshake()) {
			handleHandshake(command);
		} else {
			log(Log()
					.about(Log::Level::Warn, Log::Topic::RuleBreak)
					.message(QStringLiteral("%1 before handshake").arg(command.cmd)));
			net::Envelope error = net::Envelope::makeError(
				QStringLiteral("AUTH_REQUIRED: Handshake required"));
			if(!command.requestId.isUndefined() && !command.requestId.isNull())
				error.meta[QStringLiteral("requestId")] = command.requestId;
			sendControl(error);
		}
		return;
	}

	if(command.isHandshake()) {
		sendError(QStringLiteral("Already authenticated"), command.requestId);
		return;
	}

	const Permission permission = d->authState == AuthState::AuthenticatedReadOnly
									  ? Permission::ReadOnly
									  : Permission::ReadWrite;
	sendChunked(d->dispatcher->dispatch(command, permission, d->remoteId));
}

void PeerSession::handleHandshake(const net::Command &command)
{
	const AuthResult result = d->auth->resolve(
		command.stringArg(QStringLiteral("guestEmail")),
		command.stringArg(QStringLiteral("authHash")));

	QJsonObject meta;
	if(!command.requestId.isUndefined() && !command.requestId.isNull())
		meta[QStringLiteral("requestId")] = command.requestId;

	if(!result.granted) {
		log(Log()
				.about(Log::Level::Warn, Log::Topic::Auth)
				.identity(result.identity)
				.message(result.reason));

		net::Envelope error = net::Envelope::makeError(result.reason);
		error.meta = meta;
		sendControl(error);

		d->denied = true;
		d->idleTimer->stop();
		d->graceTimer->start();
		return;
	}

	d->idleTimer->stop();
	d->identity = result.identity;
	d->authState = result.isReadOnly() ? AuthState::AuthenticatedReadOnly
									   : AuthState::AuthenticatedReadWrite;

	const QString sessionName = command.stringArg(QStringLiteral("sessionName"));
	log(Log()
			.about(Log::Level::Info, Log::Topic::Auth)
			.message(QStringLiteral("Authenticated (%1)%2")
						 .arg(
							 result.isReadOnly() ? QStringLiteral("read-only")
												 : QStringLiteral("read-write"),
							 sessionName.isEmpty() ? QString()
												   : QStringLiteral(" as ") + sessionName)));

	net::Envelope ack = net::Envelope::makeHandshakeAck(
		command.cmd == QStringLiteral("PING"), result.isReadOnly());
	ack.meta = meta;
	sendControl(ack);

	emit authenticated(d->identity, result.isReadOnly());
}

void PeerSession::sendError(const QString &message, const QJsonValue &requestId)
{
	net::Envelope error = net::Envelope::makeError(message);
	if(!requestId.isUndefined() && !requestId.isNull())
		error.meta[QStringLiteral("requestId")] = requestId;

	if(isAuthenticated())
		sendChunked(error);
	else
		sendControl(error);
}

bool PeerSession::sendControl(const net::Envelope &envelope)
{
	if(d->closed)
		return false;

	if(d->channel->state() != net::PeerChannel::State::Open) {
		log(Log()
				.about(Log::Level::Debug, Log::Topic::Session)
				.message(QStringLiteral("Channel not open, dropped %1").arg(envelope.type)));
		return false;
	}

	QString error;
	if(!d->channel->sendMessage(envelope.toBytes(), &error)) {
		log(Log()
				.about(Log::Level::Warn, Log::Topic::Session)
				.message(QStringLiteral("Couldn't send %1: %2").arg(envelope.type, error)));
		return false;
	}
	return true;
}

bool PeerSession::sendChunked(const net::Envelope &envelope)
{
	if(d->closed)
		return false;

	if(!isAuthenticated() && !envelope.isError()) {
		log(Log()
				.about(Log::Level::Error, Log::Topic::RuleBreak)
				.message(QStringLiteral("Refusing to send %1 to unauthenticated peer")
							 .arg(envelope.type)));
		return false;
	}

	d->sender->enqueue(net::makeFrames(envelope));
	return true;
}

void PeerSession::onChannelError(const QString &message)
{
	log(Log()
			.about(Log::Level::Warn, Log::Topic::Session)
			.message(QStringLiteral("Channel error: %1").arg(message)));
	close(message);
}

void PeerSession::onChannelClosed()
{
	close(QStringLiteral("channel closed"));
}

void PeerSession::onSendFailed(const QString &message)
{
	log(Log()
			.about(Log::Level::Warn, Log::Topic::Session)
			.message(QStringLiteral("Send failed: %1").arg(message)));
	close(message);
}

void PeerSession::onIdleTimeout()
{
	if(isAuthenticated() || d->closed)
		return;

	log(Log()
			.about(Log::Level::Info, Log::Topic::Session)
			.message(QStringLiteral("No handshake within %1 ms").arg(d->idleTimer->interval())));
	close(QStringLiteral("authentication timeout"));
}

void PeerSession::close(const QString &reason)
{
	if(d->closed)
		return;
	d->closed = true;

	d->idleTimer->stop();
	d->graceTimer->stop();
	d->sender->clear();
	d->reassembler.clear();

	log(Log()
			.about(Log::Level::Info, Log::Topic::Session)
			.message(QStringLiteral("Closed: %1").arg(reason)));

	d->channel->close();
	emit closed(this);
}

void PeerSession::log(Log entry) const
{
	if(!d->logger)
		return;

	entry.session(d->remoteId);
	if(isAuthenticated()) {
		if(entry.identity().isEmpty())
			entry.identity(d->identity);
		entry.access(isReadOnly() ? Log::Access::ReadOnly : Log::Access::ReadWrite);
	}
	d->logger->logMessage(entry);
}

}
