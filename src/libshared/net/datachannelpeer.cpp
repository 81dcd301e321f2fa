// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/datachannelpeer.h"
#include <QLoggingCategory>
#include <QMetaObject>
#include <climits>
#include <exception>
#include <variant>

Q_LOGGING_CATEGORY(lcNrRtc, "noterelay.rtc", QtWarningMsg)

namespace net {

namespace {

rtc::IceServer::RelayType relayType(IceServer::Transport transport)
{
	switch(transport) {
	case IceServer::Transport::Tcp:
		return rtc::IceServer::RelayType::TurnTcp;
	case IceServer::Transport::Tls:
		return rtc::IceServer::RelayType::TurnTls;
	case IceServer::Transport::Udp:
		break;
	}
	return rtc::IceServer::RelayType::TurnUdp;
}

QByteArray toByteArray(const rtc::message_variant &data)
{
	if(const std::string *text = std::get_if<std::string>(&data))
		return QByteArray(text->data(), int(text->size()));

	const rtc::binary &bytes = std::get<rtc::binary>(data);
	return QByteArray(
		reinterpret_cast<const char *>(bytes.data()), int(bytes.size()));
}

}

DataChannelPeer::DataChannelPeer(
	const QVector<IceServer> &servers, QObject *parent)
	: PeerChannel(parent)
	, m_servers(servers)
	, m_answered(false)
{
}

DataChannelPeer::~DataChannelPeer()
{
	closeTransport();
}

rtc::Configuration
DataChannelPeer::configuration(const QVector<IceServer> &servers)
{
	rtc::Configuration config;
	for(const IceServer &s : servers) {
		if(s.host.isEmpty())
			continue;

		if(s.isTurn()) {
			config.iceServers.emplace_back(
				s.host.toStdString(), s.port, s.username.toStdString(),
				s.password.toStdString(), relayType(s.transport));
		} else {
			config.iceServers.emplace_back(s.host.toStdString(), s.port);
		}
	}
	return config;
}

void DataChannelPeer::acceptOffer(const QJsonObject &offer)
{
	if(state() != State::New) {
		qCWarning(lcNrRtc, "offer already accepted");
		return;
	}

	const QString type = offer.value(QStringLiteral("type")).toString();
	const std::string sdp = offer.value(QStringLiteral("sdp")).toString().toStdString();
	if(sdp.empty()) {
		fail(QStringLiteral("offer has no session description"));
		return;
	}
	if(!type.isEmpty() && type != QStringLiteral("offer")) {
		fail(QStringLiteral("expected an offer, got '%1'").arg(type));
		return;
	}

	setState(State::Connecting);

	try {
		m_connection = std::make_shared<rtc::PeerConnection>(configuration(m_servers));

		m_connection->onStateChange([this](rtc::PeerConnection::State s) {
			QMetaObject::invokeMethod(
				this, [this, s]() { handleConnectionState(s); },
				Qt::QueuedConnection);
		});

		m_connection->onGatheringStateChange(
			[this](rtc::PeerConnection::GatheringState s) {
				if(s == rtc::PeerConnection::GatheringState::Complete) {
					QMetaObject::invokeMethod(
						this, [this]() { handleGatheringComplete(); },
						Qt::QueuedConnection);
				}
			});

		// Messages received before the channel's callbacks are attached
		// stay queued in the channel
		m_connection->onDataChannel(
			[this](std::shared_ptr<rtc::DataChannel> channel) {
				QMetaObject::invokeMethod(
					this, [this, channel]() { adoptChannel(channel); },
					Qt::QueuedConnection);
			});

		// The answer is generated automatically from the remote offer
		m_connection->setRemoteDescription(rtc::Description(sdp, "offer"));

	} catch(const std::exception &e) {
		fail(QStringLiteral("offer rejected: %1").arg(QString::fromStdString(e.what())));
	}
}

void DataChannelPeer::watchChannel(const std::shared_ptr<rtc::DataChannel> &channel)
{
	channel->onOpen([this]() {
		QMetaObject::invokeMethod(
			this, [this]() { handleChannelOpen(); }, Qt::QueuedConnection);
	});

	channel->onClosed([this]() {
		QMetaObject::invokeMethod(
			this, [this]() { close(); }, Qt::QueuedConnection);
	});

	channel->onError([this](std::string error) {
		const QString message = QString::fromStdString(error);
		QMetaObject::invokeMethod(
			this, [this, message]() { fail(message); }, Qt::QueuedConnection);
	});

	channel->onMessage([this](rtc::message_variant data) {
		const QByteArray message = toByteArray(data);
		QMetaObject::invokeMethod(
			this, [this, message]() { handleMessage(message); },
			Qt::QueuedConnection);
	});
}

void DataChannelPeer::adoptChannel(const std::shared_ptr<rtc::DataChannel> &channel)
{
	if(state() == State::Closed) {
		channel->resetCallbacks();
		channel->close();
		return;
	}

	if(m_channel) {
		qCWarning(lcNrRtc, "ignoring extra data channel '%s'", channel->label().c_str());
		channel->resetCallbacks();
		channel->close();
		return;
	}

	qCDebug(lcNrRtc, "data channel '%s' announced", channel->label().c_str());
	m_channel = channel;
	watchChannel(channel);

	// The channel may have opened before its callbacks were attached
	if(m_channel->isOpen())
		handleChannelOpen();
}

void DataChannelPeer::handleGatheringComplete()
{
	if(!m_connection || m_answered || state() == State::Closed)
		return;

	const std::optional<rtc::Description> local = m_connection->localDescription();
	if(!local) {
		fail(QStringLiteral("no local session description after gathering"));
		return;
	}

	m_answered = true;
	emit answerReady(QJsonObject{
		{QStringLiteral("type"), QString::fromStdString(local->typeString())},
		{QStringLiteral("sdp"), QString::fromStdString(std::string(*local))},
	});
}

void DataChannelPeer::handleConnectionState(rtc::PeerConnection::State s)
{
	if(!m_connection)
		return;

	switch(s) {
	case rtc::PeerConnection::State::Failed:
		fail(QStringLiteral("peer connection failed"));
		break;
	case rtc::PeerConnection::State::Disconnected:
	case rtc::PeerConnection::State::Closed:
		close();
		break;
	default:
		qCDebug(lcNrRtc, "peer connection state %d", int(s));
		break;
	}
}

void DataChannelPeer::handleChannelOpen()
{
	if(m_channel && state() == State::Connecting)
		setState(State::Open);
}

void DataChannelPeer::handleMessage(const QByteArray &message)
{
	if(state() == State::Connecting)
		handleChannelOpen();

	if(state() == State::Open)
		emit messageReceived(message);
}

bool DataChannelPeer::sendMessage(const QByteArray &message, QString *errorMessage)
{
	if(state() != State::Open || !m_channel) {
		if(errorMessage)
			*errorMessage = QStringLiteral("channel is not open");
		return false;
	}

	if(message.size() > maxMessageSize()) {
		if(errorMessage)
			*errorMessage = QStringLiteral("message of %1 bytes is too large")
								.arg(message.size());
		return false;
	}

	// Sent as text: the remote side expects JSON strings. A false return
	// only means the message was buffered.
	try {
		m_channel->send(std::string(message.constData(), size_t(message.size())));
		return true;
	} catch(const std::exception &e) {
		if(errorMessage)
			*errorMessage = QString::fromStdString(e.what());
		return false;
	}
}

int DataChannelPeer::maxMessageSize() const
{
	if(!m_channel)
		return DEFAULT_MAX_MESSAGE_SIZE;
	return int(qMin(m_channel->maxMessageSize(), size_t(INT_MAX)));
}

void DataChannelPeer::closeTransport()
{
	// Detaching waits for callbacks already running on other threads
	if(m_channel) {
		m_channel->resetCallbacks();
		m_channel->close();
		m_channel.reset();
	}

	if(m_connection) {
		m_connection->resetCallbacks();
		m_connection->close();
		m_connection.reset();
	}
}

void DataChannelPeer::fail(const QString &message)
{
	if(state() == State::Closed)
		return;

	qCWarning(lcNrRtc, "%s", qUtf8Printable(message));
	emit channelError(message);
	close();
}

}
