// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_NET_DATACHANNELPEER_H
#define NR_SHARED_NET_DATACHANNELPEER_H
#include "libshared/net/iceserver.h"
#include "libshared/net/peerchannel.h"
#include <rtc/rtc.hpp>
#include <memory>

namespace net {

/**
 * @brief A peer channel over a WebRTC data channel
 *
 * The remote side is the initiator: its offer (`{type: "offer", sdp}`)
 * announces one reliable, ordered data channel and the host answers with
 * `{type: "answer", sdp}`. Candidates are not trickled, so the answer is
 * only produced once candidate gathering has completed.
 *
 * The connection runs on the library's own threads. Every callback is
 * forwarded to the thread this object lives in before anything else is
 * touched, and all callbacks are detached before the connection is closed.
 */
class DataChannelPeer final : public PeerChannel {
	Q_OBJECT
public:
	//! Message size limit used until the data channel is open
	static constexpr int DEFAULT_MAX_MESSAGE_SIZE = 65535;

	DataChannelPeer(const QVector<IceServer> &servers, QObject *parent = nullptr);
	~DataChannelPeer() override;

	void acceptOffer(const QJsonObject &offer) override;
	bool sendMessage(const QByteArray &message, QString *errorMessage) override;
	int maxMessageSize() const override;

	//! Build the connection configuration for these ICE servers
	static rtc::Configuration configuration(const QVector<IceServer> &servers);

protected:
	void closeTransport() override;

private:
	void watchChannel(const std::shared_ptr<rtc::DataChannel> &channel);
	void adoptChannel(const std::shared_ptr<rtc::DataChannel> &channel);
	void handleGatheringComplete();
	void handleConnectionState(rtc::PeerConnection::State state);
	void handleChannelOpen();
	void handleMessage(const QByteArray &message);
	void fail(const QString &message);

	QVector<IceServer> m_servers;
	std::shared_ptr<rtc::PeerConnection> m_connection;
	std::shared_ptr<rtc::DataChannel> m_channel;
	bool m_answered;
};

}

#endif
