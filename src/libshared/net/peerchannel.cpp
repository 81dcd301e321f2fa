// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/peerchannel.h"

namespace net {

PeerChannel::PeerChannel(QObject *parent)
	: QObject(parent)
	, m_state(State::New)
{
}

void PeerChannel::close()
{
	if(m_state == State::Closed)
		return;

	closeTransport();
	setState(State::Closed);
}

void PeerChannel::setState(State state)
{
	if(state == m_state)
		return;

	m_state = state;
	if(state == State::Open)
		emit opened();
	else if(state == State::Closed)
		emit closed();
}

}
