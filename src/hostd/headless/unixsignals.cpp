// SPDX-License-Identifier: GPL-3.0-or-later

#include "hostd/headless/unixsignals.h"

#include <sys/socket.h>
#include <signal.h>
#include <unistd.h>

#include <QMetaMethod>
#include <QSocketNotifier>

namespace host {

namespace {
	UnixSignals *INSTANCE;

	int SIGNAL_FDS[2];
	QSocketNotifier *NOTIFIER;

	struct HandledSignal {
		const int signum;
		const char *qtSignal;
		bool installed;
	};

	HandledSignal HANDLED[] = {
		{SIGINT, "sigInt", false},
		{SIGTERM, "sigTerm", false},
		{SIGHUP, "sigHup", false},
		{SIGUSR1, "sigUsr1", false},
	};

	HandledSignal *findSignal(int signum)
	{
		for(HandledSignal &s : HANDLED) {
			if(s.signum == signum)
				return &s;
		}
		return nullptr;
	}

	HandledSignal *findSignal(const QByteArray &name)
	{
		for(HandledSignal &s : HANDLED) {
			if(name == s.qtSignal)
				return &s;
		}
		return nullptr;
	}

	// Runs in signal context: only async-signal-safe calls allowed
	void onUnixSignal(int signum)
	{
		uchar b = uchar(signum);
		ssize_t written = ::write(SIGNAL_FDS[0], &b, sizeof(b));
		Q_UNUSED(written);
	}
}

UnixSignals *UnixSignals::instance()
{
	if(!INSTANCE)
		INSTANCE = new UnixSignals;

	return INSTANCE;
}

UnixSignals::UnixSignals() : QObject()
{
	if(::socketpair(AF_UNIX, SOCK_STREAM, 0, SIGNAL_FDS) == 0) {
		NOTIFIER = new QSocketNotifier(SIGNAL_FDS[1], QSocketNotifier::Read, this);
		connect(NOTIFIER, &QSocketNotifier::activated, this, &UnixSignals::handleSignal);
	} else {
		qWarning("Couldn't create the signal socket pair");
	}
}

void UnixSignals::connectNotify(const QMetaMethod &signal)
{
	if(!NOTIFIER)
		return;

	HandledSignal *hs = findSignal(signal.name());
	if(!hs || hs->installed)
		return;

	hs->installed = true;

	struct sigaction sa;
	sa.sa_handler = onUnixSignal;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = SA_RESTART;

	if(sigaction(hs->signum, &sa, nullptr) != 0)
		qWarning("Couldn't install handler for %s", hs->qtSignal);
}

void UnixSignals::handleSignal()
{
	NOTIFIER->setEnabled(false);

	uchar b;
	if(::read(SIGNAL_FDS[1], &b, sizeof(b)) != 1) {
		qWarning("Read from the signal socket failed");
	} else if(HandledSignal *hs = findSignal(int(b))) {
		QMetaObject::invokeMethod(this, hs->qtSignal);
	} else {
		qWarning("Unhandled signal %d", int(b));
	}

	NOTIFIER->setEnabled(true);
}

}
