// SPDX-License-Identifier: GPL-3.0-or-later
#include "cmake-config/config.h"
#include "hostd/headless/headless.h"
#include "libshared/relay/registrationapi.h"
#include "libshared/relay/signalingclient.h"
#include <QCoreApplication>
#include <cstdio>
#ifdef Q_OS_UNIX
#	include <unistd.h>
#endif

int main(int argc, char *argv[])
{
#ifdef Q_OS_UNIX
	// Security check
	if(geteuid() == 0) {
		std::fprintf(stderr, "This program should not be run as root!\n");
		return 1;
	}
#endif

	QCoreApplication app(argc, argv);

	qRegisterMetaType<relay::SignalRow>("relay::SignalRow");
	qRegisterMetaType<relay::RegistrationResult>("relay::RegistrationResult");
	qRegisterMetaType<relay::RelayCredentials>("relay::RelayCredentials");

	// Set common settings
	QCoreApplication::setOrganizationName("noterelay");
	QCoreApplication::setOrganizationDomain("noterelay.io");
	QCoreApplication::setApplicationName("noterelay-host");
	QCoreApplication::setApplicationVersion(cmake_config::version());

	if(!host::headless::start())
		return 1;

	return app.exec();
}
