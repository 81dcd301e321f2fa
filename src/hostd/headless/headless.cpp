// SPDX-License-Identifier: GPL-3.0-or-later

#include "hostd/headless/headless.h"
#include "hostd/headless/configfile.h"
#include "libhost/filesystemvault.h"
#include "libhost/hostlog.h"
#include "libhost/hostservice.h"
#include "libhost/inmemoryconfig.h"
#include "libhost/markdownrenderer.h"
#include "libshared/relay/registrationapi.h"
#include "cmake-config/config.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

#include <rtc/rtc.hpp>
#include <sodium.h>

#ifdef Q_OS_UNIX
#include "hostd/headless/unixsignals.h"
#endif

Q_LOGGING_CATEGORY(lcNrRtcLib, "noterelay.rtc.lib")

namespace host {
namespace headless {

namespace {
void printVersion()
{
	printf("noterelay-host %s\n", cmake_config::version());
	printf("Qt version: %s (compiled against %s)\n", qVersion(), QT_VERSION_STR);
	printf("Libsodium version: %s\n", sodium_version_string());
}

// Route libdatachannel's own log output through Qt's message handler
void initRtcLogging(bool verbose)
{
	rtc::InitLogger(
		verbose ? rtc::LogLevel::Info : rtc::LogLevel::Warning,
		[](rtc::LogLevel level, std::string message) {
			switch(level) {
			case rtc::LogLevel::Fatal:
			case rtc::LogLevel::Error:
				qCCritical(lcNrRtcLib, "%s", message.c_str());
				break;
			case rtc::LogLevel::Warning:
				qCWarning(lcNrRtcLib, "%s", message.c_str());
				break;
			default:
				qCInfo(lcNrRtcLib, "%s", message.c_str());
				break;
			}
		});
}

void setOverride(HostConfig *config, const ConfigKey key, const QString &value)
{
	if(!config->setConfigString(key, value))
		qWarning("Invalid value for %s: %s", key.name, qUtf8Printable(value));
}
}

bool start() {
	// Set up command line arguments
	QCommandLineParser parser;

	parser.setApplicationDescription("Remote access host for a note vault");
	parser.addHelpOption();

	// --version, -v
	QCommandLineOption versionOption(QStringList() << "v" << "version", "Displays version information.");
	parser.addOption(versionOption);

	// --config, -c <filename>
	QCommandLineOption configFileOption(QStringList() << "config" << "c", "Load configuration file", "filename");
	parser.addOption(configFileOption);

	// --vault <path>
	QCommandLineOption vaultOption(QStringList() << "vault", "Vault root directory (overrides the configuration file)", "path");
	parser.addOption(vaultOption);

	// --email <address>
	QCommandLineOption emailOption(QStringList() << "email", "Owner identity (overrides the configuration file)", "address");
	parser.addOption(emailOption);

	// --api-url <url>
	QCommandLineOption apiUrlOption(QStringList() << "api-url", "Registration service address", "url");
	parser.addOption(apiUrlOption);

	// --verbose
	QCommandLineOption verboseOption(QStringList() << "verbose", "Log protocol level detail.");
	parser.addOption(verboseOption);

	// Process
	parser.process(*QCoreApplication::instance());

	if(parser.isSet(versionOption)) {
		printVersion();
		::exit(0);
	}

	if(sodium_init() < 0) {
		qCritical("Failed to initialize sodium");
		return false;
	}

	initRtcLogging(parser.isSet(verboseOption));

	HostConfig *hostconfig;
	if(parser.isSet(configFileOption)) {
		const QString path = parser.value(configFileOption);
		if(!QFileInfo::exists(path)) {
			qCritical("Configuration file %s not found", qPrintable(path));
			return false;
		}
		hostconfig = new ConfigFile(path);
	} else {
		hostconfig = new InMemoryConfig;
	}

	if(parser.isSet(vaultOption))
		setOverride(hostconfig, config::VaultPath, QDir(parser.value(vaultOption)).absolutePath());
	if(parser.isSet(emailOption))
		setOverride(hostconfig, config::Email, parser.value(emailOption));
	// Keeps the credential hash out of the process list
	const QString ownerHash = qEnvironmentVariable("NOTERELAY_OWNER_HASH");
	if(!ownerHash.isEmpty())
		setOverride(hostconfig, config::OwnerHash, ownerHash);
	if(parser.isSet(apiUrlOption))
		setOverride(hostconfig, config::ApiUrl, parser.value(apiUrlOption));

	if(!parser.isSet(verboseOption))
		QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));

	const QString vaultPath = hostconfig->getConfigString(config::VaultPath);
	if(vaultPath.isEmpty() || !QFileInfo(vaultPath).isDir()) {
		qCritical("Vault directory \"%s\" not found", qUtf8Printable(vaultPath));
		return false;
	}

	const QUrl apiUrl(hostconfig->getConfigString(config::ApiUrl));
	if(!apiUrl.isValid() || (apiUrl.scheme() != QStringLiteral("https") && apiUrl.scheme() != QStringLiteral("http"))) {
		qCritical("Invalid registration service address %s", qUtf8Printable(apiUrl.toString()));
		return false;
	}

	// These live until the application exits
	FilesystemVault *vault = new FilesystemVault(vaultPath);
	vault->setUseTrash(hostconfig->getConfigBool(config::TrashDeleted));

	MarkdownRenderer *renderer = new MarkdownRenderer;

	relay::RegistrationApi *api = new relay::RegistrationApi(apiUrl);

	HostService *service = new HostService(hostconfig, vault, api);
	service->setRenderer(renderer);

	QObject::connect(service, &HostService::statusChanged, [](HostService::Status, const QString &text) {
		qInfo("%s", qUtf8Printable(text));
	});

	QObject::connect(QCoreApplication::instance(), &QCoreApplication::aboutToQuit, [service, api, hostconfig, vault, renderer]() {
		service->stop();
		delete service;
		delete api;
		delete hostconfig;
		delete renderer;
		delete vault;
	});

#ifdef Q_OS_UNIX
	// Catch signals
	QObject::connect(UnixSignals::instance(), &UnixSignals::sigInt, QCoreApplication::instance(), &QCoreApplication::quit);
	QObject::connect(UnixSignals::instance(), &UnixSignals::sigTerm, QCoreApplication::instance(), &QCoreApplication::quit);
	QObject::connect(UnixSignals::instance(), &UnixSignals::sigHup, service, &HostService::refreshRelayCredentials);
	QObject::connect(UnixSignals::instance(), &UnixSignals::sigUsr1, service, &HostService::wake);
#endif

	if(!service->start()) {
		qCritical("%s", qUtf8Printable(service->statusText()));
		return false;
	}

	return true;
}

}
}
