// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_HOSTCONFIG_H
#define NR_HOST_HOSTCONFIG_H
#include "libhost/accesscontrol.h"
#include <QObject>
#include <QString>
#include <QVariant>
#include <QVector>

namespace host {

class HostLog;

class ConfigKey {
public:
	enum Type {
		STRING, // A string value
		TIME,	// Time in seconds, converted from a time definition string
		SIZE,	// Size in bytes, converted from a size definition string
		INT,	// Integer
		BOOL	// Boolean (true|1)
	};

	constexpr ConfigKey(
		int index_, const char *name_, const char *defaultValue_, Type type_)
		: index(index_)
		, name(name_)
		, defaultValue(defaultValue_)
		, type(type_)
	{
	}

	const int index;
	const char *name;
	const char *defaultValue;
	const Type type;
};

namespace config {
static constexpr ConfigKey
	// Owner identity (email)
	Email(0, "email", "", ConfigKey::STRING),
	// Owner credential hash (SHA-256 hex)
	OwnerHash(1, "ownerHash", "", ConfigKey::STRING),
	// Stable vault identifier assigned by the registration service
	VaultId(2, "vaultId", "", ConfigKey::STRING),
	// Root directory of the vault
	VaultPath(3, "vaultPath", "", ConfigKey::STRING),
	// Display name of the vault (defaults to the root directory's name)
	VaultName(4, "vaultName", "", ConfigKey::STRING),
	// Master switch for the whole remote access subsystem
	EnableRemoteAccess(5, "enableRemoteAccess", "true", ConfigKey::BOOL),
	// Registration service base address
	ApiUrl(6, "apiUrl", "https://noterelay.io", ConfigKey::STRING),
	// Time between registration heartbeats
	HeartbeatInterval(7, "heartbeatInterval", "5m", ConfigKey::TIME),
	// Time since the last heartbeat attempt after which a wake rebuilds everything
	StaleAfter(8, "staleAfter", "6m", ConfigKey::TIME),
	// Unauthenticated sessions are closed after this long
	SessionIdleTimeout(9, "sessionIdleTimeout", "30", ConfigKey::TIME),
	// Delay between a denial error and closing the session (milliseconds)
	DenyGraceMs(10, "denyGraceMs", "1000", ConfigKey::INT),
	// Pause between outbound frames (milliseconds)
	FrameIntervalMs(11, "frameIntervalMs", "5", ConfigKey::INT),
	// Maximum amount of partially received messages buffered per session
	MaxReassemblySize(12, "maxReassemblySize", "32mb", ConfigKey::SIZE),
	// Maximum number of concurrent peer sessions
	MaxSessions(13, "maxSessions", "10", ConfigKey::INT),
	// Create an empty note when rendering a link target that doesn't exist
	AutoCreateMissing(14, "autoCreateMissing", "false", ConfigKey::BOOL),
	// Move deleted files to the system trash instead of removing them
	TrashDeleted(15, "trashDeleted", "true", ConfigKey::BOOL),
	// Transfer timeout of registration service requests
	RequestTimeout(16, "requestTimeout", "15", ConfigKey::TIME),
	// STUN server used when the service provides none (host:port)
	StunServer(17, "stunServer", "stun.l.google.com:19302", ConfigKey::STRING),
	// Name of the signaling table on the relay
	SignalTable(18, "signalTable", "signaling", ConfigKey::STRING),
	// Consecutive failed heartbeats after which registration is rebuilt (0 for never)
	MaxHeartbeatFailures(19, "maxHeartbeatFailures", "3", ConfigKey::INT);
}

/**
 * @brief Host configuration
 *
 * Values are stored as strings and converted on access. Keys not set
 * explicitly return their defaults.
 */
class HostConfig : public QObject {
	Q_OBJECT
public:
	explicit HostConfig(QObject *parent = nullptr)
		: QObject(parent)
	{
	}

	QString getConfigString(ConfigKey key) const;
	int getConfigTime(ConfigKey key) const;
	int getConfigSize(ConfigKey key) const;
	int getConfigInt(ConfigKey key) const;
	bool getConfigBool(ConfigKey key) const;
	QVariant getConfigVariant(ConfigKey key) const;

	/**
	 * @brief Set a configuration value
	 * @return false if the value doesn't parse as the key's type
	 */
	bool setConfigString(ConfigKey key, const QString &value);
	void setConfigInt(ConfigKey key, int value);
	void setConfigBool(ConfigKey key, bool value);

	//! The guest list
	virtual QVector<GuestEntry> guests() const = 0;

	//! The owner record, as far as it is configured
	IdentityRecord ownerRecord() const;

	virtual HostLog *logger() const = 0;

	/**
	 * @brief Parse a time interval string (e.g. "1d" or "5m")
	 * @return time in seconds or a negative value in case of error
	 */
	static int parseTimeString(const QString &str);

	/**
	 * @brief Parse a size string (e.g. "32mb" or "550kb")
	 * @return size in bytes or a negative value in case of error
	 */
	static int parseSizeString(const QString &str);

signals:
	void configValueChanged(int keyIndex);
	void guestsChanged();

protected:
	virtual QString getConfigValue(const ConfigKey key, bool &found) const = 0;
	virtual void setConfigValue(const ConfigKey key, const QString &value) = 0;
};

}

#endif
