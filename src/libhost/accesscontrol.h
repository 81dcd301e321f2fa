// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_ACCESSCONTROL_H
#define NR_HOST_ACCESSCONTROL_H
#include <QHash>
#include <QObject>
#include <QSharedPointer>
#include <QString>
#include <QVector>

namespace host {

enum class Permission { ReadWrite, ReadOnly };

/**
 * @brief A non-owner identity the owner has shared the vault with
 */
struct GuestEntry {
	enum class Status { Pending, Verified };

	QString identity;
	QString credentialHash;
	Permission permission = Permission::ReadOnly;
	Status status = Status::Pending;

	bool isVerified() const { return status == Status::Verified; }

	/**
	 * @brief Parse a guest list line
	 *
	 * The format is `identity:credentialHash:rw|ro:verified|pending`.
	 * The status field may be omitted, in which case the guest is pending.
	 */
	static bool
	fromString(const QString &line, GuestEntry &entry, QString *errorMessage);

	QString toString() const;
};

/**
 * @brief The vault owner
 */
struct IdentityRecord {
	QString email;
	QString credentialHash;
	QString vaultId;
	QString nodeId;

	//! Are the fields needed to authenticate the owner present?
	bool isConfigured() const
	{
		return !email.trimmed().isEmpty() && !credentialHash.isEmpty();
	}
};

/**
 * @brief An immutable view of the owner and the guest list
 *
 * Guests are keyed by their normalized (trimmed, lowercase) identity.
 */
struct AccessSnapshot {
	IdentityRecord owner;
	QHash<QString, GuestEntry> guests;
};

struct AuthResult {
	bool granted = false;
	Permission permission = Permission::ReadOnly;
	QString identity;
	QString reason;

	bool isReadOnly() const { return permission == Permission::ReadOnly; }
};

/**
 * @brief Resolves handshake credentials into an access grant
 *
 * The owner record and guest list are held in a snapshot that is replaced
 * as a whole on every change. A resolution always works on the snapshot
 * that was current when it started, so it never sees a half-updated list.
 */
class AuthResolver final : public QObject {
	Q_OBJECT
public:
	explicit AuthResolver(QObject *parent = nullptr);

	static QString normalizeIdentity(const QString &identity);

	QSharedPointer<const AccessSnapshot> snapshot() const { return m_snapshot; }

	IdentityRecord owner() const { return m_snapshot->owner; }
	void setOwner(const IdentityRecord &owner);

	void setGuests(const QVector<GuestEntry> &guests);
	void addGuest(const GuestEntry &guest);
	bool removeGuest(const QString &identity);
	int guestCount() const { return m_snapshot->guests.size(); }

	/**
	 * @brief Decide whether the claimed identity may access the vault
	 *
	 * The owner's identity is only ever checked against the owner's own
	 * credential, never against the guest list. Missing identity or proof
	 * always denies.
	 */
	AuthResult resolve(const QString &identity, const QString &proof) const;

	static AuthResult
	resolve(const AccessSnapshot &snapshot, const QString &identity,
			const QString &proof);

signals:
	void accessChanged();

private:
	void replace(AccessSnapshot *snapshot);

	QSharedPointer<const AccessSnapshot> m_snapshot;
};

}

#endif
