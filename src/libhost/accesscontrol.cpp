// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/accesscontrol.h"
#include "libshared/util/credentials.h"
#include <QStringList>

namespace host {

bool GuestEntry::fromString(
	const QString &line, GuestEntry &entry, QString *errorMessage)
{
	const QStringList parts = line.trimmed().split(':');
	if(parts.size() < 3 || parts.size() > 4) {
		if(errorMessage)
			*errorMessage = QStringLiteral("expected identity:hash:rw|ro[:status]");
		return false;
	}

	GuestEntry e;
	e.identity = parts.at(0).trimmed();
	e.credentialHash = parts.at(1).trimmed();
	if(e.identity.isEmpty() || e.credentialHash.isEmpty()) {
		if(errorMessage)
			*errorMessage = QStringLiteral("identity and hash must not be empty");
		return false;
	}

	const QString mode = parts.at(2).trimmed().toLower();
	if(mode == QStringLiteral("rw")) {
		e.permission = Permission::ReadWrite;
	} else if(mode == QStringLiteral("ro")) {
		e.permission = Permission::ReadOnly;
	} else {
		if(errorMessage)
			*errorMessage = QStringLiteral("unknown permission: %1").arg(mode);
		return false;
	}

	if(parts.size() == 4) {
		const QString status = parts.at(3).trimmed().toLower();
		if(status == QStringLiteral("verified")) {
			e.status = Status::Verified;
		} else if(status == QStringLiteral("pending")) {
			e.status = Status::Pending;
		} else {
			if(errorMessage)
				*errorMessage = QStringLiteral("unknown status: %1").arg(status);
			return false;
		}
	}

	entry = e;
	return true;
}

QString GuestEntry::toString() const
{
	return QStringLiteral("%1:%2:%3:%4")
		.arg(
			identity, credentialHash,
			permission == Permission::ReadWrite ? QStringLiteral("rw")
												: QStringLiteral("ro"),
			status == Status::Verified ? QStringLiteral("verified")
									   : QStringLiteral("pending"));
}

AuthResolver::AuthResolver(QObject *parent)
	: QObject(parent)
	, m_snapshot(new AccessSnapshot)
{
}

QString AuthResolver::normalizeIdentity(const QString &identity)
{
	return identity.trimmed().toLower();
}

void AuthResolver::replace(AccessSnapshot *snapshot)
{
	m_snapshot = QSharedPointer<const AccessSnapshot>(snapshot);
	emit accessChanged();
}

void AuthResolver::setOwner(const IdentityRecord &owner)
{
	AccessSnapshot *s = new AccessSnapshot(*m_snapshot);
	s->owner = owner;
	replace(s);
}

void AuthResolver::setGuests(const QVector<GuestEntry> &guests)
{
	AccessSnapshot *s = new AccessSnapshot(*m_snapshot);
	s->guests.clear();
	for(const GuestEntry &g : guests)
		s->guests.insert(normalizeIdentity(g.identity), g);
	replace(s);
}

void AuthResolver::addGuest(const GuestEntry &guest)
{
	AccessSnapshot *s = new AccessSnapshot(*m_snapshot);
	s->guests.insert(normalizeIdentity(guest.identity), guest);
	replace(s);
}

bool AuthResolver::removeGuest(const QString &identity)
{
	const QString key = normalizeIdentity(identity);
	if(!m_snapshot->guests.contains(key))
		return false;

	AccessSnapshot *s = new AccessSnapshot(*m_snapshot);
	s->guests.remove(key);
	replace(s);
	return true;
}

AuthResult AuthResolver::resolve(const QString &identity, const QString &proof) const
{
	// Hold a reference so a concurrent replacement can't pull the
	// snapshot out from under us.
	const QSharedPointer<const AccessSnapshot> snapshot = m_snapshot;
	return resolve(*snapshot, identity, proof);
}

AuthResult AuthResolver::resolve(
	const AccessSnapshot &snapshot, const QString &identity,
	const QString &proof)
{
	AuthResult result;
	const QString claimed = normalizeIdentity(identity);
	result.identity = claimed.isEmpty() ? QStringLiteral("unknown") : claimed;

	if(claimed.isEmpty() || proof.isEmpty()) {
		result.reason = QStringLiteral("ACCESS_DENIED: Invalid credentials");
		return result;
	}

	const QString ownerIdentity = normalizeIdentity(snapshot.owner.email);
	if(!ownerIdentity.isEmpty() && claimed == ownerIdentity) {
		if(credentials::matches(proof, snapshot.owner.credentialHash)) {
			result.granted = true;
			result.permission = Permission::ReadWrite;
		} else {
			result.reason = QStringLiteral("ACCESS_DENIED: Invalid password.");
		}
		return result;
	}

	const auto guest = snapshot.guests.constFind(claimed);
	if(guest == snapshot.guests.constEnd()) {
		result.reason = QStringLiteral("ACCESS_DENIED: Not authorized");
		return result;
	}

	if(!guest->isVerified()) {
		result.reason = QStringLiteral("ACCESS_DENIED: Guest not verified");
		return result;
	}

	if(!credentials::matches(proof, guest->credentialHash)) {
		result.reason = QStringLiteral("ACCESS_DENIED: Invalid password.");
		return result;
	}

	result.granted = true;
	result.permission = guest->permission;
	return result;
}

}
