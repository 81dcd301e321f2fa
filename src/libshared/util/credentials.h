// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_UTIL_CREDENTIALS_H
#define NR_SHARED_UTIL_CREDENTIALS_H

class QByteArray;
class QString;

namespace credentials {

/**
 * @brief Hash a string with SHA-256
 * @return lowercase hexadecimal digest
 */
QString sha256Hex(const QString &input);

/**
 * @brief Check a credential proof against the expected credential hash
 *
 * The comparison takes the same time regardless of where the first
 * mismatching character is. Hex digests are compared case-insensitively.
 * An empty expected hash never matches anything.
 */
bool matches(const QString &proof, const QString &expected);

/**
 * @brief Check if the string looks like a SHA-256 hex digest
 */
bool isValidHash(const QString &hash);

/**
 * @brief Derive the node ID of this machine for the given vault
 *
 * The ID is stable across restarts without storing any secret: it is the
 * SHA-256 digest of `vaultPath|platform|hostname`.
 */
QString deriveNodeId(
	const QString &vaultPath, const QString &platform, const QString &hostname);

//! Derive the node ID using this machine's platform and host name
QString localNodeId(const QString &vaultPath);

//! Platform name used in node ID derivation
QString platformName();

}

#endif
