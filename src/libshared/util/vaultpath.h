// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_UTIL_VAULTPATH_H
#define NR_SHARED_UTIL_VAULTPATH_H

class QString;

namespace vaultpath {

/**
 * @brief Turn a path received from a remote peer into a safe vault path
 *
 * Backslashes become forward slashes, null bytes and every ".." sequence
 * are removed, and empty or "." segments are dropped. The result is always
 * relative (no leading slash) and never contains a parent directory
 * segment. An empty result means the path was unusable and must be
 * rejected.
 */
QString sanitize(const QString &unsafePath);

//! Last segment of the path
QString fileName(const QString &path);

//! Last segment of the path without its extension
QString baseName(const QString &path);

//! Extension of the last segment, lowercased and without the dot
QString extension(const QString &path);

//! Path of the containing folder (empty for top level entries)
QString parentPath(const QString &path);

//! Is this a Markdown note?
bool isMarkdown(const QString &path);

}

#endif
