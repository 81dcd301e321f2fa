// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_NOTEMETADATA_H
#define NR_HOST_NOTEMETADATA_H
#include "libhost/vaultstorage.h"

namespace host {
namespace notemeta {

/**
 * @brief Split a note into its front-matter block and body
 *
 * The front-matter block is a `---` line, YAML lines and a closing `---`
 * line at the very beginning of the note.
 *
 * @return false if the note has no front-matter (body is then the whole text)
 */
bool splitFrontmatter(const QString &text, QString &yaml, QString &body);

/**
 * @brief Parse a front-matter block
 *
 * Only the subset of YAML notes actually use is understood: top level
 * `key: value` pairs, inline `[a, b]` lists and indented `- item` lists.
 * Scalars that look like booleans or numbers are converted.
 */
QJsonObject parseFrontmatter(const QString &yaml);

//! Extract tags, links and front-matter from a note
FileMetadata extract(const QString &text);

//! Get the front-matter tags with a leading '#'
QStringList frontmatterTags(const QJsonObject &frontmatter);

}
}

#endif
