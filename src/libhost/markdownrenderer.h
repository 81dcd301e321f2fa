// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_MARKDOWNRENDERER_H
#define NR_HOST_MARKDOWNRENDERER_H
#include "libhost/vaultstorage.h"

namespace host {

/**
 * @brief A plain Markdown to HTML renderer
 *
 * Handles the common block elements (headings, paragraphs, lists, quotes,
 * fenced code, rules) and inline markup, plus wiki links and embeds.
 * Embeds and local images are emitted as internal-embed images with an
 * `app://` source that the dispatcher replaces with inline data.
 */
class MarkdownRenderer final : public ContentRenderer {
public:
	bool render(
		const QString &markdown, const QString &sourcePath, QString &html,
		QString *errorMessage) override;

	static QString renderInline(const QString &text);
};

}

#endif
