// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOST_COMMANDDISPATCHER_H
#define NR_HOST_COMMANDDISPATCHER_H
#include "libhost/accesscontrol.h"
#include "libhost/markdownrenderer.h"
#include "libshared/net/envelope.h"
#include <QStringList>

namespace host {

class HostLog;
class VaultStorage;

//! Error returned for mutating commands in a read-only session
extern const char READ_ONLY_ERROR[];

/**
 * @brief Executes commands from authenticated peers against the vault
 *
 * Every command maps to one handler. Commands that modify the vault are
 * refused outright in read-only sessions, before their handler runs.
 * Handler failures (including exceptions) are turned into ERROR envelopes.
 * The request's correlation ID is echoed in every response's meta fields.
 */
class CommandDispatcher {
public:
	CommandDispatcher(
		VaultStorage *storage, ContentRenderer *renderer = nullptr,
		HostLog *logger = nullptr);

	VaultStorage *storage() const { return m_storage; }

	//! Set the renderer to use (nullptr selects the built-in plain renderer)
	void setRenderer(ContentRenderer *renderer);
	ContentRenderer *renderer() const;

	/**
	 * @brief Allow rendering a missing note to create it
	 *
	 * This lets a remote user follow links to notes that don't exist yet.
	 * Never applies to read-only sessions.
	 */
	void setAutoCreateMissing(bool autoCreate) { m_autoCreateMissing = autoCreate; }
	bool autoCreateMissing() const { return m_autoCreateMissing; }

	void setLogger(HostLog *logger) { m_logger = logger; }

	/**
	 * @brief Execute a command
	 * @param command the command from the peer
	 * @param permission the permission level of the peer's session
	 * @param session session ID for logging
	 * @return the response envelope (possibly an ERROR)
	 */
	net::Envelope dispatch(
		const net::Command &command, Permission permission,
		const QString &session = QString());

	static QStringList commandNames();
	static bool isKnownCommand(const QString &name);
	static bool isMutating(const QString &name);

	/**
	 * @brief Render a note for display
	 *
	 * The result is a RENDERED_FILE envelope with the note's HTML, its
	 * front-matter, backlinks and link graph.
	 *
	 * @param path sanitized note path
	 * @param includeFiles also list every file in the vault
	 */
	net::Envelope renderNote(const QString &path, bool includeFiles);

	/**
	 * @brief Replace internal embed sources with inline data URIs
	 *
	 * Embeds that don't resolve to a file in the vault are left as they are.
	 */
	QString inlineAssets(const QString &html, const QString &sourcePath) const;

	//! Build the link graph and backlink list of a note
	void buildGraph(
		const QString &path, QJsonArray &backlinks, QJsonObject &graph) const;

private:
	VaultStorage *m_storage;
	ContentRenderer *m_renderer;
	MarkdownRenderer m_plainRenderer;
	HostLog *m_logger;
	bool m_autoCreateMissing;
};

}

#endif
