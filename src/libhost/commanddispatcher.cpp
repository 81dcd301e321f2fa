// SPDX-License-Identifier: GPL-3.0-or-later
#include "libhost/commanddispatcher.h"
#include "libhost/hostlog.h"
#include "libhost/notemetadata.h"
#include "libhost/vaultstorage.h"
#include "libshared/util/vaultpath.h"
#include <QJsonArray>
#include <QMimeDatabase>
#include <QRegularExpression>
#include <exception>

namespace host {

const char READ_ONLY_ERROR[] = "READ-ONLY MODE: Editing is disabled";

namespace {

typedef net::Envelope (*HostCommandFn)(
	CommandDispatcher &, const net::Command &, Permission);

class HostCommand {
public:
	enum Mode {
		READ, // allowed in every authenticated session
		WRITE // modifies the vault, needs read-write access
	};

	HostCommand(const QString &name, HostCommandFn fn, Mode mode = READ)
		: m_fn(fn)
		, m_name(name)
		, m_mode(mode)
	{
	}

	net::Envelope call(
		CommandDispatcher &d, const net::Command &cmd, Permission permission) const
	{
		return m_fn(d, cmd, permission);
	}

	const QString &name() const { return m_name; }
	Mode mode() const { return m_mode; }

private:
	HostCommandFn m_fn;
	QString m_name;
	Mode m_mode;
};

struct HostCommandSet {
	QList<HostCommand> commands;

	HostCommandSet();

	const HostCommand *find(const QString &name) const
	{
		for(const HostCommand &c : commands) {
			if(c.name() == name)
				return &c;
		}
		return nullptr;
	}
};

const HostCommandSet COMMANDS;

const QStringList IMAGE_EXTENSIONS = {
	QStringLiteral("png"), QStringLiteral("jpg"), QStringLiteral("jpeg"),
	QStringLiteral("gif"), QStringLiteral("svg"), QStringLiteral("webp")};

net::Envelope err(const QString &message)
{
	return net::Envelope::makeError(message);
}

net::Envelope invalidPath()
{
	return err(QStringLiteral("Invalid path"));
}

net::Envelope notFound()
{
	return err(QStringLiteral("File not found"));
}

QString pathArg(const net::Command &cmd)
{
	return vaultpath::sanitize(cmd.stringArg(QStringLiteral("path")));
}

QString nodeLabel(const QString &path)
{
	QString label = vaultpath::fileName(path);
	if(label.endsWith(QStringLiteral(".md"), Qt::CaseInsensitive))
		label.chop(3);
	return label;
}

QJsonArray fileList(const VaultStorage &storage)
{
	QJsonArray files;
	for(const QString &path : storage.files()) {
		files.append(QJsonObject{
			{QStringLiteral("path"), path},
			{QStringLiteral("name"), vaultpath::fileName(path)},
			{QStringLiteral("basename"), vaultpath::baseName(path)},
			{QStringLiteral("extension"), vaultpath::extension(path)},
		});
	}
	return files;
}

net::Envelope getTree(CommandDispatcher &d, const net::Command &, Permission)
{
	const VaultStorage &storage = *d.storage();

	QJsonArray files;
	for(const QString &path : storage.markdownFiles()) {
		const FileMetadata meta = storage.metadata(path);
		files.append(QJsonObject{
			{QStringLiteral("path"), path},
			{QStringLiteral("tags"), QJsonArray::fromStringList(meta.tags)},
			{QStringLiteral("links"), QJsonArray::fromStringList(meta.links)},
		});
	}

	return net::Envelope::make(
		QStringLiteral("TREE"),
		QJsonObject{
			{QStringLiteral("files"), files},
			{QStringLiteral("folders"),
			 QJsonArray::fromStringList(storage.folders())},
		});
}

net::Envelope getRenderedFile(
	CommandDispatcher &d, const net::Command &cmd, Permission permission)
{
	const QString path = pathArg(cmd);
	if(path.isEmpty())
		return invalidPath();

	VaultStorage &storage = *d.storage();
	if(!storage.exists(path)) {
		if(!d.autoCreateMissing() || permission != Permission::ReadWrite)
			return notFound();

		QString error;
		if(!storage.createFile(path, QString(), &error))
			return err(QStringLiteral("Could not create '%1'").arg(path));
	}

	return d.renderNote(path, false);
}

net::Envelope openFile(
	CommandDispatcher &d, const net::Command &cmd, Permission)
{
	const QString path = pathArg(cmd);
	if(path.isEmpty())
		return invalidPath();
	if(!d.storage()->exists(path))
		return notFound();

	net::Envelope response = d.renderNote(path, false);
	if(!response.isError())
		response.type = QStringLiteral("OPEN_FILE");
	return response;
}

net::Envelope getFile(CommandDispatcher &d, const net::Command &cmd, Permission)
{
	const QString path = pathArg(cmd);
	if(path.isEmpty())
		return invalidPath();

	const VaultStorage &storage = *d.storage();
	if(!storage.exists(path))
		return notFound();
	if(storage.isFolder(path))
		return err(QStringLiteral("Not a file: %1").arg(path));

	const QString ext = vaultpath::extension(path);
	QString error;

	if(ext == QStringLiteral("md")) {
		QString text;
		if(!storage.readText(path, text, &error))
			return err(QStringLiteral("Failed to read file"));

		QJsonArray backlinks;
		QJsonObject graph;
		d.buildGraph(path, backlinks, graph);

		return net::Envelope::make(
			QStringLiteral("FILE"),
			QJsonObject{
				{QStringLiteral("data"), text},
				{QStringLiteral("backlinks"), backlinks},
			},
			QJsonObject{{QStringLiteral("path"), path}});
	}

	QByteArray data;
	if(!storage.readBinary(path, data, &error))
		return err(QStringLiteral("Failed to read file"));

	QJsonObject meta{
		{QStringLiteral("path"), path},
		{QStringLiteral("ext"), ext},
	};
	if(IMAGE_EXTENSIONS.contains(ext))
		meta[QStringLiteral("isImage")] = true;
	else
		meta[QStringLiteral("isBinary")] = true;

	return net::Envelope::make(
		QStringLiteral("FILE"), QString::fromLatin1(data.toBase64()), meta);
}

net::Envelope saveFile(CommandDispatcher &d, const net::Command &cmd, Permission)
{
	const QString path = pathArg(cmd);
	if(path.isEmpty())
		return invalidPath();

	const QJsonValue data = cmd.args.value(QStringLiteral("data"));
	if(!data.isString())
		return err(QStringLiteral("Missing file content"));

	VaultStorage &storage = *d.storage();
	if(!storage.exists(path) || storage.isFolder(path))
		return notFound();

	QString error;
	if(!storage.writeText(path, data.toString(), &error))
		return err(QStringLiteral("Failed to write file"));

	return net::Envelope::makeSaved(path);
}

net::Envelope createFile(CommandDispatcher &d, const net::Command &cmd, Permission)
{
	const QString path = pathArg(cmd);
	if(path.isEmpty())
		return invalidPath();

	VaultStorage &storage = *d.storage();
	if(storage.exists(path))
		return err(QStringLiteral("File already exists"));

	QString error;
	if(!storage.createFile(path, cmd.stringArg(QStringLiteral("data")), &error))
		return err(QStringLiteral("Could not create '%1'").arg(path));

	// The client needs the new note and the updated file list in one go
	return d.renderNote(path, true);
}

net::Envelope createFolder(CommandDispatcher &d, const net::Command &cmd, Permission)
{
	const QString path = pathArg(cmd);
	if(path.isEmpty())
		return invalidPath();

	VaultStorage &storage = *d.storage();
	if(storage.exists(path))
		return err(QStringLiteral("Folder already exists"));

	QString error;
	if(!storage.createFolder(path, &error))
		return err(QStringLiteral("Could not create folder '%1'").arg(path));

	return net::Envelope::makeSaved(path);
}

net::Envelope renameFile(CommandDispatcher &d, const net::Command &cmd, Permission)
{
	QString newPath = cmd.args.value(QStringLiteral("data"))
						  .toObject()
						  .value(QStringLiteral("newPath"))
						  .toString();
	if(newPath.isEmpty())
		newPath = cmd.stringArg(QStringLiteral("newPath"));

	const QString path = pathArg(cmd);
	newPath = vaultpath::sanitize(newPath);
	if(path.isEmpty() || newPath.isEmpty())
		return invalidPath();

	VaultStorage &storage = *d.storage();
	if(!storage.exists(path))
		return notFound();
	if(path != newPath && storage.exists(newPath))
		return err(QStringLiteral("'%1' already exists").arg(newPath));

	QString error;
	if(!storage.rename(path, newPath, &error))
		return err(QStringLiteral("Failed to rename file"));

	return net::Envelope::makeSaved(newPath);
}

net::Envelope deleteFile(CommandDispatcher &d, const net::Command &cmd, Permission)
{
	const QString path = pathArg(cmd);
	if(path.isEmpty())
		return invalidPath();

	VaultStorage &storage = *d.storage();
	if(!storage.exists(path))
		return notFound();

	QString error;
	if(!storage.remove(path, &error))
		return err(QStringLiteral("Failed to delete file"));

	return net::Envelope::makeSaved(path);
}

net::Envelope search(CommandDispatcher &d, const net::Command &cmd, Permission)
{
	static constexpr int MAX_MATCHES_PER_FILE = 5;

	const QString query = cmd.stringArg(QStringLiteral("query"));
	if(query.trimmed().isEmpty())
		return err(QStringLiteral("Missing search query"));

	const VaultStorage &storage = *d.storage();
	QJsonArray results;

	for(const QString &path : storage.markdownFiles()) {
		QString text;
		if(!storage.readText(path, text, nullptr))
			continue;
		if(!text.contains(query, Qt::CaseInsensitive))
			continue;

		QJsonArray matches;
		const QStringList lines = text.split('\n');
		for(int i = 0; i < lines.size() && matches.size() < MAX_MATCHES_PER_FILE; ++i) {
			if(lines.at(i).contains(query, Qt::CaseInsensitive)) {
				matches.append(QJsonObject{
					{QStringLiteral("lineNum"), i + 1},
					{QStringLiteral("text"), lines.at(i).trimmed()},
				});
			}
		}

		if(!matches.isEmpty()) {
			results.append(QJsonObject{
				{QStringLiteral("path"), path},
				{QStringLiteral("matches"), matches},
			});
		}
	}

	return net::Envelope::makeSearchResults(results, query);
}

HostCommandSet::HostCommandSet()
{
	commands << HostCommand("GET_TREE", getTree)
			 << HostCommand("GET_RENDERED_FILE", getRenderedFile)
			 << HostCommand("OPEN_FILE", openFile)
			 << HostCommand("GET_FILE", getFile)
			 << HostCommand("SEARCH", search)
			 << HostCommand("SAVE_FILE", saveFile, HostCommand::WRITE)
			 << HostCommand("CREATE_FILE", createFile, HostCommand::WRITE)
			 << HostCommand("CREATE_FOLDER", createFolder, HostCommand::WRITE)
			 << HostCommand("RENAME_FILE", renameFile, HostCommand::WRITE)
			 << HostCommand("DELETE_FILE", deleteFile, HostCommand::WRITE);
}

} // end of anonymous namespace

CommandDispatcher::CommandDispatcher(
	VaultStorage *storage, ContentRenderer *renderer, HostLog *logger)
	: m_storage(storage)
	, m_renderer(renderer)
	, m_logger(logger)
	, m_autoCreateMissing(false)
{
	Q_ASSERT(storage);
}

void CommandDispatcher::setRenderer(ContentRenderer *renderer)
{
	m_renderer = renderer;
}

ContentRenderer *CommandDispatcher::renderer() const
{
	return m_renderer ? m_renderer
					  : const_cast<MarkdownRenderer *>(&m_plainRenderer);
}

QStringList CommandDispatcher::commandNames()
{
	QStringList names;
	for(const HostCommand &c : COMMANDS.commands)
		names << c.name();
	return names;
}

bool CommandDispatcher::isKnownCommand(const QString &name)
{
	return COMMANDS.find(name) != nullptr;
}

bool CommandDispatcher::isMutating(const QString &name)
{
	const HostCommand *c = COMMANDS.find(name);
	return c && c->mode() == HostCommand::WRITE;
}

net::Envelope CommandDispatcher::dispatch(
	const net::Command &command, Permission permission, const QString &session)
{
	net::Envelope response;
	const auto log = [&](Log::Level level, Log::Topic topic, const QString &message) {
		if(m_logger)
			Log().about(level, topic).session(session).message(message).to(m_logger);
	};

	const HostCommand *c = COMMANDS.find(command.cmd);
	if(!c) {
		log(Log::Level::Warn, Log::Topic::BadData,
			QStringLiteral("Unknown command %1").arg(command.cmd));
		response = err(QStringLiteral("Unknown command: %1").arg(command.cmd));

	} else if(c->mode() == HostCommand::WRITE && permission == Permission::ReadOnly) {
		log(Log::Level::Warn, Log::Topic::RuleBreak,
			QStringLiteral("%1 refused in read-only session").arg(command.cmd));
		response = err(QString::fromLatin1(READ_ONLY_ERROR));

	} else {
		try {
			response = c->call(*this, command, permission);
		} catch(const std::exception &e) {
			log(Log::Level::Error, Log::Topic::Command,
				QStringLiteral("%1 failed: %2")
					.arg(command.cmd, QString::fromLocal8Bit(e.what())));
			response = err(QStringLiteral("%1 failed").arg(command.cmd));
		}

		if(response.isError()) {
			log(Log::Level::Info, Log::Topic::Command,
				QStringLiteral("%1: %2").arg(command.cmd, response.errorMessage()));
		} else {
			log(Log::Level::Debug, Log::Topic::Command,
				QStringLiteral("%1 -> %2").arg(command.cmd, response.type));
		}
	}

	if(!command.requestId.isUndefined() && !command.requestId.isNull())
		response.meta[QStringLiteral("requestId")] = command.requestId;

	return response;
}

void CommandDispatcher::buildGraph(
	const QString &path, QJsonArray &backlinks, QJsonObject &graph) const
{
	QJsonArray nodes;
	QJsonArray edges;
	QStringList nodeIds;

	const auto addNode = [&](const QString &id, const QString &label, const QString &group) {
		if(nodeIds.contains(id))
			return;
		nodeIds << id;
		nodes.append(QJsonObject{
			{QStringLiteral("id"), id},
			{QStringLiteral("label"), label},
			{QStringLiteral("group"), group},
		});
	};

	addNode(path, vaultpath::baseName(path), QStringLiteral("center"));

	const LinkIndex links(m_storage->files());

	for(const QString &link : m_storage->metadata(path).links) {
		const QString resolved = links.resolve(link, path);
		const QString target = resolved.isEmpty() ? link : resolved;
		addNode(target, nodeLabel(target), QStringLiteral("neighbor"));
		edges.append(QJsonObject{
			{QStringLiteral("from"), path},
			{QStringLiteral("to"), target},
		});
	}

	// No reverse link index is kept, so every note has to be checked
	const QHash<QString, QStringList> index = m_storage->resolvedLinks(links);
	for(const QString &source : links.notes()) {
		if(source == path || !index.value(source).contains(path))
			continue;

		backlinks.append(source);
		addNode(source, nodeLabel(source), QStringLiteral("neighbor"));
		edges.append(QJsonObject{
			{QStringLiteral("from"), source},
			{QStringLiteral("to"), path},
		});
	}

	graph = QJsonObject{
		{QStringLiteral("nodes"), nodes},
		{QStringLiteral("edges"), edges},
	};
}

net::Envelope CommandDispatcher::renderNote(const QString &path, bool includeFiles)
{
	if(m_storage->isFolder(path))
		return err(QStringLiteral("Not a file: %1").arg(path));

	QString text;
	QString error;
	if(!m_storage->readText(path, text, &error))
		return err(QStringLiteral("Failed to read file"));

	QString yaml, body;
	QJsonValue frontmatter;
	if(notemeta::splitFrontmatter(text, yaml, body))
		frontmatter = notemeta::parseFrontmatter(yaml);

	QString html;
	if(!renderer()->render(body, path, html, &error))
		return err(QStringLiteral("Rendering failed: %1").arg(error));

	QJsonArray backlinks;
	QJsonObject graph;
	buildGraph(path, backlinks, graph);

	QJsonObject payload{
		{QStringLiteral("html"), inlineAssets(html, path)},
		{QStringLiteral("yaml"), frontmatter},
		{QStringLiteral("backlinks"), backlinks},
		{QStringLiteral("graph"), graph},
	};

	if(includeFiles)
		payload[QStringLiteral("files")] = fileList(*m_storage);

	return net::Envelope::make(
		QStringLiteral("RENDERED_FILE"), payload,
		QJsonObject{{QStringLiteral("path"), path}});
}

QString CommandDispatcher::inlineAssets(const QString &html, const QString &sourcePath) const
{
	static const QRegularExpression element(
		QStringLiteral("<(img|embed|object|iframe)\\b[^>]*\\bdata-src=\"([^\"]*)\"[^>]*>"),
		QRegularExpression::CaseInsensitiveOption);
	static const QRegularExpression srcAttr(
		QStringLiteral("\\s(src|data)=\"[^\"]*\""), QRegularExpression::CaseInsensitiveOption);
	static const QRegularExpression srcsetAttr(
		QStringLiteral("\\ssrcset=\"[^\"]*\""), QRegularExpression::CaseInsensitiveOption);

	const QMimeDatabase mimeDb;
	QString out;
	int pos = 0;

	auto it = element.globalMatch(html);
	while(it.hasNext()) {
		const QRegularExpressionMatch m = it.next();
		out += html.mid(pos, m.capturedStart() - pos);
		pos = m.capturedEnd();

		QString tag = m.captured(0);
		const QString link = m.captured(2)
								 .replace(QStringLiteral("&amp;"), QStringLiteral("&"))
								 .replace(QStringLiteral("&quot;"), QStringLiteral("\""))
								 .replace(QStringLiteral("&lt;"), QStringLiteral("<"))
								 .replace(QStringLiteral("&gt;"), QStringLiteral(">"));
		const QString target = m_storage->resolveLink(link, sourcePath);

		QByteArray data;
		if(target.isEmpty() || !m_storage->readBinary(target, data, nullptr)) {
			out += tag;
			continue;
		}

		const QString uri = QStringLiteral("data:%1;base64,%2")
								.arg(
									mimeDb.mimeTypeForFile(target, QMimeDatabase::MatchExtension).name(),
									QString::fromLatin1(data.toBase64()));

		tag.remove(srcsetAttr);
		const QString attr = m.captured(1).compare(QStringLiteral("object"), Qt::CaseInsensitive) == 0
								 ? QStringLiteral("data")
								 : QStringLiteral("src");
		tag.remove(srcAttr);
		tag.insert(m.captured(1).length() + 1, QStringLiteral(" %1=\"%2\"").arg(attr, uri));
		out += tag;
	}
	out += html.mid(pos);
	return out;
}

}
