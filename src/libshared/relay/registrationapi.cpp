// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/relay/registrationapi.h"
#include "libshared/util/networkaccess.h"
#include <QJsonObject>
#include <QNetworkRequest>
#include <QUrlQuery>

namespace relay {

static QString slashcat(QString s, const QString &s2)
{
	if(!s.endsWith('/'))
		s.append('/');
	s.append(s2);
	return s;
}

/**
 * Read the response body and turn HTTP failures into an error message.
 *
 * An empty body is acceptable for a successful response.
 */
static bool readReply(
	QNetworkReply *reply, QJsonDocument &doc, QString &errorMessage,
	int &httpStatus)
{
	httpStatus = networkaccess::httpStatus(reply);
	const QByteArray body = reply->readAll();

	if(reply->error() != QNetworkReply::NoError) {
		if(httpStatus >= 400) {
			// The service explains refusals with {"error": "..."}
			const QJsonObject obj = QJsonDocument::fromJson(body).object();
			QString msg = obj.value(QStringLiteral("error")).toString();
			if(msg.isEmpty())
				msg = obj.value(QStringLiteral("message")).toString();
			if(msg.isEmpty())
				msg = obj.value(QStringLiteral("details")).toString();

			if(msg.isEmpty())
				errorMessage = QStringLiteral("HTTP error %1").arg(httpStatus);
			else
				errorMessage = QStringLiteral("HTTP error %1: %2")
								   .arg(httpStatus)
								   .arg(msg);
		} else {
			errorMessage =
				QStringLiteral("Network error: ") + reply->errorString();
		}
		return false;
	}

	if(body.trimmed().isEmpty()) {
		doc = QJsonDocument();
		return true;
	}

	QJsonParseError error;
	doc = QJsonDocument::fromJson(body, &error);
	if(error.error != QJsonParseError::NoError) {
		errorMessage =
			QStringLiteral("Unparseable response: ") + error.errorString();
		return false;
	}

	return true;
}

void ApiResponse::setResult(const QVariant &result, const QString &message)
{
	m_result = result;
	m_message = message;
	m_finished = true;
	emit finished(m_result, m_message, QString());
}

void ApiResponse::setError(
	const QString &error, int httpStatus,
	QNetworkReply::NetworkError networkError)
{
	m_error = error.isEmpty() ? QStringLiteral("Unknown error") : error;
	m_httpStatus = httpStatus;
	m_networkError = networkError;
	m_finished = true;
	emit finished(QVariant(), QString(), m_error);
}

RegistrationApi::RegistrationApi(const QUrl &baseUrl, QObject *parent)
	: QObject(parent)
	, m_baseUrl(baseUrl)
	, m_timeout(DEFAULT_TIMEOUT)
{
}

ApiResponse *RegistrationApi::post(
	const QString &path, const QString &route, const QJsonObject &body,
	const SuccessHandler &onSuccess)
{
	QUrl url = m_baseUrl;
	url.setPath(slashcat(url.path(), path));
	if(!route.isEmpty()) {
		QUrlQuery q;
		q.addQueryItem(QStringLiteral("route"), route);
		url.setQuery(q);
	}

	ApiResponse *res = new ApiResponse(url);

	QNetworkReply *reply =
		networkaccess::postJson(networkaccess::jsonRequest(url, m_timeout), body);
	reply->connect(reply, &QNetworkReply::finished, res, [reply, res, onSuccess]() {
		QJsonDocument doc;
		QString error;
		int status;
		if(!readReply(reply, doc, error, status)) {
			res->setError(error, status, reply->error());
			return;
		}
		onSuccess(res, doc);
	});

	return res;
}

ApiResponse *RegistrationApi::registerVault(const VaultRegistration &reg)
{
	const QJsonObject body{
		{QStringLiteral("email"), reg.email},
		{QStringLiteral("vaultId"), reg.vaultId},
		{QStringLiteral("signalId"), reg.signalId},
		{QStringLiteral("vaultName"), reg.vaultName},
		{QStringLiteral("hostname"), reg.hostname},
		{QStringLiteral("nodeId"), reg.nodeId},
		{QStringLiteral("machineName"), reg.hostname},
	};

	return post(
		QStringLiteral("api/vaults"), QStringLiteral("register"), body,
		[](ApiResponse *res, const QJsonDocument &doc) {
			const QJsonObject obj = doc.object();
			if(!obj.value(QStringLiteral("success")).toBool()) {
				const QString error = obj.value(QStringLiteral("error")).toString();
				res->setError(
					error.isEmpty() ? QStringLiteral("Registration refused")
									: error);
				return;
			}

			const RegistrationResult r{
				obj.value(QStringLiteral("signalId")).toString(),
				obj.value(QStringLiteral("vaultId")).toString(),
				obj.value(QStringLiteral("userId")).toString(),
			};
			if(r.signalId.isEmpty()) {
				res->setError(QStringLiteral("Registration reply has no signal ID"));
				return;
			}
			res->setResult(QVariant::fromValue(r));
		});
}

ApiResponse *RegistrationApi::heartbeat(
	const QString &email, const QString &vaultId, const QString &signalId)
{
	const QJsonObject body{
		{QStringLiteral("email"), email},
		{QStringLiteral("vaultId"), vaultId},
		{QStringLiteral("signalId"), signalId},
	};

	return post(
		QStringLiteral("api/vaults"), QStringLiteral("heartbeat"), body,
		[](ApiResponse *res, const QJsonDocument &) { res->setResult(true); });
}

ApiResponse *RegistrationApi::fetchTurnCredentials(const QString &email)
{
	return post(
		QStringLiteral("api/turn-credentials"), QString(),
		QJsonObject{{QStringLiteral("email"), email}},
		[](ApiResponse *res, const QJsonDocument &doc) {
			const QJsonValue servers =
				doc.object().value(QStringLiteral("iceServers"));
			if(!servers.isArray()) {
				res->setError(QStringLiteral("Reply has no ICE servers"));
				return;
			}
			res->setResult(servers.toArray());
		});
}

ApiResponse *RegistrationApi::fetchRelayCredentials(
	const QString &email, const QString &vaultId)
{
	const QJsonObject body{
		{QStringLiteral("email"), email},
		{QStringLiteral("vaultId"), vaultId},
	};

	return post(
		QStringLiteral("api/plugin-init"), QString(), body,
		[](ApiResponse *res, const QJsonDocument &doc) {
			const QJsonObject obj = doc.object();
			const QJsonObject relay =
				obj.value(QStringLiteral("supabase")).toObject();

			const RelayCredentials c{
				QUrl(relay.value(QStringLiteral("url")).toString()),
				relay.value(QStringLiteral("anonKey")).toString(),
				obj.value(QStringLiteral("iceServers")).toArray(),
			};
			if(!c.isValid()) {
				res->setError(QStringLiteral("Reply has no relay credentials"));
				return;
			}
			res->setResult(QVariant::fromValue(c));
		});
}

}
