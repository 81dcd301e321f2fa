// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_RELAY_REGISTRATIONAPI_H
#define NR_SHARED_RELAY_REGISTRATIONAPI_H
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkReply>
#include <QObject>
#include <QUrl>
#include <QVariant>
#include <functional>

namespace relay {

//! Parameters of a vault registration request
struct VaultRegistration {
	QString email;
	QString vaultId;
	QString signalId;
	QString vaultName;
	QString hostname;
	QString nodeId;
};

//! A successful registration: the relay's view of this host
struct RegistrationResult {
	QString signalId;
	QString vaultId;
	QString userId;
};

/**
 * @brief Credentials needed to talk to the signaling relay
 *
 * These are fetched from the registration service at startup and kept
 * for the lifetime of the host service. They are only re-fetched by an
 * explicit refresh.
 */
struct RelayCredentials {
	QUrl url;
	QString key;
	QJsonArray iceServers;

	bool isValid() const { return url.isValid() && !key.isEmpty(); }
};

}

Q_DECLARE_METATYPE(relay::RegistrationResult)
Q_DECLARE_METATYPE(relay::RelayCredentials)

namespace relay {

class ApiResponse final : public QObject {
	Q_OBJECT
public:
	explicit ApiResponse(const QUrl &url, QObject *parent = nullptr)
		: QObject(parent)
		, m_apiUrl(url)
		, m_networkError(QNetworkReply::NoError)
		, m_httpStatus(0)
		, m_finished(false)
	{
	}

	void setResult(const QVariant &result, const QString &message = QString());
	void setError(
		const QString &error, int httpStatus = 0,
		QNetworkReply::NetworkError networkError = QNetworkReply::NoError);

	QUrl apiUrl() const { return m_apiUrl; }
	QVariant result() const { return m_result; }
	QString message() const { return m_message; }
	QString errorMessage() const { return m_error; }
	QNetworkReply::NetworkError networkError() const { return m_networkError; }
	int httpStatus() const { return m_httpStatus; }
	bool isFinished() const { return m_finished; }

	//! Did the server explicitly refuse our credentials (HTTP 401 or 403)?
	bool isAuthRejection() const
	{
		return m_httpStatus == 401 || m_httpStatus == 403;
	}

signals:
	void finished(const QVariant &result, const QString &message, const QString &error);

private:
	QUrl m_apiUrl;
	QVariant m_result;
	QString m_message;
	QString m_error;
	QNetworkReply::NetworkError m_networkError;
	int m_httpStatus;
	bool m_finished;
};

/**
 * @brief Client for the vault registration service
 *
 * All calls are asynchronous and return a response object that emits
 * finished() exactly once. The caller owns the response object and should
 * delete it (with deleteLater) once it has finished.
 */
class RegistrationApi : public QObject {
	Q_OBJECT
public:
	static constexpr int DEFAULT_TIMEOUT = 15000;

	explicit RegistrationApi(const QUrl &baseUrl, QObject *parent = nullptr);

	QUrl baseUrl() const { return m_baseUrl; }

	//! Set the transfer timeout of each request in milliseconds
	void setRequestTimeout(int msecs) { m_timeout = msecs; }

	/**
	 * @brief Register this host and its vault
	 *
	 * Returns RegistrationResult
	 */
	virtual ApiResponse *registerVault(const VaultRegistration &reg);

	/**
	 * @brief Tell the service this host is still alive
	 *
	 * Returns nothing on success. A 401 or 403 status means the
	 * registration was revoked.
	 */
	virtual ApiResponse *
	heartbeat(const QString &email, const QString &vaultId, const QString &signalId);

	/**
	 * @brief Fetch TURN relay credentials for the direct channel
	 *
	 * Returns a QJsonArray of ICE servers
	 */
	virtual ApiResponse *fetchTurnCredentials(const QString &email);

	/**
	 * @brief Fetch the signaling relay's address and access key
	 *
	 * Returns RelayCredentials
	 */
	virtual ApiResponse *
	fetchRelayCredentials(const QString &email, const QString &vaultId);

protected:
	using SuccessHandler =
		std::function<void(ApiResponse *, const QJsonDocument &)>;

	ApiResponse *post(
		const QString &path, const QString &route, const QJsonObject &body,
		const SuccessHandler &onSuccess);

private:
	QUrl m_baseUrl;
	int m_timeout;
};

}

#endif
