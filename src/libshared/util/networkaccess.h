// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_UTIL_NETWORKACCESS_H
#define NR_SHARED_UTIL_NETWORKACCESS_H
#include <QNetworkRequest>

class QJsonObject;
class QNetworkAccessManager;
class QNetworkReply;

namespace networkaccess {

/**
 * @brief Get a shared instance of a QNetworkAccessManager
 *
 * The returned instance will be unique to the current thread
 */
QNetworkAccessManager *getInstance();

/**
 * @brief Make a request for a JSON endpoint
 *
 * Sets the host's user agent, JSON content negotiation headers, a small
 * redirect limit and the given transfer timeout (milliseconds).
 */
QNetworkRequest jsonRequest(const QUrl &url, int timeout);

/**
 * @brief POST a JSON object
 *
 * The reply deletes itself after its finished signal has been delivered.
 */
QNetworkReply *postJson(const QNetworkRequest &req, const QJsonObject &body);

int httpStatus(const QNetworkReply *reply);

}

#endif
