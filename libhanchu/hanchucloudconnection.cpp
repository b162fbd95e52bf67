/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 *
 * Copyright 2024, Consolinno Energy GmbH
 * Contact: info@consolinno.de
 *
 * GNU Lesser General Public License Usage
 * Alternatively, this project may be redistributed and/or modified under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation; version 3. This project is distributed in the hope that
 * it will be useful, but WITHOUT ANY WARRANTY; without even the implied
 * warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this project. If not, see <https://www.gnu.org/licenses/>.
 *
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#include "hanchucloudconnection.h"
#include "hanchurequestcipher.h"
#include "loggingcategories.h"

#include <QTimer>
#include <QPointer>
#include <QJsonDocument>
#include <QNetworkReply>
#include <QNetworkRequest>

NYMEA_LOGGING_CATEGORY(dcHanchuCloud, "HanchuCloud")

HanchuCloudConnection::HanchuCloudConnection(QNetworkAccessManager *networkManager, QObject *parent) :
    QObject(parent),
    m_networkManager(networkManager),
    m_baseUrl(QUrl("https://iess3.hanchuess.com")),
    m_requestTimeout(Hanchu::RequestTimeout)
{

}

QUrl HanchuCloudConnection::baseUrl() const
{
    return m_baseUrl;
}

void HanchuCloudConnection::setBaseUrl(const QUrl &baseUrl)
{
    m_baseUrl = baseUrl;
}

int HanchuCloudConnection::requestTimeout() const
{
    return m_requestTimeout;
}

void HanchuCloudConnection::setRequestTimeout(int requestTimeout)
{
    m_requestTimeout = requestTimeout;
}

QString HanchuCloudConnection::endpointPath(Endpoint endpoint)
{
    switch (endpoint) {
    case EndpointLogin:
        return "/gateway/identify/auth/login/account";
    case EndpointParallelPowerChart:
        return "/gateway/platform/pcs/parallelPowerChart";
    case EndpointRackData:
        return "/gateway/platform/rack/queryRackDataDivisions";
    case EndpointSetWorkMode:
        return "/gateway/platform/pcs/setWorkMode";
    }
    return QString();
}

HanchuReply *HanchuCloudConnection::post(Endpoint endpoint, const QJsonObject &payload, const QString &token)
{
    HanchuReply *reply = new HanchuReply(this);

    QByteArray body = HanchuRequestCipher::encryptPayload(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    if (body.isEmpty()) {
        reply->finish(Hanchu::ErrorNetwork, "Could not encrypt the request payload.");
        return reply;
    }

    QUrl url = m_baseUrl;
    url.setPath(endpointPath(endpoint));

    // Same headers the web application sends
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "text/plain");
    request.setRawHeader("accept", "application/json, text/plain, */*");
    request.setRawHeader("appplat", "iess");
    request.setRawHeader("origin", m_baseUrl.toString(QUrl::RemovePath | QUrl::StripTrailingSlash).toUtf8());
    request.setRawHeader("referer", m_baseUrl.toString(QUrl::RemovePath | QUrl::StripTrailingSlash).toUtf8() + "/");
    request.setRawHeader("access-token", token.toUtf8());

    qCDebug(dcHanchuCloud()) << "--> POST" << endpoint << url.toString();
    QNetworkReply *networkReply = m_networkManager->post(request, body);

    // Make sure the network reply gets cleaned up, no matter who finishes first
    connect(networkReply, &QNetworkReply::finished, networkReply, &QNetworkReply::deleteLater);
    connect(reply, &HanchuReply::aborted, networkReply, &QNetworkReply::abort);

    // Aborting emits finished synchronously, the dying reply must not see it
    connect(reply, &QObject::destroyed, networkReply, [networkReply, reply](){
        QObject::disconnect(networkReply, nullptr, reply, nullptr);
        networkReply->abort();
    });

    QPointer<QTimer> timeoutTimer = new QTimer(reply);
    timeoutTimer->setSingleShot(true);
    timeoutTimer->setInterval(m_requestTimeout);
    connect(timeoutTimer, &QTimer::timeout, networkReply, [endpoint, networkReply](){
        qCWarning(dcHanchuCloud()) << "Request" << endpoint << "timed out. Aborting the request.";
        networkReply->setProperty("timedOut", true);
        networkReply->abort();
    });
    timeoutTimer->start();

    connect(networkReply, &QNetworkReply::finished, reply, [this, endpoint, token, networkReply, reply, timeoutTimer](){
        if (timeoutTimer)
            timeoutTimer->stop();

        processResponse(endpoint, token, networkReply, reply, networkReply->property("timedOut").toBool());
    });

    return reply;
}

void HanchuCloudConnection::processResponse(Endpoint endpoint, const QString &token, QNetworkReply *networkReply, HanchuReply *reply, bool timedOut)
{
    // Aborted by the owner, nothing to report any more
    if (reply->isFinished())
        return;

    int status = networkReply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 401 || status == 403
            || networkReply->error() == QNetworkReply::AuthenticationRequiredError
            || networkReply->error() == QNetworkReply::ContentAccessDenied) {
        qCWarning(dcHanchuCloud()) << "<-- Request" << endpoint << "has been rejected as unauthenticated. HTTP status:" << status;
        emit authenticationRejected(token);
        reply->finish(Hanchu::ErrorAuthentication, QString("The cloud rejected the session (HTTP %1).").arg(status));
        return;
    }

    if (timedOut) {
        reply->finish(Hanchu::ErrorNetwork, QString("The request timed out after %1 ms.").arg(m_requestTimeout));
        return;
    }

    if (networkReply->error() != QNetworkReply::NoError) {
        qCWarning(dcHanchuCloud()) << "<-- Request" << endpoint << "finished with error:" << status << networkReply->errorString();
        reply->finish(Hanchu::ErrorNetwork, networkReply->errorString());
        return;
    }

    if (status != 0 && (status < 200 || status >= 300)) {
        qCWarning(dcHanchuCloud()) << "<-- Request" << endpoint << "finished with HTTP status" << status;
        reply->finish(Hanchu::ErrorNetwork, QString("Unexpected HTTP status %1.").arg(status));
        return;
    }

    QByteArray data = networkReply->readAll();
    QJsonParseError error;
    QJsonDocument jsonDoc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !jsonDoc.isObject()) {
        qCWarning(dcHanchuCloud()) << "<-- Response of" << endpoint << "is not a JSON object:" << error.errorString() << data;
        reply->finish(Hanchu::ErrorNetwork, QString("Invalid JSON response: %1").arg(error.errorString()));
        return;
    }

    qCDebug(dcHanchuCloud()) << "<-- Response from" << endpoint << qUtf8Printable(data);

    QJsonObject envelope = jsonDoc.object();
    if (!envelope.value("code").isDouble()) {
        qCWarning(dcHanchuCloud()) << "<-- Response of" << endpoint << "carries no result code:" << qUtf8Printable(data);
        reply->finish(Hanchu::ErrorMalformedPayload, "The response carries no result code.");
        return;
    }

    int code = envelope.value("code").toInt();
    QString message = envelope.value("msg").toString();
    if (code == 401 || code == 403) {
        qCWarning(dcHanchuCloud()) << "<-- Request" << endpoint << "has been rejected as unauthenticated:" << code << message;
        emit authenticationRejected(token);
        reply->finish(Hanchu::ErrorAuthentication, message.isEmpty() ? QString("The cloud rejected the session (code %1).").arg(code) : message);
        return;
    }

    if (!envelope.value("success").toBool() || code != 200) {
        qCWarning(dcHanchuCloud()) << "<-- Request" << endpoint << "has not been successful:" << code << message;
        reply->finish(Hanchu::ErrorRejectedByDevice, message.isEmpty() ? QString("The cloud refused the request (code %1).").arg(code) : message);
        return;
    }

    reply->setResult(envelope.value("data").toVariant());
    reply->finish();
}

QDebug operator<<(QDebug debug, HanchuCloudConnection *connection)
{
    debug.nospace().noquote() << "HanchuCloudConnection(" << connection->baseUrl().toString() << ")";
    return debug.quote().space();
}
