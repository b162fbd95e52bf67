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

#ifndef HANCHUCLOUDCONNECTION_H
#define HANCHUCLOUDCONNECTION_H

#include <QObject>
#include <QUrl>
#include <QJsonObject>
#include <QNetworkAccessManager>

#include "hanchureply.h"

class HanchuCloudConnection : public QObject
{
    Q_OBJECT
public:
    enum Endpoint {
        EndpointLogin,
        EndpointParallelPowerChart,
        EndpointRackData,
        EndpointSetWorkMode
    };
    Q_ENUM(Endpoint)

    explicit HanchuCloudConnection(QNetworkAccessManager *networkManager, QObject *parent = nullptr);
    ~HanchuCloudConnection() = default;

    QUrl baseUrl() const;
    void setBaseUrl(const QUrl &baseUrl);

    // Milliseconds until a pending request gets aborted
    int requestTimeout() const;
    void setRequestTimeout(int requestTimeout);

    static QString endpointPath(Endpoint endpoint);

    // The result of the reply is the "data" member of the response envelope
    HanchuReply *post(Endpoint endpoint, const QJsonObject &payload, const QString &token = QString());

signals:
    // token is the one the rejected request has been sent with
    void authenticationRejected(const QString &token);

private:
    QNetworkAccessManager *m_networkManager = nullptr;
    QUrl m_baseUrl;
    int m_requestTimeout;

    void processResponse(Endpoint endpoint, const QString &token, QNetworkReply *networkReply, HanchuReply *reply, bool timedOut);
};

QDebug operator<<(QDebug debug, HanchuCloudConnection *connection);

#endif // HANCHUCLOUDCONNECTION_H
