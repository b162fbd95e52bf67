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

#ifndef HANCHUAUTHSESSION_H
#define HANCHUAUTHSESSION_H

#include <QObject>
#include <QPointer>
#include <QDateTime>

#include "hanchucredentials.h"
#include "hanchucloudconnection.h"

/**
 * @brief Session token handling for the Hanchu cloud.
 *
 * The session logs in lazily on the first request and again whenever the token
 * is about to expire or the cloud rejected it. Callers waiting for a token while
 * a login is running get attached to that login, so there is never more than one
 * login request pending. A failed login is reported to all waiting callers as
 * Hanchu::ErrorAuthentication and is not retried here.
 */
class HanchuAuthSession : public QObject
{
    Q_OBJECT
public:
    explicit HanchuAuthSession(const HanchuCredentials &credentials, HanchuCloudConnection *connection, QObject *parent = nullptr);
    ~HanchuAuthSession();

    bool isValid() const;
    bool loginPending() const;

    QDateTime obtainedAt() const;
    // Invalid if the token carries no readable expiry
    QDateTime expiresAt() const;

    // The result of the reply is the token
    HanchuReply *ensureValid();

    // Sends the payload with the current token attached, logging in first if required
    HanchuReply *sendRequest(HanchuCloudConnection::Endpoint endpoint, const QJsonObject &payload);

    static QDateTime tokenExpiry(const QString &token);

public slots:
    void invalidate();
    void abort();

signals:
    void loginFinished(bool success);

private:
    HanchuCredentials m_credentials;
    HanchuCloudConnection *m_connection = nullptr;

    QString m_token;
    QDateTime m_obtainedAt;
    QDateTime m_expiresAt;

    QPointer<HanchuReply> m_loginReply;
    QList<QPointer<HanchuReply>> m_pendingReplies;

    void onAuthenticationRejected(const QString &token);
    void login();
    void finishPendingReplies(Hanchu::Error error, const QString &errorString);
};

#endif // HANCHUAUTHSESSION_H
