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

#include "hanchuauthsession.h"
#include "hanchurequestcipher.h"
#include "loggingcategories.h"

#include <QJsonDocument>

NYMEA_LOGGING_CATEGORY(dcHanchuSession, "HanchuSession")

HanchuAuthSession::HanchuAuthSession(const HanchuCredentials &credentials, HanchuCloudConnection *connection, QObject *parent) :
    QObject(parent),
    m_credentials(credentials),
    m_connection(connection)
{
    connect(m_connection, &HanchuCloudConnection::authenticationRejected, this, &HanchuAuthSession::onAuthenticationRejected);
}

HanchuAuthSession::~HanchuAuthSession()
{
    abort();
}

bool HanchuAuthSession::isValid() const
{
    if (m_token.isEmpty())
        return false;

    // Tokens without a readable expiry are used until the cloud rejects them
    if (!m_expiresAt.isValid())
        return true;

    return QDateTime::currentDateTimeUtc() < m_expiresAt.addSecs(-Hanchu::TokenRefreshMargin);
}

bool HanchuAuthSession::loginPending() const
{
    return !m_loginReply.isNull();
}

QDateTime HanchuAuthSession::obtainedAt() const
{
    return m_obtainedAt;
}

QDateTime HanchuAuthSession::expiresAt() const
{
    return m_expiresAt;
}

HanchuReply *HanchuAuthSession::ensureValid()
{
    HanchuReply *reply = new HanchuReply(this);
    if (isValid()) {
        reply->setResult(m_token);
        reply->finish();
        return reply;
    }

    m_pendingReplies.append(reply);
    if (!loginPending())
        login();

    return reply;
}

HanchuReply *HanchuAuthSession::sendRequest(HanchuCloudConnection::Endpoint endpoint, const QJsonObject &payload)
{
    HanchuReply *reply = new HanchuReply(this);

    HanchuReply *sessionReply = ensureValid();
    connect(sessionReply, &HanchuReply::finished, sessionReply, &HanchuReply::deleteLater);
    connect(reply, &HanchuReply::aborted, sessionReply, &HanchuReply::abort);
    connect(sessionReply, &HanchuReply::finished, reply, [this, endpoint, payload, sessionReply, reply](){
        if (sessionReply->error() != Hanchu::ErrorNoError) {
            reply->finish(sessionReply->error(), sessionReply->errorString());
            return;
        }

        HanchuReply *requestReply = m_connection->post(endpoint, payload, sessionReply->result().toString());
        connect(requestReply, &HanchuReply::finished, requestReply, &HanchuReply::deleteLater);
        connect(reply, &HanchuReply::aborted, requestReply, &HanchuReply::abort);
        connect(requestReply, &HanchuReply::finished, reply, [requestReply, reply](){
            reply->setResult(requestReply->result());
            reply->finish(requestReply->error(), requestReply->errorString());
        });
    });

    return reply;
}

QDateTime HanchuAuthSession::tokenExpiry(const QString &token)
{
    // JWT: header.payload.signature, the payload is base64url without padding
    QStringList parts = token.split('.');
    if (parts.count() != 3)
        return QDateTime();

    QByteArray payload = QByteArray::fromBase64(parts.at(1).toUtf8(), QByteArray::Base64UrlEncoding);
    QJsonDocument jsonDoc = QJsonDocument::fromJson(payload);
    if (!jsonDoc.isObject())
        return QDateTime();

    // Seconds since epoch, at most 9999-12-31T23:59:59Z
    QJsonValue expiry = jsonDoc.object().value("exp");
    if (!expiry.isDouble() || !(expiry.toDouble() > 0 && expiry.toDouble() <= 253402300799.0))
        return QDateTime();

    return QDateTime::fromSecsSinceEpoch(static_cast<qint64>(expiry.toDouble()), Qt::UTC);
}

void HanchuAuthSession::invalidate()
{
    if (m_token.isEmpty())
        return;

    qCDebug(dcHanchuSession()) << "Session invalidated. Logging in again with the next request.";
    m_token.clear();
    m_obtainedAt = QDateTime();
    m_expiresAt = QDateTime();
}

void HanchuAuthSession::onAuthenticationRejected(const QString &token)
{
    // A late rejection of a replaced token must not throw away the current one
    if (token != m_token) {
        qCDebug(dcHanchuSession()) << "Ignoring rejection of an outdated token";
        return;
    }

    invalidate();
}

void HanchuAuthSession::abort()
{
    if (m_loginReply) {
        qCDebug(dcHanchuSession()) << "Aborting pending login";
        m_loginReply->abort();
        m_loginReply = nullptr;
    }

    finishPendingReplies(Hanchu::ErrorAborted, "The login has been aborted.");
}

void HanchuAuthSession::login()
{
    QByteArray password = HanchuRequestCipher::encryptPassword(m_credentials.password());
    if (password.isEmpty()) {
        finishPendingReplies(Hanchu::ErrorAuthentication, "Could not encrypt the password.");
        emit loginFinished(false);
        return;
    }

    QJsonObject payload;
    payload.insert("account", m_credentials.username());
    payload.insert("pwd", QString::fromUtf8(password));

    qCDebug(dcHanchuSession()) << "Logging in as" << m_credentials.username();
    HanchuReply *reply = m_connection->post(HanchuCloudConnection::EndpointLogin, payload);
    m_loginReply = reply;
    connect(reply, &HanchuReply::finished, reply, &HanchuReply::deleteLater);
    connect(reply, &HanchuReply::finished, this, [this, reply](){
        if (reply->error() == Hanchu::ErrorAborted)
            return;

        m_loginReply = nullptr;

        QString token = reply->result().toString();
        if (reply->error() != Hanchu::ErrorNoError || token.isEmpty()) {
            QString errorString = reply->error() != Hanchu::ErrorNoError ? reply->errorString() : "The login response contained no token.";
            qCWarning(dcHanchuSession()) << "Login failed:" << errorString;
            finishPendingReplies(Hanchu::ErrorAuthentication, QString("Login failed: %1").arg(errorString));
            emit loginFinished(false);
            return;
        }

        m_token = token;
        m_obtainedAt = QDateTime::currentDateTimeUtc();
        m_expiresAt = tokenExpiry(token);
        qCDebug(dcHanchuSession()) << "Authenticated successfully. Token expires" << m_expiresAt;
        finishPendingReplies(Hanchu::ErrorNoError, QString());
        emit loginFinished(true);
    });
}

void HanchuAuthSession::finishPendingReplies(Hanchu::Error error, const QString &errorString)
{
    QList<QPointer<HanchuReply>> replies = m_pendingReplies;
    m_pendingReplies.clear();
    foreach (const QPointer<HanchuReply> &reply, replies) {
        if (reply.isNull())
            continue;

        if (error == Hanchu::ErrorNoError)
            reply->setResult(m_token);

        reply->finish(error, errorString);
    }
}
