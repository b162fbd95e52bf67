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

#ifndef FAKECLOUD_H
#define FAKECLOUD_H

#include <QHash>
#include <QList>
#include <QQueue>
#include <QPointer>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkAccessManager>

// In-process stand-in for the Hanchu cloud, scripted per request path
class FakeNetworkReply : public QNetworkReply
{
    Q_OBJECT
public:
    explicit FakeNetworkReply(const QNetworkRequest &request, QObject *parent = nullptr);

    void respond(int status, const QByteArray &body);
    void fail(QNetworkReply::NetworkError error, const QString &errorString);

    void abort() override;
    qint64 bytesAvailable() const override;
    bool isSequential() const override;

signals:
    void abortRequested();

protected:
    qint64 readData(char *data, qint64 maxSize) override;

private:
    QByteArray m_body;
    qint64 m_offset = 0;
};

class FakeCloud : public QNetworkAccessManager
{
    Q_OBJECT
public:
    struct Response {
        int status = 200;
        QByteArray body;
        QNetworkReply::NetworkError error = QNetworkReply::NoError;
        // Keep the reply pending until it gets released or aborted
        bool hold = false;
    };

    struct Request {
        QString path;
        QByteArray token;
        QNetworkRequest request;
        QJsonObject payload;
    };

    explicit FakeCloud(QObject *parent = nullptr);

    // Used for every request to the path unless a queued response is pending
    void setResponse(const QString &path, const Response &response);
    void setResponse(const QString &path, const QByteArray &body, int status = 200);

    // Used once, before the default response
    void enqueueResponse(const QString &path, const Response &response);

    QList<Request> requests() const;
    QList<Request> requests(const QString &path) const;
    int requestCount(const QString &path) const;

    QList<QPointer<FakeNetworkReply>> heldReplies() const;
    int abortedCount() const;
    FakeNetworkReply *takeHeldReply();

    static QByteArray envelope(const QJsonValue &data, bool success = true, int code = 200, const QString &message = QString());
    static Response holdResponse();
    static QString makeToken(qint64 expiry);

    static QString loginPath();
    static QString inverterPath();
    static QString batteryPath();
    static QString workModePath();

signals:
    void requestReceived(const QString &path, const QJsonObject &payload);

protected:
    QNetworkReply *createRequest(Operation operation, const QNetworkRequest &request, QIODevice *outgoingData = nullptr) override;

private:
    QHash<QString, Response> m_responses;
    QHash<QString, QQueue<Response>> m_queuedResponses;
    QList<Request> m_requests;
    QList<QPointer<FakeNetworkReply>> m_heldReplies;
    int m_abortedCount = 0;
};

// Typical payloads as delivered by the cloud
QJsonObject inverterPayload(const QString &serialNumber, int workMode = 1);
QJsonObject batteryPayload(const QString &serialNumber);

#endif // FAKECLOUD_H
