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

#ifndef HANCHUREPLY_H
#define HANCHUREPLY_H

#include <QObject>
#include <QVariant>

#include "hanchu.h"

/**
 * @brief Asynchronous result of a request against the Hanchu cloud.
 *
 * A reply is handed out before the request has been processed. Once the request
 * is done the reply emits finished() exactly once, always from the event loop and
 * never from within the call that created it, so the caller can connect after
 * receiving the reply. The receiver of finished() is responsible for deleting the
 * reply, typically by connecting finished() to deleteLater().
 *
 * Depending on the request the result() contains the session token, the payload
 * of the response envelope, a normalized reading or the acknowledged work mode.
 */
class HanchuReply : public QObject
{
    Q_OBJECT
public:
    explicit HanchuReply(QObject *parent = nullptr);
    ~HanchuReply() = default;

    bool isFinished() const;

    Hanchu::Error error() const;
    QString errorString() const;

    QVariant result() const;
    void setResult(const QVariant &result);

    void finish(Hanchu::Error error = Hanchu::ErrorNoError, const QString &errorString = QString());

public slots:
    void abort();

signals:
    void aborted();
    void finished();

private:
    bool m_finished = false;
    Hanchu::Error m_error = Hanchu::ErrorNoError;
    QString m_errorString;
    QVariant m_result;
};

#endif // HANCHUREPLY_H
