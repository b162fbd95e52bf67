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

#ifndef HANCHUCOMMANDDISPATCHER_H
#define HANCHUCOMMANDDISPATCHER_H

#include <QObject>
#include <QQueue>
#include <QPointer>

#include "hanchu.h"
#include "hanchuauthsession.h"

/**
 * @brief Sends work mode changes to the inverter.
 *
 * Commands are executed strictly one after another in the order they have been
 * requested. A finished reply only means the cloud accepted the command, the
 * device applies it later and the change shows up with one of the next polls.
 * Failed commands are reported as they are and never retried.
 */
class HanchuCommandDispatcher : public QObject
{
    Q_OBJECT
public:
    explicit HanchuCommandDispatcher(HanchuAuthSession *session, const QString &serialNumber, QObject *parent = nullptr);
    ~HanchuCommandDispatcher();

    QString serialNumber() const;

    int queueLength() const;
    bool busy() const;

    // The result of the reply is the accepted Hanchu::WorkMode as int
    HanchuReply *setWorkMode(Hanchu::WorkMode workMode);

public slots:
    void abortAll();

signals:
    void workModeAccepted(Hanchu::WorkMode workMode);

private:
    struct Command {
        Hanchu::WorkMode workMode;
        QPointer<HanchuReply> reply;
    };

    HanchuAuthSession *m_session = nullptr;
    QString m_serialNumber;

    QQueue<Command> m_queue;
    QPointer<HanchuReply> m_currentReply;
    QPointer<HanchuReply> m_currentRequest;

    void sendNextCommand();
};

#endif // HANCHUCOMMANDDISPATCHER_H
