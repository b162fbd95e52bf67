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

#include "hanchucommanddispatcher.h"
#include "loggingcategories.h"

NYMEA_LOGGING_CATEGORY(dcHanchuCommand, "HanchuCommand")

HanchuCommandDispatcher::HanchuCommandDispatcher(HanchuAuthSession *session, const QString &serialNumber, QObject *parent) :
    QObject(parent),
    m_session(session),
    m_serialNumber(serialNumber)
{

}

HanchuCommandDispatcher::~HanchuCommandDispatcher()
{
    abortAll();
}

QString HanchuCommandDispatcher::serialNumber() const
{
    return m_serialNumber;
}

int HanchuCommandDispatcher::queueLength() const
{
    return m_queue.count();
}

bool HanchuCommandDispatcher::busy() const
{
    return !m_currentRequest.isNull();
}

HanchuReply *HanchuCommandDispatcher::setWorkMode(Hanchu::WorkMode workMode)
{
    HanchuReply *reply = new HanchuReply(this);
    if (!Hanchu::isValidWorkMode(workMode)) {
        qCWarning(dcHanchuCommand()) << "Refusing to set invalid work mode" << workMode;
        reply->finish(Hanchu::ErrorRejectedByDevice, QString("Invalid work mode %1.").arg(static_cast<int>(workMode)));
        return reply;
    }

    Command command;
    command.workMode = workMode;
    command.reply = reply;
    m_queue.enqueue(command);

    qCDebug(dcHanchuCommand()) << "Queued work mode" << Hanchu::workModeToString(workMode) << "for" << m_serialNumber << "Queue length:" << m_queue.count();
    if (!busy())
        sendNextCommand();

    return reply;
}

void HanchuCommandDispatcher::abortAll()
{
    QQueue<Command> queue = m_queue;
    m_queue.clear();

    if (m_currentRequest) {
        HanchuReply *request = m_currentRequest;
        m_currentRequest = nullptr;
        disconnect(request, nullptr, this, nullptr);
        request->abort();
    }

    if (m_currentReply) {
        m_currentReply->abort();
        m_currentReply = nullptr;
    }

    while (!queue.isEmpty()) {
        Command command = queue.dequeue();
        if (command.reply)
            command.reply->abort();
    }
}

void HanchuCommandDispatcher::sendNextCommand()
{
    while (!m_queue.isEmpty()) {
        Command command = m_queue.dequeue();
        // The caller deleted the reply meanwhile
        if (command.reply.isNull())
            continue;

        QPointer<HanchuReply> reply = command.reply;
        Hanchu::WorkMode workMode = command.workMode;

        QJsonObject payload;
        payload.insert("sn", m_serialNumber);
        payload.insert("workMode", static_cast<int>(workMode));

        qCDebug(dcHanchuCommand()) << "Setting work mode of" << m_serialNumber << "to" << Hanchu::workModeToString(workMode);
        HanchuReply *request = m_session->sendRequest(HanchuCloudConnection::EndpointSetWorkMode, payload);
        m_currentReply = reply;
        m_currentRequest = request;

        connect(request, &HanchuReply::finished, request, &HanchuReply::deleteLater);
        connect(request, &HanchuReply::finished, this, [this, request, reply, workMode](){
            if (m_currentRequest != request)
                return;

            m_currentRequest = nullptr;
            m_currentReply = nullptr;

            if (request->error() != Hanchu::ErrorNoError) {
                qCWarning(dcHanchuCommand()) << "Setting work mode" << Hanchu::workModeToString(workMode) << "failed:" << request->errorString();
                if (reply)
                    reply->finish(request->error(), request->errorString());
            } else {
                qCDebug(dcHanchuCommand()) << "Work mode" << Hanchu::workModeToString(workMode) << "has been accepted by the cloud";
                if (reply) {
                    reply->setResult(static_cast<int>(workMode));
                    reply->finish();
                }
                emit workModeAccepted(workMode);
            }

            sendNextCommand();
        });
        return;
    }
}
