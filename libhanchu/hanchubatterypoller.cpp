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

#include "hanchubatterypoller.h"
#include "hanchupayloadnormalizer.h"

HanchuBatteryPoller::HanchuBatteryPoller(HanchuAuthSession *session, const QString &serialNumber, QObject *parent) :
    QObject(parent),
    m_session(session),
    m_serialNumber(serialNumber)
{

}

QString HanchuBatteryPoller::serialNumber() const
{
    return m_serialNumber;
}

QString HanchuBatteryPoller::name() const
{
    return QString("battery %1").arg(m_serialNumber);
}

HanchuReply *HanchuBatteryPoller::poll()
{
    HanchuReply *reply = new HanchuReply(this);

    QJsonObject payload;
    payload.insert("sn", m_serialNumber);

    qCDebug(dcHanchuPoller()) << "Polling" << name();
    HanchuReply *requestReply = m_session->sendRequest(HanchuCloudConnection::EndpointRackData, payload);
    connect(requestReply, &HanchuReply::finished, requestReply, &HanchuReply::deleteLater);
    connect(reply, &HanchuReply::aborted, requestReply, &HanchuReply::abort);
    connect(requestReply, &HanchuReply::finished, reply, [this, requestReply, reply](){
        Hanchu::Error error = requestReply->error();
        if (error != Hanchu::ErrorNoError) {
            if (error == Hanchu::ErrorRejectedByDevice)
                error = Hanchu::ErrorNetwork;

            if (error != Hanchu::ErrorAborted)
                qCWarning(dcHanchuPoller()) << "Polling" << name() << "failed:" << requestReply->errorString();

            reply->finish(error, requestReply->errorString());
            return;
        }

        HanchuBatteryReading reading;
        QString errorString;
        QJsonObject data = QJsonObject::fromVariantMap(requestReply->result().toMap());
        Hanchu::Error normalizeError = HanchuPayloadNormalizer::normalizeBattery(data, m_serialNumber, &reading, &errorString);
        if (normalizeError != Hanchu::ErrorNoError) {
            qCWarning(dcHanchuPoller()) << "Received invalid data for" << name() << errorString;
            reply->finish(normalizeError, errorString);
            return;
        }

        qCDebug(dcHanchuPoller()) << reading;
        reply->setResult(QVariant::fromValue(reading));
        reply->finish();
    });

    return reply;
}
