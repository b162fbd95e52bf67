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

#ifndef HANCHUSYSTEM_H
#define HANCHUSYSTEM_H

#include <QObject>
#include <QPointer>
#include <QNetworkAccessManager>

#include "hanchu.h"
#include "hanchucredentials.h"
#include "hanchucloudconnection.h"
#include "hanchuauthsession.h"
#include "hanchuinverterpoller.h"
#include "hanchubatterypoller.h"
#include "hanchuupdatecoordinator.h"
#include "hanchucommanddispatcher.h"

/**
 * @brief One Hanchu installation, an inverter with an optional battery rack.
 *
 * The system owns the cloud session shared by both pollers and the command
 * dispatcher. The battery poller and its coordinator only exist if the
 * credentials contain a battery serial number, batteryCoordinator() is a null
 * pointer otherwise.
 */
class HanchuSystem : public QObject
{
    Q_OBJECT
public:
    explicit HanchuSystem(const HanchuCredentials &credentials, QNetworkAccessManager *networkManager, QObject *parent = nullptr);
    ~HanchuSystem();

    HanchuCredentials credentials() const;
    bool hasBattery() const;

    HanchuCloudConnection *connection() const;
    HanchuAuthSession *session() const;
    HanchuCommandDispatcher *commandDispatcher() const;
    HanchuUpdateCoordinator *inverterCoordinator() const;
    HanchuUpdateCoordinator *batteryCoordinator() const;

    bool inverterAvailable() const;
    bool batteryAvailable() const;

    // Last good readings, also while the device is not available
    HanchuInverterReading inverterReading() const;
    HanchuBatteryReading batteryReading() const;

    // Polls the inverter once without touching the coordinators. The reply gets
    // aborted by stop() and when the system is deleted.
    HanchuReply *testConnection();

    HanchuReply *setWorkMode(Hanchu::WorkMode workMode);

public slots:
    void start();
    // Stops polling and aborts every pending request
    void stop();

signals:
    void inverterReadingChanged(const HanchuInverterReading &reading);
    void batteryReadingChanged(const HanchuBatteryReading &reading);
    void inverterAvailableChanged(bool available);
    void batteryAvailableChanged(bool available);

private:
    HanchuCredentials m_credentials;

    HanchuCloudConnection *m_connection = nullptr;
    HanchuAuthSession *m_session = nullptr;
    HanchuCommandDispatcher *m_commandDispatcher = nullptr;

    HanchuInverterPoller *m_inverterPoller = nullptr;
    HanchuUpdateCoordinator *m_inverterCoordinator = nullptr;

    HanchuBatteryPoller *m_batteryPoller = nullptr;
    HanchuUpdateCoordinator *m_batteryCoordinator = nullptr;

    QPointer<HanchuReply> m_testReply;
};

QDebug operator<<(QDebug debug, HanchuSystem *system);

#endif // HANCHUSYSTEM_H
