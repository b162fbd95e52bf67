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

#include "hanchusystem.h"

#include <QDebug>

HanchuSystem::HanchuSystem(const HanchuCredentials &credentials, QNetworkAccessManager *networkManager, QObject *parent) :
    QObject(parent),
    m_credentials(credentials)
{
    m_connection = new HanchuCloudConnection(networkManager, this);
    m_session = new HanchuAuthSession(m_credentials, m_connection, this);
    m_commandDispatcher = new HanchuCommandDispatcher(m_session, m_credentials.inverterSerial(), this);

    m_inverterPoller = new HanchuInverterPoller(m_session, m_credentials.inverterSerial(), this);
    m_inverterCoordinator = new HanchuUpdateCoordinator(m_inverterPoller, Hanchu::InverterPollInterval, Hanchu::UnavailableThreshold, this);
    connect(m_inverterCoordinator, &HanchuUpdateCoordinator::readingChanged, this, [this](const QVariant &reading){
        emit inverterReadingChanged(reading.value<HanchuInverterReading>());
    });
    connect(m_inverterCoordinator, &HanchuUpdateCoordinator::availableChanged, this, &HanchuSystem::inverterAvailableChanged);

    // The device applies the mode with a delay, fetch it as soon as possible
    connect(m_commandDispatcher, &HanchuCommandDispatcher::workModeAccepted, m_inverterCoordinator, &HanchuUpdateCoordinator::refresh);

    if (m_credentials.hasBattery()) {
        m_batteryPoller = new HanchuBatteryPoller(m_session, m_credentials.batterySerial(), this);
        m_batteryCoordinator = new HanchuUpdateCoordinator(m_batteryPoller, Hanchu::BatteryPollInterval, Hanchu::UnavailableThreshold, this);
        connect(m_batteryCoordinator, &HanchuUpdateCoordinator::readingChanged, this, [this](const QVariant &reading){
            emit batteryReadingChanged(reading.value<HanchuBatteryReading>());
        });
        connect(m_batteryCoordinator, &HanchuUpdateCoordinator::availableChanged, this, &HanchuSystem::batteryAvailableChanged);
    }
}

HanchuSystem::~HanchuSystem()
{
    stop();
}

HanchuCredentials HanchuSystem::credentials() const
{
    return m_credentials;
}

bool HanchuSystem::hasBattery() const
{
    return m_credentials.hasBattery();
}

HanchuCloudConnection *HanchuSystem::connection() const
{
    return m_connection;
}

HanchuAuthSession *HanchuSystem::session() const
{
    return m_session;
}

HanchuCommandDispatcher *HanchuSystem::commandDispatcher() const
{
    return m_commandDispatcher;
}

HanchuUpdateCoordinator *HanchuSystem::inverterCoordinator() const
{
    return m_inverterCoordinator;
}

HanchuUpdateCoordinator *HanchuSystem::batteryCoordinator() const
{
    return m_batteryCoordinator;
}

bool HanchuSystem::inverterAvailable() const
{
    return m_inverterCoordinator->available();
}

bool HanchuSystem::batteryAvailable() const
{
    if (!m_batteryCoordinator)
        return false;

    return m_batteryCoordinator->available();
}

HanchuInverterReading HanchuSystem::inverterReading() const
{
    return m_inverterCoordinator->reading<HanchuInverterReading>();
}

HanchuBatteryReading HanchuSystem::batteryReading() const
{
    if (!m_batteryCoordinator)
        return HanchuBatteryReading();

    return m_batteryCoordinator->reading<HanchuBatteryReading>();
}

HanchuReply *HanchuSystem::testConnection()
{
    if (m_testReply)
        m_testReply->abort();

    m_testReply = m_inverterPoller->poll();
    return m_testReply;
}

HanchuReply *HanchuSystem::setWorkMode(Hanchu::WorkMode workMode)
{
    return m_commandDispatcher->setWorkMode(workMode);
}

void HanchuSystem::start()
{
    m_inverterCoordinator->start();
    if (m_batteryCoordinator)
        m_batteryCoordinator->start();
}

void HanchuSystem::stop()
{
    m_inverterCoordinator->stop();
    if (m_batteryCoordinator)
        m_batteryCoordinator->stop();

    if (m_testReply) {
        m_testReply->abort();
        m_testReply = nullptr;
    }

    m_commandDispatcher->abortAll();
    m_session->abort();
}

QDebug operator<<(QDebug debug, HanchuSystem *system)
{
    debug.nospace() << "HanchuSystem(" << system->credentials().inverterSerial();
    if (system->hasBattery())
        debug.nospace() << ", battery: " << system->credentials().batterySerial();

    debug.nospace() << ")";
    return debug.space();
}
