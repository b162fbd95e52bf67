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

#include "hanchucredentials.h"

HanchuCredentials::HanchuCredentials(const QString &username, const QString &password, const QString &inverterSerial, const QString &batterySerial) :
    m_username(username.trimmed()),
    m_password(password),
    m_inverterSerial(inverterSerial.trimmed()),
    m_batterySerial(batterySerial.trimmed())
{

}

QString HanchuCredentials::username() const
{
    return m_username;
}

QString HanchuCredentials::password() const
{
    return m_password;
}

QString HanchuCredentials::inverterSerial() const
{
    return m_inverterSerial;
}

QString HanchuCredentials::batterySerial() const
{
    return m_batterySerial;
}

bool HanchuCredentials::hasBattery() const
{
    return !m_batterySerial.isEmpty();
}

bool HanchuCredentials::isValid() const
{
    return !m_username.isEmpty() && !m_password.isEmpty() && !m_inverterSerial.isEmpty();
}

QDebug operator<<(QDebug debug, const HanchuCredentials &credentials)
{
    // Never print the password
    debug.nospace().noquote() << "HanchuCredentials(" << credentials.username() << ", inverter: " << credentials.inverterSerial();
    if (credentials.hasBattery())
        debug.nospace().noquote() << ", battery: " << credentials.batterySerial();

    debug.nospace().noquote() << ")";
    return debug.quote().space();
}
