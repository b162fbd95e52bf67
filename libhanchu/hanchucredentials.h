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

#ifndef HANCHUCREDENTIALS_H
#define HANCHUCREDENTIALS_H

#include <QString>
#include <QDebug>

class HanchuCredentials
{
public:
    HanchuCredentials(const QString &username, const QString &password, const QString &inverterSerial, const QString &batterySerial = QString());

    QString username() const;
    QString password() const;
    QString inverterSerial() const;

    // Empty if no battery rack is configured
    QString batterySerial() const;
    bool hasBattery() const;

    bool isValid() const;

private:
    QString m_username;
    QString m_password;
    QString m_inverterSerial;
    QString m_batterySerial;
};

QDebug operator<<(QDebug debug, const HanchuCredentials &credentials);

#endif // HANCHUCREDENTIALS_H
