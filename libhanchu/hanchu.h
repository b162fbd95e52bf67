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

#ifndef HANCHU_H
#define HANCHU_H

#include <QObject>
#include <QString>
#include <QtGlobal>
#include <QtNumeric>

class Hanchu
{
    Q_GADGET
public:
    // Wire values of the "workMode" field
    enum WorkMode {
        WorkModeUnknown = 0,
        WorkModeSelfConsumption = 1,
        WorkModeUserDefined = 2,
        WorkModeOffGrid = 3,
        WorkModeBackupPower = 4
    };
    Q_ENUM(WorkMode)

    enum Error {
        ErrorNoError,
        ErrorAuthentication,
        ErrorNetwork,
        ErrorMalformedPayload,
        ErrorRejectedByDevice,
        ErrorAborted
    };
    Q_ENUM(Error)

    static const int InverterPollInterval = 30000;
    static const int BatteryPollInterval = 60000;
    static const int UnavailableThreshold = 3;
    static const int RequestTimeout = 30000;
    static const int TokenRefreshMargin = 86400;

    static QString workModeToString(WorkMode workMode);
    static WorkMode workModeFromString(const QString &workMode);
    static WorkMode workModeFromValue(int value);
    static bool isValidWorkMode(WorkMode workMode);

    static QString errorToString(Error error);

    // Reading fields are NaN while the payload did not deliver them
    static double unknownValue() { return qQNaN(); }
    static bool isKnown(double value) { return !qIsNaN(value); }

    // True if the value can be converted to qint64 without overflow
    static bool fitsInt64(double value) { return qIsFinite(value) && qAbs(value) < 9.2e18; }
};

#endif // HANCHU_H
