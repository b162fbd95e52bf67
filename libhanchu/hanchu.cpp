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

#include "hanchu.h"

const int Hanchu::InverterPollInterval;
const int Hanchu::BatteryPollInterval;
const int Hanchu::UnavailableThreshold;
const int Hanchu::RequestTimeout;
const int Hanchu::TokenRefreshMargin;

QString Hanchu::workModeToString(WorkMode workMode)
{
    switch (workMode) {
    case WorkModeSelfConsumption:
        return "Self-consumption";
    case WorkModeUserDefined:
        return "User-defined";
    case WorkModeOffGrid:
        return "Off-grid";
    case WorkModeBackupPower:
        return "Backup power";
    case WorkModeUnknown:
        break;
    }
    return "Unknown";
}

Hanchu::WorkMode Hanchu::workModeFromString(const QString &workMode)
{
    if (workMode == "Self-consumption")
        return WorkModeSelfConsumption;

    if (workMode == "User-defined")
        return WorkModeUserDefined;

    if (workMode == "Off-grid")
        return WorkModeOffGrid;

    if (workMode == "Backup power")
        return WorkModeBackupPower;

    return WorkModeUnknown;
}

Hanchu::WorkMode Hanchu::workModeFromValue(int value)
{
    switch (value) {
    case WorkModeSelfConsumption:
    case WorkModeUserDefined:
    case WorkModeOffGrid:
    case WorkModeBackupPower:
        return static_cast<WorkMode>(value);
    default:
        return WorkModeUnknown;
    }
}

bool Hanchu::isValidWorkMode(WorkMode workMode)
{
    return workModeFromValue(workMode) != WorkModeUnknown;
}

QString Hanchu::errorToString(Error error)
{
    switch (error) {
    case ErrorNoError:
        return "No error";
    case ErrorAuthentication:
        return "Authentication error";
    case ErrorNetwork:
        return "Network error";
    case ErrorMalformedPayload:
        return "Malformed payload";
    case ErrorRejectedByDevice:
        return "Rejected by device";
    case ErrorAborted:
        return "Aborted";
    }
    return QString();
}
