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

#include "hanchuinverterreading.h"

#include <QDebug>

const int HanchuInverterReading::PhaseCount;

HanchuInverterReading::HanchuInverterReading() :
    m_solarPower(Hanchu::unknownValue()),
    m_loadPower(Hanchu::unknownValue()),
    m_gridPower(Hanchu::unknownValue()),
    m_gridPhasePower(PhaseCount, Hanchu::unknownValue()),
    m_batteryPower(Hanchu::unknownValue()),
    m_batterySoc(Hanchu::unknownValue()),
    m_solarEnergyToday(Hanchu::unknownValue()),
    m_gridImportEnergyToday(Hanchu::unknownValue()),
    m_gridExportEnergyToday(Hanchu::unknownValue()),
    m_batteryChargeEnergyToday(Hanchu::unknownValue()),
    m_batteryDischargeEnergyToday(Hanchu::unknownValue()),
    m_loadEnergyToday(Hanchu::unknownValue()),
    m_bmsDesignCapacity(Hanchu::unknownValue())
{

}

QString HanchuInverterReading::serialNumber() const
{
    return m_serialNumber;
}

void HanchuInverterReading::setSerialNumber(const QString &serialNumber)
{
    m_serialNumber = serialNumber;
}

QDateTime HanchuInverterReading::timestamp() const
{
    return m_timestamp;
}

void HanchuInverterReading::setTimestamp(const QDateTime &timestamp)
{
    m_timestamp = timestamp;
}

double HanchuInverterReading::solarPower() const
{
    return m_solarPower;
}

void HanchuInverterReading::setSolarPower(double solarPower)
{
    m_solarPower = solarPower;
}

double HanchuInverterReading::loadPower() const
{
    return m_loadPower;
}

void HanchuInverterReading::setLoadPower(double loadPower)
{
    m_loadPower = loadPower;
}

double HanchuInverterReading::gridPower() const
{
    return m_gridPower;
}

void HanchuInverterReading::setGridPower(double gridPower)
{
    m_gridPower = gridPower;
}

QVector<double> HanchuInverterReading::gridPhasePower() const
{
    return m_gridPhasePower;
}

void HanchuInverterReading::setGridPhasePower(const QVector<double> &gridPhasePower)
{
    // Always keep one slot per phase
    m_gridPhasePower = gridPhasePower.mid(0, PhaseCount);
    while (m_gridPhasePower.count() < PhaseCount)
        m_gridPhasePower.append(Hanchu::unknownValue());
}

double HanchuInverterReading::batteryPower() const
{
    return m_batteryPower;
}

void HanchuInverterReading::setBatteryPower(double batteryPower)
{
    m_batteryPower = batteryPower;
}

double HanchuInverterReading::batterySoc() const
{
    return m_batterySoc;
}

void HanchuInverterReading::setBatterySoc(double batterySoc)
{
    m_batterySoc = batterySoc;
}

double HanchuInverterReading::solarEnergyToday() const
{
    return m_solarEnergyToday;
}

void HanchuInverterReading::setSolarEnergyToday(double solarEnergyToday)
{
    m_solarEnergyToday = solarEnergyToday;
}

double HanchuInverterReading::gridImportEnergyToday() const
{
    return m_gridImportEnergyToday;
}

void HanchuInverterReading::setGridImportEnergyToday(double gridImportEnergyToday)
{
    m_gridImportEnergyToday = gridImportEnergyToday;
}

double HanchuInverterReading::gridExportEnergyToday() const
{
    return m_gridExportEnergyToday;
}

void HanchuInverterReading::setGridExportEnergyToday(double gridExportEnergyToday)
{
    m_gridExportEnergyToday = gridExportEnergyToday;
}

double HanchuInverterReading::batteryChargeEnergyToday() const
{
    return m_batteryChargeEnergyToday;
}

void HanchuInverterReading::setBatteryChargeEnergyToday(double batteryChargeEnergyToday)
{
    m_batteryChargeEnergyToday = batteryChargeEnergyToday;
}

double HanchuInverterReading::batteryDischargeEnergyToday() const
{
    return m_batteryDischargeEnergyToday;
}

void HanchuInverterReading::setBatteryDischargeEnergyToday(double batteryDischargeEnergyToday)
{
    m_batteryDischargeEnergyToday = batteryDischargeEnergyToday;
}

double HanchuInverterReading::loadEnergyToday() const
{
    return m_loadEnergyToday;
}

void HanchuInverterReading::setLoadEnergyToday(double loadEnergyToday)
{
    m_loadEnergyToday = loadEnergyToday;
}

double HanchuInverterReading::bmsDesignCapacity() const
{
    return m_bmsDesignCapacity;
}

void HanchuInverterReading::setBmsDesignCapacity(double bmsDesignCapacity)
{
    m_bmsDesignCapacity = bmsDesignCapacity;
}

Hanchu::WorkMode HanchuInverterReading::workMode() const
{
    return m_workMode;
}

void HanchuInverterReading::setWorkMode(Hanchu::WorkMode workMode)
{
    m_workMode = workMode;
}

QDebug operator<<(QDebug debug, const HanchuInverterReading &reading)
{
    debug.nospace().noquote() << "HanchuInverterReading(" << reading.serialNumber() << ", " << reading.timestamp().toString(Qt::ISODate) << ")" << "\n";
    debug.nospace().noquote() << "    - Solar power: " << reading.solarPower() << " [W]" << "\n";
    debug.nospace().noquote() << "    - Load power: " << reading.loadPower() << " [W]" << "\n";
    debug.nospace().noquote() << "    - Grid power: " << reading.gridPower() << " [W]" << "\n";
    debug.nospace().noquote() << "    - Grid phase power: " << reading.gridPhasePower() << " [W]" << "\n";
    debug.nospace().noquote() << "    - Battery power: " << reading.batteryPower() << " [W]" << "\n";
    debug.nospace().noquote() << "    - Battery SoC: " << reading.batterySoc() << " [%]" << "\n";
    debug.nospace().noquote() << "    - Work mode: " << Hanchu::workModeToString(reading.workMode()) << "\n";
    return debug.quote().space();
}
