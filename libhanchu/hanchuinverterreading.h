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

#ifndef HANCHUINVERTERREADING_H
#define HANCHUINVERTERREADING_H

#include <QVector>
#include <QDateTime>
#include <QMetaType>
#include <QDebug>

#include "hanchu.h"

// Unknown values are NaN, see Hanchu::isKnown()
class HanchuInverterReading
{
public:
    static const int PhaseCount = 3;

    HanchuInverterReading();

    QString serialNumber() const;
    void setSerialNumber(const QString &serialNumber);

    QDateTime timestamp() const;
    void setTimestamp(const QDateTime &timestamp);

    /* Solar power [W] */
    double solarPower() const;
    void setSolarPower(double solarPower);

    /* Load power [W] */
    double loadPower() const;
    void setLoadPower(double loadPower);

    /* Grid power [W], positive = import, negative = export */
    double gridPower() const;
    void setGridPower(double gridPower);

    /* Grid power per phase L1 - L3 [W], same sign as gridPower() */
    QVector<double> gridPhasePower() const;
    void setGridPhasePower(const QVector<double> &gridPhasePower);

    /* Battery power [W], negative = charging, positive = discharging */
    double batteryPower() const;
    void setBatteryPower(double batteryPower);

    /* Battery state of charge [%] */
    double batterySoc() const;
    void setBatterySoc(double batterySoc);

    /* Daily counters [kWh], reset by the device at midnight */
    double solarEnergyToday() const;
    void setSolarEnergyToday(double solarEnergyToday);

    double gridImportEnergyToday() const;
    void setGridImportEnergyToday(double gridImportEnergyToday);

    double gridExportEnergyToday() const;
    void setGridExportEnergyToday(double gridExportEnergyToday);

    double batteryChargeEnergyToday() const;
    void setBatteryChargeEnergyToday(double batteryChargeEnergyToday);

    double batteryDischargeEnergyToday() const;
    void setBatteryDischargeEnergyToday(double batteryDischargeEnergyToday);

    double loadEnergyToday() const;
    void setLoadEnergyToday(double loadEnergyToday);

    /* BMS design capacity [kWh] */
    double bmsDesignCapacity() const;
    void setBmsDesignCapacity(double bmsDesignCapacity);

    Hanchu::WorkMode workMode() const;
    void setWorkMode(Hanchu::WorkMode workMode);

private:
    QString m_serialNumber;
    QDateTime m_timestamp;

    double m_solarPower;
    double m_loadPower;
    double m_gridPower;
    QVector<double> m_gridPhasePower;
    double m_batteryPower;
    double m_batterySoc;

    double m_solarEnergyToday;
    double m_gridImportEnergyToday;
    double m_gridExportEnergyToday;
    double m_batteryChargeEnergyToday;
    double m_batteryDischargeEnergyToday;
    double m_loadEnergyToday;

    double m_bmsDesignCapacity;
    Hanchu::WorkMode m_workMode = Hanchu::WorkModeUnknown;
};

Q_DECLARE_METATYPE(HanchuInverterReading)

QDebug operator<<(QDebug debug, const HanchuInverterReading &reading);

#endif // HANCHUINVERTERREADING_H
