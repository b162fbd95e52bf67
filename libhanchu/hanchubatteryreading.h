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

#ifndef HANCHUBATTERYREADING_H
#define HANCHUBATTERYREADING_H

#include <QObject>
#include <QVector>
#include <QDateTime>
#include <QMetaType>
#include <QDebug>

#include "hanchu.h"

// Unknown values are NaN, see Hanchu::isKnown(). The cycle count is -1 while unknown.
class HanchuBatteryReading
{
    Q_GADGET
public:
    enum Relay {
        RelayCharging,
        RelayDischarging,
        RelayNegative,
        RelayShunt,
        RelayPreCharge
    };
    Q_ENUM(Relay)

    enum RelayState {
        RelayStateUnknown,
        RelayStateOpen,
        RelayStateClosed
    };
    Q_ENUM(RelayState)

    static const int ProbeCount = 6;
    static const int PackCount = 8;
    static const int RelayCount = 5;

    HanchuBatteryReading();

    QString serialNumber() const;
    void setSerialNumber(const QString &serialNumber);

    QDateTime timestamp() const;
    void setTimestamp(const QDateTime &timestamp);

    /* Rack state of charge [%] */
    double soc() const;
    void setSoc(double soc);

    /* Rack power [kW], negative = charging, positive = discharging */
    double power() const;
    void setPower(double power);

    /* Rack voltage [V] */
    double voltage() const;
    void setVoltage(double voltage);

    /* Rack current [A], same sign as power() */
    double current() const;
    void setCurrent(double current);

    /* Remaining capacity [%] */
    double capacityRemaining() const;
    void setCapacityRemaining(double capacityRemaining);

    /* Highest and lowest cell temperature [°C] */
    double temperatureMax() const;
    void setTemperatureMax(double temperatureMax);

    double temperatureMin() const;
    void setTemperatureMin(double temperatureMin);

    /* Rack temperature probes 1 - 6 [°C] */
    QVector<double> probeTemperatures() const;
    void setProbeTemperatures(const QVector<double> &probeTemperatures);

    /* Energy counters [kWh] */
    double chargeEnergyToday() const;
    void setChargeEnergyToday(double chargeEnergyToday);

    double dischargeEnergyToday() const;
    void setDischargeEnergyToday(double dischargeEnergyToday);

    double chargeEnergyTotal() const;
    void setChargeEnergyTotal(double chargeEnergyTotal);

    double dischargeEnergyTotal() const;
    void setDischargeEnergyTotal(double dischargeEnergyTotal);

    qint64 cycleCount() const;
    void setCycleCount(qint64 cycleCount);

    /* Rack capacity [kWh] */
    double capacity() const;
    void setCapacity(double capacity);

    /* Pack 1 - 8 voltage [V] */
    QVector<double> packVoltages() const;
    void setPackVoltages(const QVector<double> &packVoltages);

    /* Pack 1 - 8 average temperature [°C] */
    QVector<double> packAverageTemperatures() const;
    void setPackAverageTemperatures(const QVector<double> &packAverageTemperatures);

    RelayState relayState(Relay relay) const;
    void setRelayState(Relay relay, RelayState relayState);

private:
    QString m_serialNumber;
    QDateTime m_timestamp;

    double m_soc;
    double m_power;
    double m_voltage;
    double m_current;
    double m_capacityRemaining;
    double m_temperatureMax;
    double m_temperatureMin;
    QVector<double> m_probeTemperatures;

    double m_chargeEnergyToday;
    double m_dischargeEnergyToday;
    double m_chargeEnergyTotal;
    double m_dischargeEnergyTotal;
    qint64 m_cycleCount = -1;
    double m_capacity;

    QVector<double> m_packVoltages;
    QVector<double> m_packAverageTemperatures;
    QVector<RelayState> m_relayStates;
};

Q_DECLARE_METATYPE(HanchuBatteryReading)

QDebug operator<<(QDebug debug, const HanchuBatteryReading &reading);

#endif // HANCHUBATTERYREADING_H
