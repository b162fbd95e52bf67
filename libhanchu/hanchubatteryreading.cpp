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

#include "hanchubatteryreading.h"

#include <QDebug>

const int HanchuBatteryReading::ProbeCount;
const int HanchuBatteryReading::PackCount;
const int HanchuBatteryReading::RelayCount;

// Pads or truncates a positional series to its fixed slot count
static QVector<double> fixedSeries(const QVector<double> &values, int count)
{
    QVector<double> series = values.mid(0, count);
    while (series.count() < count)
        series.append(Hanchu::unknownValue());

    return series;
}

HanchuBatteryReading::HanchuBatteryReading() :
    m_soc(Hanchu::unknownValue()),
    m_power(Hanchu::unknownValue()),
    m_voltage(Hanchu::unknownValue()),
    m_current(Hanchu::unknownValue()),
    m_capacityRemaining(Hanchu::unknownValue()),
    m_temperatureMax(Hanchu::unknownValue()),
    m_temperatureMin(Hanchu::unknownValue()),
    m_probeTemperatures(ProbeCount, Hanchu::unknownValue()),
    m_chargeEnergyToday(Hanchu::unknownValue()),
    m_dischargeEnergyToday(Hanchu::unknownValue()),
    m_chargeEnergyTotal(Hanchu::unknownValue()),
    m_dischargeEnergyTotal(Hanchu::unknownValue()),
    m_capacity(Hanchu::unknownValue()),
    m_packVoltages(PackCount, Hanchu::unknownValue()),
    m_packAverageTemperatures(PackCount, Hanchu::unknownValue()),
    m_relayStates(RelayCount, RelayStateUnknown)
{

}

QString HanchuBatteryReading::serialNumber() const
{
    return m_serialNumber;
}

void HanchuBatteryReading::setSerialNumber(const QString &serialNumber)
{
    m_serialNumber = serialNumber;
}

QDateTime HanchuBatteryReading::timestamp() const
{
    return m_timestamp;
}

void HanchuBatteryReading::setTimestamp(const QDateTime &timestamp)
{
    m_timestamp = timestamp;
}

double HanchuBatteryReading::soc() const
{
    return m_soc;
}

void HanchuBatteryReading::setSoc(double soc)
{
    m_soc = soc;
}

double HanchuBatteryReading::power() const
{
    return m_power;
}

void HanchuBatteryReading::setPower(double power)
{
    m_power = power;
}

double HanchuBatteryReading::voltage() const
{
    return m_voltage;
}

void HanchuBatteryReading::setVoltage(double voltage)
{
    m_voltage = voltage;
}

double HanchuBatteryReading::current() const
{
    return m_current;
}

void HanchuBatteryReading::setCurrent(double current)
{
    m_current = current;
}

double HanchuBatteryReading::capacityRemaining() const
{
    return m_capacityRemaining;
}

void HanchuBatteryReading::setCapacityRemaining(double capacityRemaining)
{
    m_capacityRemaining = capacityRemaining;
}

double HanchuBatteryReading::temperatureMax() const
{
    return m_temperatureMax;
}

void HanchuBatteryReading::setTemperatureMax(double temperatureMax)
{
    m_temperatureMax = temperatureMax;
}

double HanchuBatteryReading::temperatureMin() const
{
    return m_temperatureMin;
}

void HanchuBatteryReading::setTemperatureMin(double temperatureMin)
{
    m_temperatureMin = temperatureMin;
}

QVector<double> HanchuBatteryReading::probeTemperatures() const
{
    return m_probeTemperatures;
}

void HanchuBatteryReading::setProbeTemperatures(const QVector<double> &probeTemperatures)
{
    m_probeTemperatures = fixedSeries(probeTemperatures, ProbeCount);
}

double HanchuBatteryReading::chargeEnergyToday() const
{
    return m_chargeEnergyToday;
}

void HanchuBatteryReading::setChargeEnergyToday(double chargeEnergyToday)
{
    m_chargeEnergyToday = chargeEnergyToday;
}

double HanchuBatteryReading::dischargeEnergyToday() const
{
    return m_dischargeEnergyToday;
}

void HanchuBatteryReading::setDischargeEnergyToday(double dischargeEnergyToday)
{
    m_dischargeEnergyToday = dischargeEnergyToday;
}

double HanchuBatteryReading::chargeEnergyTotal() const
{
    return m_chargeEnergyTotal;
}

void HanchuBatteryReading::setChargeEnergyTotal(double chargeEnergyTotal)
{
    m_chargeEnergyTotal = chargeEnergyTotal;
}

double HanchuBatteryReading::dischargeEnergyTotal() const
{
    return m_dischargeEnergyTotal;
}

void HanchuBatteryReading::setDischargeEnergyTotal(double dischargeEnergyTotal)
{
    m_dischargeEnergyTotal = dischargeEnergyTotal;
}

qint64 HanchuBatteryReading::cycleCount() const
{
    return m_cycleCount;
}

void HanchuBatteryReading::setCycleCount(qint64 cycleCount)
{
    m_cycleCount = cycleCount;
}

double HanchuBatteryReading::capacity() const
{
    return m_capacity;
}

void HanchuBatteryReading::setCapacity(double capacity)
{
    m_capacity = capacity;
}

QVector<double> HanchuBatteryReading::packVoltages() const
{
    return m_packVoltages;
}

void HanchuBatteryReading::setPackVoltages(const QVector<double> &packVoltages)
{
    m_packVoltages = fixedSeries(packVoltages, PackCount);
}

QVector<double> HanchuBatteryReading::packAverageTemperatures() const
{
    return m_packAverageTemperatures;
}

void HanchuBatteryReading::setPackAverageTemperatures(const QVector<double> &packAverageTemperatures)
{
    m_packAverageTemperatures = fixedSeries(packAverageTemperatures, PackCount);
}

HanchuBatteryReading::RelayState HanchuBatteryReading::relayState(Relay relay) const
{
    return m_relayStates.value(relay, RelayStateUnknown);
}

void HanchuBatteryReading::setRelayState(Relay relay, RelayState relayState)
{
    if (relay < 0 || relay >= RelayCount)
        return;

    m_relayStates[relay] = relayState;
}

QDebug operator<<(QDebug debug, const HanchuBatteryReading &reading)
{
    debug.nospace().noquote() << "HanchuBatteryReading(" << reading.serialNumber() << ", " << reading.timestamp().toString(Qt::ISODate) << ")" << "\n";
    debug.nospace().noquote() << "    - SoC: " << reading.soc() << " [%]" << "\n";
    debug.nospace().noquote() << "    - Power: " << reading.power() << " [kW]" << "\n";
    debug.nospace().noquote() << "    - Voltage: " << reading.voltage() << " [V]" << "\n";
    debug.nospace().noquote() << "    - Current: " << reading.current() << " [A]" << "\n";
    debug.nospace().noquote() << "    - Capacity remaining: " << reading.capacityRemaining() << " [%]" << "\n";
    debug.nospace().noquote() << "    - Pack voltages: " << reading.packVoltages() << " [V]" << "\n";
    debug.nospace().noquote() << "    - Cycles: " << reading.cycleCount() << "\n";
    return debug.quote().space();
}
