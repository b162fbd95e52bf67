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

#include "hanchupayloadnormalizer.h"

#include <QtMath>

// 9999-12-31T23:59:59Z in milliseconds
static const double MaximumTimestamp = 253402300799000.0;

Hanchu::Error HanchuPayloadNormalizer::normalizeInverter(const QJsonObject &payload, const QString &serialNumber, HanchuInverterReading *reading, QString *errorString)
{
    QDateTime timestamp;
    Hanchu::Error error = verifyIdentity(payload, serialNumber, &timestamp, errorString);
    if (error != Hanchu::ErrorNoError)
        return error;

    HanchuInverterReading result;
    result.setSerialNumber(serialNumber);
    result.setTimestamp(timestamp);

    result.setSolarPower(toNumber(payload.value("pvTtPwr")));
    result.setLoadPower(toNumber(payload.value("loadPwr")));

    // The cloud already reports grid import positive
    result.setGridPower(toNumber(payload.value("pwrGridSum")));
    result.setGridPhasePower(readSeries(payload, "pwrL%1Grid", HanchuInverterReading::PhaseCount));

    // The cloud reports charging positive
    result.setBatteryPower(negate(toNumber(payload.value("batP"))));

    // 0 - 1 on the wire
    result.setBatterySoc(clampPercentage(toNumber(payload.value("batSoc")) * 100.0));

    result.setSolarEnergyToday(toNumber(payload.value("pvDge")));
    result.setGridImportEnergyToday(toNumber(payload.value("gridTdEe")));
    result.setGridExportEnergyToday(toNumber(payload.value("gridTdFe")));
    result.setBatteryChargeEnergyToday(toNumber(payload.value("batTdChg")));
    result.setBatteryDischargeEnergyToday(toNumber(payload.value("batTdDschg")));
    result.setLoadEnergyToday(toNumber(payload.value("loadTdEe")));
    result.setBmsDesignCapacity(toNumber(payload.value("bmsDesignCap")));

    double workMode = toNumber(payload.value("workMode"));
    if (workMode >= Hanchu::WorkModeSelfConsumption && workMode <= Hanchu::WorkModeBackupPower && qFloor(workMode) == workMode)
        result.setWorkMode(Hanchu::workModeFromValue(static_cast<int>(workMode)));

    *reading = result;
    return Hanchu::ErrorNoError;
}

Hanchu::Error HanchuPayloadNormalizer::normalizeBattery(const QJsonObject &payload, const QString &serialNumber, HanchuBatteryReading *reading, QString *errorString)
{
    QDateTime timestamp;
    Hanchu::Error error = verifyIdentity(payload, serialNumber, &timestamp, errorString);
    if (error != Hanchu::ErrorNoError)
        return error;

    HanchuBatteryReading result;
    result.setSerialNumber(serialNumber);
    result.setTimestamp(timestamp);

    result.setSoc(clampPercentage(toNumber(payload.value("rackSoc"))));

    // W on the wire, charging positive
    result.setPower(negate(toNumber(payload.value("rackPwr")) / 1000.0));
    result.setVoltage(toNumber(payload.value("rackTotalV")));
    result.setCurrent(negate(toNumber(payload.value("rackTotalA"))));

    result.setCapacityRemaining(clampPercentage(toNumber(payload.value("rackCapRemain"))));
    result.setTemperatureMax(toNumber(payload.value("maxT")));
    result.setTemperatureMin(toNumber(payload.value("minT")));
    result.setProbeTemperatures(readSeries(payload, "rackT%1", HanchuBatteryReading::ProbeCount));

    result.setChargeEnergyToday(toNumber(payload.value("rackTdChg")));
    result.setDischargeEnergyToday(toNumber(payload.value("rackTdDschg")));
    result.setChargeEnergyTotal(toNumber(payload.value("rackTotalCharge")));
    result.setDischargeEnergyTotal(toNumber(payload.value("rackTotalDischarge")));

    double cycleCount = toNumber(payload.value("rackTotalLoopNum"));
    if (Hanchu::fitsInt64(cycleCount) && cycleCount >= 0)
        result.setCycleCount(qRound64(cycleCount));

    result.setCapacity(toNumber(payload.value("rackCapacity")));

    result.setPackVoltages(readSeries(payload, "pack%1V", HanchuBatteryReading::PackCount));
    result.setPackAverageTemperatures(readSeries(payload, "pack%1AvgT", HanchuBatteryReading::PackCount));

    result.setRelayState(HanchuBatteryReading::RelayCharging, toRelayState(payload.value("chargingRelay")));
    result.setRelayState(HanchuBatteryReading::RelayDischarging, toRelayState(payload.value("dischargingRelay")));
    result.setRelayState(HanchuBatteryReading::RelayNegative, toRelayState(payload.value("negRelay")));
    result.setRelayState(HanchuBatteryReading::RelayShunt, toRelayState(payload.value("shuntRelay")));
    result.setRelayState(HanchuBatteryReading::RelayPreCharge, toRelayState(payload.value("preChargeRelay")));

    *reading = result;
    return Hanchu::ErrorNoError;
}

double HanchuPayloadNormalizer::toNumber(const QJsonValue &value)
{
    if (value.isDouble()) {
        double number = value.toDouble();
        return qIsFinite(number) ? number : Hanchu::unknownValue();
    }

    // Some fields arrive as numeric strings
    if (value.isString()) {
        bool ok = false;
        double number = value.toString().trimmed().toDouble(&ok);
        if (ok && qIsFinite(number))
            return number;
    }

    return Hanchu::unknownValue();
}

double HanchuPayloadNormalizer::clampPercentage(double value)
{
    if (!Hanchu::isKnown(value))
        return value;

    return qBound(0.0, value, 100.0);
}

QDateTime HanchuPayloadNormalizer::toTimestamp(const QJsonValue &value)
{
    double number = toNumber(value);
    if (Hanchu::isKnown(number)) {
        if (number <= 0)
            return QDateTime();

        // Seconds or milliseconds since epoch
        double milliseconds = number < 100000000000.0 ? number * 1000 : number;
        if (milliseconds > MaximumTimestamp)
            return QDateTime();

        return QDateTime::fromMSecsSinceEpoch(qRound64(milliseconds), Qt::UTC);
    }

    if (value.isString()) {
        // The cloud formats dates in UTC
        QDateTime timestamp = QDateTime::fromString(value.toString().trimmed(), "yyyy-MM-dd HH:mm:ss");
        if (timestamp.isValid()) {
            timestamp.setTimeSpec(Qt::UTC);
            return timestamp;
        }

        return QDateTime::fromString(value.toString().trimmed(), Qt::ISODate);
    }

    return QDateTime();
}

HanchuBatteryReading::RelayState HanchuPayloadNormalizer::toRelayState(const QJsonValue &value)
{
    if (value.isBool())
        return value.toBool() ? HanchuBatteryReading::RelayStateClosed : HanchuBatteryReading::RelayStateOpen;

    double number = toNumber(value);
    if (!Hanchu::fitsInt64(number))
        return HanchuBatteryReading::RelayStateUnknown;

    // Only 1 means closed, fractions are truncated
    return static_cast<qint64>(number) == 1 ? HanchuBatteryReading::RelayStateClosed : HanchuBatteryReading::RelayStateOpen;
}

double HanchuPayloadNormalizer::negate(double value)
{
    // Keeps a zero reading at +0
    return -value + 0.0;
}

QVector<double> HanchuPayloadNormalizer::readSeries(const QJsonObject &payload, const QString &keyPattern, int count)
{
    QVector<double> series;
    for (int i = 0; i < count; i++)
        series.append(toNumber(payload.value(keyPattern.arg(i + 1))));

    return series;
}

Hanchu::Error HanchuPayloadNormalizer::verifyIdentity(const QJsonObject &payload, const QString &serialNumber, QDateTime *timestamp, QString *errorString)
{
    QString payloadSerial;
    QJsonValue serialValue = payload.value("sn");
    if (serialValue.isString()) {
        payloadSerial = serialValue.toString().trimmed();
    } else if (serialValue.isDouble()) {
        payloadSerial = QString::number(serialValue.toDouble(), 'f', 0);
    }

    if (payloadSerial.isEmpty()) {
        if (errorString)
            *errorString = "The payload does not contain a serial number.";

        return Hanchu::ErrorMalformedPayload;
    }

    if (payloadSerial.compare(serialNumber, Qt::CaseInsensitive) != 0) {
        if (errorString)
            *errorString = QString("The payload belongs to %1 instead of %2.").arg(payloadSerial, serialNumber);

        return Hanchu::ErrorMalformedPayload;
    }

    QDateTime payloadTimestamp = toTimestamp(payload.value("dataTimeTs"));
    if (!payloadTimestamp.isValid())
        payloadTimestamp = toTimestamp(payload.value("dataTime"));

    if (!payloadTimestamp.isValid()) {
        if (errorString)
            *errorString = "The payload does not contain a valid timestamp.";

        return Hanchu::ErrorMalformedPayload;
    }

    *timestamp = payloadTimestamp;
    return Hanchu::ErrorNoError;
}
