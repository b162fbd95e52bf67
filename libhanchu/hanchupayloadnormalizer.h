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

#ifndef HANCHUPAYLOADNORMALIZER_H
#define HANCHUPAYLOADNORMALIZER_H

#include <QJsonObject>
#include <QJsonValue>

#include "hanchu.h"
#include "hanchuinverterreading.h"
#include "hanchubatteryreading.h"

/**
 * @brief Converts the loosely typed cloud payloads into typed readings.
 *
 * This is the only place where vendor field names, units and sign conventions
 * are known. Readings leaving the normalizer follow these rules:
 *
 * - A field which is missing or not numeric is left unknown, the rest of the
 *   reading is still valid.
 * - Percentages are clamped to [0, 100].
 * - Grid power is positive while importing, battery power is negative while
 *   charging. The cloud reports battery power positive while charging, so it is
 *   negated here.
 * - Series (phases, probes, packs) are mapped by position. Missing positions stay
 *   unknown and are never filled with zero.
 *
 * The serial number and the timestamp of a payload are mandatory. If one of them
 * is missing or the serial does not belong to the requested device the whole
 * payload is rejected with Hanchu::ErrorMalformedPayload.
 */
class HanchuPayloadNormalizer
{
public:
    static Hanchu::Error normalizeInverter(const QJsonObject &payload, const QString &serialNumber, HanchuInverterReading *reading, QString *errorString = nullptr);
    static Hanchu::Error normalizeBattery(const QJsonObject &payload, const QString &serialNumber, HanchuBatteryReading *reading, QString *errorString = nullptr);

    static double toNumber(const QJsonValue &value);
    static double clampPercentage(double value);
    static QDateTime toTimestamp(const QJsonValue &value);
    static HanchuBatteryReading::RelayState toRelayState(const QJsonValue &value);
    static double negate(double value);

    // Reads "key1", "key2", ... "keyN" where keyPattern contains %1 for the position
    static QVector<double> readSeries(const QJsonObject &payload, const QString &keyPattern, int count);

private:
    static Hanchu::Error verifyIdentity(const QJsonObject &payload, const QString &serialNumber, QDateTime *timestamp, QString *errorString);
};

#endif // HANCHUPAYLOADNORMALIZER_H
