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

#include "integrationpluginhanchu.h"
#include "plugininfo.h"

#include <QDebug>

IntegrationPluginHanchu::IntegrationPluginHanchu()
{
}

void IntegrationPluginHanchu::init()
{
    m_networkManager = new QNetworkAccessManager(this);
}

void IntegrationPluginHanchu::setupThing(ThingSetupInfo *info)
{
    Thing *thing = info->thing();
    qCDebug(dcHanchu()) << "Setup" << thing;

    if (thing->thingClassId() == hanchuInverterThingClassId) {
        setupInverter(info);
        return;
    }

    if (thing->thingClassId() == hanchuBatteryThingClassId) {
        setupBattery(info);
        return;
    }
}

void IntegrationPluginHanchu::postSetupThing(Thing *thing)
{
    if (thing->thingClassId() != hanchuInverterThingClassId)
        return;

    HanchuSystem *system = m_systems.value(thing);
    if (!system)
        return;

    Thing *battery = batteryThing(thing);
    if (system->hasBattery() && !battery) {
        qCDebug(dcHanchu()) << "Set up Hanchu battery" << system->credentials().batterySerial() << "for" << thing;
        ThingDescriptor descriptor(hanchuBatteryThingClassId, "Hanchu battery", system->credentials().batterySerial(), thing->id());
        descriptor.setParams(ParamList() << Param(hanchuBatteryThingSerialNumberParamTypeId, system->credentials().batterySerial()));
        emit autoThingsAppeared(ThingDescriptors() << descriptor);
    } else if (!system->hasBattery() && battery) {
        qCDebug(dcHanchu()) << "The battery serial number has been removed from" << thing << "Removing" << battery;
        emit autoThingDisappeared(battery->id());
    }

    system->start();
}

void IntegrationPluginHanchu::executeAction(ThingActionInfo *info)
{
    Thing *thing = info->thing();
    HanchuSystem *system = m_systems.value(thing);
    if (!system) {
        qCWarning(dcHanchu()) << "No Hanchu system available for" << thing;
        info->finish(Thing::ThingErrorHardwareFailure);
        return;
    }

    if (info->action().actionTypeId() == hanchuInverterWorkModeActionTypeId) {
        QString workModeString = info->action().paramValue(hanchuInverterWorkModeActionWorkModeParamTypeId).toString();
        Hanchu::WorkMode workMode = Hanchu::workModeFromString(workModeString);
        if (workMode == Hanchu::WorkModeUnknown) {
            info->finish(Thing::ThingErrorInvalidParameter, QT_TR_NOOP("Unknown work mode."));
            return;
        }

        HanchuReply *reply = system->setWorkMode(workMode);
        connect(reply, &HanchuReply::finished, reply, &HanchuReply::deleteLater);
        connect(reply, &HanchuReply::finished, info, [info, reply, thing, workModeString](){
            if (reply->error() != Hanchu::ErrorNoError) {
                qCWarning(dcHanchu()) << "Setting the work mode of" << thing << "failed:" << reply->errorString();
                info->finish(thingError(reply->error()), reply->errorString());
                return;
            }

            // Accepted by the cloud only. The state follows the refresh the system triggers.
            qCDebug(dcHanchu()) << "Work mode" << workModeString << "accepted for" << thing;
            info->finish(Thing::ThingErrorNoError);
        });
        return;
    }

    info->finish(Thing::ThingErrorActionTypeNotFound);
}

void IntegrationPluginHanchu::thingRemoved(Thing *thing)
{
    if (m_systems.contains(thing)) {
        qCDebug(dcHanchu()) << "Removing Hanchu system of" << thing;
        HanchuSystem *system = m_systems.take(thing);
        system->stop();
        system->deleteLater();
    }
}

void IntegrationPluginHanchu::setupInverter(ThingSetupInfo *info)
{
    Thing *thing = info->thing();

    HanchuCredentials credentials(thing->paramValue(hanchuInverterThingUsernameParamTypeId).toString(),
                                  thing->paramValue(hanchuInverterThingPasswordParamTypeId).toString(),
                                  thing->paramValue(hanchuInverterThingInverterSerialParamTypeId).toString(),
                                  thing->paramValue(hanchuInverterThingBatterySerialParamTypeId).toString());
    if (!credentials.isValid()) {
        qCWarning(dcHanchu()) << "Setup failed, incomplete configuration" << credentials;
        info->finish(Thing::ThingErrorInvalidParameter, QT_TR_NOOP("Please enter the username, the password and the serial number of the inverter."));
        return;
    }

    foreach (Thing *existingThing, myThings().filterByThingClassId(hanchuInverterThingClassId)) {
        if (existingThing->id() == thing->id())
            continue;

        if (existingThing->paramValue(hanchuInverterThingInverterSerialParamTypeId).toString().trimmed().compare(credentials.inverterSerial(), Qt::CaseInsensitive) == 0) {
            qCWarning(dcHanchu()) << "Setup failed, inverter" << credentials.inverterSerial() << "is already configured as" << existingThing;
            info->finish(Thing::ThingErrorThingInUse, QT_TR_NOOP("This inverter has already been added."));
            return;
        }
    }

    if (m_systems.contains(thing)) {
        qCDebug(dcHanchu()) << "Already have a Hanchu system for this thing. Cleaning up old system and initializing new one...";
        m_systems.take(thing)->deleteLater();
    }

    HanchuSystem *system = new HanchuSystem(credentials, m_networkManager, this);
    connect(info, &ThingSetupInfo::aborted, system, [=](){
        qCDebug(dcHanchu()) << "Cleaning up Hanchu system because setup has been aborted.";
        system->deleteLater();
    });

    // Same check the vendor app does: log in and fetch the inverter once
    HanchuReply *reply = system->testConnection();
    connect(reply, &HanchuReply::finished, reply, &HanchuReply::deleteLater);
    connect(reply, &HanchuReply::finished, info, [=](){
        if (reply->error() != Hanchu::ErrorNoError) {
            qCWarning(dcHanchu()) << "Connection test for" << credentials << "failed:" << reply->errorString();
            system->deleteLater();
            if (reply->error() == Hanchu::ErrorAuthentication) {
                info->finish(Thing::ThingErrorAuthenticationFailure, QT_TR_NOOP("The login to the Hanchu cloud failed. Please check username and password."));
            } else {
                info->finish(Thing::ThingErrorHardwareNotAvailable, QT_TR_NOOP("The inverter could not be reached through the Hanchu cloud. Please check the serial number."));
            }
            return;
        }

        m_systems.insert(thing, system);

        connect(system, &HanchuSystem::inverterAvailableChanged, thing, [thing](bool available){
            qCDebug(dcHanchu()) << thing << (available ? "is available" : "is not available");
            thing->setStateValue(hanchuInverterConnectedStateTypeId, available);
        });
        connect(system, &HanchuSystem::inverterReadingChanged, thing, [this, thing](const HanchuInverterReading &reading){
            updateInverter(thing, reading);
        });
        connect(system, &HanchuSystem::batteryAvailableChanged, thing, [this, thing](bool available){
            Thing *battery = batteryThing(thing);
            if (battery)
                battery->setStateValue(hanchuBatteryConnectedStateTypeId, available);
        });
        connect(system, &HanchuSystem::batteryReadingChanged, thing, [this, thing](const HanchuBatteryReading &reading){
            Thing *battery = batteryThing(thing);
            if (battery)
                updateBattery(battery, reading);
        });

        updateInverter(thing, reply->result().value<HanchuInverterReading>());
        info->finish(Thing::ThingErrorNoError);
    });
}

void IntegrationPluginHanchu::setupBattery(ThingSetupInfo *info)
{
    // All information comes from the parent system
    Thing *thing = info->thing();
    info->finish(Thing::ThingErrorNoError);

    Thing *parentThing = myThings().findById(thing->parentId());
    if (!parentThing)
        return;

    HanchuSystem *system = m_systems.value(parentThing);
    if (!system)
        return;

    thing->setStateValue(hanchuBatteryConnectedStateTypeId, system->batteryAvailable());
    if (system->batteryCoordinator() && system->batteryCoordinator()->hasReading())
        updateBattery(thing, system->batteryReading());
}

Thing *IntegrationPluginHanchu::batteryThing(Thing *inverterThing) const
{
    Things batteryThings = myThings().filterByParentId(inverterThing->id()).filterByThingClassId(hanchuBatteryThingClassId);
    if (batteryThings.isEmpty())
        return nullptr;

    return batteryThings.first();
}

void IntegrationPluginHanchu::updateInverter(Thing *thing, const HanchuInverterReading &reading)
{
    setKnownStateValue(thing, hanchuInverterSolarPowerStateTypeId, reading.solarPower());
    setKnownStateValue(thing, hanchuInverterLoadPowerStateTypeId, reading.loadPower());
    setKnownStateValue(thing, hanchuInverterGridPowerStateTypeId, reading.gridPower());

    QVector<double> phasePower = reading.gridPhasePower();
    setKnownStateValue(thing, hanchuInverterGridPowerPhaseAStateTypeId, phasePower.value(0, Hanchu::unknownValue()));
    setKnownStateValue(thing, hanchuInverterGridPowerPhaseBStateTypeId, phasePower.value(1, Hanchu::unknownValue()));
    setKnownStateValue(thing, hanchuInverterGridPowerPhaseCStateTypeId, phasePower.value(2, Hanchu::unknownValue()));

    setKnownStateValue(thing, hanchuInverterBatteryPowerStateTypeId, reading.batteryPower());
    setKnownStateValue(thing, hanchuInverterBatteryLevelStateTypeId, reading.batterySoc());
    setKnownStateValue(thing, hanchuInverterSolarEnergyTodayStateTypeId, reading.solarEnergyToday());
    setKnownStateValue(thing, hanchuInverterGridImportEnergyTodayStateTypeId, reading.gridImportEnergyToday());
    setKnownStateValue(thing, hanchuInverterGridExportEnergyTodayStateTypeId, reading.gridExportEnergyToday());
    setKnownStateValue(thing, hanchuInverterBatteryChargeEnergyTodayStateTypeId, reading.batteryChargeEnergyToday());
    setKnownStateValue(thing, hanchuInverterBatteryDischargeEnergyTodayStateTypeId, reading.batteryDischargeEnergyToday());
    setKnownStateValue(thing, hanchuInverterLoadEnergyTodayStateTypeId, reading.loadEnergyToday());
    setKnownStateValue(thing, hanchuInverterBmsDesignCapacityStateTypeId, reading.bmsDesignCapacity());

    if (reading.workMode() != Hanchu::WorkModeUnknown)
        thing->setStateValue(hanchuInverterWorkModeStateTypeId, Hanchu::workModeToString(reading.workMode()));

    if (reading.timestamp().isValid())
        thing->setStateValue(hanchuInverterLastUpdateStateTypeId, reading.timestamp().toSecsSinceEpoch());
}

void IntegrationPluginHanchu::updateBattery(Thing *thing, const HanchuBatteryReading &reading)
{
    if (Hanchu::isKnown(reading.soc())) {
        thing->setStateValue(hanchuBatteryBatteryLevelStateTypeId, reading.soc());
        thing->setStateValue(hanchuBatteryBatteryCriticalStateTypeId, reading.soc() < 10);
    }

    // The energy storage interface counts charging positive, in W
    if (Hanchu::isKnown(reading.power())) {
        double currentPower = -reading.power() * 1000 + 0.0;
        thing->setStateValue(hanchuBatteryCurrentPowerStateTypeId, currentPower);
        if (currentPower > 0) {
            thing->setStateValue(hanchuBatteryChargingStateStateTypeId, "charging");
        } else if (currentPower < 0) {
            thing->setStateValue(hanchuBatteryChargingStateStateTypeId, "discharging");
        } else {
            thing->setStateValue(hanchuBatteryChargingStateStateTypeId, "idle");
        }
    }
    setKnownStateValue(thing, hanchuBatteryVoltageStateTypeId, reading.voltage());
    setKnownStateValue(thing, hanchuBatteryCurrentStateTypeId, reading.current());
    setKnownStateValue(thing, hanchuBatteryCapacityRemainingStateTypeId, reading.capacityRemaining());
    setKnownStateValue(thing, hanchuBatteryTemperatureMaxStateTypeId, reading.temperatureMax());
    setKnownStateValue(thing, hanchuBatteryTemperatureMinStateTypeId, reading.temperatureMin());

    QList<StateTypeId> probeStateTypeIds = {
        hanchuBatteryProbeTemperature1StateTypeId, hanchuBatteryProbeTemperature2StateTypeId,
        hanchuBatteryProbeTemperature3StateTypeId, hanchuBatteryProbeTemperature4StateTypeId,
        hanchuBatteryProbeTemperature5StateTypeId, hanchuBatteryProbeTemperature6StateTypeId
    };
    QVector<double> probeTemperatures = reading.probeTemperatures();
    for (int i = 0; i < probeStateTypeIds.count(); i++)
        setKnownStateValue(thing, probeStateTypeIds.at(i), probeTemperatures.value(i, Hanchu::unknownValue()));

    setKnownStateValue(thing, hanchuBatteryChargeEnergyTodayStateTypeId, reading.chargeEnergyToday());
    setKnownStateValue(thing, hanchuBatteryDischargeEnergyTodayStateTypeId, reading.dischargeEnergyToday());
    setKnownStateValue(thing, hanchuBatteryTotalEnergyChargedStateTypeId, reading.chargeEnergyTotal());
    setKnownStateValue(thing, hanchuBatteryTotalEnergyDischargedStateTypeId, reading.dischargeEnergyTotal());
    setKnownStateValue(thing, hanchuBatteryCapacityStateTypeId, reading.capacity());

    if (reading.cycleCount() >= 0)
        thing->setStateValue(hanchuBatteryCycleCountStateTypeId, reading.cycleCount());

    QList<StateTypeId> packVoltageStateTypeIds = {
        hanchuBatteryPack1VoltageStateTypeId, hanchuBatteryPack2VoltageStateTypeId,
        hanchuBatteryPack3VoltageStateTypeId, hanchuBatteryPack4VoltageStateTypeId,
        hanchuBatteryPack5VoltageStateTypeId, hanchuBatteryPack6VoltageStateTypeId,
        hanchuBatteryPack7VoltageStateTypeId, hanchuBatteryPack8VoltageStateTypeId
    };
    QList<StateTypeId> packTemperatureStateTypeIds = {
        hanchuBatteryPack1TemperatureStateTypeId, hanchuBatteryPack2TemperatureStateTypeId,
        hanchuBatteryPack3TemperatureStateTypeId, hanchuBatteryPack4TemperatureStateTypeId,
        hanchuBatteryPack5TemperatureStateTypeId, hanchuBatteryPack6TemperatureStateTypeId,
        hanchuBatteryPack7TemperatureStateTypeId, hanchuBatteryPack8TemperatureStateTypeId
    };
    QVector<double> packVoltages = reading.packVoltages();
    QVector<double> packTemperatures = reading.packAverageTemperatures();
    for (int i = 0; i < HanchuBatteryReading::PackCount; i++) {
        setKnownStateValue(thing, packVoltageStateTypeIds.at(i), packVoltages.value(i, Hanchu::unknownValue()));
        setKnownStateValue(thing, packTemperatureStateTypeIds.at(i), packTemperatures.value(i, Hanchu::unknownValue()));
    }

    // Same order as HanchuBatteryReading::Relay
    QList<StateTypeId> relayStateTypeIds = {
        hanchuBatteryChargingRelayStateTypeId, hanchuBatteryDischargingRelayStateTypeId,
        hanchuBatteryNegativeRelayStateTypeId, hanchuBatteryShuntRelayStateTypeId,
        hanchuBatteryPreChargeRelayStateTypeId
    };
    for (int i = 0; i < relayStateTypeIds.count(); i++) {
        HanchuBatteryReading::RelayState relayState = reading.relayState(static_cast<HanchuBatteryReading::Relay>(i));
        if (relayState != HanchuBatteryReading::RelayStateUnknown)
            thing->setStateValue(relayStateTypeIds.at(i), relayState == HanchuBatteryReading::RelayStateClosed);
    }

    if (reading.timestamp().isValid())
        thing->setStateValue(hanchuBatteryLastUpdateStateTypeId, reading.timestamp().toSecsSinceEpoch());
}

void IntegrationPluginHanchu::setKnownStateValue(Thing *thing, const StateTypeId &stateTypeId, double value)
{
    // Unknown values keep the last known state
    if (!Hanchu::isKnown(value))
        return;

    thing->setStateValue(stateTypeId, value);
}

Thing::ThingError IntegrationPluginHanchu::thingError(Hanchu::Error error)
{
    switch (error) {
    case Hanchu::ErrorNoError:
        return Thing::ThingErrorNoError;
    case Hanchu::ErrorAuthentication:
        return Thing::ThingErrorAuthenticationFailure;
    case Hanchu::ErrorNetwork:
    case Hanchu::ErrorMalformedPayload:
        return Thing::ThingErrorHardwareNotAvailable;
    case Hanchu::ErrorRejectedByDevice:
        return Thing::ThingErrorHardwareFailure;
    case Hanchu::ErrorAborted:
        return Thing::ThingErrorTimeout;
    }
    return Thing::ThingErrorHardwareFailure;
}
