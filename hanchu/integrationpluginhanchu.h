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

#ifndef INTEGRATIONPLUGINHANCHU_H
#define INTEGRATIONPLUGINHANCHU_H

#include <integrations/integrationplugin.h>

#include "extern-plugininfo.h"
#include "hanchusystem.h"

#include <QObject>
#include <QHash>
#include <QNetworkAccessManager>

class IntegrationPluginHanchu : public IntegrationPlugin
{
    Q_OBJECT

    Q_PLUGIN_METADATA(IID "io.nymea.IntegrationPlugin" FILE "integrationpluginhanchu.json")
    Q_INTERFACES(IntegrationPlugin)

public:
    explicit IntegrationPluginHanchu();
    void init() override;
    void setupThing(ThingSetupInfo *info) override;
    void postSetupThing(Thing *thing) override;
    void executeAction(ThingActionInfo *info) override;
    void thingRemoved(Thing *thing) override;

private:
    QNetworkAccessManager *m_networkManager = nullptr;
    QHash<Thing *, HanchuSystem *> m_systems;

    void setupInverter(ThingSetupInfo *info);
    void setupBattery(ThingSetupInfo *info);

    Thing *batteryThing(Thing *inverterThing) const;
    void updateInverter(Thing *thing, const HanchuInverterReading &reading);
    void updateBattery(Thing *thing, const HanchuBatteryReading &reading);

    static void setKnownStateValue(Thing *thing, const StateTypeId &stateTypeId, double value);
    static Thing::ThingError thingError(Hanchu::Error error);
};

#endif // INTEGRATIONPLUGINHANCHU_H
