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

#ifndef HANCHUBATTERYPOLLER_H
#define HANCHUBATTERYPOLLER_H

#include <QObject>

#include "hanchupoller.h"
#include "hanchuauthsession.h"
#include "hanchubatteryreading.h"

class HanchuBatteryPoller : public QObject, public HanchuPoller
{
    Q_OBJECT
public:
    explicit HanchuBatteryPoller(HanchuAuthSession *session, const QString &serialNumber, QObject *parent = nullptr);
    ~HanchuBatteryPoller() = default;

    QString serialNumber() const;

    QString name() const override;

    // The result of the reply is a HanchuBatteryReading
    HanchuReply *poll() override;

private:
    HanchuAuthSession *m_session = nullptr;
    QString m_serialNumber;
};

#endif // HANCHUBATTERYPOLLER_H
