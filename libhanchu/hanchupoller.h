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

#ifndef HANCHUPOLLER_H
#define HANCHUPOLLER_H

#include <QString>
#include <QLoggingCategory>

#include "hanchureply.h"

Q_DECLARE_LOGGING_CATEGORY(dcHanchuPoller)

// A source of readings driven by a HanchuUpdateCoordinator
class HanchuPoller
{
public:
    virtual ~HanchuPoller() = default;

    virtual QString name() const = 0;

    // Starts one poll. The result of the reply is the reading wrapped in a QVariant.
    // The caller takes ownership of the reply.
    virtual HanchuReply *poll() = 0;
};

#endif // HANCHUPOLLER_H
