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

#include <gtest/gtest.h>

#include <QCoreApplication>

#include "hanchu.h"
#include "hanchuinverterreading.h"
#include "hanchubatteryreading.h"
#include "hanchuupdatecoordinator.h"

int main(int argc, char *argv[])
{
    QCoreApplication application(argc, argv);

    qRegisterMetaType<Hanchu::Error>();
    qRegisterMetaType<HanchuInverterReading>();
    qRegisterMetaType<HanchuBatteryReading>();
    qRegisterMetaType<HanchuUpdateCoordinator::State>();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
