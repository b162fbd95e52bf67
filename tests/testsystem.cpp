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

#include <QTest>
#include <QPointer>
#include <QSignalSpy>

#include "fakecloud.h"
#include "hanchusystem.h"

static const QString s_inverterSerial("H016A1234567");
static const QString s_batterySerial("B5K0987654321");

class SystemTest : public ::testing::Test
{
protected:
    FakeCloud cloud;

    void SetUp() override
    {
        cloud.setResponse(FakeCloud::inverterPath(), FakeCloud::envelope(inverterPayload(s_inverterSerial, Hanchu::WorkModeSelfConsumption)));
        cloud.setResponse(FakeCloud::batteryPath(), FakeCloud::envelope(batteryPayload(s_batterySerial)));
        cloud.setResponse(FakeCloud::workModePath(), FakeCloud::envelope(QJsonValue()));
    }
};

TEST_F(SystemTest, WithoutBatterySerialNoBatteryIsPolled)
{
    HanchuSystem system(HanchuCredentials("user@example.com", "secret", s_inverterSerial), &cloud);
    EXPECT_FALSE(system.hasBattery());
    EXPECT_EQ(system.batteryCoordinator(), nullptr);

    QSignalSpy inverterSpy(&system, &HanchuSystem::inverterReadingChanged);
    QSignalSpy batterySpy(&system, &HanchuSystem::batteryReadingChanged);
    system.start();

    ASSERT_TRUE(inverterSpy.wait(2000));
    QTest::qWait(50);

    EXPECT_TRUE(system.inverterAvailable());
    EXPECT_FALSE(system.batteryAvailable());
    EXPECT_TRUE(batterySpy.isEmpty());
    EXPECT_EQ(cloud.requestCount(FakeCloud::batteryPath()), 0);
    EXPECT_EQ(system.inverterReading().serialNumber(), s_inverterSerial);
}

TEST_F(SystemTest, BothDevicesShareOneLogin)
{
    HanchuSystem system(HanchuCredentials("user@example.com", "secret", s_inverterSerial, s_batterySerial), &cloud);
    ASSERT_TRUE(system.hasBattery());
    ASSERT_NE(system.batteryCoordinator(), nullptr);
    EXPECT_EQ(system.batteryCoordinator()->interval(), Hanchu::BatteryPollInterval);
    EXPECT_EQ(system.inverterCoordinator()->interval(), Hanchu::InverterPollInterval);

    QSignalSpy inverterSpy(&system, &HanchuSystem::inverterReadingChanged);
    QSignalSpy batterySpy(&system, &HanchuSystem::batteryReadingChanged);
    system.start();

    if (inverterSpy.isEmpty())
        ASSERT_TRUE(inverterSpy.wait(2000));
    if (batterySpy.isEmpty())
        ASSERT_TRUE(batterySpy.wait(2000));

    EXPECT_EQ(cloud.requestCount(FakeCloud::loginPath()), 1);
    EXPECT_TRUE(system.batteryAvailable());
    EXPECT_DOUBLE_EQ(system.batteryReading().power(), -1.5);
    EXPECT_DOUBLE_EQ(system.inverterReading().batteryPower(), -1500);
}

TEST_F(SystemTest, FailingBatteryDoesNotAffectInverter)
{
    cloud.setResponse(FakeCloud::batteryPath(), "Bad gateway", 502);

    HanchuSystem system(HanchuCredentials("user@example.com", "secret", s_inverterSerial, s_batterySerial), &cloud);
    QSignalSpy inverterSpy(&system, &HanchuSystem::inverterReadingChanged);
    QSignalSpy batteryFinishedSpy(system.batteryCoordinator(), &HanchuUpdateCoordinator::pollFinished);
    system.start();

    if (inverterSpy.isEmpty())
        ASSERT_TRUE(inverterSpy.wait(2000));
    if (batteryFinishedSpy.isEmpty())
        ASSERT_TRUE(batteryFinishedSpy.wait(2000));

    EXPECT_TRUE(system.inverterAvailable());
    EXPECT_EQ(system.batteryCoordinator()->lastError(), Hanchu::ErrorNetwork);
    EXPECT_EQ(system.batteryCoordinator()->consecutiveFailures(), 1);
}

TEST_F(SystemTest, WorkModeIsReflectedWithinOnePollCycle)
{
    HanchuSystem system(HanchuCredentials("user@example.com", "secret", s_inverterSerial), &cloud);
    QSignalSpy inverterSpy(&system, &HanchuSystem::inverterReadingChanged);
    system.start();
    ASSERT_TRUE(inverterSpy.wait(2000));
    EXPECT_EQ(system.inverterReading().workMode(), Hanchu::WorkModeSelfConsumption);

    // The device applies the new mode once the cloud accepted the command
    QObject::connect(&cloud, &FakeCloud::requestReceived, &cloud, [this](const QString &path, const QJsonObject &payload){
        if (path == FakeCloud::workModePath())
            cloud.setResponse(FakeCloud::inverterPath(), FakeCloud::envelope(inverterPayload(s_inverterSerial, payload.value("workMode").toInt())));
    });

    inverterSpy.clear();
    QScopedPointer<HanchuReply> reply(system.setWorkMode(Hanchu::WorkModeUserDefined));
    QSignalSpy replySpy(reply.data(), &HanchuReply::finished);
    ASSERT_TRUE(replySpy.wait(2000));
    ASSERT_EQ(reply->error(), Hanchu::ErrorNoError);

    // The previous mode is still a valid answer until the next poll
    EXPECT_NE(system.inverterReading().workMode(), Hanchu::WorkModeUnknown);

    if (inverterSpy.isEmpty())
        ASSERT_TRUE(inverterSpy.wait(2000));

    EXPECT_EQ(system.inverterReading().workMode(), Hanchu::WorkModeUserDefined);
    EXPECT_EQ(cloud.requestCount(FakeCloud::inverterPath()), 2);
}

TEST_F(SystemTest, IgnoredWorkModeKeepsTheReportedMode)
{
    HanchuSystem system(HanchuCredentials("user@example.com", "secret", s_inverterSerial), &cloud);
    QSignalSpy inverterSpy(&system, &HanchuSystem::inverterReadingChanged);
    system.start();
    ASSERT_TRUE(inverterSpy.wait(2000));

    // Accepted by the cloud, but the inverter keeps its mode
    inverterSpy.clear();
    QScopedPointer<HanchuReply> reply(system.setWorkMode(Hanchu::WorkModeOffGrid));
    QSignalSpy replySpy(reply.data(), &HanchuReply::finished);
    ASSERT_TRUE(replySpy.wait(2000));
    ASSERT_EQ(reply->error(), Hanchu::ErrorNoError);
    EXPECT_EQ(system.inverterReading().workMode(), Hanchu::WorkModeSelfConsumption);

    if (inverterSpy.isEmpty())
        ASSERT_TRUE(inverterSpy.wait(2000));

    EXPECT_EQ(cloud.requestCount(FakeCloud::inverterPath()), 2);
    EXPECT_EQ(system.inverterReading().workMode(), Hanchu::WorkModeSelfConsumption);
}

TEST_F(SystemTest, TestConnectionReportsAuthenticationFailure)
{
    cloud.setResponse(FakeCloud::loginPath(), FakeCloud::envelope(QJsonValue(), false, 500, "Account or password error"));

    HanchuSystem system(HanchuCredentials("user@example.com", "wrong", s_inverterSerial), &cloud);
    QScopedPointer<HanchuReply> reply(system.testConnection());
    QSignalSpy spy(reply.data(), &HanchuReply::finished);
    ASSERT_TRUE(spy.wait(2000));

    EXPECT_EQ(reply->error(), Hanchu::ErrorAuthentication);
    EXPECT_FALSE(system.inverterCoordinator()->hasReading());
}

TEST_F(SystemTest, TestConnectionReportsWrongSerial)
{
    HanchuSystem system(HanchuCredentials("user@example.com", "secret", "H016A0000000"), &cloud);
    QScopedPointer<HanchuReply> reply(system.testConnection());
    QSignalSpy spy(reply.data(), &HanchuReply::finished);
    ASSERT_TRUE(spy.wait(2000));

    EXPECT_EQ(reply->error(), Hanchu::ErrorMalformedPayload);
}

TEST_F(SystemTest, StopAbortsRequestsAndPolling)
{
    cloud.setResponse(FakeCloud::inverterPath(), FakeCloud::holdResponse());

    QScopedPointer<HanchuSystem> system(new HanchuSystem(HanchuCredentials("user@example.com", "secret", s_inverterSerial), &cloud));
    system->start();

    QSignalSpy requestSpy(&cloud, &FakeCloud::requestReceived);
    while (cloud.requestCount(FakeCloud::inverterPath()) < 1)
        ASSERT_TRUE(requestSpy.wait(2000));

    system->stop();
    EXPECT_FALSE(system->inverterCoordinator()->running());
    EXPECT_EQ(cloud.abortedCount(), 1);

    system.reset();
    QTest::qWait(50);
    EXPECT_EQ(cloud.requestCount(FakeCloud::inverterPath()), 1);
}

TEST_F(SystemTest, StopAbortsPendingWorkMode)
{
    cloud.setResponse(FakeCloud::workModePath(), FakeCloud::holdResponse());

    HanchuSystem system(HanchuCredentials("user@example.com", "secret", s_inverterSerial), &cloud);
    QScopedPointer<HanchuReply> reply(system.setWorkMode(Hanchu::WorkModeBackupPower));

    QSignalSpy requestSpy(&cloud, &FakeCloud::requestReceived);
    while (cloud.requestCount(FakeCloud::workModePath()) < 1)
        ASSERT_TRUE(requestSpy.wait(2000));

    QSignalSpy replySpy(reply.data(), &HanchuReply::finished);
    system.stop();

    ASSERT_TRUE(replySpy.wait(2000));
    EXPECT_EQ(reply->error(), Hanchu::ErrorAborted);
    EXPECT_EQ(cloud.abortedCount(), 1);
    EXPECT_FALSE(system.commandDispatcher()->busy());
}

TEST_F(SystemTest, DeletingTheSystemDuringTestConnection)
{
    cloud.setResponse(FakeCloud::inverterPath(), FakeCloud::holdResponse());

    HanchuSystem *system = new HanchuSystem(HanchuCredentials("user@example.com", "secret", s_inverterSerial), &cloud);
    QPointer<HanchuReply> reply = system->testConnection();

    QSignalSpy requestSpy(&cloud, &FakeCloud::requestReceived);
    while (cloud.requestCount(FakeCloud::inverterPath()) < 1)
        ASSERT_TRUE(requestSpy.wait(2000));

    // Same as an aborted thing setup
    system->deleteLater();
    QTest::qWait(50);

    EXPECT_TRUE(reply.isNull());
    EXPECT_EQ(cloud.abortedCount(), 1);
    EXPECT_EQ(cloud.requestCount(FakeCloud::inverterPath()), 1);
}
