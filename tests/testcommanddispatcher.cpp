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
#include <QSignalSpy>

#include "fakecloud.h"
#include "hanchucommanddispatcher.h"

class CommandDispatcherTest : public ::testing::Test
{
protected:
    FakeCloud cloud;
    HanchuCloudConnection connection{&cloud};
    HanchuAuthSession session{HanchuCredentials("user@example.com", "secret", "H016A1234567"), &connection};
    HanchuCommandDispatcher dispatcher{&session, "H016A1234567"};

    void SetUp() override
    {
        cloud.setResponse(FakeCloud::workModePath(), FakeCloud::envelope(QJsonValue()));
    }

    bool waitFor(HanchuReply *reply)
    {
        if (reply->isFinished())
            return true;

        QSignalSpy spy(reply, &HanchuReply::finished);
        return spy.wait(2000);
    }
};

TEST_F(CommandDispatcherTest, WorkModeIsSent)
{
    QSignalSpy acceptedSpy(&dispatcher, &HanchuCommandDispatcher::workModeAccepted);

    QScopedPointer<HanchuReply> reply(dispatcher.setWorkMode(Hanchu::WorkModeUserDefined));
    ASSERT_TRUE(waitFor(reply.data()));

    EXPECT_EQ(reply->error(), Hanchu::ErrorNoError);
    EXPECT_EQ(reply->result().toInt(), static_cast<int>(Hanchu::WorkModeUserDefined));
    EXPECT_EQ(acceptedSpy.count(), 1);

    ASSERT_EQ(cloud.requestCount(FakeCloud::workModePath()), 1);
    QJsonObject payload = cloud.requests(FakeCloud::workModePath()).first().payload;
    EXPECT_EQ(payload.value("sn").toString(), QString("H016A1234567"));
    EXPECT_EQ(payload.value("workMode").toInt(), 2);
}

TEST_F(CommandDispatcherTest, UnknownWorkModeIsRejectedLocally)
{
    QScopedPointer<HanchuReply> reply(dispatcher.setWorkMode(Hanchu::WorkModeUnknown));
    ASSERT_TRUE(waitFor(reply.data()));

    EXPECT_EQ(reply->error(), Hanchu::ErrorRejectedByDevice);
    EXPECT_TRUE(cloud.requests().isEmpty());
}

TEST_F(CommandDispatcherTest, RefusedWorkModeIsRejectedByDevice)
{
    cloud.setResponse(FakeCloud::workModePath(), FakeCloud::envelope(QJsonValue(), false, 500, "Mode not supported"));

    QScopedPointer<HanchuReply> reply(dispatcher.setWorkMode(Hanchu::WorkModeOffGrid));
    ASSERT_TRUE(waitFor(reply.data()));

    EXPECT_EQ(reply->error(), Hanchu::ErrorRejectedByDevice);
    EXPECT_EQ(reply->errorString(), QString("Mode not supported"));

    // No automatic retry
    EXPECT_EQ(cloud.requestCount(FakeCloud::workModePath()), 1);
}

TEST_F(CommandDispatcherTest, FailedLoginIsReported)
{
    cloud.setResponse(FakeCloud::loginPath(), "{}", 401);

    QScopedPointer<HanchuReply> reply(dispatcher.setWorkMode(Hanchu::WorkModeBackupPower));
    ASSERT_TRUE(waitFor(reply.data()));
    EXPECT_EQ(reply->error(), Hanchu::ErrorAuthentication);
    EXPECT_EQ(cloud.requestCount(FakeCloud::workModePath()), 0);
}

TEST_F(CommandDispatcherTest, WritesKeepTheirOrder)
{
    cloud.enqueueResponse(FakeCloud::workModePath(), FakeCloud::holdResponse());

    QScopedPointer<HanchuReply> first(dispatcher.setWorkMode(Hanchu::WorkModeOffGrid));
    QScopedPointer<HanchuReply> second(dispatcher.setWorkMode(Hanchu::WorkModeSelfConsumption));
    EXPECT_EQ(dispatcher.queueLength(), 1);

    // The first write is pending in the cloud, the second one must wait
    QSignalSpy requestSpy(&cloud, &FakeCloud::requestReceived);
    while (cloud.requestCount(FakeCloud::workModePath()) < 1)
        ASSERT_TRUE(requestSpy.wait(2000));

    QTest::qWait(50);
    EXPECT_EQ(cloud.requestCount(FakeCloud::workModePath()), 1);
    EXPECT_FALSE(second->isFinished());

    FakeNetworkReply *held = cloud.takeHeldReply();
    ASSERT_TRUE(held != nullptr);
    held->respond(200, FakeCloud::envelope(QJsonValue()));

    ASSERT_TRUE(waitFor(first.data()));
    ASSERT_TRUE(waitFor(second.data()));
    EXPECT_EQ(first->error(), Hanchu::ErrorNoError);
    EXPECT_EQ(second->error(), Hanchu::ErrorNoError);

    QList<FakeCloud::Request> writes = cloud.requests(FakeCloud::workModePath());
    ASSERT_EQ(writes.count(), 2);
    EXPECT_EQ(writes.at(0).payload.value("workMode").toInt(), 3);
    EXPECT_EQ(writes.at(1).payload.value("workMode").toInt(), 1);
}

TEST_F(CommandDispatcherTest, AbortAllFailsQueuedWrites)
{
    cloud.enqueueResponse(FakeCloud::workModePath(), FakeCloud::holdResponse());

    QScopedPointer<HanchuReply> first(dispatcher.setWorkMode(Hanchu::WorkModeOffGrid));
    QScopedPointer<HanchuReply> second(dispatcher.setWorkMode(Hanchu::WorkModeSelfConsumption));
    dispatcher.abortAll();

    ASSERT_TRUE(waitFor(first.data()));
    ASSERT_TRUE(waitFor(second.data()));
    EXPECT_EQ(first->error(), Hanchu::ErrorAborted);
    EXPECT_EQ(second->error(), Hanchu::ErrorAborted);
    EXPECT_FALSE(dispatcher.busy());
    EXPECT_EQ(dispatcher.queueLength(), 0);
}
