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

#include <QSignalSpy>
#include <QDateTime>

#include <limits>

#include "fakecloud.h"
#include "hanchuauthsession.h"

class AuthSessionTest : public ::testing::Test
{
protected:
    FakeCloud cloud;
    HanchuCloudConnection connection{&cloud};
    HanchuAuthSession session{HanchuCredentials("user@example.com", "secret", "H016A1234567"), &connection};

    bool waitFor(HanchuReply *reply)
    {
        if (reply->isFinished())
            return true;

        QSignalSpy spy(reply, &HanchuReply::finished);
        return spy.wait(2000);
    }

    void setToken(qint64 expiry)
    {
        cloud.setResponse(FakeCloud::loginPath(), FakeCloud::envelope(FakeCloud::makeToken(expiry)));
    }
};

TEST_F(AuthSessionTest, ConcurrentCallersShareOneLogin)
{
    QScopedPointer<HanchuReply> first(session.ensureValid());
    QScopedPointer<HanchuReply> second(session.ensureValid());
    EXPECT_TRUE(session.loginPending());

    QSignalSpy firstSpy(first.data(), &HanchuReply::finished);
    QSignalSpy secondSpy(second.data(), &HanchuReply::finished);
    ASSERT_TRUE(firstSpy.wait(2000));
    if (secondSpy.isEmpty())
        ASSERT_TRUE(secondSpy.wait(2000));

    EXPECT_EQ(cloud.requestCount(FakeCloud::loginPath()), 1);
    EXPECT_EQ(first->error(), Hanchu::ErrorNoError);
    EXPECT_EQ(second->error(), Hanchu::ErrorNoError);
    EXPECT_FALSE(first->result().toString().isEmpty());
    EXPECT_EQ(first->result(), second->result());
    EXPECT_TRUE(session.isValid());
}

TEST_F(AuthSessionTest, LoginSendsAccountAndEncryptedPassword)
{
    QScopedPointer<HanchuReply> reply(session.ensureValid());
    ASSERT_TRUE(waitFor(reply.data()));

    ASSERT_EQ(cloud.requestCount(FakeCloud::loginPath()), 1);
    FakeCloud::Request login = cloud.requests(FakeCloud::loginPath()).first();
    EXPECT_EQ(login.payload.value("account").toString(), QString("user@example.com"));
    EXPECT_FALSE(login.payload.value("pwd").toString().isEmpty());
    EXPECT_NE(login.payload.value("pwd").toString(), QString("secret"));
    EXPECT_TRUE(login.token.isEmpty());
}

TEST_F(AuthSessionTest, ValidSessionIsReused)
{
    QScopedPointer<HanchuReply> first(session.ensureValid());
    ASSERT_TRUE(waitFor(first.data()));

    QScopedPointer<HanchuReply> second(session.ensureValid());
    ASSERT_TRUE(waitFor(second.data()));

    EXPECT_EQ(second->error(), Hanchu::ErrorNoError);
    EXPECT_EQ(cloud.requestCount(FakeCloud::loginPath()), 1);
}

TEST_F(AuthSessionTest, TokenCloseToExpiryTriggersLogin)
{
    // Expires within the refresh margin
    setToken(QDateTime::currentSecsSinceEpoch() + 3600);

    QScopedPointer<HanchuReply> first(session.ensureValid());
    ASSERT_TRUE(waitFor(first.data()));
    EXPECT_EQ(first->error(), Hanchu::ErrorNoError);
    EXPECT_FALSE(session.isValid());

    setToken(QDateTime::currentSecsSinceEpoch() + 3 * 86400);
    QScopedPointer<HanchuReply> second(session.ensureValid());
    ASSERT_TRUE(waitFor(second.data()));
    EXPECT_EQ(cloud.requestCount(FakeCloud::loginPath()), 2);
    EXPECT_TRUE(session.isValid());
}

TEST_F(AuthSessionTest, RejectedTokenCausesOneRelogin)
{
    cloud.setResponse(FakeCloud::inverterPath(), FakeCloud::envelope(QJsonObject()));
    cloud.enqueueResponse(FakeCloud::inverterPath(), FakeCloud::Response{401, "{}", QNetworkReply::NoError, false});

    QScopedPointer<HanchuReply> rejected(session.sendRequest(HanchuCloudConnection::EndpointParallelPowerChart, QJsonObject()));
    ASSERT_TRUE(waitFor(rejected.data()));
    EXPECT_EQ(rejected->error(), Hanchu::ErrorAuthentication);
    EXPECT_FALSE(session.isValid());

    QScopedPointer<HanchuReply> retried(session.sendRequest(HanchuCloudConnection::EndpointParallelPowerChart, QJsonObject()));
    ASSERT_TRUE(waitFor(retried.data()));
    EXPECT_EQ(retried->error(), Hanchu::ErrorNoError);
    EXPECT_EQ(cloud.requestCount(FakeCloud::loginPath()), 2);
    EXPECT_EQ(cloud.requestCount(FakeCloud::inverterPath()), 2);

    // The token travels with the request
    EXPECT_FALSE(cloud.requests(FakeCloud::inverterPath()).last().token.isEmpty());
}

TEST_F(AuthSessionTest, LateRejectionOfReplacedTokenIsIgnored)
{
    cloud.setResponse(FakeCloud::inverterPath(), FakeCloud::holdResponse());
    cloud.setResponse(FakeCloud::batteryPath(), "{}", 401);

    QSignalSpy requestSpy(&cloud, &FakeCloud::requestReceived);
    QScopedPointer<HanchuReply> slow(session.sendRequest(HanchuCloudConnection::EndpointParallelPowerChart, QJsonObject()));
    while (cloud.requestCount(FakeCloud::inverterPath()) < 1)
        ASSERT_TRUE(requestSpy.wait(2000));

    QByteArray firstToken = cloud.requests(FakeCloud::inverterPath()).first().token;

    QScopedPointer<HanchuReply> rejected(session.sendRequest(HanchuCloudConnection::EndpointRackData, QJsonObject()));
    ASSERT_TRUE(waitFor(rejected.data()));
    EXPECT_FALSE(session.isValid());

    setToken(QDateTime::currentSecsSinceEpoch() + 5 * 86400);
    QScopedPointer<HanchuReply> renewed(session.ensureValid());
    ASSERT_TRUE(waitFor(renewed.data()));
    ASSERT_NE(renewed->result().toString().toUtf8(), firstToken);

    // The request still running with the first token gets rejected now
    FakeNetworkReply *held = cloud.takeHeldReply();
    ASSERT_NE(held, nullptr);
    held->respond(401, "{}");
    ASSERT_TRUE(waitFor(slow.data()));
    EXPECT_EQ(slow->error(), Hanchu::ErrorAuthentication);

    EXPECT_TRUE(session.isValid());
    QScopedPointer<HanchuReply> next(session.ensureValid());
    ASSERT_TRUE(waitFor(next.data()));
    EXPECT_EQ(next->result(), renewed->result());
    EXPECT_EQ(cloud.requestCount(FakeCloud::loginPath()), 2);
}

TEST_F(AuthSessionTest, FailedLoginIsAuthenticationError)
{
    cloud.setResponse(FakeCloud::loginPath(), FakeCloud::envelope(QJsonValue(), false, 500, "Wrong password"));
    QSignalSpy loginSpy(&session, &HanchuAuthSession::loginFinished);

    QScopedPointer<HanchuReply> reply(session.sendRequest(HanchuCloudConnection::EndpointParallelPowerChart, QJsonObject()));
    ASSERT_TRUE(waitFor(reply.data()));

    EXPECT_EQ(reply->error(), Hanchu::ErrorAuthentication);
    EXPECT_TRUE(reply->errorString().contains("Wrong password"));
    EXPECT_EQ(cloud.requestCount(FakeCloud::inverterPath()), 0);
    ASSERT_EQ(loginSpy.count(), 1);
    EXPECT_FALSE(loginSpy.first().first().toBool());
}

TEST_F(AuthSessionTest, UnreachableCloudDuringLoginIsAuthenticationError)
{
    FakeCloud::Response unreachable;
    unreachable.error = QNetworkReply::ConnectionRefusedError;
    cloud.setResponse(FakeCloud::loginPath(), unreachable);

    QScopedPointer<HanchuReply> reply(session.ensureValid());
    ASSERT_TRUE(waitFor(reply.data()));
    EXPECT_EQ(reply->error(), Hanchu::ErrorAuthentication);
}

TEST_F(AuthSessionTest, AbortFailsWaitingCallers)
{
    cloud.setResponse(FakeCloud::loginPath(), FakeCloud::holdResponse());

    QScopedPointer<HanchuReply> reply(session.ensureValid());
    session.abort();

    ASSERT_TRUE(waitFor(reply.data()));
    EXPECT_EQ(reply->error(), Hanchu::ErrorAborted);
    EXPECT_FALSE(session.loginPending());
    EXPECT_EQ(cloud.abortedCount(), 1);
}

TEST_F(AuthSessionTest, TokenExpiryIsDecoded)
{
    qint64 expiry = 1893456000;
    EXPECT_EQ(HanchuAuthSession::tokenExpiry(FakeCloud::makeToken(expiry)).toSecsSinceEpoch(), expiry);
    EXPECT_FALSE(HanchuAuthSession::tokenExpiry("opaque-session-id").isValid());
    EXPECT_FALSE(HanchuAuthSession::tokenExpiry(FakeCloud::makeToken(std::numeric_limits<qint64>::max())).isValid());
}
