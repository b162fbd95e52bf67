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

#include "hanchurequestcipher.h"

TEST(RequestCipher, EncryptsLikeTheWebApplication)
{
    EXPECT_EQ(HanchuRequestCipher::encryptPayload("{\"sn\":\"H016A1234567\"}"), QByteArray("fnEI56pfy3yZ2i6QclHBPfLG0aBYGW3JENeNLFm372A="));
    EXPECT_EQ(HanchuRequestCipher::decryptPayload("fnEI56pfy3yZ2i6QclHBPfLG0aBYGW3JENeNLFm372A="), QByteArray("{\"sn\":\"H016A1234567\"}"));
}

TEST(RequestCipher, EmptyPayloadIsPadded)
{
    EXPECT_EQ(HanchuRequestCipher::encryptPayload(QByteArray()), QByteArray("rVj5BZrRMpVUld3xDB/aWQ=="));
}

TEST(RequestCipher, GarbageDoesNotDecrypt)
{
    EXPECT_TRUE(HanchuRequestCipher::decryptPayload("bm90IGVuY3J5cHRlZA==").isEmpty());
}

TEST(RequestCipher, PasswordIsEncryptedWithRsa)
{
    QByteArray first = HanchuRequestCipher::encryptPassword("secret");
    QByteArray second = HanchuRequestCipher::encryptPassword("secret");

    // 1024 bit key, randomized padding
    EXPECT_EQ(QByteArray::fromBase64(first).size(), 128);
    EXPECT_NE(first, second);
}
