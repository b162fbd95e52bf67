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

#ifndef HANCHUREQUESTCIPHER_H
#define HANCHUREQUESTCIPHER_H

#include <QByteArray>
#include <QString>

/**
 * @brief Encryption of request bodies as expected by the Hanchu web API.
 *
 * Every request body is the compact JSON payload, encrypted with AES-128-CBC
 * (PKCS#7 padding, the IV equals the key) and Base64 encoded. The login password
 * is additionally encrypted with the RSA public key of the web application using
 * PKCS#1 v1.5 padding. Responses are not encrypted.
 *
 * All methods return an empty byte array on failure.
 */
class HanchuRequestCipher
{
public:
    static QByteArray encryptPayload(const QByteArray &plainText);
    static QByteArray decryptPayload(const QByteArray &cipherText);

    static QByteArray encryptPassword(const QString &password);
};

#endif // HANCHUREQUESTCIPHER_H
