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

#include "hanchurequestcipher.h"
#include "loggingcategories.h"

#include <QScopedPointer>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

NYMEA_LOGGING_CATEGORY(dcHanchuCipher, "HanchuCipher")

// Key and IV of the web application (the IV equals the key)
static const QByteArray s_aesKey("9z64Qr8mZH7Pg8d1");

static const char s_publicKey[] =
        "-----BEGIN PUBLIC KEY-----\n"
        "MIGfMA0GCSqGSIb3DQEBAQUAA4GNADCBiQKBgQCVg7RFDLMGM4O98d1zWKI5RQan\n"
        "jci3iY4qlpgsH76fUn3GnZtqjbRk37lCQDv6AhgPNXRPpty81+g909/c4yzySKaP\n"
        "CcDZv7KdCRB1mVxkq+0z4EtKx9EoTXKnFSDBaYi2srdal1tM3gGOsNTDN58CzYPX\n"
        "nDGPX7+EHS1Mm4aVDQIDAQAB\n"
        "-----END PUBLIC KEY-----\n";

struct CipherContextDeleter
{
    static void cleanup(EVP_CIPHER_CTX *context) { EVP_CIPHER_CTX_free(context); }
};

struct KeyDeleter
{
    static void cleanup(EVP_PKEY *key) { EVP_PKEY_free(key); }
};

struct KeyContextDeleter
{
    static void cleanup(EVP_PKEY_CTX *context) { EVP_PKEY_CTX_free(context); }
};

struct BioDeleter
{
    static void cleanup(BIO *bio) { BIO_free(bio); }
};

static QByteArray runAesCipher(const QByteArray &input, bool encrypt)
{
    QScopedPointer<EVP_CIPHER_CTX, CipherContextDeleter> context(EVP_CIPHER_CTX_new());
    if (context.isNull())
        return QByteArray();

    const unsigned char *key = reinterpret_cast<const unsigned char *>(s_aesKey.constData());
    if (EVP_CipherInit_ex(context.data(), EVP_aes_128_cbc(), nullptr, key, key, encrypt ? 1 : 0) != 1)
        return QByteArray();

    QByteArray output(input.size() + EVP_MAX_BLOCK_LENGTH, Qt::Uninitialized);
    int length = 0;
    int finalLength = 0;
    if (EVP_CipherUpdate(context.data(), reinterpret_cast<unsigned char *>(output.data()), &length,
                         reinterpret_cast<const unsigned char *>(input.constData()), input.size()) != 1)
        return QByteArray();

    if (EVP_CipherFinal_ex(context.data(), reinterpret_cast<unsigned char *>(output.data()) + length, &finalLength) != 1)
        return QByteArray();

    output.resize(length + finalLength);
    return output;
}

QByteArray HanchuRequestCipher::encryptPayload(const QByteArray &plainText)
{
    QByteArray cipherText = runAesCipher(plainText, true);
    if (cipherText.isEmpty()) {
        qCWarning(dcHanchuCipher()) << "Failed to encrypt request payload";
        return QByteArray();
    }

    return cipherText.toBase64();
}

QByteArray HanchuRequestCipher::decryptPayload(const QByteArray &cipherText)
{
    QByteArray plainText = runAesCipher(QByteArray::fromBase64(cipherText), false);
    if (plainText.isEmpty())
        qCWarning(dcHanchuCipher()) << "Failed to decrypt request payload";

    return plainText;
}

QByteArray HanchuRequestCipher::encryptPassword(const QString &password)
{
    QScopedPointer<BIO, BioDeleter> bio(BIO_new_mem_buf(s_publicKey, -1));
    if (bio.isNull())
        return QByteArray();

    QScopedPointer<EVP_PKEY, KeyDeleter> key(PEM_read_bio_PUBKEY(bio.data(), nullptr, nullptr, nullptr));
    if (key.isNull()) {
        qCWarning(dcHanchuCipher()) << "Could not load the public key of the web application";
        return QByteArray();
    }

    QScopedPointer<EVP_PKEY_CTX, KeyContextDeleter> context(EVP_PKEY_CTX_new(key.data(), nullptr));
    if (context.isNull() || EVP_PKEY_encrypt_init(context.data()) != 1
            || EVP_PKEY_CTX_set_rsa_padding(context.data(), RSA_PKCS1_PADDING) != 1) {
        qCWarning(dcHanchuCipher()) << "Could not set up the password encryption";
        return QByteArray();
    }

    const QByteArray plainText = password.toUtf8();
    const unsigned char *input = reinterpret_cast<const unsigned char *>(plainText.constData());
    size_t length = 0;
    if (EVP_PKEY_encrypt(context.data(), nullptr, &length, input, plainText.size()) != 1)
        return QByteArray();

    QByteArray cipherText(static_cast<int>(length), Qt::Uninitialized);
    if (EVP_PKEY_encrypt(context.data(), reinterpret_cast<unsigned char *>(cipherText.data()), &length, input, plainText.size()) != 1) {
        qCWarning(dcHanchuCipher()) << "Failed to encrypt the password";
        return QByteArray();
    }

    cipherText.resize(static_cast<int>(length));
    return cipherText.toBase64();
}
