#include "pgpcard-qt/public_key.h"
#include "pgpcard-qt/logging.h"
#include <QDebug>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/buffer.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>

namespace PgpCard {

namespace {

QString openSslError(const char* operation)
{
    const unsigned long code = ERR_get_error();
    char buffer[256] = {};
    if (code != 0) {
        ERR_error_string_n(code, buffer, sizeof(buffer));
    }
    return QStringLiteral("%1 failed: %2").arg(QLatin1String(operation), QLatin1String(buffer));
}

BIGNUM* toBignum(const QByteArray& bytes)
{
    return BN_bin2bn(reinterpret_cast<const unsigned char*>(bytes.constData()),
                     static_cast<int>(bytes.size()), nullptr);
}

} // anonymous namespace

Result<PublicKey> PublicKey::parse(KeyType keyType, const TLV::TagMap& tags)
{
    PublicKey key;
    key.m_keyType = keyType;
    key.m_modulus = tags.value(Tags::PublicKeyModulus);
    key.m_exponent = tags.value(Tags::PublicKeyExponent);
    key.m_ecPoint = tags.value(Tags::PublicKeyEcPoint);

    if (!key.isRsa() && key.m_ecPoint.isEmpty()) {
        return Result<PublicKey>::error(ErrorCode::NoSuchTag,
            QStringLiteral("public key(%1): no RSA or EC components in 7F49").arg(keyTypeName(keyType)));
    }

    qCDebug(lcPgpCard) << "PublicKey:" << keyTypeName(keyType)
                       << (key.isRsa() ? "RSA" : "EC") << "bits:" << key.bits();
    return Result<PublicKey>::success(key);
}

int PublicKey::bits() const
{
    if (!isRsa()) {
        return 0;
    }

    int first = 0;
    while (first < m_modulus.size() && m_modulus[first] == 0) {
        first++;
    }
    if (first == m_modulus.size()) {
        return 0;
    }

    int topBits = 0;
    for (uint8_t top = static_cast<uint8_t>(m_modulus[first]); top != 0; top >>= 1) {
        topBits++;
    }
    return (m_modulus.size() - first - 1) * 8 + topBits;
}

Result<QString> PublicKey::toPem() const
{
    if (!isRsa()) {
        return Result<QString>::error(ErrorCode::NoSuchAlgorithm,
            QStringLiteral("PEM export(%1): only RSA keys are supported").arg(keyTypeName(m_keyType)));
    }

    BIGNUM* n = toBignum(m_modulus);
    BIGNUM* e = toBignum(m_exponent);
    OSSL_PARAM_BLD* builder = OSSL_PARAM_BLD_new();
    OSSL_PARAM* params = nullptr;
    EVP_PKEY_CTX* ctx = nullptr;
    EVP_PKEY* pkey = nullptr;
    BIO* bio = nullptr;

    auto cleanup = [&]() {
        if (bio) BIO_free(bio);
        if (pkey) EVP_PKEY_free(pkey);
        if (ctx) EVP_PKEY_CTX_free(ctx);
        if (params) OSSL_PARAM_free(params);
        if (builder) OSSL_PARAM_BLD_free(builder);
        if (e) BN_free(e);
        if (n) BN_free(n);
    };
    auto fail = [&](const char* operation) {
        const QString message = openSslError(operation);
        qCWarning(lcPgpCard) << "PublicKey:" << message;
        cleanup();
        return Result<QString>::error(ErrorCode::CryptoError, message);
    };

    if (!n || !e || !builder) {
        return fail("BN_bin2bn");
    }

    if (OSSL_PARAM_BLD_push_BN(builder, OSSL_PKEY_PARAM_RSA_N, n) != 1
        || OSSL_PARAM_BLD_push_BN(builder, OSSL_PKEY_PARAM_RSA_E, e) != 1) {
        return fail("OSSL_PARAM_BLD_push_BN");
    }

    params = OSSL_PARAM_BLD_to_param(builder);
    if (!params) {
        return fail("OSSL_PARAM_BLD_to_param");
    }

    ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
    if (!ctx || EVP_PKEY_fromdata_init(ctx) <= 0) {
        return fail("EVP_PKEY_fromdata_init");
    }

    if (EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params) <= 0) {
        return fail("EVP_PKEY_fromdata");
    }

    bio = BIO_new(BIO_s_mem());
    if (!bio || PEM_write_bio_PUBKEY(bio, pkey) != 1) {
        return fail("PEM_write_bio_PUBKEY");
    }

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(bio, &buffer);
    const QString pem = QString::fromLatin1(buffer->data, static_cast<int>(buffer->length));

    cleanup();
    return Result<QString>::success(pem);
}

} // namespace PgpCard
