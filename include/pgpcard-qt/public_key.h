#pragma once

#include "result.h"
#include "tlv.h"
#include "types.h"
#include <QByteArray>
#include <QString>

namespace PgpCard {

/**
 * @brief Public key of a card key slot
 *
 * Decoded from the public key template (7F49) returned by
 * GENERATE ASYMMETRIC KEY PAIR in "read" mode (P1 = 81).
 */
class PublicKey {
public:
    PublicKey() = default;

    /**
     * @brief Decode a 7F49 template
     * @param keyType Slot the key was read from
     * @param tags Parsed response
     * @return Key, or NoSuchTag if neither RSA nor EC components are present
     */
    static Result<PublicKey> parse(KeyType keyType, const TLV::TagMap& tags);

    KeyType keyType() const { return m_keyType; }
    QByteArray modulus() const { return m_modulus; }
    QByteArray exponent() const { return m_exponent; }
    QByteArray ecPoint() const { return m_ecPoint; }

    bool isRsa() const { return !m_modulus.isEmpty() && !m_exponent.isEmpty(); }

    /**
     * @brief RSA modulus size in bits (leading zero bytes ignored), 0 for EC keys
     */
    int bits() const;

    /**
     * @brief Export as SubjectPublicKeyInfo PEM ("-----BEGIN PUBLIC KEY-----")
     * @return PEM text, NoSuchAlgorithm for non-RSA keys, CryptoError if OpenSSL fails
     */
    Result<QString> toPem() const;

private:
    KeyType m_keyType = KeyType::Signature;
    QByteArray m_modulus;
    QByteArray m_exponent;
    QByteArray m_ecPoint;
};

} // namespace PgpCard
