#pragma once

#include <QString>
#include <cstdint>

namespace PgpCard {

/**
 * @brief Key slots of the OpenPGP application
 *
 * The ordinal is the index into packed per-key data objects
 * (fingerprints, creation dates, origins).
 */
enum class KeyType : uint8_t {
    Signature = 0,
    Decryption = 1,
    Authentication = 2,
    Attestation = 3
};

/**
 * @brief Provenance of a key
 */
enum class KeyOrigin : uint8_t {
    NotPresent = 0,
    Empty = 1,
    Generated = 2,
    Imported = 3
};

constexpr KeyOrigin KeyOriginLast = KeyOrigin::Imported;

/**
 * @brief Secure messaging algorithm, Extended Capabilities byte 2
 */
enum class SecureMessagingAlgorithm : uint8_t {
    None = 0,
    AES128 = 1,
    AES256 = 2,
    SCP11b = 3
};

constexpr SecureMessagingAlgorithm SecureMessagingAlgorithmLast = SecureMessagingAlgorithm::SCP11b;

/**
 * @brief Extended Capabilities byte 1 flags (OpenPGP card 3.4, 4.4.3.7)
 */
enum class ExtendedCapability : uint8_t {
    SecureMessaging = 0x80,              ///< bit 8
    GetChallenge = 0x40,                 ///< bit 7
    KeyImport = 0x20,                    ///< bit 6
    PWStatusChangeable = 0x10,           ///< bit 5
    PrivateUseDOs = 0x08,                ///< bit 4
    AlgorithmAttributesChangeable = 0x04,///< bit 3
    PSODecEncWithAES = 0x02,             ///< bit 2
    KDFSupported = 0x01                  ///< bit 1
};

inline bool hasCapability(uint8_t capabilities, ExtendedCapability cap) {
    const auto flag = static_cast<uint8_t>(cap);
    return (capabilities & flag) == flag;
}

/**
 * @brief Ordinal of a key slot
 */
constexpr int keyIndex(KeyType keyType) {
    return static_cast<int>(keyType);
}

/// Short name ("Sig", "Dec", "Aut", "Att")
QString keyTypeName(KeyType keyType);

/// Display name of a key origin ("not present", "empty", "generated", "imported")
QString keyOriginName(KeyOrigin origin);

/// Display name of a secure messaging algorithm
QString secureMessagingName(SecureMessagingAlgorithm algorithm);

/**
 * @brief Dotted tag paths of the data objects read from the card
 *
 * OpenPGP card 3.4, 4.4.1 "DOs for GET DATA".
 */
namespace Tags {
    inline const QString ApplicationIdentifier = QStringLiteral("6E.4F");
    inline const QString CardholderName = QStringLiteral("65.5B");
    inline const QString ExtendedCapabilities = QStringLiteral("6E.73.C0");
    inline const QString SignatureAlgorithmAttributes = QStringLiteral("6E.73.C1");
    inline const QString DecryptionAlgorithmAttributes = QStringLiteral("6E.73.C2");
    inline const QString AuthenticationAlgorithmAttributes = QStringLiteral("6E.73.C3");
    inline const QString Fingerprints = QStringLiteral("6E.73.C5");
    inline const QString CreationDates = QStringLiteral("6E.73.CD");
    inline const QString KeyOrigins = QStringLiteral("6E.73.DE");
    inline const QString PublicKeyModulus = QStringLiteral("7F49.81");
    inline const QString PublicKeyExponent = QStringLiteral("7F49.82");
    inline const QString PublicKeyEcPoint = QStringLiteral("7F49.86");
}

// Packed data object widths
constexpr int FingerprintLength = 20;
constexpr int KeyIdLength = 8;
constexpr int CreationDateLength = 4;
constexpr int KeyOriginLength = 1;
constexpr int ApplicationIdentifierMinLength = 14;

// APDU command parameters
namespace APDU {
    // Class bytes
    constexpr uint8_t CLA_ISO7816 = 0x00;

    // Instruction bytes
    constexpr uint8_t INS_SELECT = 0xA4;
    constexpr uint8_t INS_GET_DATA = 0xCA;
    constexpr uint8_t INS_GET_RESPONSE = 0xC0;
    constexpr uint8_t INS_GENERATE_ASYMMETRIC_KEY_PAIR = 0x47;
    constexpr uint8_t INS_GET_VERSION = 0xF1;

    // P1 parameters
    constexpr uint8_t P1SelectByName = 0x04;
    constexpr uint8_t P1ReadPublicKey = 0x81;

    // GET DATA P1P2 for constructed DOs
    constexpr uint16_t DO_APPLICATION_RELATED_DATA = 0x006E;
    constexpr uint16_t DO_CARDHOLDER_RELATED_DATA = 0x0065;

    // Status words (OpenPGP card 3.4, 7.4)
    constexpr uint8_t SW1_MORE_DATA = 0x61;
    constexpr uint16_t SW_OK = 0x9000;
    constexpr uint16_t SW_TERMINATION_STATE = 0x6285;
    constexpr uint16_t SW_MEMORY_FAILURE = 0x6581;
    constexpr uint16_t SW_WRONG_LENGTH = 0x6700;
    constexpr uint16_t SW_SECURE_MESSAGING_NOT_SUPPORTED = 0x6882;
    constexpr uint16_t SW_LAST_COMMAND_EXPECTED = 0x6883;
    constexpr uint16_t SW_CHAINING_NOT_SUPPORTED = 0x6884;
    constexpr uint16_t SW_SECURITY_CONDITION_NOT_SATISFIED = 0x6982;
    constexpr uint16_t SW_AUTHENTICATION_METHOD_BLOCKED = 0x6983;
    constexpr uint16_t SW_CONDITIONS_NOT_SATISFIED = 0x6985;
    constexpr uint16_t SW_WRONG_DATA = 0x6A80;
    constexpr uint16_t SW_FILE_NOT_FOUND = 0x6A82;
    constexpr uint16_t SW_REFERENCED_DATA_NOT_FOUND = 0x6A88;
    constexpr uint16_t SW_INCORRECT_P1P2 = 0x6B00;
    constexpr uint16_t SW_INS_NOT_SUPPORTED = 0x6D00;
    constexpr uint16_t SW_CLA_NOT_SUPPORTED = 0x6E00;
    constexpr uint16_t SW_NO_PRECISE_DIAGNOSIS = 0x6F00;
}

} // namespace PgpCard
