#pragma once

#include "../logging.h"
#include "../result.h"
#include "../tlv.h"
#include "../types.h"
#include <QByteArray>
#include <cstdint>

namespace PgpCard {

/**
 * @brief Optional card features advertised by the Extended Capabilities DO (6E.73.C0)
 *
 * OpenPGP card 3.4, 4.4.3.7. All fields default to "unsupported"; older
 * cards that omit the data object keep the defaults.
 */
class ExtendedCapabilities {
public:
    ExtendedCapabilities() = default;

    /**
     * @brief Decode the Extended Capabilities DO from a GET DATA response
     * @param tags Parsed Application Related Data
     * @param log Category for diagnostic output
     * @return Defaults if the tag is absent; error if it is present but malformed
     */
    static Result<ExtendedCapabilities> parse(const TLV::TagMap& tags, LoggingCategory log = lcPgpCard);

    /**
     * @brief Decode the raw 10-byte value
     */
    static Result<ExtendedCapabilities> parseValue(const QByteArray& value, LoggingCategory log = lcPgpCard);

    // Getters
    bool secureMessagingSupported() const { return m_secureMessagingSupported; }
    SecureMessagingAlgorithm secureMessaging() const { return m_secureMessaging; }
    bool getChallengeSupported() const { return m_getChallengeSupported; }
    uint16_t maximumChallengeLength() const { return m_maximumChallengeLength; }
    bool keyImportSupported() const { return m_keyImportSupported; }
    bool pwStatusChangeable() const { return m_pwStatusChangeable; }
    bool privateUseDOsSupported() const { return m_privateUseDOsSupported; }
    bool algorithmAttributesChangeable() const { return m_algorithmAttributesChangeable; }
    bool psoDecEncWithAesSupported() const { return m_psoDecEncWithAesSupported; }
    bool kdfSupported() const { return m_kdfSupported; }
    uint16_t maximumCardholderCertificateLength() const { return m_maximumCardholderCertificateLength; }
    uint16_t maximumSpecialDOLength() const { return m_maximumSpecialDOLength; }
    bool pinBlock2Supported() const { return m_pinBlock2Supported; }
    bool mseCommandSupported() const { return m_mseCommandSupported; }

private:
    Result<void> setSecureMessaging(uint8_t capabilities, const QByteArray& value);
    Result<void> setGetChallenge(uint8_t capabilities, const QByteArray& value);

    bool m_secureMessagingSupported = false;
    SecureMessagingAlgorithm m_secureMessaging = SecureMessagingAlgorithm::None;
    bool m_getChallengeSupported = false;
    uint16_t m_maximumChallengeLength = 0;
    bool m_keyImportSupported = false;
    bool m_pwStatusChangeable = false;
    bool m_privateUseDOsSupported = false;
    bool m_algorithmAttributesChangeable = false;
    bool m_psoDecEncWithAesSupported = false;
    bool m_kdfSupported = false;
    uint16_t m_maximumCardholderCertificateLength = 0;
    uint16_t m_maximumSpecialDOLength = 0;
    bool m_pinBlock2Supported = false;
    bool m_mseCommandSupported = false;
};

} // namespace PgpCard
