#include "pgpcard-qt/types/extended_capabilities.h"
#include "pgpcard-qt/byte_utils.h"
#include "pgpcard-qt/logging.h"
#include <QDebug>

namespace PgpCard {

namespace {

// Bytes 9 and 10 only use bit 1
constexpr uint8_t LOWEST_BIT = 0x01;

} // anonymous namespace

Result<ExtendedCapabilities> ExtendedCapabilities::parse(const TLV::TagMap& tags, LoggingCategory log)
{
    if (!tags.contains(Tags::ExtendedCapabilities)) {
        // Cards before 2.0 have no Extended Capabilities
        qCDebug(log) << "ExtendedCapabilities: tag" << Tags::ExtendedCapabilities << "absent, using defaults";
        return Result<ExtendedCapabilities>::success(ExtendedCapabilities());
    }

    return parseValue(tags.value(Tags::ExtendedCapabilities), log);
}

Result<ExtendedCapabilities> ExtendedCapabilities::parseValue(const QByteArray& value, LoggingCategory log)
{
    using R = Result<ExtendedCapabilities>;
    ExtendedCapabilities caps;

    qCDebug(log) << "ExtendedCapabilities: Parsing data:" << value.toHex();

    // byte 1 is a bit field
    Result<uint8_t> flags = ByteUtils::byteAt(value, 1);
    if (!flags) {
        return R::error(flags.errorInfo().wrap(QStringLiteral("extended capabilities")));
    }
    const uint8_t capabilities = flags.value();

    // byte 1 bit 8, byte 2
    Result<void> sm = caps.setSecureMessaging(capabilities, value);
    if (!sm) {
        return R::error(sm.errorInfo().wrap(QStringLiteral("extended capabilities (secure messaging)")));
    }

    // byte 1 bit 7, bytes 3-4
    Result<void> challenge = caps.setGetChallenge(capabilities, value);
    if (!challenge) {
        return R::error(challenge.errorInfo().wrap(QStringLiteral("extended capabilities (get challenge)")));
    }

    // byte 1 bits 6..1
    caps.m_keyImportSupported = hasCapability(capabilities, ExtendedCapability::KeyImport);
    caps.m_pwStatusChangeable = hasCapability(capabilities, ExtendedCapability::PWStatusChangeable);
    caps.m_privateUseDOsSupported = hasCapability(capabilities, ExtendedCapability::PrivateUseDOs);
    caps.m_algorithmAttributesChangeable = hasCapability(capabilities, ExtendedCapability::AlgorithmAttributesChangeable);
    caps.m_psoDecEncWithAesSupported = hasCapability(capabilities, ExtendedCapability::PSODecEncWithAES);
    caps.m_kdfSupported = hasCapability(capabilities, ExtendedCapability::KDFSupported);

    // bytes 5-6
    Result<QByteArray> certLength = ByteUtils::bytesAt(value, 5, 6);
    if (!certLength) {
        return R::error(certLength.errorInfo().wrap(QStringLiteral("extended capabilities (maximum cardholder certificate length)")));
    }
    caps.m_maximumCardholderCertificateLength = ByteUtils::toUint16(certLength.value());

    // bytes 7-8
    Result<QByteArray> specialLength = ByteUtils::bytesAt(value, 7, 8);
    if (!specialLength) {
        return R::error(specialLength.errorInfo().wrap(QStringLiteral("extended capabilities (maximum special DO length)")));
    }
    caps.m_maximumSpecialDOLength = ByteUtils::toUint16(specialLength.value());

    // byte 9
    Result<uint8_t> pinBlock = ByteUtils::byteAt(value, 9);
    if (!pinBlock) {
        return R::error(pinBlock.errorInfo().wrap(QStringLiteral("extended capabilities (PIN block 2 format)")));
    }
    caps.m_pinBlock2Supported = (pinBlock.value() & LOWEST_BIT) == LOWEST_BIT;

    // byte 10
    Result<uint8_t> mse = ByteUtils::byteAt(value, 10);
    if (!mse) {
        return R::error(mse.errorInfo().wrap(QStringLiteral("extended capabilities (MSE command)")));
    }
    caps.m_mseCommandSupported = (mse.value() & LOWEST_BIT) == LOWEST_BIT;

    qCDebug(log) << "ExtendedCapabilities: SM:" << caps.m_secureMessagingSupported
                       << secureMessagingName(caps.m_secureMessaging)
                       << "challenge:" << caps.m_maximumChallengeLength
                       << "cert:" << caps.m_maximumCardholderCertificateLength
                       << "special DO:" << caps.m_maximumSpecialDOLength;

    return R::success(caps);
}

Result<void> ExtendedCapabilities::setSecureMessaging(uint8_t capabilities, const QByteArray& value)
{
    if (!hasCapability(capabilities, ExtendedCapability::SecureMessaging)) {
        return Result<void>::success();
    }

    Result<uint8_t> algorithm = ByteUtils::byteAt(value, 2);
    if (!algorithm) {
        return Result<void>::error(algorithm.errorInfo());
    }

    if (algorithm.value() > static_cast<uint8_t>(SecureMessagingAlgorithmLast)) {
        return Result<void>::error(ErrorCode::NoSuchAlgorithm,
            QStringLiteral("secure messaging algorithm %1 > %2")
                .arg(static_cast<int>(algorithm.value())).arg(static_cast<int>(SecureMessagingAlgorithmLast)));
    }

    m_secureMessagingSupported = true;
    m_secureMessaging = static_cast<SecureMessagingAlgorithm>(algorithm.value());
    return Result<void>::success();
}

Result<void> ExtendedCapabilities::setGetChallenge(uint8_t capabilities, const QByteArray& value)
{
    if (!hasCapability(capabilities, ExtendedCapability::GetChallenge)) {
        return Result<void>::success();
    }

    Result<QByteArray> length = ByteUtils::bytesAt(value, 3, 4);
    if (!length) {
        return Result<void>::error(length.errorInfo());
    }

    if (length.value().size() != 2) {
        return Result<void>::error(ErrorCode::TooShort,
            QStringLiteral("maximum challenge length has %1 bytes, expected 2").arg(length.value().size()));
    }

    m_getChallengeSupported = true;
    m_maximumChallengeLength = ByteUtils::toUint16(length.value());
    return Result<void>::success();
}

} // namespace PgpCard
