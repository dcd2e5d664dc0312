#include "pgpcard-qt/result.h"

namespace PgpCard {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("None");
    case ErrorCode::KeyNotPresent:
        return QStringLiteral("KeyNotPresent");
    case ErrorCode::NoSuchTag:
        return QStringLiteral("NoSuchTag");
    case ErrorCode::NoSuchAlgorithm:
        return QStringLiteral("NoSuchAlgorithm");
    case ErrorCode::UnknownKeyOrigin:
        return QStringLiteral("UnknownKeyOrigin");
    case ErrorCode::NotFound:
        return QStringLiteral("NotFound");
    case ErrorCode::TooShort:
        return QStringLiteral("TooShort");
    case ErrorCode::MalformedTlv:
        return QStringLiteral("MalformedTlv");
    case ErrorCode::TransportError:
        return QStringLiteral("TransportError");
    case ErrorCode::CardError:
        return QStringLiteral("CardError");
    case ErrorCode::CryptoError:
        return QStringLiteral("CryptoError");
    }
    return QStringLiteral("Unknown");
}

QString Error::toString() const
{
    if (m_code == ErrorCode::None) {
        return QString();
    }
    return QStringLiteral("%1 [%2]").arg(m_message, errorCodeName(m_code));
}

} // namespace PgpCard
