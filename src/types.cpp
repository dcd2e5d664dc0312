#include "pgpcard-qt/types.h"

namespace PgpCard {

QString keyTypeName(KeyType keyType)
{
    switch (keyType) {
    case KeyType::Signature:
        return QStringLiteral("Sig");
    case KeyType::Decryption:
        return QStringLiteral("Dec");
    case KeyType::Authentication:
        return QStringLiteral("Aut");
    case KeyType::Attestation:
        return QStringLiteral("Att");
    }
    return QStringLiteral("KeyType(%1)").arg(static_cast<int>(keyType));
}

QString keyOriginName(KeyOrigin origin)
{
    switch (origin) {
    case KeyOrigin::NotPresent:
        return QStringLiteral("not present");
    case KeyOrigin::Empty:
        return QStringLiteral("empty");
    case KeyOrigin::Generated:
        return QStringLiteral("generated");
    case KeyOrigin::Imported:
        return QStringLiteral("imported");
    }
    return QStringLiteral("unknown");
}

QString secureMessagingName(SecureMessagingAlgorithm algorithm)
{
    switch (algorithm) {
    case SecureMessagingAlgorithm::None:
        return QStringLiteral("none");
    case SecureMessagingAlgorithm::AES128:
        return QStringLiteral("AES-128");
    case SecureMessagingAlgorithm::AES256:
        return QStringLiteral("AES-256");
    case SecureMessagingAlgorithm::SCP11b:
        return QStringLiteral("SCP11b");
    }
    return QStringLiteral("unknown");
}

} // namespace PgpCard
