#include "pgpcard-qt/types_parser.h"
#include "pgpcard-qt/byte_utils.h"

namespace PgpCard {

namespace {

const QString NAME_SEPARATOR = QStringLiteral("<<");

// Algorithm ids 1..3: RSA (OpenPGP card 3.4, 4.4.3.9)
constexpr uint8_t ALGORITHM_RSA_FIRST = 0x01;
constexpr uint8_t ALGORITHM_RSA_LAST = 0x03;
constexpr int ALGORITHM_RSA_MIN_LENGTH = 3;
constexpr int ALGORITHM_FIELD_WIDTH = 4;

} // anonymous namespace

QString parseCardHolderName(const QByteArray& data)
{
    if (data.isEmpty()) {
        return NameNotSet;
    }

    const QString name = QString::fromUtf8(data);
    if (name.isEmpty()) {
        return NameNotSet;
    }

    QString result;

    // Everything after the first << comes first
    int surnameEnd = name.indexOf(NAME_SEPARATOR);
    if (surnameEnd >= 0) {
        const QString forename = name.mid(surnameEnd + NAME_SEPARATOR.size());
        result.append(forename);
        if (!forename.isEmpty()) {
            result.append(QLatin1Char('\n'));
        }
    } else {
        surnameEnd = name.size();
    }

    QString surname = name.left(surnameEnd);
    surname.replace(QLatin1Char('<'), QLatin1Char(' '));
    result.append(surname);

    return result;
}

Result<QString> parseAlgorithmAttributes(const QByteArray& data)
{
    Result<uint8_t> id = ByteUtils::byteAt(data, 1);
    if (!id) {
        return Result<QString>::error(id.errorInfo());
    }

    if (id.value() >= ALGORITHM_RSA_FIRST && id.value() <= ALGORITHM_RSA_LAST) {
        if (data.size() < ALGORITHM_RSA_MIN_LENGTH) {
            return Result<QString>::error(ErrorCode::NoSuchAlgorithm,
                QStringLiteral("RSA attributes have %1 bytes, expected at least %2")
                    .arg(data.size()).arg(ALGORITHM_RSA_MIN_LENGTH));
        }

        // bytes 2-3: modulus length in bits
        const uint16_t bits = ByteUtils::toUint16(data.mid(1, 2));
        return Result<QString>::success(QStringLiteral("RSA %1").arg(bits));
    }

    return Result<QString>::success(
        QStringLiteral("Alg=%1").arg(static_cast<int>(id.value()), -ALGORITHM_FIELD_WIDTH));
}

Result<KeyOrigin> parseKeyOrigin(uint8_t value)
{
    if (value > static_cast<uint8_t>(KeyOriginLast)) {
        return Result<KeyOrigin>::error(ErrorCode::UnknownKeyOrigin,
            QStringLiteral("key origin %1 > %2")
                .arg(static_cast<int>(value)).arg(static_cast<int>(KeyOriginLast)));
    }
    return Result<KeyOrigin>::success(static_cast<KeyOrigin>(value));
}

} // namespace PgpCard
