#include "pgpcard-qt/card_data.h"
#include "pgpcard-qt/byte_utils.h"
#include "pgpcard-qt/types/key_slot_array.h"
#include "pgpcard-qt/types_parser.h"
#include <QDebug>
#include <QTimeZone>

namespace PgpCard {

namespace {

// Application identifier layout (OpenPGP card 3.4, 4.2.1), 0-based
constexpr int AID_RID_OFFSET = 0;
constexpr int AID_RID_LENGTH = 5;
constexpr int AID_APPLICATION = 5;
constexpr int AID_VERSION_MAJOR = 6;
constexpr int AID_VERSION_MINOR = 7;
constexpr int AID_MANUFACTURER_HIGH = 8;
constexpr int AID_MANUFACTURER_LOW = 9;
constexpr int AID_SERIAL_OFFSET = 10;
constexpr int AID_SERIAL_LENGTH = 4;

constexpr uint8_t APPLICATION_OPENPGP = 0x01;
constexpr uint8_t MANUFACTURER_YUBICO_HIGH = 0x00;
constexpr uint8_t MANUFACTURER_YUBICO_LOW = 0x06;

constexpr int SUMMARY_ALGORITHM_WIDTH = 8;
constexpr int SUMMARY_KEY_ID_WIDTH = KeyIdLength * 2;
constexpr int SUMMARY_FINGERPRINT_WIDTH = FingerprintLength * 2;

QString hexByte(const QByteArray& data, int index, int width)
{
    return QStringLiteral("%1")
        .arg(static_cast<int>(static_cast<uint8_t>(data[index])), width, 16, QLatin1Char('0'))
        .toUpper();
}

QString algorithmTag(KeyType keyType)
{
    switch (keyType) {
    case KeyType::Signature:
        return Tags::SignatureAlgorithmAttributes;
    case KeyType::Decryption:
        return Tags::DecryptionAlgorithmAttributes;
    case KeyType::Authentication:
        return Tags::AuthenticationAlgorithmAttributes;
    case KeyType::Attestation:
        break;
    }
    return QString();
}

QString operationName(const char* operation, KeyType keyType)
{
    return QStringLiteral("%1(%2)").arg(QLatin1String(operation), keyTypeName(keyType));
}

} // anonymous namespace

Result<CardData> CardData::parse(const TLV::TagMap& tags, const CardDataOptions& options)
{
    CardData data;
    data.m_tags = tags;
    data.m_log = options.log ? options.log : lcPgpCard;
    data.m_readerName = options.readerName;
    data.m_appletVersion = options.appletVersion;

    Result<void> aid = data.parseApplicationIdentifier();
    if (!aid) {
        qCWarning(data.m_log) << "CardData: application identifier:" << aid.error();
        return Result<CardData>::error(aid.errorInfo());
    }

    // Cardholder name is optional, an absent DO reads as "not set"
    data.m_cardHolder = parseCardHolderName(tags.value(Tags::CardholderName));
    qCDebug(data.m_log) << "CardData: Cardholder:" << data.m_cardHolder;

    Result<ExtendedCapabilities> caps = ExtendedCapabilities::parse(tags, data.m_log);
    if (!caps) {
        qCWarning(data.m_log) << "CardData: extended capabilities:" << caps.error();
        return Result<CardData>::error(caps.errorInfo());
    }
    data.m_capabilities = caps.value();

    qCDebug(data.m_log) << "CardData: Card selected:" << data.m_longName;
    return Result<CardData>::success(data);
}

Result<void> CardData::parseApplicationIdentifier()
{
    Result<QByteArray> tagValue = tag(Tags::ApplicationIdentifier, ApplicationIdentifierMinLength);
    if (!tagValue) {
        return Result<void>::error(tagValue.errorInfo());
    }
    const QByteArray& aid = tagValue.value();

    qCDebug(m_log) << "CardData: AID:" << aid.toHex();

    m_serial = hexByte(aid, AID_SERIAL_OFFSET, 0)
             + hexByte(aid, AID_SERIAL_OFFSET + 1, 2)
             + hexByte(aid, AID_SERIAL_OFFSET + 2, 2)
             + hexByte(aid, AID_SERIAL_OFFSET + 3, 2);
    m_serialNumber = ByteUtils::toUint32(aid.mid(AID_SERIAL_OFFSET, AID_SERIAL_LENGTH));

    m_rid = ByteUtils::toHex(aid.mid(AID_RID_OFFSET, AID_RID_LENGTH));

    m_application = hexByte(aid, AID_APPLICATION, 2);
    if (static_cast<uint8_t>(aid[AID_APPLICATION]) == APPLICATION_OPENPGP) {
        m_application += QStringLiteral(" (OpenPGP)");
    }

    m_version = hexByte(aid, AID_VERSION_MAJOR, 0) + QLatin1Char('.') + hexByte(aid, AID_VERSION_MINOR, 0);

    m_manufacturer = hexByte(aid, AID_MANUFACTURER_HIGH, 2) + hexByte(aid, AID_MANUFACTURER_LOW, 2);
    if (static_cast<uint8_t>(aid[AID_MANUFACTURER_HIGH]) == MANUFACTURER_YUBICO_HIGH
        && static_cast<uint8_t>(aid[AID_MANUFACTURER_LOW]) == MANUFACTURER_YUBICO_LOW) {
        m_manufacturer += QStringLiteral(" (YubiCo)");
    }

    m_longName = QStringLiteral("%1 SN %2 OpenPGP %3").arg(m_readerName, m_serial, m_version);

    return Result<void>::success();
}

Result<QByteArray> CardData::tag(const QString& path, int minLength) const
{
    const std::optional<int> length = m_tags.length(path);
    if (!length) {
        return Result<QByteArray>::error(ErrorCode::NoSuchTag,
            QStringLiteral("tag %1 not present").arg(path));
    }

    if (*length < minLength) {
        return Result<QByteArray>::error(ErrorCode::TooShort,
            QStringLiteral("tag %1 has %2 bytes, expected at least %3").arg(path).arg(*length).arg(minLength));
    }

    return Result<QByteArray>::success(m_tags.value(path));
}

Result<QString> CardData::algorithm(KeyType keyType) const
{
    const QString operation = operationName("algorithm", keyType);
    const QString path = algorithmTag(keyType);
    if (path.isEmpty()) {
        return Result<QString>::error(ErrorCode::NoSuchTag,
            QStringLiteral("%1: unsupported key type").arg(operation));
    }

    Result<QByteArray> data = tag(path, 1);
    if (!data) {
        return Result<QString>::error(data.errorInfo().wrap(operation));
    }

    Result<QString> name = parseAlgorithmAttributes(data.value());
    if (!name) {
        return Result<QString>::error(name.errorInfo().wrap(operation));
    }
    return name;
}

Result<QString> CardData::fingerprint(KeyType keyType) const
{
    const QString operation = operationName("fingerprint", keyType);

    Result<QByteArray> data = tag(Tags::Fingerprints, 0);
    if (!data) {
        return Result<QString>::error(data.errorInfo().wrap(operation));
    }

    Result<QByteArray> slot = FingerprintArray(data.value()).slice(keyType);
    if (!slot) {
        return Result<QString>::error(slot.errorInfo().wrap(operation));
    }

    return Result<QString>::success(ByteUtils::toHex(slot.value()));
}

Result<QString> CardData::keyId(KeyType keyType) const
{
    const QString operation = operationName("keyId", keyType);

    Result<QByteArray> data = tag(Tags::Fingerprints, 0);
    if (!data) {
        return Result<QString>::error(data.errorInfo().wrap(operation));
    }

    Result<QByteArray> slot = FingerprintArray(data.value()).slice(keyType);
    if (!slot) {
        return Result<QString>::error(slot.errorInfo().wrap(operation));
    }

    // Key ID is the low 64 bits of the fingerprint
    return Result<QString>::success(ByteUtils::toHex(slot.value().right(KeyIdLength)));
}

Result<QDateTime> CardData::creationDate(KeyType keyType) const
{
    const QString operation = operationName("creationDate", keyType);

    Result<QByteArray> data = tag(Tags::CreationDates, 0);
    if (!data) {
        return Result<QDateTime>::error(data.errorInfo().wrap(operation));
    }

    Result<QByteArray> slot = CreationDateArray(data.value()).slice(keyType);
    if (!slot) {
        return Result<QDateTime>::error(slot.errorInfo().wrap(operation));
    }

    // Seconds since Jan 1, 1970; 00000000 means "not specified"
    const qint64 seconds = ByteUtils::toUint32(slot.value());
    return Result<QDateTime>::success(QDateTime::fromSecsSinceEpoch(seconds, QTimeZone::utc()));
}

bool CardData::hasCreationDate(KeyType keyType) const
{
    Result<QByteArray> slot = CreationDateArray(m_tags.value(Tags::CreationDates)).slice(keyType);
    return slot && ByteUtils::toUint32(slot.value()) != 0;
}

Result<KeyOrigin> CardData::origin(KeyType keyType) const
{
    const QString operation = operationName("origin", keyType);

    const std::optional<int> length = hasTag(Tags::KeyOrigins);
    if (!length || *length == 0) {
        return Result<KeyOrigin>::error(ErrorCode::KeyNotPresent,
            QStringLiteral("%1: key origin not present").arg(operation));
    }

    Result<QByteArray> slot = KeyOriginArray(m_tags.value(Tags::KeyOrigins)).slice(keyType);
    if (!slot) {
        return Result<KeyOrigin>::error(slot.errorInfo().wrap(operation));
    }

    Result<KeyOrigin> origin = parseKeyOrigin(static_cast<uint8_t>(slot.value()[0]));
    if (!origin) {
        qCWarning(m_log) << "CardData:" << operation << origin.error();
        return Result<KeyOrigin>::error(origin.errorInfo().wrap(operation));
    }
    return origin;
}

QString CardData::keySummary(KeyType keyType) const
{
    const QString date = hasCreationDate(keyType)
        ? creationDate(keyType).value().toString(Qt::ISODate)
        : QString();

    Result<KeyOrigin> keyOrigin = origin(keyType);

    return QStringLiteral("  %1  %2  %3  %4  %5  %6")
        .arg(keyTypeName(keyType),
             algorithm(keyType).valueOr(QString()).leftJustified(SUMMARY_ALGORITHM_WIDTH),
             keyId(keyType).valueOr(QString()).leftJustified(SUMMARY_KEY_ID_WIDTH),
             fingerprint(keyType).valueOr(QString()).leftJustified(SUMMARY_FINGERPRINT_WIDTH),
             date,
             keyOrigin ? keyOriginName(keyOrigin.value()) : QString());
}

QString CardData::toString() const
{
    QString result;
    result += QLatin1Char('\n');
    result += QStringLiteral("  Card:            %1\n").arg(m_longName);
    result += QStringLiteral("  RID:             %1\n").arg(m_rid);
    result += QStringLiteral("  Application:     %1\n").arg(m_application);
    result += QStringLiteral("  Version:         %1\n").arg(m_version);
    result += QStringLiteral("  Manufacturer:    %1\n").arg(m_manufacturer);
    result += QStringLiteral("  Serial Number:   %1\n").arg(m_serial);
    result += QStringLiteral("  Cardholder Name: %1\n").arg(m_cardHolder);
    return result;
}

// OptionalCardData

namespace {

template<typename T>
Result<T> notPresent(const char* operation, KeyType keyType)
{
    return Result<T>::error(ErrorCode::KeyNotPresent,
        QStringLiteral("%1: card data not read").arg(operationName(operation, keyType)));
}

} // anonymous namespace

Result<QString> OptionalCardData::algorithm(KeyType keyType) const
{
    return m_data ? m_data->algorithm(keyType) : notPresent<QString>("algorithm", keyType);
}

Result<QString> OptionalCardData::fingerprint(KeyType keyType) const
{
    return m_data ? m_data->fingerprint(keyType) : notPresent<QString>("fingerprint", keyType);
}

Result<QString> OptionalCardData::keyId(KeyType keyType) const
{
    return m_data ? m_data->keyId(keyType) : notPresent<QString>("keyId", keyType);
}

Result<QDateTime> OptionalCardData::creationDate(KeyType keyType) const
{
    return m_data ? m_data->creationDate(keyType) : notPresent<QDateTime>("creationDate", keyType);
}

Result<KeyOrigin> OptionalCardData::origin(KeyType keyType) const
{
    return m_data ? m_data->origin(keyType) : notPresent<KeyOrigin>("origin", keyType);
}

Result<QString> OptionalCardData::toString() const
{
    if (!m_data) {
        return Result<QString>::error(ErrorCode::KeyNotPresent, QStringLiteral("toString: card data not read"));
    }
    return Result<QString>::success(m_data->toString());
}

} // namespace PgpCard
