#include "pgpcard-qt/command_set.h"
#include "pgpcard-qt/byte_utils.h"
#include "pgpcard-qt/logging.h"
#include "pgpcard-qt/tlv.h"
#include <QDebug>
#include <QStringList>
#include <stdexcept>

namespace PgpCard {

// AID prefix of the OpenPGP application: RID D2 76 00 01 24, PIX 01
static const QByteArray OPENPGP_AID = QByteArray::fromHex("D27600012401");

// Upper bound on GET RESPONSE rounds for one command
static const int MAX_GET_RESPONSE = 64;

static QByteArray controlReferenceTemplate(KeyType keyType)
{
    switch (keyType) {
    case KeyType::Signature:
        return QByteArray::fromHex("B600");
    case KeyType::Decryption:
        return QByteArray::fromHex("B800");
    case KeyType::Authentication:
        return QByteArray::fromHex("A400");
    case KeyType::Attestation:
        return QByteArray::fromHex("B603840181");
    }
    return QByteArray();
}

CommandSet::CommandSet(std::shared_ptr<IChannel> channel, CardDataOptions options)
    : m_channel(std::move(channel))
    , m_options(std::move(options))
{
    if (!m_options.log) {
        m_options.log = lcPgpCard;
    }

    if (!m_channel) {
        qCWarning(m_options.log) << "CommandSet: Null channel provided";
    }
}

Result<QByteArray> CommandSet::transmit(const APDU::Command& cmd, const QString& operation)
{
    if (!m_channel || !m_channel->isConnected()) {
        m_lastError = QStringLiteral("%1: card not connected").arg(operation);
        qCWarning(m_options.log) << "CommandSet:" << m_lastError;
        return Result<QByteArray>::error(ErrorCode::TransportError, m_lastError);
    }

    const QByteArray apdu = cmd.serialize();
    qCDebug(lcPgpCardApdu) << ">>" << ByteUtils::toHex(apdu);

    try {
        const QByteArray raw = m_channel->transmit(apdu);
        qCDebug(lcPgpCardApdu) << "<<" << ByteUtils::toHex(raw);
        return Result<QByteArray>::success(raw);
    } catch (const std::runtime_error& e) {
        m_lastError = QStringLiteral("%1: %2").arg(operation, QString::fromUtf8(e.what()));
        qCWarning(m_options.log) << "CommandSet: transmit failed:" << m_lastError;
        return Result<QByteArray>::error(ErrorCode::TransportError, m_lastError);
    }
}

Result<QByteArray> CommandSet::send(const APDU::Command& cmd, const QString& operation)
{
    Result<QByteArray> raw = transmit(cmd, operation);
    if (!raw) {
        return raw;
    }

    APDU::Response response(raw.value());
    QByteArray data = response.data();

    // 61xx: card has more bytes, fetch them with GET RESPONSE
    int rounds = 0;
    while (response.hasMoreData()) {
        if (++rounds > MAX_GET_RESPONSE) {
            m_lastError = QStringLiteral("%1: response chaining did not terminate").arg(operation);
            qCWarning(m_options.log) << "CommandSet:" << m_lastError;
            return Result<QByteArray>::error(ErrorCode::CardError, m_lastError);
        }

        APDU::Command getResponse(APDU::CLA_ISO7816, APDU::INS_GET_RESPONSE, 0x00, 0x00);
        getResponse.setLe(static_cast<uint8_t>(response.remainingBytes()));

        Result<QByteArray> next = transmit(getResponse, operation);
        if (!next) {
            return next;
        }
        response.setData(next.value());
        data.append(response.data());
    }

    if (!response.isOK()) {
        m_lastError = QStringLiteral("%1: SW=%2 (%3)")
                          .arg(operation)
                          .arg(response.sw(), 4, 16, QLatin1Char('0'))
                          .arg(response.errorMessage());
        qCWarning(m_options.log) << "CommandSet:" << m_lastError;
        return Result<QByteArray>::error(ErrorCode::CardError, m_lastError);
    }

    m_lastError.clear();
    return Result<QByteArray>::success(data);
}

Result<QByteArray> CommandSet::select()
{
    qCDebug(m_options.log) << "CommandSet::select()";

    APDU::Command cmd(APDU::CLA_ISO7816, APDU::INS_SELECT, APDU::P1SelectByName, 0x00);
    cmd.setData(OPENPGP_AID);
    cmd.setLe(0);

    return send(cmd, QStringLiteral("select"));
}

Result<QByteArray> CommandSet::getData(uint16_t tag)
{
    const QString operation = QStringLiteral("get data(%1)").arg(QString::number(tag, 16).rightJustified(4, QLatin1Char('0')).toUpper());
    qCDebug(m_options.log) << "CommandSet::getData()" << operation;

    APDU::Command cmd(APDU::CLA_ISO7816, APDU::INS_GET_DATA,
                      static_cast<uint8_t>((tag >> 8) & 0xFF),
                      static_cast<uint8_t>(tag & 0xFF));
    cmd.setLe(0);

    return send(cmd, operation);
}

Result<QString> CommandSet::getAppletVersion()
{
    qCDebug(m_options.log) << "CommandSet::getAppletVersion()";

    APDU::Command cmd(APDU::CLA_ISO7816, APDU::INS_GET_VERSION, 0x00, 0x00);
    Result<QByteArray> raw = transmit(cmd, QStringLiteral("get version"));
    if (!raw) {
        return Result<QString>::error(raw.errorInfo());
    }

    APDU::Response response(raw.value());
    if (!response.isOK()) {
        qCDebug(m_options.log) << "CommandSet: GET VERSION not supported, SW="
                               << QString::number(response.sw(), 16);
        return Result<QString>::success(QString());
    }

    QStringList parts;
    for (char byte : response.data()) {
        parts.append(QString::number(static_cast<int>(static_cast<uint8_t>(byte))));
    }
    return Result<QString>::success(parts.join(QLatin1Char('.')));
}

Result<CardData> CommandSet::readCardData()
{
    qCDebug(m_options.log) << "CommandSet::readCardData()";

    Result<QByteArray> selected = select();
    if (!selected) {
        return Result<CardData>::error(selected.errorInfo());
    }

    TLV::TagMap tags;
    for (uint16_t object : {APDU::DO_APPLICATION_RELATED_DATA, APDU::DO_CARDHOLDER_RELATED_DATA}) {
        Result<QByteArray> response = getData(object);
        if (!response) {
            return Result<CardData>::error(response.errorInfo());
        }

        Result<TLV::TagMap> parsed = TLV::parse(response.value());
        if (!parsed) {
            return Result<CardData>::error(parsed.errorInfo().wrap(
                QStringLiteral("card data(%1)").arg(QString::number(object, 16).toUpper())));
        }
        tags.merge(parsed.value());
    }

    CardDataOptions options = m_options;
    if (options.appletVersion.isEmpty()) {
        Result<QString> version = getAppletVersion();
        if (!version) {
            return Result<CardData>::error(version.errorInfo());
        }
        options.appletVersion = version.value();
    }

    return CardData::parse(tags, options);
}

Result<PublicKey> CommandSet::readPublicKey(KeyType keyType)
{
    const QString operation = QStringLiteral("read public key(%1)").arg(keyTypeName(keyType));
    qCDebug(m_options.log) << "CommandSet::readPublicKey()" << keyTypeName(keyType);

    APDU::Command cmd(APDU::CLA_ISO7816, APDU::INS_GENERATE_ASYMMETRIC_KEY_PAIR,
                      APDU::P1ReadPublicKey, 0x00);
    cmd.setData(controlReferenceTemplate(keyType));
    cmd.setLe(0);

    Result<QByteArray> response = send(cmd, operation);
    if (!response) {
        return Result<PublicKey>::error(response.errorInfo());
    }

    Result<TLV::TagMap> parsed = TLV::parse(response.value());
    if (!parsed) {
        return Result<PublicKey>::error(parsed.errorInfo().wrap(operation));
    }

    return PublicKey::parse(keyType, parsed.value());
}

} // namespace PgpCard
