#include "pgpcard-qt/byte_utils.h"

namespace PgpCard {

Result<uint8_t> ByteUtils::byteAt(const QByteArray& data, int position)
{
    if (position < 1 || position > data.size()) {
        return Result<uint8_t>::error(ErrorCode::NotFound,
            QStringLiteral("byte %1 not found in %2 byte block").arg(position).arg(data.size()));
    }
    return Result<uint8_t>::success(static_cast<uint8_t>(data[position - 1]));
}

Result<QByteArray> ByteUtils::bytesAt(const QByteArray& data, int start, int end)
{
    // start is 1-based, end is inclusive, so data.mid(start - 1, end - start + 1)
    if (start < 1 || end < start || end > data.size()) {
        return Result<QByteArray>::error(ErrorCode::NotFound,
            QStringLiteral("bytes %1-%2 not found in %3 byte block").arg(start).arg(end).arg(data.size()));
    }
    return Result<QByteArray>::success(data.mid(start - 1, end - start + 1));
}

uint16_t ByteUtils::toUint16(const QByteArray& bytes)
{
    if (bytes.size() < 2) {
        return 0;
    }

    return static_cast<uint16_t>((static_cast<uint8_t>(bytes[0]) << 8) |
                                 static_cast<uint8_t>(bytes[1]));
}

uint32_t ByteUtils::toUint32(const QByteArray& bytes)
{
    if (bytes.size() < 4) {
        return 0;
    }

    return (static_cast<uint32_t>(static_cast<uint8_t>(bytes[0])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(bytes[3]));
}

QString ByteUtils::toHex(const QByteArray& data, bool uppercase)
{
    QString hex = QString::fromLatin1(data.toHex());
    return uppercase ? hex.toUpper() : hex;
}

QByteArray ByteUtils::fromHex(const QString& hex)
{
    QString cleaned = hex;
    cleaned.remove(QChar(' '));
    cleaned.remove(QChar(':'));
    cleaned.remove(QChar('-'));
    return QByteArray::fromHex(cleaned.toLatin1());
}

} // namespace PgpCard
