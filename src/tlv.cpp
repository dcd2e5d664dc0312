#include "pgpcard-qt/tlv.h"
#include "pgpcard-qt/logging.h"
#include <QDebug>
#include <QQueue>
#include <algorithm>

namespace PgpCard {
namespace TLV {

namespace {

constexpr uint8_t TAG_MULTI_BYTE_MASK = 0x1F;
constexpr uint8_t TAG_CONSTRUCTED_BIT = 0x20;
constexpr uint8_t TAG_CONTINUATION_BIT = 0x80;
constexpr int MAX_TAG_BYTES = 4;
constexpr int MAX_LENGTH_BYTES = 4;

Result<QByteArray> readTag(const QByteArray& data, int& offset, int end)
{
    const int start = offset;
    const uint8_t first = static_cast<uint8_t>(data[offset]);
    offset++;

    if ((first & TAG_MULTI_BYTE_MASK) == TAG_MULTI_BYTE_MASK) {
        // Subsequent tag bytes follow while bit 8 is set
        uint8_t b = 0;
        do {
            if (offset >= end) {
                return Result<QByteArray>::error(ErrorCode::MalformedTlv,
                    QStringLiteral("tag truncated at offset %1").arg(start));
            }
            b = static_cast<uint8_t>(data[offset]);
            offset++;
            if (offset - start > MAX_TAG_BYTES) {
                return Result<QByteArray>::error(ErrorCode::MalformedTlv,
                    QStringLiteral("tag at offset %1 longer than %2 bytes").arg(start).arg(MAX_TAG_BYTES));
            }
        } while (b & TAG_CONTINUATION_BIT);
    }

    return Result<QByteArray>::success(data.mid(start, offset - start));
}

Result<quint32> readLength(const QByteArray& data, int& offset, int end)
{
    if (offset >= end) {
        return Result<quint32>::error(ErrorCode::MalformedTlv,
            QStringLiteral("length missing at offset %1").arg(offset));
    }

    const uint8_t firstByte = static_cast<uint8_t>(data[offset]);
    offset++;

    if ((firstByte & 0x80) == 0) {
        // Short form: length is in the lower 7 bits
        return Result<quint32>::success(firstByte);
    }

    // Long form: lower 7 bits indicate number of length bytes
    const int numLengthBytes = firstByte & 0x7F;
    if (numLengthBytes == 0 || numLengthBytes > MAX_LENGTH_BYTES) {
        return Result<quint32>::error(ErrorCode::MalformedTlv,
            QStringLiteral("unsupported length encoding 0x%1").arg(firstByte, 2, 16, QLatin1Char('0')));
    }
    if (offset + numLengthBytes > end) {
        return Result<quint32>::error(ErrorCode::MalformedTlv,
            QStringLiteral("length field truncated at offset %1").arg(offset));
    }

    quint32 length = 0;
    for (int i = 0; i < numLengthBytes; i++) {
        length = (length << 8) | static_cast<uint8_t>(data[offset]);
        offset++;
    }

    return Result<quint32>::success(length);
}

// Constructed value still to be walked: [begin, end) of the input
struct Span {
    QString prefix;
    int begin;
    int end;
    int depth;
};

Result<void> parseInto(const QByteArray& data, TagMap& out)
{
    // Breadth-first: equal paths are met in document order
    QQueue<Span> pending;
    pending.enqueue(Span{QString(), 0, static_cast<int>(data.size()), 1});

    while (!pending.isEmpty()) {
        const Span span = pending.dequeue();
        int offset = span.begin;

        while (offset < span.end) {
            Result<QByteArray> tag = readTag(data, offset, span.end);
            if (!tag) {
                return Result<void>::error(tag.errorInfo());
            }

            const QString path = span.prefix.isEmpty()
                ? tagName(tag.value())
                : span.prefix + QLatin1Char(PathSeparator) + tagName(tag.value());

            if (span.depth > MaxNestingDepth) {
                return Result<void>::error(ErrorCode::MalformedTlv,
                    QStringLiteral("%1: nested deeper than %2 levels").arg(path).arg(MaxNestingDepth));
            }

            Result<quint32> length = readLength(data, offset, span.end);
            if (!length) {
                return Result<void>::error(length.errorInfo().wrap(path));
            }

            // Check if we have enough data
            const qint64 remaining = span.end - offset;
            if (static_cast<qint64>(length.value()) > remaining) {
                qCWarning(lcPgpCardTlv) << "TLV::parse: Length exceeds data size. Tag:" << path
                                        << "Length:" << length.value() << "Remaining:" << remaining;
                return Result<void>::error(ErrorCode::MalformedTlv,
                    QStringLiteral("%1: declared length %2 exceeds remaining %3 bytes")
                        .arg(path).arg(length.value()).arg(remaining));
            }

            const int valueEnd = offset + static_cast<int>(length.value());
            out.insert(path, data.mid(offset, valueEnd - offset));

            if (static_cast<uint8_t>(tag.value()[0]) & TAG_CONSTRUCTED_BIT) {
                pending.enqueue(Span{path, offset, valueEnd, span.depth + 1});
            }
            offset = valueEnd;
        }
    }

    return Result<void>::success();
}

} // anonymous namespace

std::optional<int> TagMap::length(const QString& path) const
{
    auto it = m_values.constFind(path);
    if (it == m_values.constEnd()) {
        return std::nullopt;
    }
    return it.value().size();
}

QStringList TagMap::paths() const
{
    QStringList result = m_values.keys();
    std::sort(result.begin(), result.end());
    return result;
}

void TagMap::insert(const QString& path, const QByteArray& value)
{
    if (m_values.contains(path)) {
        qCDebug(lcPgpCardTlv) << "TagMap: duplicate path ignored:" << path;
        return;
    }
    m_values.insert(path, value);
}

void TagMap::merge(const TagMap& other)
{
    for (auto it = other.m_values.constBegin(); it != other.m_values.constEnd(); ++it) {
        insert(it.key(), it.value());
    }
}

Result<TagMap> parse(const QByteArray& data)
{
    TagMap map;

    Result<void> parsed = parseInto(data, map);
    if (!parsed) {
        qCWarning(lcPgpCardTlv) << "TLV::parse failed:" << parsed.error();
        return Result<TagMap>::error(parsed.errorInfo());
    }

    qCDebug(lcPgpCardTlv) << "TLV::parse:" << map.size() << "paths from" << data.size() << "bytes";
    return Result<TagMap>::success(map);
}

Result<quint32> parseLength(const QByteArray& data, int& offset)
{
    return readLength(data, offset, static_cast<int>(data.size()));
}

QString tagName(const QByteArray& tag)
{
    return QString::fromLatin1(tag.toHex()).toUpper();
}

QByteArray encodeLength(quint32 length)
{
    QByteArray result;

    if (length < 128) {
        // Short form (0-127)
        result.append(static_cast<char>(length));
    } else {
        // Long form
        int numBytes = 0;
        quint32 temp = length;
        while (temp > 0) {
            numBytes++;
            temp >>= 8;
        }

        // First byte: 0x80 | numBytes
        result.append(static_cast<char>(0x80 | numBytes));

        // Length bytes (big-endian)
        for (int i = numBytes - 1; i >= 0; i--) {
            result.append(static_cast<char>((length >> (i * 8)) & 0xFF));
        }
    }

    return result;
}

QByteArray encode(uint8_t tag, const QByteArray& value)
{
    return encode(QByteArray(1, static_cast<char>(tag)), value);
}

QByteArray encode(const QByteArray& tag, const QByteArray& value)
{
    QByteArray result = tag;
    result.append(encodeLength(static_cast<quint32>(value.size())));
    result.append(value);
    return result;
}

} // namespace TLV
} // namespace PgpCard
