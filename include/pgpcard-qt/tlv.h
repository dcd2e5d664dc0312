#pragma once

#include "result.h"
#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>

namespace PgpCard {
namespace TLV {

/// Separator between tags of a path, e.g. "6E.73.C5"
constexpr char PathSeparator = '.';

/// Deepest accepted tag path, in components ("6E.73.C5" is 3)
constexpr int MaxNestingDepth = 16;

/**
 * @brief Flattened view of a BER-TLV stream
 *
 * Maps dotted tag paths (uppercase hex, one component per tag, e.g.
 * "6E.73.C5" or "7F49.81") to the raw value bytes of that element.
 * Constructed elements are stored with their full value and their
 * children are stored under the extended path.
 */
class TagMap {
public:
    TagMap() = default;

    bool contains(const QString& path) const { return m_values.contains(path); }

    /**
     * @brief Length of the value at path
     * @return Value length, or std::nullopt if the path is absent
     */
    std::optional<int> length(const QString& path) const;

    /**
     * @brief Value at path, or empty QByteArray if absent
     */
    QByteArray value(const QString& path) const { return m_values.value(path); }

    /**
     * @brief All paths, sorted
     */
    QStringList paths() const;

    int size() const { return m_values.size(); }
    bool isEmpty() const { return m_values.isEmpty(); }

    /**
     * @brief Record a value; the first occurrence of a path wins
     */
    void insert(const QString& path, const QByteArray& value);

    /**
     * @brief Add all paths of another map (e.g. a second GET DATA response)
     */
    void merge(const TagMap& other);

private:
    QHash<QString, QByteArray> m_values;
};

/**
 * @brief Parse a BER-TLV stream into a tag-path map
 *
 * Supports multi-byte tags, short and long form lengths and nested
 * constructed elements up to MaxNestingDepth. Any truncation or deeper
 * nesting fails the whole parse.
 *
 * @param data Raw TLV data (status word already stripped)
 * @return Flattened map; empty map for empty input; MalformedTlv on error
 */
Result<TagMap> parse(const QByteArray& data);

/**
 * @brief Parse BER-TLV length field
 * @param data Raw data containing TLV structure
 * @param offset Current offset in data, will be updated to point after length field
 * @return Parsed length value, or MalformedTlv
 */
Result<quint32> parseLength(const QByteArray& data, int& offset);

/**
 * @brief Render tag bytes as a path component ("5B", "7F49")
 */
QString tagName(const QByteArray& tag);

/**
 * @brief Encode a single TLV entry
 * @param tag Tag byte
 * @param value Value data
 * @return Encoded TLV structure (tag + length + value)
 */
QByteArray encode(uint8_t tag, const QByteArray& value);

/**
 * @brief Encode a single TLV entry with a multi-byte tag (e.g. 7F 49)
 */
QByteArray encode(const QByteArray& tag, const QByteArray& value);

/**
 * @brief Encode TLV length field (BER-TLV format)
 * @param length Length value to encode
 * @return Encoded length bytes
 */
QByteArray encodeLength(quint32 length);

} // namespace TLV
} // namespace PgpCard
