#pragma once

#include "result.h"
#include <QByteArray>
#include <QString>
#include <cstdint>

namespace PgpCard {

/**
 * @brief Byte helpers for decoding card data objects
 *
 * byteAt() and bytesAt() use 1-based positions so decoding code reads the
 * same as the OpenPGP card specification ("byte 3-4", "byte 9").
 */
class ByteUtils {
public:
    /**
     * @brief Read one byte at a 1-based position
     * @param data Source block (may be empty)
     * @param position 1-based position
     * @return The byte, or NotFound if position is outside the block
     */
    static Result<uint8_t> byteAt(const QByteArray& data, int position);

    /**
     * @brief Read an inclusive 1-based range
     *
     * bytesAt(data, 3, 4) returns data[2..3], two bytes.
     *
     * @param data Source block (may be empty)
     * @param start 1-based first position
     * @param end 1-based last position (inclusive)
     * @return end - start + 1 bytes, or NotFound if the range is outside the block
     */
    static Result<QByteArray> bytesAt(const QByteArray& data, int start, int end);

    /**
     * @brief Convert 2 big-endian bytes to uint16
     * @return 0 if fewer than 2 bytes
     */
    static uint16_t toUint16(const QByteArray& bytes);

    /**
     * @brief Convert 4 big-endian bytes to uint32
     * @return 0 if fewer than 4 bytes
     */
    static uint32_t toUint32(const QByteArray& bytes);

    /**
     * @brief Convert byte array to hex string without separators
     * @param data Byte array
     * @param uppercase Use uppercase letters (default: true)
     */
    static QString toHex(const QByteArray& data, bool uppercase = true);

    /**
     * @brief Convert hex string to byte array
     * @param hex Hex string, spaces, ':' and '-' are ignored
     */
    static QByteArray fromHex(const QString& hex);
};

} // namespace PgpCard
