#pragma once

#include "../result.h"
#include "../types.h"
#include <QByteArray>

namespace PgpCard {

/**
 * @brief Data object holding one fixed-width entry per key slot
 *
 * Fingerprints (C5), creation dates (CD) and origins pack the entries of
 * all key slots back to back: Signature at [0, Width), Decryption at
 * [Width, 2*Width), Authentication at [2*Width, 3*Width), and so on.
 *
 * @tparam Width Bytes per key slot
 */
template<int Width>
class KeySlotArray {
public:
    explicit KeySlotArray(const QByteArray& data)
        : m_data(data)
    {
    }

    static constexpr int offset(KeyType keyType) { return keyIndex(keyType) * Width; }

    bool covers(KeyType keyType) const {
        return offset(keyType) + Width <= m_data.size();
    }

    /**
     * @brief Entry of one key slot
     * @return Width bytes, or TooShort if the data object ends before the slot
     */
    Result<QByteArray> slice(KeyType keyType) const {
        if (!covers(keyType)) {
            return Result<QByteArray>::error(ErrorCode::TooShort,
                QStringLiteral("slot %1 needs %2 bytes, data object has %3")
                    .arg(keyTypeName(keyType)).arg(offset(keyType) + Width).arg(m_data.size()));
        }
        return Result<QByteArray>::success(m_data.mid(offset(keyType), Width));
    }

private:
    QByteArray m_data;
};

using FingerprintArray = KeySlotArray<FingerprintLength>;
using CreationDateArray = KeySlotArray<CreationDateLength>;
using KeyOriginArray = KeySlotArray<KeyOriginLength>;

} // namespace PgpCard
