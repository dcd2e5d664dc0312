#pragma once

#include "result.h"
#include "types.h"
#include <QByteArray>
#include <QString>

namespace PgpCard {

/// Cardholder name shown when the card has none
inline const QString NameNotSet = QStringLiteral("[not set]");

/**
 * @brief Decode the Name DO (65.5B) into a display string
 *
 * The card stores "SURNAME<<FORENAME" with '<' as filler. The part after
 * the first "<<" comes first, then a newline (only if that part is not
 * empty), then the part before with every '<' replaced by a space.
 *
 * @param data Raw UTF-8 bytes of the Name DO
 * @return Display name, or NameNotSet for empty input
 */
QString parseCardHolderName(const QByteArray& data);

/**
 * @brief Format Algorithm Attributes (C1/C2/C3)
 *
 * RSA (algorithm id 1..3) yields "RSA <modulus bits>", anything else
 * "Alg=<id>" padded to 4 characters.
 *
 * @param data Raw value, at least 1 byte
 */
Result<QString> parseAlgorithmAttributes(const QByteArray& data);

/**
 * @brief Map a key origin byte to KeyOrigin
 * @return UnknownKeyOrigin for values above KeyOriginLast
 */
Result<KeyOrigin> parseKeyOrigin(uint8_t value);

} // namespace PgpCard
