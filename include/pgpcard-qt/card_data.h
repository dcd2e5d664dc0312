#pragma once

#include "logging.h"
#include "result.h"
#include "tlv.h"
#include "types.h"
#include "types/extended_capabilities.h"
#include <QDateTime>
#include <QString>
#include <optional>

namespace PgpCard {

/**
 * @brief Inputs to CardData that do not come from the card's data objects
 */
struct CardDataOptions {
    QString readerName;            ///< Reader the card sits in, used in longName()
    QString appletVersion;         ///< Vendor firmware version, empty if unknown
    LoggingCategory log = lcPgpCard; ///< Category for diagnostic output
};

/**
 * @brief Identity, key metadata and capabilities of an OpenPGP card
 *
 * Built once per card session from the Application Related Data (6E) and
 * Cardholder Related Data (65) responses. It is a value snapshot: rebuild
 * it after anything that changes card state.
 *
 * The per-key accessors decode on demand from the stored tag map and never
 * modify the object, so a CardData can be read from several threads.
 */
class CardData {
public:
    CardData() = default;

    /**
     * @brief Build the record from parsed GET DATA responses
     * @param tags Merged tag map of 6E and 65
     * @param options Reader name, applet version and logging category
     * @return CardData, or the first decoding error (missing AID, bad capabilities)
     */
    static Result<CardData> parse(const TLV::TagMap& tags, const CardDataOptions& options = CardDataOptions());

    // Identity (from the AID, 6E.4F)
    QString readerName() const { return m_readerName; }
    QString serial() const { return m_serial; }
    quint32 serialNumber() const { return m_serialNumber; }
    QString rid() const { return m_rid; }
    QString application() const { return m_application; }
    QString version() const { return m_version; }
    QString manufacturer() const { return m_manufacturer; }
    QString longName() const { return m_longName; }
    QString cardHolder() const { return m_cardHolder; }
    QString appletVersion() const { return m_appletVersion; }

    const ExtendedCapabilities& capabilities() const { return m_capabilities; }
    const TLV::TagMap& tags() const { return m_tags; }

    /**
     * @brief Raw value of a data object
     * @param path Dotted tag path
     * @param minLength Minimum number of bytes required
     * @return Value, NoSuchTag if absent, TooShort if shorter than minLength
     */
    Result<QByteArray> tag(const QString& path, int minLength) const;

    /**
     * @brief Length of a data object, std::nullopt if absent
     */
    std::optional<int> hasTag(const QString& path) const { return m_tags.length(path); }

    /**
     * @brief Algorithm of a key ("RSA 2048", "Alg=22  ")
     *
     * Attestation keys have no algorithm attributes DO and fail with NoSuchTag.
     */
    Result<QString> algorithm(KeyType keyType) const;

    /**
     * @brief 20-byte fingerprint as uppercase hex
     */
    Result<QString> fingerprint(KeyType keyType) const;

    /**
     * @brief Key ID: last 8 bytes of the fingerprint as uppercase hex
     */
    Result<QString> keyId(KeyType keyType) const;

    /**
     * @brief Key creation time (UTC)
     *
     * The card stores 0 for "not specified"; that is returned as the epoch,
     * use hasCreationDate() to tell the two apart.
     */
    Result<QDateTime> creationDate(KeyType keyType) const;

    /**
     * @brief True if the creation date DO holds a non-zero value for this key
     */
    bool hasCreationDate(KeyType keyType) const;

    /**
     * @brief Key origin
     * @return KeyNotPresent if the origin DO is absent or empty,
     *         UnknownKeyOrigin for unrecognized values
     */
    Result<KeyOrigin> origin(KeyType keyType) const;

    /**
     * @brief One-line key listing: name, algorithm, id, fingerprint, date, origin
     *
     * Fields that cannot be decoded are left blank.
     */
    QString keySummary(KeyType keyType) const;

    /**
     * @brief Multi-line description of the card identity
     */
    QString toString() const;

private:
    Result<void> parseApplicationIdentifier();

    TLV::TagMap m_tags;
    LoggingCategory m_log = lcPgpCard;

    QString m_readerName;
    QString m_serial;
    quint32 m_serialNumber = 0;
    QString m_rid;
    QString m_application;
    QString m_version;
    QString m_manufacturer;
    QString m_longName;
    QString m_cardHolder;
    QString m_appletVersion;
    ExtendedCapabilities m_capabilities;
};

/**
 * @brief CardData that may not have been read yet
 *
 * Checks presence once for every accessor: per-key accessors and
 * toString() fail with KeyNotPresent, plain getters return an empty string.
 */
class OptionalCardData {
public:
    OptionalCardData() = default;
    explicit OptionalCardData(CardData data)
        : m_data(std::move(data))
    {
    }

    bool isPresent() const { return m_data.has_value(); }

    /**
     * @brief The record, or nullptr if absent
     */
    const CardData* get() const { return m_data ? &*m_data : nullptr; }

    void reset() { m_data.reset(); }

    QString cardHolder() const { return m_data ? m_data->cardHolder() : QString(); }
    QString version() const { return m_data ? m_data->version() : QString(); }
    QString appletVersion() const { return m_data ? m_data->appletVersion() : QString(); }

    Result<QString> algorithm(KeyType keyType) const;
    Result<QString> fingerprint(KeyType keyType) const;
    Result<QString> keyId(KeyType keyType) const;
    Result<QDateTime> creationDate(KeyType keyType) const;
    Result<KeyOrigin> origin(KeyType keyType) const;
    Result<QString> toString() const;

private:
    std::optional<CardData> m_data;
};

} // namespace PgpCard
