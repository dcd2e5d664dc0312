#pragma once

#include "apdu/command.h"
#include "apdu/response.h"
#include "card_data.h"
#include "channel_interface.h"
#include "public_key.h"
#include "result.h"
#include "types.h"
#include <QByteArray>
#include <QString>
#include <memory>

namespace PgpCard {

/**
 * @brief Read-only command set for the OpenPGP card application
 * 
 * Frames the APDUs needed to read the card's data objects and hands the
 * responses to the decoders. Transport failures (std::runtime_error from
 * the channel) and non-9000 status words are turned into Result errors.
 *
 * Not thread-safe: exactly one exchange is in flight per channel.
 */
class CommandSet {
public:
    /**
     * @brief Create CommandSet with dependency injection
     * @param channel Communication channel (required)
     * @param options Reader name and logging category passed on to CardData
     */
    explicit CommandSet(std::shared_ptr<IChannel> channel,
                        CardDataOptions options = CardDataOptions());

    /**
     * @brief Get the channel
     * @return Channel
     */
    std::shared_ptr<IChannel> channel() const { return m_channel; }

    /**
     * @brief Select the OpenPGP application (AID D2 76 00 01 24 01)
     * @return Raw SELECT response data (usually empty)
     */
    Result<QByteArray> select();

    /**
     * @brief GET DATA for a data object, following 61xx with GET RESPONSE
     * @param tag Data object (P1-P2), e.g. APDU::DO_APPLICATION_RELATED_DATA
     * @return Complete response data without the status word
     */
    Result<QByteArray> getData(uint16_t tag);

    /**
     * @brief Vendor firmware version (GET VERSION, INS F1)
     *
     * Cards that do not implement the command yield an empty string; only a
     * transport failure is an error.
     */
    Result<QString> getAppletVersion();

    /**
     * @brief Select the application and build a CardData snapshot
     *
     * Reads Application Related Data (6E) and Cardholder Related Data (65),
     * merges the parsed tag maps and adds the applet version.
     */
    Result<CardData> readCardData();

    /**
     * @brief Read the public key of a key slot
     *
     * Uses GENERATE ASYMMETRIC KEY PAIR in read mode (P1 = 81), which does
     * not modify the card.
     */
    Result<PublicKey> readPublicKey(KeyType keyType);

    /**
     * @brief Message of the last failed exchange, empty after a success
     */
    QString lastError() const { return m_lastError; }

private:
    Result<QByteArray> send(const APDU::Command& cmd, const QString& operation);
    Result<QByteArray> transmit(const APDU::Command& cmd, const QString& operation);

    std::shared_ptr<IChannel> m_channel;
    CardDataOptions m_options;
    QString m_lastError;
};

} // namespace PgpCard
