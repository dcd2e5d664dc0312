#pragma once

#include "../types.h"
#include <QByteArray>
#include <QString>
#include <cstdint>

namespace PgpCard {
namespace APDU {

/**
 * @brief Represents an APDU response
 * 
 * APDU response structure: [Data | SW1 | SW2]
 * - Data: Response data (optional)
 * - SW1, SW2: Status word (2 bytes)
 */
class Response {
public:
    /**
     * @brief Construct from raw response bytes
     * @param rawResponse Complete response including SW1/SW2
     */
    explicit Response(const QByteArray& rawResponse);

    /**
     * @brief Initialize from raw response bytes
     * @param rawResponse Complete response including SW1/SW2
     */
    void setData(const QByteArray& rawResponse);
    
    /**
     * @brief Get the response data (without status word)
     * @return The data bytes
     */
    QByteArray data() const { return m_data; }
    
    /**
     * @brief Get the status word
     * @return SW1 << 8 | SW2
     */
    uint16_t sw() const { return m_sw; }
    
    /**
     * @brief Check if response is OK (SW = 0x9000)
     * @return true if OK
     */
    bool isOK() const { return m_sw == SW_OK; }

    /**
     * @brief Check if more response bytes are waiting (SW1 = 0x61)
     *
     * The remaining bytes are fetched with GET RESPONSE.
     */
    bool hasMoreData() const { return (m_sw >> 8) == SW1_MORE_DATA; }

    /**
     * @brief Number of bytes announced by a 61xx status (0 means 256 or more)
     * @return SW2 if hasMoreData(), -1 otherwise
     */
    int remainingBytes() const;
    
    /**
     * @brief Get error message for status word
     * @return Human-readable error message
     */
    QString errorMessage() const;
    
private:
    QByteArray m_data;
    uint16_t m_sw;
};

} // namespace APDU
} // namespace PgpCard
