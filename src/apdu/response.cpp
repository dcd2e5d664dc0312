#include "pgpcard-qt/apdu/response.h"

namespace PgpCard {
namespace APDU {

Response::Response(const QByteArray& rawResponse)
    : m_sw(0)
{
    setData(rawResponse);
}

void Response::setData(const QByteArray& rawResponse)
{
    m_data.clear();

    if (rawResponse.size() < 2) {
        // Invalid response - should have at least SW1 SW2
        m_sw = SW_NO_PRECISE_DIAGNOSIS;
        return;
    }
    
    // Last 2 bytes are SW1 and SW2
    int dataLen = rawResponse.size() - 2;
    if (dataLen > 0) {
        m_data = rawResponse.left(dataLen);
    }
    
    uint8_t sw1 = static_cast<uint8_t>(rawResponse[dataLen]);
    uint8_t sw2 = static_cast<uint8_t>(rawResponse[dataLen + 1]);
    m_sw = (static_cast<uint16_t>(sw1) << 8) | sw2;
}

int Response::remainingBytes() const
{
    if (!hasMoreData()) {
        return -1;
    }
    return m_sw & 0x00FF;
}

QString Response::errorMessage() const
{
    switch (m_sw) {
    case SW_OK:
        return QStringLiteral("Success");
    case SW_TERMINATION_STATE:
        return QStringLiteral("Selected file in termination state");
    case SW_MEMORY_FAILURE:
        return QStringLiteral("Memory failure");
    case SW_WRONG_LENGTH:
        return QStringLiteral("Wrong length");
    case SW_SECURE_MESSAGING_NOT_SUPPORTED:
        return QStringLiteral("Secure messaging not supported");
    case SW_LAST_COMMAND_EXPECTED:
        return QStringLiteral("Last command of the chain expected");
    case SW_CHAINING_NOT_SUPPORTED:
        return QStringLiteral("Command chaining not supported");
    case SW_SECURITY_CONDITION_NOT_SATISFIED:
        return QStringLiteral("Security condition not satisfied");
    case SW_AUTHENTICATION_METHOD_BLOCKED:
        return QStringLiteral("Authentication method blocked");
    case SW_CONDITIONS_NOT_SATISFIED:
        return QStringLiteral("Conditions not satisfied");
    case SW_WRONG_DATA:
        return QStringLiteral("Wrong data");
    case SW_FILE_NOT_FOUND:
        return QStringLiteral("File or application not found");
    case SW_REFERENCED_DATA_NOT_FOUND:
        return QStringLiteral("Referenced data not found");
    case SW_INCORRECT_P1P2:
        return QStringLiteral("Wrong parameters P1-P2");
    case SW_INS_NOT_SUPPORTED:
        return QStringLiteral("Instruction not supported");
    case SW_CLA_NOT_SUPPORTED:
        return QStringLiteral("Class not supported");
    case SW_NO_PRECISE_DIAGNOSIS:
        return QStringLiteral("No precise diagnosis");
    default:
        if (hasMoreData()) {
            return QStringLiteral("More data available: %1 bytes").arg(remainingBytes());
        }
        return QStringLiteral("Unknown error: 0x%1").arg(m_sw, 4, 16, QLatin1Char('0'));
    }
}

} // namespace APDU
} // namespace PgpCard
