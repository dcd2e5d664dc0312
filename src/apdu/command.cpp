#include "pgpcard-qt/apdu/command.h"

namespace PgpCard {
namespace APDU {

Command::Command(uint8_t cla, uint8_t ins, uint8_t p1, uint8_t p2)
    : m_cla(cla)
    , m_ins(ins)
    , m_p1(p1)
    , m_p2(p2)
    , m_hasData(false)
    , m_hasLe(false)
    , m_le(0)
{
}

void Command::setData(const QByteArray& data)
{
    m_data = data;
    m_hasData = !data.isEmpty();
}

void Command::setLe(uint8_t le)
{
    m_hasLe = true;
    m_le = le;
}

QByteArray Command::serialize() const
{
    QByteArray result;
    
    // Header: CLA | INS | P1 | P2
    result.append(static_cast<char>(m_cla));
    result.append(static_cast<char>(m_ins));
    result.append(static_cast<char>(m_p1));
    result.append(static_cast<char>(m_p2));

    if (isExtended()) {
        // Extended Lc: 00 | Lc1 | Lc2
        result.append(static_cast<char>(0));
        result.append(static_cast<char>((m_data.size() >> 8) & 0xFF));
        result.append(static_cast<char>(m_data.size() & 0xFF));
        result.append(m_data);

        // Extended Le: 2 bytes, 00 00 means 65536
        if (m_hasLe) {
            result.append(static_cast<char>(0));
            result.append(static_cast<char>(m_le));
        }
        return result;
    }

    // Case 3/4: Lc | Data
    if (m_hasData) {
        result.append(static_cast<char>(m_data.size()));
        result.append(m_data);
    }

    // Case 2/4: Le
    if (m_hasLe) {
        result.append(static_cast<char>(m_le));
    }
    
    return result;
}

} // namespace APDU
} // namespace PgpCard
