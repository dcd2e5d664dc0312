#include "pgpcard-qt/logging.h"

namespace PgpCard {

Q_LOGGING_CATEGORY(lcPgpCard, "pgpcard.card", QtWarningMsg)
Q_LOGGING_CATEGORY(lcPgpCardTlv, "pgpcard.tlv", QtWarningMsg)
Q_LOGGING_CATEGORY(lcPgpCardApdu, "pgpcard.apdu", QtWarningMsg)

} // namespace PgpCard
