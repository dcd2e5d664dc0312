#pragma once

#include <QLoggingCategory>

namespace PgpCard {

/**
 * @brief Qt logging categories used by the library
 *
 * All categories default to QtWarningMsg. Enable debug output via environment:
 *   QT_LOGGING_RULES="pgpcard.*.debug=true"
 */
Q_DECLARE_LOGGING_CATEGORY(lcPgpCard)
Q_DECLARE_LOGGING_CATEGORY(lcPgpCardTlv)
Q_DECLARE_LOGGING_CATEGORY(lcPgpCardApdu)

/**
 * @brief Logging capability injected into CardData and CommandSet
 *
 * Same shape as the accessor generated by Q_LOGGING_CATEGORY, so any
 * category (including an application's own) can be passed and used with
 * qCDebug()/qCWarning().
 */
using LoggingCategory = const QLoggingCategory& (*)();

} // namespace PgpCard
