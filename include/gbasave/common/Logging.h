#pragma once

#include <QString>

namespace GBASave::Common {

/**
 * @brief Initializes process-wide logging for the command-line front end.
 *
 * Routes every log source into one file sink:
 *
 * - `GBASave::Common::Logger` entries (codec logging)
 * - Qt message output (qDebug/qWarning/qCritical) via `qInstallMessageHandler`
 * - `std::cout` / `std::cerr` writes, captured line by line
 *
 * Configuration (environment variables):
 * - `GBASAVE_LOG_MIRROR=1` mirrors logger output to the real stdout/stderr.
 * - `GBASAVE_LOG_APPEND=1` appends to the log file instead of truncating.
 * - `GBASAVE_LOG_LEVEL=debug|info|warn|error|fatal` sets minimum log level.
 *
 * @param mirrorToConsole forces mirroring regardless of GBASAVE_LOG_MIRROR.
 */
void InitAppLogging(const QString& logFilePath, bool mirrorToConsole = false);

/**
 * @brief Restores stdout/stderr and flushes the file sink.
 *
 * Safe to call multiple times.
 */
void ShutdownAppLogging();

} // namespace GBASave::Common
