#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(braidSyncLog)
Q_DECLARE_LOGGING_CATEGORY(braidCryptoLog)
Q_DECLARE_LOGGING_CATEGORY(braidStorageLog)
Q_DECLARE_LOGGING_CATEGORY(braidNetworkLog)

namespace braid {

// Turns on braid.*.debug output when BRAID_DEBUG_SYNC is set.
void apply_debug_environment();

// Installs a Qt message handler that appends to `path`. Lines carry the UTC
// time, a one-letter level, the category and the message.
// Returns false if the file cannot be opened; logging then stays on stderr.
bool install_file_logging(const QString& path);

} // namespace braid
