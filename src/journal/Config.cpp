#include "journal/Config.hpp"

#include "journal/Logging.hpp"

#include <QByteArray>
#include <QString>
#include <QtGlobal>

#include <algorithm>
#include <limits>

namespace journal::sqlite {

namespace {

// Positive integer from the environment, or fallback when unset or malformed.
long long positiveFromEnvironment(const char* name, long long fallback) {
    if (qEnvironmentVariableIsEmpty(name)) {
        return fallback;
    }
    bool ok = false;
    const long long value = qEnvironmentVariable(name).toLongLong(&ok);
    if (!ok || value <= 0) {
        qCWarning(journalSqlite, "Ignoring %s=%s: expected a positive integer", name,
                  qPrintable(qEnvironmentVariable(name)));
        return fallback;
    }
    return value;
}

}  // namespace

SqliteOptions SqliteOptions::fromEnvironment() {
    SqliteOptions options;
    if (!qEnvironmentVariableIsEmpty("JOURNAL_DB_PATH")) {
        options.path = qEnvironmentVariable("JOURNAL_DB_PATH").toStdString();
    }
    // sqlite3_busy_timeout takes an int.
    options.busyTimeoutMs = static_cast<int>(std::min<long long>(
        positiveFromEnvironment("JOURNAL_BUSY_TIMEOUT_MS", options.busyTimeoutMs), std::numeric_limits<int>::max()));
    options.streamPageSize = static_cast<std::size_t>(
        positiveFromEnvironment("JOURNAL_STREAM_PAGE_SIZE", static_cast<long long>(options.streamPageSize)));
    qCDebug(journalSqlite, "SQLite options: path=%s busy_timeout=%dms page=%zu", options.path.c_str(),
            options.busyTimeoutMs, options.streamPageSize);
    return options;
}

}  // namespace journal::sqlite
