#pragma once

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="journal.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(journalMemory)
Q_DECLARE_LOGGING_CATEGORY(journalSqlite)
Q_DECLARE_LOGGING_CATEGORY(journalCodec)
Q_DECLARE_LOGGING_CATEGORY(journalVerify)
Q_DECLARE_LOGGING_CATEGORY(journalTools)
