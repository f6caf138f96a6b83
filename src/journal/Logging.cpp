#include "journal/Logging.hpp"

Q_LOGGING_CATEGORY(journalMemory, "journal.memory")
Q_LOGGING_CATEGORY(journalSqlite, "journal.sqlite")
Q_LOGGING_CATEGORY(journalCodec, "journal.codec")
Q_LOGGING_CATEGORY(journalVerify, "journal.verify")
Q_LOGGING_CATEGORY(journalTools, "journal.tools")
