#include "test_base.h"

Q_LOGGING_CATEGORY(journalTests, "journal.tests")
