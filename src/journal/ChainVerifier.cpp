#include "journal/ChainVerifier.hpp"

#include "journal/Logging.hpp"

namespace journal {

ChainReport verifyChain(const EventStore& store, const std::string& aggregateId) {
    ChainReport report;
    report.aggregateId = aggregateId;
    report.head = store.head(aggregateId);

    const std::vector<Event> chain = store.chain(aggregateId);
    report.eventCount = chain.size();

    Hash expectedParent = Hash::zero();
    for (std::size_t i = 0; i < chain.size(); ++i) {
        const Event& event = chain[i];
        if (event.parentOrZero() != expectedParent) {
            report.problems.push_back("event #" + std::to_string(i) + " (" + event.id + ") follows " +
                                      event.parentOrZero().toString() + ", expected " +
                                      expectedParent.toString());
        }
        expectedParent = event.hash();
    }
    if (!chain.empty()) {
        report.lastEventHash = expectedParent;
    }

    if (report.head != report.lastEventHash) {
        const std::string head = report.head ? report.head->toString() : "(none)";
        const std::string last = report.lastEventHash ? report.lastEventHash->toString() : "(none)";
        report.problems.push_back("ref " + head + " does not match last event hash " + last);
    }

    if (report.ok()) {
        qCDebug(journalVerify, "Chain %s intact: %zu events", aggregateId.c_str(), report.eventCount);
    } else {
        for (const std::string& problem : report.problems) {
            qCWarning(journalVerify, "Chain %s: %s", aggregateId.c_str(), problem.c_str());
        }
    }
    return report;
}

}  // namespace journal
