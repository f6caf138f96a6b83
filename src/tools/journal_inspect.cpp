#include "journal/ChainVerifier.hpp"
#include "journal/Errors.hpp"
#include "journal/EventCodec.hpp"
#include "journal/Journal.hpp"
#include "journal/Logging.hpp"
#include "journal/sqlite/Database.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

struct Arguments {
    std::string dbPath;
    std::string command;
    std::string aggregateId;
    std::optional<std::string> type;
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> end;
};

int usage() {
    std::cerr << "Usage: journal_inspect --db <path> <command> [options]\n"
              << "Commands:\n"
              << "  head   --aggregate <id>\n"
              << "  list   --aggregate <id> [--type <type>] [--start <ts>] [--end <ts>]\n"
              << "  all\n"
              << "  verify --aggregate <id>\n";
    return 2;
}

std::optional<std::int64_t> parseTimestamp(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Arguments> parseArguments(int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--db" && i + 1 < argc) {
            args.dbPath = argv[++i];
        } else if (arg == "--aggregate" && i + 1 < argc) {
            args.aggregateId = argv[++i];
        } else if (arg == "--type" && i + 1 < argc) {
            args.type = std::string(argv[++i]);
        } else if ((arg == "--start" || arg == "--end") && i + 1 < argc) {
            std::optional<std::int64_t> ts = parseTimestamp(argv[++i]);
            if (!ts) {
                std::cerr << "Invalid timestamp for " << arg << ": " << argv[i] << "\n";
                return std::nullopt;
            }
            (arg == "--start" ? args.start : args.end) = ts;
        } else if (!arg.empty() && arg[0] != '-' && args.command.empty()) {
            args.command = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (args.dbPath.empty() || args.command.empty()) {
        return std::nullopt;
    }
    const bool needsAggregate = args.command == "head" || args.command == "list" || args.command == "verify";
    if (needsAggregate && args.aggregateId.empty()) {
        std::cerr << args.command << " requires --aggregate\n";
        return std::nullopt;
    }
    if (!needsAggregate && args.command != "all") {
        std::cerr << "Unknown command: " << args.command << "\n";
        return std::nullopt;
    }
    return args;
}

int run(const Arguments& args) {
    if (!fs::exists(args.dbPath)) {
        std::cerr << "No journal at " << args.dbPath << "\n";
        return 1;
    }

    journal::sqlite::SqliteOptions options = journal::sqlite::SqliteOptions::fromEnvironment();
    options.path = args.dbPath;
    options.readOnly = true;
    journal::sqlite::FileDatabaseFactory factory(options);
    std::shared_ptr<const journal::EventCodec> codec = journal::EventCodec::permissive();
    journal::Journal journal = journal::Journal::createPersistent(factory, codec);
    journal::EventStore& store = journal.eventStore();

    if (args.command == "head") {
        std::optional<journal::Hash> head = store.head(args.aggregateId);
        std::cout << (head ? head->toString() : std::string("(none)")) << "\n";
        return 0;
    }

    if (args.command == "list") {
        journal::EventFilter filter;
        filter.aggregateId = args.aggregateId;
        filter.type = args.type;
        filter.start = args.start;
        filter.end = args.end;
        for (const journal::Event& event : store.events(filter)) {
            std::cout << codec->encode(event) << "\n";
        }
        return 0;
    }

    if (args.command == "all") {
        journal::EventStream stream = store.getAllEvents();
        for (const journal::Event& event : stream) {
            std::cout << codec->encode(event) << "\n";
        }
        return 0;
    }

    journal::ChainReport report = journal::verifyChain(store, args.aggregateId);
    for (const std::string& problem : report.problems) {
        std::cout << "BROKEN " << problem << "\n";
    }
    if (report.ok()) {
        std::cout << "OK " << report.eventCount << " events, head "
                  << (report.head ? report.head->toString() : std::string("(none)")) << "\n";
        return 0;
    }
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<Arguments> args = parseArguments(argc, argv);
    if (!args) {
        return usage();
    }

    try {
        return run(*args);
    } catch (const journal::JournalError& e) {
        qCCritical(journalTools, "%s failed (%s): %s", args->command.c_str(), journal::errorCodeToString(e.code()),
                   e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
