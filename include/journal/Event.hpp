#pragma once

#include "journal/Hash.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace journal {

// Immutable fact about an aggregate. Persisted exactly once by a successful commit.
struct Event {
    std::string id;
    std::string aggregateId;
    std::int64_t timestamp{0};
    // Hash of the event this one follows; empty for the first event of an aggregate.
    std::optional<Hash> currentVersion;
    std::string type;
    nlohmann::json payload = nlohmann::json::object();

    // SHA-256 over the canonical encoding of every field above.
    Hash hash() const;

    // The predecessor hash with "none" spelled as the zero hash.
    Hash parentOrZero() const;
};

bool operator==(const Event& a, const Event& b);
bool operator!=(const Event& a, const Event& b);

// Order-sensitive byte encoding hashed by Event::hash(). Throws InvalidArgument
// for content validateEncodable() rejects.
std::string canonicalEncoding(const Event& event);

// Throws InvalidArgument unless every string field, payload key and payload string
// is valid UTF-8 and every payload number is finite. JSON cannot carry anything
// else without loss.
void validateEncodable(const Event& event);

struct EventFilter {
    std::string aggregateId;
    std::optional<std::string> type;
    std::optional<std::int64_t> start;  // inclusive
    std::optional<std::int64_t> end;    // inclusive

    bool matches(const Event& event) const;
};

}  // namespace journal
