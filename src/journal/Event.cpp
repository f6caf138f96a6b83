#include "journal/Event.hpp"

#include "journal/Errors.hpp"

#include <cmath>

using json = nlohmann::json;

namespace journal {

namespace {

bool hasNonFiniteNumber(const json& value) {
    if (value.is_number_float()) {
        return !std::isfinite(value.get<double>());
    }
    if (value.is_structured()) {
        for (const json& item : value) {
            if (hasNonFiniteNumber(item)) {
                return true;
            }
        }
    }
    return false;
}

json canonicalFields(const Event& event) {
    json parent = nullptr;
    if (event.currentVersion && !event.currentVersion->isZero()) {
        parent = event.currentVersion->toString();
    }
    return json::array({event.id, event.aggregateId, event.timestamp, parent, event.type, event.payload});
}

// dump() writes NaN and Inf as null and throws type_error on invalid UTF-8.
std::string dumpChecked(const Event& event) {
    if (hasNonFiniteNumber(event.payload)) {
        throw InvalidArgument("Event payload contains a non-finite number");
    }
    try {
        return canonicalFields(event).dump();
    } catch (const json::type_error& e) {
        throw InvalidArgument(std::string("Event is not valid UTF-8: ") + e.what());
    }
}

}  // namespace

std::string canonicalEncoding(const Event& event) {
    // JSON string escaping keeps field boundaries unambiguous and objects dump
    // with sorted keys, so equal payloads always encode identically.
    return dumpChecked(event);
}

void validateEncodable(const Event& event) {
    dumpChecked(event);
}

Hash Event::hash() const {
    return Hash::of(canonicalEncoding(*this));
}

Hash Event::parentOrZero() const {
    return currentVersion ? *currentVersion : Hash::zero();
}

bool operator==(const Event& a, const Event& b) {
    return a.id == b.id && a.aggregateId == b.aggregateId && a.timestamp == b.timestamp &&
           a.parentOrZero() == b.parentOrZero() && a.type == b.type && a.payload == b.payload;
}

bool operator!=(const Event& a, const Event& b) {
    return !(a == b);
}

bool EventFilter::matches(const Event& event) const {
    if (event.aggregateId != aggregateId) {
        return false;
    }
    if (type && event.type != *type) {
        return false;
    }
    if (start && event.timestamp < *start) {
        return false;
    }
    if (end && event.timestamp > *end) {
        return false;
    }
    return true;
}

}  // namespace journal
