#include "journal/EventCodec.hpp"

#include "journal/Errors.hpp"
#include "journal/Logging.hpp"

#include <exception>
#include <utility>

using json = nlohmann::json;

namespace journal {

namespace {

constexpr int kDocumentSchema = 1;

}  // namespace

void EventTypeRegistry::registerType(const std::string& type, PayloadValidator validator) {
    if (type.empty()) {
        throw InvalidArgument("Event type cannot be empty");
    }
    m_validators[type] = std::move(validator);
    qCDebug(journalCodec, "Registered event type: %s", type.c_str());
}

bool EventTypeRegistry::contains(const std::string& type) const {
    return m_validators.count(type) > 0;
}

std::vector<std::string> EventTypeRegistry::types() const {
    std::vector<std::string> result;
    result.reserve(m_validators.size());
    for (const auto& entry : m_validators) {
        result.push_back(entry.first);
    }
    return result;
}

void EventTypeRegistry::validate(const std::string& type, const json& payload) const {
    auto it = m_validators.find(type);
    if (it == m_validators.end()) {
        throw DecodeError("Unregistered event type: " + type);
    }
    if (!it->second) {
        return;
    }
    try {
        it->second(payload);
    } catch (const std::exception& e) {
        throw DecodeError("Payload rejected for type " + type + ": " + e.what());
    }
}

EventCodec::EventCodec(std::shared_ptr<const EventTypeRegistry> registry) : m_registry(std::move(registry)) {
    if (!m_registry) {
        throw InvalidArgument("EventCodec requires a type registry");
    }
}

std::shared_ptr<const EventCodec> EventCodec::permissive() {
    static const std::shared_ptr<const EventCodec> codec(new EventCodec());
    return codec;
}

std::string EventCodec::encode(const Event& event) const {
    validateEncodable(event);
    json document;
    document["schema"] = kDocumentSchema;
    document["id"] = event.id;
    document["aggregate_id"] = event.aggregateId;
    document["ts"] = event.timestamp;
    if (event.currentVersion && !event.currentVersion->isZero()) {
        document["parent"] = event.currentVersion->toString();
    } else {
        document["parent"] = nullptr;
    }
    document["type"] = event.type;
    document["payload"] = event.payload;
    return document.dump();
}

Event EventCodec::decode(std::string_view document) const {
    Event event;
    try {
        json parsed = json::parse(document.begin(), document.end());
        event.id = parsed.at("id").get<std::string>();
        event.aggregateId = parsed.at("aggregate_id").get<std::string>();
        event.timestamp = parsed.at("ts").get<std::int64_t>();
        const json& parent = parsed.at("parent");
        if (!parent.is_null()) {
            event.currentVersion = Hash(parent.get<std::string>());
        }
        event.type = parsed.at("type").get<std::string>();
        if (parsed.contains("payload")) {
            event.payload = parsed.at("payload");
        }
    } catch (const std::exception& e) {
        throw DecodeError(std::string("Malformed event document: ") + e.what());
    }

    if (m_registry) {
        m_registry->validate(event.type, event.payload);
    }
    return event;
}

}  // namespace journal
