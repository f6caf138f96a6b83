#pragma once

#include "journal/Event.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace journal {

// Checks the payload shape for one event type. Throws std::exception on mismatch.
using PayloadValidator = std::function<void(const nlohmann::json& payload)>;

// Maps event type discriminators to the payload shape they carry.
class EventTypeRegistry {
public:
    void registerType(const std::string& type, PayloadValidator validator = {});

    bool contains(const std::string& type) const;
    std::vector<std::string> types() const;

    // Throws DecodeError if the type is unknown or its validator rejects the payload.
    void validate(const std::string& type, const nlohmann::json& payload) const;

private:
    std::map<std::string, PayloadValidator> m_validators;
};

// Encodes events to the self-describing JSON document stored as the row payload.
class EventCodec {
public:
    // Strict: decode rejects event types missing from the registry.
    explicit EventCodec(std::shared_ptr<const EventTypeRegistry> registry);

    // Accepts every event type.
    static std::shared_ptr<const EventCodec> permissive();

    // Throws InvalidArgument for events validateEncodable() rejects.
    std::string encode(const Event& event) const;

    // Throws DecodeError on malformed documents or unregistered types.
    Event decode(std::string_view document) const;

private:
    EventCodec() = default;

    std::shared_ptr<const EventTypeRegistry> m_registry;
};

}  // namespace journal
