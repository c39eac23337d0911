#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "esp_err.h"
#include "message_bus.hpp"
#include "entity_catalog.hpp"

// Home Assistant facing side of the bus: discovery, state, events and commands.
// Publish failures are logged here and never reported further.
class BusAdapter {
public:
    using CommandCallback = std::function<void(const std::string& component, const std::string& object_id,
                                               const std::string& payload)>;

    // "component/object_id" to state text
    using StateMap = std::map<std::string, std::string>;

    static const size_t MAX_STATE_CHARS = 255;

    BusAdapter(MessageBus& bus, const EntityCatalog& catalog);

    // Retained discovery for every entity and both event types. Safe to repeat.
    esp_err_t registerEntities();
    // Catalog defaults, except where the running gateway already holds a value
    esp_err_t publishInitialStates(const StateMap& live = StateMap());

    // entity_id is "component/object_id"
    void publishState(const std::string& entity_id, const std::string& value, bool retain = true);
    void publishStateOnOff(const std::string& entity_id, bool on);
    void publishImage(const std::vector<uint8_t>& image);
    // data_json must be a JSON object; event_type is merged in first.
    void fireEvent(const std::string& event_type, const std::string& data_json);

    esp_err_t subscribeCommands(CommandCallback callback);

    const EntityCatalog& catalog() const { return catalog_; }

    // Truncates to max_chars code points without splitting a UTF-8 sequence.
    static std::string truncate(const std::string& text, size_t max_chars);

private:
    void handleMessage(const std::string& topic, const std::string& payload);

    MessageBus& bus_;
    const EntityCatalog& catalog_;
    CommandCallback command_callback_;
};
