#pragma once

#include <string>
#include <vector>

struct EntityDescriptor {
    const char* component;
    const char* object_id;
    const char* name;
    const char* unique_suffix;
    const char* initial_state;   // nullptr for entities without a state topic
    bool has_command_topic;
    const char* extra;           // discovery fields specific to the entity, as a JSON object
};

// Discovery catalog and topic layout for the bus.
//   discovery:  <prefix>/<component>/<node>/<object>/config
//   state:      <node>/<component>/<object>/state
//   command:    <node>/<component>/<object>/set
//   events:     <node>/event/<type>/state
class EntityCatalog {
public:
    static const size_t ENTITY_COUNT = 16;
    static const char* const EVENT_TYPES[2];

    EntityCatalog(const std::string& node_id, const std::string& discovery_prefix);

    const std::vector<EntityDescriptor>& entities() const;
    const EntityDescriptor* find(const std::string& component, const std::string& object_id) const;

    std::string discoveryTopic(const std::string& component, const std::string& object_id) const;
    std::string stateTopic(const std::string& component, const std::string& object_id) const;
    std::string commandTopic(const std::string& component, const std::string& object_id) const;
    std::string commandWildcard() const;
    std::string eventTopic(const std::string& event_type) const;
    std::string eventDiscoveryTopic(const std::string& event_type) const;
    std::string imageTopic() const;

    std::string discoveryPayload(const EntityDescriptor& entity) const;
    std::string eventDiscoveryPayload(const std::string& event_type) const;

    // Splits <node>/<component>/<object>/set. False for any other shape or node.
    bool parseCommandTopic(const std::string& topic, std::string& component, std::string& object_id) const;

    const std::string& nodeId() const { return node_id_; }

private:
    std::string node_id_;
    std::string discovery_prefix_;
};
