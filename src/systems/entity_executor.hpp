#pragma once
#include "../message_bus.hpp"
#include "command_ingestion.hpp"
#include <cstddef>
#include <memory>
#include <string>

// Subscribes one named entity to the command topic. Every executor sees every
// command on the topic; ingestion filters by name so several entities can
// share one topic. Unsubscribes on destruction.
class EntityExecutor {
public:
    EntityExecutor(std::shared_ptr<MessageBus> bus, const std::string& command_topic,
                   std::string entity_name, std::shared_ptr<CommandIngestion> ingestion);
    ~EntityExecutor();

    EntityExecutor(const EntityExecutor&)            = delete;
    EntityExecutor& operator=(const EntityExecutor&) = delete;

    const std::string&  entity_name() const { return entity_name_; }
    const IngestResult& last_result() const { return last_result_; }
    std::size_t         accepted() const    { return accepted_; }

private:
    void on_command(const std::string& payload);

    std::shared_ptr<MessageBus>       bus_;
    std::string                       entity_name_;
    std::shared_ptr<CommandIngestion> ingestion_;
    MessageBus::SubscriptionId        subscription_ = 0;
    IngestResult                      last_result_;
    std::size_t                       accepted_ = 0;
};
