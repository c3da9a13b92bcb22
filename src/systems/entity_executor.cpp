#include "entity_executor.hpp"
#include <spdlog/spdlog.h>
#include <utility>

EntityExecutor::EntityExecutor(std::shared_ptr<MessageBus> bus, const std::string& command_topic,
                               std::string entity_name, std::shared_ptr<CommandIngestion> ingestion)
    : bus_(std::move(bus)), entity_name_(std::move(entity_name)), ingestion_(std::move(ingestion)) {
    subscription_ = bus_->subscribe(command_topic, [this](const std::string&, const std::string& payload) {
        on_command(payload);
    });
    spdlog::info("executor: '{}' listening on '{}'", entity_name_, command_topic);
}

EntityExecutor::~EntityExecutor() {
    bus_->unsubscribe(subscription_);
}

void EntityExecutor::on_command(const std::string& payload) {
    last_result_ = ingestion_->ingest(payload, entity_name_);
    if (last_result_.accepted()) ++accepted_;
}
