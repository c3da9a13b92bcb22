#include "stdin_source.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <thread>
#include <utility>

StdinSource::StdinSource(std::shared_ptr<MessageBus> bus, std::string topic)
    : bus_(std::move(bus)), topic_(std::move(topic)) {}

StdinSource::~StdinSource() { stop(); }

void StdinSource::start() {
    if (started_) return;
    started_ = true;

    std::thread([bus = bus_, topic = topic_, state = state_]() {
        std::string line;
        while (!state->stop.load() && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            if (state->stop.load()) break;
            bus->post(topic, line);
        }
        state->eof.store(true);
        spdlog::debug("stdin: reader finished");
    }).detach();
    spdlog::info("stdin: reading move commands for '{}'", topic_);
}

void StdinSource::stop() {
    state_->stop.store(true);
}
