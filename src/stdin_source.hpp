#pragma once
#include "message_bus.hpp"
#include <atomic>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// StdinSource — feeds the command topic from standard input.
//
// A background thread reads one payload per line and post()s it to the bus;
// the frame's pump() publishes it on the main thread. Blank lines are
// skipped. The thread is detached because std::getline cannot be
// interrupted; stop() only stops further posting.
// ---------------------------------------------------------------------------

class StdinSource {
public:
    StdinSource(std::shared_ptr<MessageBus> bus, std::string topic);
    ~StdinSource();

    StdinSource(const StdinSource&)            = delete;
    StdinSource& operator=(const StdinSource&) = delete;

    void start();
    void stop();

    // True once stdin hit EOF.
    bool finished() const { return state_->eof.load(); }

private:
    struct State {
        std::atomic<bool> stop{false};
        std::atomic<bool> eof{false};
    };

    std::shared_ptr<MessageBus> bus_;
    std::string                 topic_;
    std::shared_ptr<State>      state_ = std::make_shared<State>();
    bool                        started_ = false;
};
