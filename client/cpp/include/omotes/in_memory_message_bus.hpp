#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "message_bus.hpp"

namespace omotes {

/**
 * Process-local MessageBus with broker-queue semantics.
 *
 * Nothing is delivered until process_events() is called. Delivery is
 * sequential on the calling thread, in global publish order, and callbacks
 * run without the internal lock held so they may publish, subscribe or
 * unsubscribe.
 *
 * Example:
 *   auto bus = std::make_shared<InMemoryMessageBus>();
 *   bus->start();
 *   bus->subscribe("jobs.1.progress", [](const std::string& m) { ... });
 *   bus->publish("jobs.1.progress", payload);
 *   bus->run_until_idle();
 */
class InMemoryMessageBus : public MessageBus {
public:
    using Clock = std::chrono::steady_clock;

    void start() override;
    void stop() override;
    void publish(const std::string& queue_name, const std::string& message) override;
    void subscribe(const std::string& queue_name, MessageCallback on_message) override;
    void unsubscribe(const std::string& queue_name) override;
    void receive_once(const std::string& queue_name,
                      std::optional<std::chrono::milliseconds> timeout,
                      MessageCallback on_message,
                      TimeoutCallback on_timeout) override;

    /**
     * Deliver every message that was queued when the call started and has a
     * consumer, then fire expired receive_once timeouts.
     *
     * Messages published by callbacks during this call wait for the next
     * call. Does nothing while the bus is stopped.
     *
     * @return Number of callbacks invoked
     * @throws Whatever a callback throws; the message is consumed
     */
    size_t process_events();

    /**
     * Call process_events() until a pass invokes no callback.
     *
     * @param max_rounds Upper bound on passes for callbacks that keep publishing
     * @return Total number of callbacks invoked
     */
    size_t run_until_idle(size_t max_rounds = 1000);

    /// Messages waiting on a queue.
    size_t pending(const std::string& queue_name) const;

    bool has_consumer(const std::string& queue_name) const;

    /** Queues currently holding at least one undelivered message. */
    size_t queue_count() const;

    size_t consumer_count() const;

    bool is_running() const;

private:
    struct Envelope {
        uint64_t sequence;
        std::string body;
    };

    struct Consumer {
        MessageCallback on_message;
        bool once = false;
        std::optional<Clock::time_point> deadline;
        TimeoutCallback on_timeout;
    };

    mutable std::mutex mutex_;
    bool running_ = false;
    uint64_t next_sequence_ = 0;
    std::map<std::string, std::deque<Envelope>> queues_;
    std::map<std::string, Consumer> consumers_;
};

} // namespace omotes
