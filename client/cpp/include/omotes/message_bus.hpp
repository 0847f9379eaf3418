#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace omotes {

/**
 * Broker transport used by all three sides of the protocol.
 *
 * A queue holds messages until a consumer takes them, so a consumer that
 * attaches after a publish still receives the message. Each queue has at
 * most one consumer; subscribing again replaces the previous consumer.
 *
 * Implementations deliver messages through the callbacks; whether that
 * happens on a broker thread or from an explicit pump is up to the
 * implementation. Exceptions thrown by a callback are not swallowed.
 */
class MessageBus {
public:
    using MessageCallback = std::function<void(const std::string& message)>;
    using TimeoutCallback = std::function<void()>;

    virtual ~MessageBus() = default;

    /**
     * Connect to the broker. Must be called before messages are delivered.
     */
    virtual void start() = 0;

    /**
     * Disconnect and drop all consumers. Queued messages are kept.
     */
    virtual void stop() = 0;

    /**
     * Enqueue a message. Never invokes a callback before returning.
     */
    virtual void publish(const std::string& queue_name, const std::string& message) = 0;

    /**
     * Consume every message on the queue until unsubscribed.
     */
    virtual void subscribe(const std::string& queue_name, MessageCallback on_message) = 0;

    /**
     * Remove the consumer of a queue. Idempotent.
     */
    virtual void unsubscribe(const std::string& queue_name) = 0;

    /**
     * Consume exactly one message from the queue.
     *
     * @param timeout How long to wait; std::nullopt waits forever
     * @param on_message Called with the message if one arrives in time
     * @param on_timeout Called if the timeout passes first; may be empty
     */
    virtual void receive_once(const std::string& queue_name,
                              std::optional<std::chrono::milliseconds> timeout,
                              MessageCallback on_message,
                              TimeoutCallback on_timeout) = 0;
};

} // namespace omotes
