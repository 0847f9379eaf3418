#include "omotes/in_memory_message_bus.hpp"

#include <vector>
#include "omotes/logging.hpp"

namespace omotes {

void InMemoryMessageBus::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
    log_debug(log_domains::INTERNAL, "Message bus started");
}

void InMemoryMessageBus::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    consumers_.clear();
    log_debug(log_domains::INTERNAL, "Message bus stopped");
}

void InMemoryMessageBus::publish(const std::string& queue_name, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[queue_name].push_back({next_sequence_++, message});
}

void InMemoryMessageBus::subscribe(const std::string& queue_name, MessageCallback on_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    Consumer consumer;
    consumer.on_message = std::move(on_message);
    consumers_[queue_name] = std::move(consumer);
}

void InMemoryMessageBus::unsubscribe(const std::string& queue_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    consumers_.erase(queue_name);
}

void InMemoryMessageBus::receive_once(const std::string& queue_name,
                                      std::optional<std::chrono::milliseconds> timeout,
                                      MessageCallback on_message,
                                      TimeoutCallback on_timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    Consumer consumer;
    consumer.on_message = std::move(on_message);
    consumer.once = true;
    if (timeout) {
        consumer.deadline = Clock::now() + *timeout;
    }
    consumer.on_timeout = std::move(on_timeout);
    consumers_[queue_name] = std::move(consumer);
}

size_t InMemoryMessageBus::process_events() {
    size_t invoked = 0;
    uint64_t horizon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return 0;
        }
        horizon = next_sequence_;
    }

    while (true) {
        MessageCallback callback;
        std::string body;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                break;
            }

            // Oldest deliverable message across all queues with a consumer.
            std::map<std::string, std::deque<Envelope>>::iterator oldest = queues_.end();
            for (auto it = queues_.begin(); it != queues_.end(); ++it) {
                if (it->second.empty() || it->second.front().sequence >= horizon) continue;
                if (consumers_.count(it->first) == 0) continue;
                if (oldest == queues_.end() ||
                    it->second.front().sequence < oldest->second.front().sequence) {
                    oldest = it;
                }
            }
            if (oldest == queues_.end()) {
                break;
            }

            auto consumer_it = consumers_.find(oldest->first);
            callback = consumer_it->second.on_message;
            if (consumer_it->second.once) {
                consumers_.erase(consumer_it);
            }
            body = std::move(oldest->second.front().body);
            oldest->second.pop_front();
            if (oldest->second.empty()) {
                queues_.erase(oldest);
            }
        }

        ++invoked;
        callback(body);
    }

    std::vector<TimeoutCallback> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        for (auto it = consumers_.begin(); it != consumers_.end();) {
            const Consumer& consumer = it->second;
            if (consumer.once && consumer.deadline && *consumer.deadline <= now) {
                log_debug(log_domains::INTERNAL, "No message received before timeout",
                          {{"queue", it->first}});
                if (consumer.on_timeout) {
                    expired.push_back(consumer.on_timeout);
                }
                it = consumers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& on_timeout : expired) {
        ++invoked;
        on_timeout();
    }
    return invoked;
}

size_t InMemoryMessageBus::run_until_idle(size_t max_rounds) {
    size_t total = 0;
    for (size_t round = 0; round < max_rounds; ++round) {
        size_t invoked = process_events();
        if (invoked == 0) {
            break;
        }
        total += invoked;
    }
    return total;
}

size_t InMemoryMessageBus::pending(const std::string& queue_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(queue_name);
    return it != queues_.end() ? it->second.size() : 0;
}

size_t InMemoryMessageBus::queue_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.size();
}

size_t InMemoryMessageBus::consumer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumers_.size();
}

bool InMemoryMessageBus::has_consumer(const std::string& queue_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumers_.count(queue_name) > 0;
}

bool InMemoryMessageBus::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace omotes
