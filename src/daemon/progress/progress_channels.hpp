#pragma once

#include "progress/progress_event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// One subscriber's view of a task's event stream. The queue is bounded:
// when full, the oldest event is discarded so publishers never block.
class Subscription {
public:
    using WakeFn = std::function<void()>;

    Subscription(std::string task_id, size_t backlog, WakeFn wake = {});

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    const std::string& task_id() const { return task_id_; }

    // Blocks until an event arrives, the channel closes or the timeout passes.
    std::optional<ProgressEvent> next(std::chrono::milliseconds timeout);

    // Non-blocking: everything queued right now.
    std::vector<ProgressEvent> drain();

    // True once the channel is closed and every queued event was consumed.
    bool closed() const;
    uint64_t dropped() const;

private:
    friend class ProgressChannels;

    void push(const ProgressEvent& event);
    void close();

    std::string task_id_;
    size_t backlog_;
    WakeFn wake_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};

// Registry of per-task event channels. All methods are thread-safe.
// Late subscribers get no replay; events published with nobody
// listening are discarded. Only the most recent closed_memory closed
// task ids are remembered.
class ProgressChannels {
public:
    explicit ProgressChannels(size_t backlog = 256, size_t closed_memory = 4096);

    ProgressChannels(const ProgressChannels&) = delete;
    ProgressChannels& operator=(const ProgressChannels&) = delete;

    // wake fires (outside any lock) whenever the subscription gains an event or closes.
    std::shared_ptr<Subscription> subscribe(const std::string& task_id,
                                            Subscription::WakeFn wake = {});
    void unsubscribe(const std::shared_ptr<Subscription>& sub);

    // Stamps the event with the next sequence number and the current time.
    // Returns the assigned sequence number.
    uint64_t publish(const std::string& task_id, EventPayload payload);

    // Ends the stream: subscribers drain what is queued, then see closed().
    void close(const std::string& task_id);

    size_t subscriber_count(const std::string& task_id) const;
    bool is_closed(const std::string& task_id) const;
    size_t channel_count() const;

private:
    struct Channel {
        std::vector<std::shared_ptr<Subscription>> subscribers;
        uint64_t next_seq = 1;
    };

    size_t backlog_;
    size_t closed_memory_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Channel> channels_;
    std::unordered_set<std::string> closed_;
    std::deque<std::string> closed_order_; // oldest first
};
