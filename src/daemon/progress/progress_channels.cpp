#include "progress/progress_channels.hpp"

#include <algorithm>

Subscription::Subscription(std::string task_id, size_t backlog, WakeFn wake)
    : task_id_(std::move(task_id)), backlog_(std::max<size_t>(backlog, 1)), wake_(std::move(wake)) {}

std::optional<ProgressEvent> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mu_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    auto ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

std::vector<ProgressEvent> Subscription::drain() {
    std::lock_guard lock(mu_);
    std::vector<ProgressEvent> out(std::make_move_iterator(queue_.begin()),
                                   std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

bool Subscription::closed() const {
    std::lock_guard lock(mu_);
    return closed_ && queue_.empty();
}

uint64_t Subscription::dropped() const {
    std::lock_guard lock(mu_);
    return dropped_;
}

void Subscription::push(const ProgressEvent& event) {
    {
        std::lock_guard lock(mu_);
        if (closed_) return;
        if (queue_.size() >= backlog_) {
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(event);
    }
    cv_.notify_all();
    if (wake_) wake_();
}

void Subscription::close() {
    {
        std::lock_guard lock(mu_);
        if (closed_) return;
        closed_ = true;
    }
    cv_.notify_all();
    if (wake_) wake_();
}

ProgressChannels::ProgressChannels(size_t backlog, size_t closed_memory)
    : backlog_(backlog), closed_memory_(std::max<size_t>(closed_memory, 1)) {}

std::shared_ptr<Subscription> ProgressChannels::subscribe(const std::string& task_id,
                                                          Subscription::WakeFn wake) {
    auto sub = std::make_shared<Subscription>(task_id, backlog_, std::move(wake));

    bool already_closed = false;
    {
        std::lock_guard lock(mu_);
        if (closed_.contains(task_id)) {
            already_closed = true;
        } else {
            channels_[task_id].subscribers.push_back(sub);
        }
    }
    if (already_closed) sub->close();
    return sub;
}

void ProgressChannels::unsubscribe(const std::shared_ptr<Subscription>& sub) {
    if (!sub) return;
    std::lock_guard lock(mu_);
    auto it = channels_.find(sub->task_id());
    if (it == channels_.end()) return;
    std::erase(it->second.subscribers, sub);
    // Nothing published yet, so no sequence numbers to preserve.
    if (it->second.subscribers.empty() && it->second.next_seq == 1) channels_.erase(it);
}

uint64_t ProgressChannels::publish(const std::string& task_id, EventPayload payload) {
    std::vector<std::shared_ptr<Subscription>> targets;
    ProgressEvent event{.task_id = task_id, .payload = std::move(payload)};
    {
        std::lock_guard lock(mu_);
        if (closed_.contains(task_id)) return 0;
        auto& ch = channels_[task_id];
        event.seq = ch.next_seq++;
        event.timestamp = utc_timestamp();
        targets = ch.subscribers;
    }

    // Delivered outside the registry lock so a slow wake callback never
    // holds up other tasks.
    for (auto& sub : targets) {
        sub->push(event);
    }
    return event.seq;
}

void ProgressChannels::close(const std::string& task_id) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard lock(mu_);
        if (closed_.insert(task_id).second) {
            closed_order_.push_back(task_id);
            if (closed_order_.size() > closed_memory_) {
                closed_.erase(closed_order_.front());
                closed_order_.pop_front();
            }
        }
        auto it = channels_.find(task_id);
        if (it != channels_.end()) {
            targets = std::move(it->second.subscribers);
            channels_.erase(it);
        }
    }
    for (auto& sub : targets) {
        sub->close();
    }
}

size_t ProgressChannels::subscriber_count(const std::string& task_id) const {
    std::lock_guard lock(mu_);
    auto it = channels_.find(task_id);
    return it != channels_.end() ? it->second.subscribers.size() : 0;
}

bool ProgressChannels::is_closed(const std::string& task_id) const {
    std::lock_guard lock(mu_);
    return closed_.contains(task_id);
}

size_t ProgressChannels::channel_count() const {
    std::lock_guard lock(mu_);
    return channels_.size();
}
