// ============================================================================
// event_channel.cpp — implementation for bacgate/event_channel.hpp
// ============================================================================

#include "bacgate/event_channel.hpp"

namespace bacgate {

bool EventChannel::push(const BacnetEvent& ev) {
    std::unique_lock<std::mutex> lock(mu_);
    not_full_.wait(lock, [this] { return closed_ || !queue_.full(); });
    if (closed_) return false;
    queue_.push_back(ev);
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

bool EventChannel::pop(BacnetEvent& out) {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) return false;          // closed and drained
    out = queue_.front();
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
}

bool EventChannel::pop_for(BacnetEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); }))
        return false;
    if (queue_.empty()) return false;
    out = queue_.front();
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

} // namespace bacgate
