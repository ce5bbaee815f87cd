#include "sandbox/output_channel.hpp"

namespace rampart::sandbox {

void OutputChannel::Publish(OutputEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push(std::move(event));
    }
    cv_.notify_one();
}

bool OutputChannel::Consume(OutputEvent& event) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return false;
    }
    event = std::move(events_.front());
    events_.pop();
    return true;
}

bool OutputChannel::TryConsume(OutputEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; })) {
        return false;
    }
    if (events_.empty()) {
        return false;
    }
    event = std::move(events_.front());
    events_.pop();
    return true;
}

void OutputChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool OutputChannel::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t OutputChannel::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace rampart::sandbox
