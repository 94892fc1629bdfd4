#include "flowdebug/debug/pause_signal.hpp"

namespace flowdebug {

void PauseSignal::set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_set_) {
            return;
        }
        is_set_ = true;
    }
    cv_.notify_all();
}

void PauseSignal::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    is_set_ = false;
}

void PauseSignal::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epoch_;
        is_set_ = true;
    }
    cv_.notify_all();
}

u64 PauseSignal::epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

bool PauseSignal::clear_if(u64 epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (epoch_ != epoch) {
        return false;
    }
    is_set_ = false;
    return true;
}

bool PauseSignal::is_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_set_;
}

void PauseSignal::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return is_set_; });
}

bool PauseSignal::wait_for(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return is_set_; });
}

}  // namespace flowdebug
