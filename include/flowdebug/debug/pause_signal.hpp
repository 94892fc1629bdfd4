#pragma once

#include "flowdebug/utils/types.hpp"
#include <condition_variable>
#include <mutex>

namespace flowdebug {

/**
 * @brief Level-set go/stop signal gating the worker thread
 *
 * set() while already set is a no-op; a wait() on a set signal returns
 * immediately. clear() only affects waits that start afterwards.
 *
 * release() sets the signal and starts a new epoch. A waiter that took
 * epoch() before deciding to block uses clear_if() so that a release in
 * between is never undone.
 */
class PauseSignal {
public:
    explicit PauseSignal(bool initially_set = true) : is_set_(initially_set) {}

    PauseSignal(const PauseSignal&) = delete;
    PauseSignal& operator=(const PauseSignal&) = delete;

    void set();
    void clear();
    bool is_set() const;

    void release();
    u64 epoch() const;
    // Clears only if no release() happened since `epoch` was read
    bool clear_if(u64 epoch);

    void wait();

    // Returns false if the timeout expired before the signal was set
    bool wait_for(Duration timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool is_set_;
    u64 epoch_ = 0;
};

}  // namespace flowdebug
