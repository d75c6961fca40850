#pragma once

#include <condition_variable>
#include <mutex>

#include "c8vm_prelude.hpp"

namespace c8vm {

// A boolean that one thread flips and another thread sleeps on. Used to wake the
// timer thread up early when it has to stop.
class sync_flag {
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    bool flag;

    void assign(bool state)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            flag = state;
        }
        cv.notify_all();
    }

public:
    sync_flag() : flag(false) {}

    bool check() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return flag;
    }

    void set(void) { assign(true); }
    void unset(void) { assign(false); }

    void wait(bool state) const
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return flag == state; });
    }

    // Returns true if the flag reached `state` before `release_time`.
    bool wait_until(bool state, const c8vm::clock::time_point& release_time) const
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_until(lock, release_time, [&] { return flag == state; });
    }
};

} // namespace c8vm
