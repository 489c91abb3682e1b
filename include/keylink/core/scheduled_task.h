#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace keylink::core {

// Runs one callback after a delay on its own thread, unless cancelled first.
// Rescheduling cancels the pending run. The callback may itself call
// schedule() or cancel().
class ScheduledTask {
public:
    using Callback = std::function<void()>;

    ScheduledTask() = default;
    ~ScheduledTask();

    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;

    void schedule(std::chrono::milliseconds delay, Callback cb);
    void cancel();

    bool pending() const;

private:
    void stopWorker();

    mutable std::mutex      _mx;
    std::condition_variable _cv;
    std::thread             _worker;
    std::uint64_t           _generation{0};
    bool                    _pending{false};
};

} // namespace keylink::core
