#include "keylink/core/scheduled_task.h"

namespace keylink::core {

ScheduledTask::~ScheduledTask()
{
    cancel();
}

void ScheduledTask::schedule(std::chrono::milliseconds delay, Callback cb)
{
    cancel();

    std::lock_guard<std::mutex> g(_mx);
    const std::uint64_t gen = ++_generation;
    _pending = true;

    const auto deadline = std::chrono::steady_clock::now() + delay;
    _worker = std::thread([this, gen, deadline, cb = std::move(cb)]() {
        {
            std::unique_lock<std::mutex> lk(_mx);
            _cv.wait_until(lk, deadline, [this, gen] { return _generation != gen; });
            if (_generation != gen) {
                return; // cancelled or replaced
            }
            _pending = false;
        }
        cb();
    });
}

void ScheduledTask::cancel()
{
    {
        std::lock_guard<std::mutex> g(_mx);
        ++_generation;
        _pending = false;
    }
    _cv.notify_all();
    stopWorker();
}

bool ScheduledTask::pending() const
{
    std::lock_guard<std::mutex> g(_mx);
    return _pending;
}

void ScheduledTask::stopWorker()
{
    std::thread worker;
    {
        std::lock_guard<std::mutex> g(_mx);
        worker = std::move(_worker);
    }
    if (!worker.joinable()) {
        return;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
        // Rescheduled from inside the callback; the callback is finishing.
        worker.detach();
    } else {
        worker.join();
    }
}

} // namespace keylink::core
