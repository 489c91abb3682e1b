#include "keylink/io/core/serial_queue.h"

#include "keylink/core/logging.h"

#include <exception>
#include <utility>

namespace keylink::io {

static constexpr const char* TAG = "queue";

SerialQueue::SerialQueue()
    : _worker(&SerialQueue::workerLoop, this)
{
}

SerialQueue::~SerialQueue()
{
    {
        std::lock_guard<std::mutex> g(_mx);
        _stopping = true;
    }
    _cv.notify_all();
    if (_worker.joinable()) {
        _worker.join();
    }
}

void SerialQueue::post(Job job)
{
    {
        std::lock_guard<std::mutex> g(_mx);
        _jobs.push_back(std::move(job));
    }
    _cv.notify_one();
}

bool SerialQueue::onWorkerThread() const noexcept
{
    return std::this_thread::get_id() == _worker.get_id();
}

void SerialQueue::workerLoop()
{
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(_mx);
            _cv.wait(lk, [this] { return _stopping || !_jobs.empty(); });
            if (_jobs.empty()) {
                return; // stopping and drained
            }
            job = std::move(_jobs.front());
            _jobs.pop_front();
        }

        // Jobs report their own outcome through their promise; anything that
        // escapes is only logged so the next job still runs.
        try {
            job();
        } catch (const std::exception& ex) {
            KL_LOGE(TAG, "queued job threw: %s", ex.what());
        }
    }
}

} // namespace keylink::io
