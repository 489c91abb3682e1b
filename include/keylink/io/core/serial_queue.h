#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace keylink::io {

// One worker thread running posted jobs strictly in order.
// A job that fails does not stop the ones queued behind it.
class SerialQueue {
public:
    using Job = std::function<void()>;

    SerialQueue();

    // Runs whatever is still queued, then joins the worker.
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    void post(Job job);

    // True when called from the worker thread.
    bool onWorkerThread() const noexcept;

private:
    void workerLoop();

    std::mutex              _mx;
    std::condition_variable _cv;
    std::deque<Job>         _jobs;
    bool                    _stopping{false};
    std::thread             _worker;
};

} // namespace keylink::io
