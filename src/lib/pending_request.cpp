#include "keylink/io/core/pending_request.h"

#include "keylink/core/logging.h"

#include <stdexcept>

namespace keylink::io {

static constexpr const char* TAG = "slot";

void PendingRequestSlot::arm(Matcher matcher)
{
    std::lock_guard<std::mutex> g(_mx);
    if (_armed) {
        throw std::logic_error("a response listener is already armed");
    }
    _armed   = true;
    _matcher = std::move(matcher);
    _inbox.clear();
    _abort = nullptr;
}

void PendingRequestSlot::disarm()
{
    std::lock_guard<std::mutex> g(_mx);
    _armed = false;
    _matcher = nullptr;
    _inbox.clear();
    _abort = nullptr;
}

bool PendingRequestSlot::armed() const
{
    std::lock_guard<std::mutex> g(_mx);
    return _armed;
}

std::optional<protocol::WrapperPacket> PendingRequestSlot::await(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(_mx);
    _cv.wait_for(lk, timeout, [this] { return !_inbox.empty() || _abort; });

    if (_abort) {
        std::rethrow_exception(_abort);
    }
    if (_inbox.empty()) {
        return std::nullopt;
    }

    protocol::WrapperPacket pkt = _inbox.front();
    _inbox.pop_front();
    return pkt;
}

bool PendingRequestSlot::offer(const protocol::WrapperPacket& pkt)
{
    {
        std::lock_guard<std::mutex> g(_mx);
        if (!_armed) {
            KL_LOGD(TAG, "report with no listener dropped (client 0x%08x)", pkt.clientId());
            return false;
        }
        if (_matcher && !_matcher(pkt)) {
            return false;
        }
        _inbox.push_back(pkt);
    }
    _cv.notify_all();
    return true;
}

void PendingRequestSlot::abort(std::exception_ptr reason)
{
    {
        std::lock_guard<std::mutex> g(_mx);
        if (!_armed) {
            return;
        }
        _abort = std::move(reason);
    }
    _cv.notify_all();
}

} // namespace keylink::io
