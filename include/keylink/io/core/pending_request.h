#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>

#include "keylink/io/protocol/wrapper_packet.h"

namespace keylink::io {

// The single "waiting for a reply" slot of a device.
//
// The FIFO guarantees one exchange at a time, so at most one listener is ever
// armed. Arming a second one while the first is live is a defect and throws
// std::logic_error.
//
// Correlation is whatever the matcher checks (wrapper prefix + client id,
// plus an optional caller check). The protocol carries no per-request
// sequence number, so a late reply to a timed-out command that arrives after
// the next listener is armed is indistinguishable from that command's own
// reply and will be accepted by it.
class PendingRequestSlot {
public:
    using Matcher = std::function<bool(const protocol::WrapperPacket&)>;

    void arm(Matcher matcher);
    void disarm();
    bool armed() const;

    // Next accepted packet, or nullopt after `timeout`.
    // Rethrows the abort reason if abort() was called while armed.
    std::optional<protocol::WrapperPacket> await(std::chrono::milliseconds timeout);

    // Inbound path (reader thread). Returns true when the packet was taken.
    bool offer(const protocol::WrapperPacket& pkt);

    // Fail the armed waiter (disconnect / close). No-op when nothing is armed.
    void abort(std::exception_ptr reason);

private:
    mutable std::mutex                    _mx;
    std::condition_variable               _cv;
    bool                                  _armed{false};
    Matcher                               _matcher;
    std::deque<protocol::WrapperPacket>   _inbox;
    std::exception_ptr                    _abort;
};

// Arms on construction, disarms on scope exit.
class ArmedListener {
public:
    ArmedListener(PendingRequestSlot& slot, PendingRequestSlot::Matcher matcher)
        : _slot(slot)
    {
        _slot.arm(std::move(matcher));
    }

    ~ArmedListener() { _slot.disarm(); }

    ArmedListener(const ArmedListener&) = delete;
    ArmedListener& operator=(const ArmedListener&) = delete;

private:
    PendingRequestSlot& _slot;
};

} // namespace keylink::io
