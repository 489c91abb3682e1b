#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>

#include "keylink/config/keylink_config.h"
#include "keylink/core/scheduled_task.h"
#include "keylink/io/core/pending_request.h"
#include "keylink/io/core/serial_queue.h"
#include "keylink/io/protocol/wrapper_packet.h"
#include "keylink/io/transport/hid_transport.h"
#include "keylink/session/nonce_source.h"

namespace keylink::session {

using Clock = std::chrono::steady_clock;

// Time-bounded client identity on the shared channel. clientId 0 means "no
// lease"; a granted lease never has id 0.
struct ClientLease {
    io::protocol::ClientId clientId{io::protocol::NO_CLIENT};
    std::uint16_t          ttlSeconds{0};
    Clock::time_point      expiry{};

    bool held() const noexcept { return clientId != io::protocol::NO_CLIENT; }
    bool validAt(Clock::time_point now) const noexcept { return held() && now < expiry; }
};

enum class LeaseState : std::uint8_t {
    Unleased,
    Bootstrapping,
    Leased,
    Renewing,
    Expired,
};

const char* to_string(LeaseState s) noexcept;

// Acquires and renews the client lease through the nonce-challenge
// bootstrap. Bootstraps run as jobs on the device FIFO so they never overlap
// a command exchange, and at most one is in flight at a time: concurrent
// ensureLease() callers and the renewal timer all share it.
class LeaseManager {
public:
    LeaseManager(io::HidTransport& transport,
                 io::SerialQueue& queue,
                 io::PendingRequestSlot& slot,
                 NonceSource& nonces,
                 const config::ProtocolConfig& cfg);
    ~LeaseManager();

    LeaseManager(const LeaseManager&) = delete;
    LeaseManager& operator=(const LeaseManager&) = delete;

    // Ready immediately while the lease is valid; otherwise the (shared)
    // in-flight bootstrap. Fails with BootstrapFailure / ConnectionError.
    // Must not be waited on from the FIFO worker.
    std::shared_future<ClientLease> ensureLease();

    // Drop the lease and cancel renewal (close / disconnect). A bootstrap
    // still running completes with ConnectionError.
    void reset();

    LeaseState state() const;
    ClientLease current() const;

private:
    std::shared_future<ClientLease> startBootstrapLocked(LeaseState next);
    void renewFromTimer();
    ClientLease runBootstrap();

    io::HidTransport&             _transport;
    io::SerialQueue&              _queue;
    io::PendingRequestSlot&       _slot;
    NonceSource&                  _nonces;
    const config::ProtocolConfig& _cfg;

    mutable std::mutex              _mx;
    LeaseState                      _state{LeaseState::Unleased};
    ClientLease                     _lease;
    std::shared_future<ClientLease> _inflight;
    std::uint64_t                   _generation{0};

    core::ScheduledTask             _renewal;
};

} // namespace keylink::session
