#include "keylink/session/lease_manager.h"

#include "keylink/core/errors.h"
#include "keylink/core/logging.h"

#include <memory>

namespace keylink::session {

static constexpr const char* TAG = "lease";

using io::ArmedListener;
using io::protocol::BootstrapReply;
using io::protocol::NO_CLIENT;
using io::protocol::Nonce;
using io::protocol::WrapperPacket;
using io::protocol::parse_bootstrap_reply;

const char* to_string(LeaseState s) noexcept
{
    switch (s) {
    case LeaseState::Unleased:      return "unleased";
    case LeaseState::Bootstrapping: return "bootstrapping";
    case LeaseState::Leased:        return "leased";
    case LeaseState::Renewing:      return "renewing";
    case LeaseState::Expired:       return "expired";
    }
    return "?";
}

LeaseManager::LeaseManager(io::HidTransport& transport,
                           io::SerialQueue& queue,
                           io::PendingRequestSlot& slot,
                           NonceSource& nonces,
                           const config::ProtocolConfig& cfg)
    : _transport(transport)
    , _queue(queue)
    , _slot(slot)
    , _nonces(nonces)
    , _cfg(cfg)
{
}

LeaseManager::~LeaseManager()
{
    reset();
}

std::shared_future<ClientLease> LeaseManager::ensureLease()
{
    std::lock_guard<std::mutex> g(_mx);

    if (_inflight.valid()) {
        return _inflight;
    }

    if (_state == LeaseState::Leased && _lease.validAt(Clock::now())) {
        std::promise<ClientLease> ready;
        ready.set_value(_lease);
        return ready.get_future().share();
    }

    if (_state == LeaseState::Leased) {
        _state = LeaseState::Expired;
    }

    KL_LOGD(TAG, "ensureLease: %s, bootstrapping", to_string(_state));
    return startBootstrapLocked(LeaseState::Bootstrapping);
}

std::shared_future<ClientLease> LeaseManager::startBootstrapLocked(LeaseState next)
{
    _state = next;

    auto promise = std::make_shared<std::promise<ClientLease>>();
    _inflight = promise->get_future().share();
    const std::uint64_t gen = _generation;

    _queue.post([this, promise, gen]() {
        std::exception_ptr failure;
        ClientLease lease;

        try {
            lease = runBootstrap();
        } catch (...) {
            failure = std::current_exception();
        }

        bool stale = false;
        std::chrono::milliseconds renewIn{0};
        {
            std::lock_guard<std::mutex> g(_mx);
            stale = (gen != _generation);
            if (!stale) {
                _inflight = {};
                if (failure) {
                    // Renewal failures are reported, not escalated: the next
                    // ensureLease() simply bootstraps again.
                    if (_state == LeaseState::Renewing) {
                        KL_LOGE(TAG, "lease renewal failed");
                        _state = LeaseState::Expired;
                    } else {
                        _state = LeaseState::Unleased;
                    }
                    _lease = ClientLease{};
                } else {
                    _state = LeaseState::Leased;
                    _lease = lease;
                    renewIn = std::chrono::duration_cast<std::chrono::milliseconds>(
                        lease.expiry - Clock::now());
                }
            }
        }

        if (stale && !failure) {
            failure = std::make_exception_ptr(ConnectionError("device closed during bootstrap"));
        }

        if (failure) {
            promise->set_exception(failure);
            return;
        }

        if (renewIn.count() > 0) {
            _renewal.schedule(renewIn, [this]() { renewFromTimer(); });
        } else {
            KL_LOGW(TAG, "lease ttl %u s leaves no renewal window", lease.ttlSeconds);
        }
        promise->set_value(lease);
    });

    return _inflight;
}

void LeaseManager::renewFromTimer()
{
    std::lock_guard<std::mutex> g(_mx);
    if (_inflight.valid() || _state != LeaseState::Leased) {
        return;
    }
    KL_LOGI(TAG, "renewing client id 0x%08x", _lease.clientId);

    // Not waited on here: on success the job reschedules this timer, which
    // joins the timer thread.
    startBootstrapLocked(LeaseState::Renewing);
}

void LeaseManager::reset()
{
    {
        std::lock_guard<std::mutex> g(_mx);
        ++_generation;
        _state = LeaseState::Unleased;
        _lease = ClientLease{};
        _inflight = {};
    }
    // Outside the lock: the renewal callback takes _mx.
    _renewal.cancel();
}

LeaseState LeaseManager::state() const
{
    std::lock_guard<std::mutex> g(_mx);
    return _state;
}

ClientLease LeaseManager::current() const
{
    std::lock_guard<std::mutex> g(_mx);
    return _lease;
}

// Runs on the FIFO worker; nothing else is on the wire meanwhile.
ClientLease LeaseManager::runBootstrap()
{
    const Nonce nonce = _nonces.next();
    const WrapperPacket request = WrapperPacket::bootstrapRequest(nonce);

    // Every inbound report is one "read" here; filtering happens below so
    // replies meant for other clients never end the attempt early.
    ArmedListener listen(_slot, [](const WrapperPacket&) { return true; });

    for (unsigned attempt = 0; attempt < _cfg.bootstrapAttempts; ++attempt) {
        KL_LOGD(TAG, "bootstrap attempt %u/%u", attempt + 1, _cfg.bootstrapAttempts);
        _transport.send(request.bytes());

        for (unsigned read = 0; read < _cfg.bootstrapReadsPerAttempt; ++read) {
            auto pkt = _slot.await(_cfg.bootstrapReadTimeout);
            if (!pkt) {
                KL_LOGD(TAG, "bootstrap read timeout, resending");
                break;
            }

            if (!pkt->hasWrapperPrefix()) {
                KL_LOGV(TAG, "bootstrap: discarding report without wrapper prefix");
                continue;
            }
            if (pkt->clientId() != NO_CLIENT) {
                KL_LOGV(TAG, "bootstrap: discarding reply for client 0x%08x", pkt->clientId());
                continue;
            }

            const BootstrapReply reply = parse_bootstrap_reply(*pkt);
            if (reply.nonce != nonce) {
                KL_LOGV(TAG, "bootstrap: nonce mismatch (another client's bootstrap)");
                continue;
            }

            if (reply.refused()) {
                KL_LOGE(TAG, "bootstrap refused by device, code %u", reply.errorCode);
                throw BootstrapFailure(reply.errorCode);
            }
            if (reply.newClientId == NO_CLIENT) {
                throw BootstrapFailure("device granted client id 0");
            }

            ClientLease lease;
            lease.clientId   = reply.newClientId;
            lease.ttlSeconds = reply.ttlSeconds;
            const auto usable = std::chrono::milliseconds(
                static_cast<std::int64_t>(reply.ttlSeconds * 1000.0 * _cfg.renewFraction));
            lease.expiry = Clock::now() + usable;

            KL_LOGI(TAG, "client id 0x%08x granted, ttl %u s", lease.clientId, lease.ttlSeconds);
            return lease;
        }
    }

    KL_LOGE(TAG, "bootstrap: no matching reply after %u attempts", _cfg.bootstrapAttempts);
    throw BootstrapFailure("no matching bootstrap reply after " +
                           std::to_string(_cfg.bootstrapAttempts) + " attempts");
}

} // namespace keylink::session
