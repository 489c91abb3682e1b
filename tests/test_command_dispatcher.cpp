#include "doctest.h"

#include "fake_hid.h"

#include "keylink/core/errors.h"
#include "keylink/io/core/pending_request.h"
#include "keylink/io/core/serial_queue.h"
#include "keylink/session/keyboard_device.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace keylink;
using keylink::io::protocol::ByteBuffer;
using keylink::io::protocol::DecodeOptions;
using keylink::io::protocol::SubProtocol;
using keylink::io::protocol::value_as;
using keylink::session::KeyboardDevice;
using keylink::tests::FakeHidBackend;
using keylink::tests::FixedNonceSource;

namespace {

constexpr auto READY = std::future_status::ready;

struct Rig {
    FakeHidBackend backend;
    std::shared_ptr<tests::FakeKeyboard> kb = backend.attach("/dev/hidraw1");
    FixedNonceSource nonces;
    KeyboardDevice device;

    explicit Rig(const config::ProtocolConfig& cfg = tests::fast_protocol())
        : device(backend, nonces, cfg)
    {
        REQUIRE(device.open({hid::default_vendor_filter()}));
    }
};

} // namespace

TEST_CASE("Replies are decoded with the requested shape")
{
    Rig rig;
    rig.kb->on(SubProtocol::Legacy, 0x11, [](const ByteBuffer&) {
        return std::vector<ByteBuffer>{{0x11, 0x04}};
    });

    CHECK(value_as<std::uint64_t>(rig.device.sendLegacy(0x11, {}, DecodeOptions::scalar(8, 1)).get()) == 4);

    // Default shape: the raw 26-byte payload, echo included.
    const auto raw = value_as<ByteBuffer>(rig.device.sendExtension(0x16, {0x01, 0x02}).get());
    REQUIRE(raw.size() == io::protocol::PAYLOAD_SIZE);
    CHECK(raw[0] == 0x16);
    CHECK(raw[1] == 0x01);
    CHECK(raw[2] == 0x02);

    const auto seen = rig.kb->commands();
    REQUIRE(seen.size() == 2);
    CHECK(seen[0].tag == 0xFE);
    CHECK(seen[0].cmd == 0x11);
    CHECK(seen[1].tag == 0xDF);
    CHECK(seen[1].cmd == 0x16);
}

TEST_CASE("Commands complete in FIFO order")
{
    Rig rig;

    auto a = rig.device.sendLegacy(0x0A, {1});
    auto b = rig.device.sendExtension(0x0B, {2});
    auto c = rig.device.sendLegacy(0x0C, {3});

    c.get();
    // C cannot resolve before A and B.
    CHECK(a.wait_for(std::chrono::milliseconds(0)) == READY);
    CHECK(b.wait_for(std::chrono::milliseconds(0)) == READY);
    CHECK(value_as<ByteBuffer>(a.get())[0] == 0x0A);
    CHECK(value_as<ByteBuffer>(b.get())[0] == 0x0B);

    const auto seen = rig.kb->commands();
    REQUIRE(seen.size() == 3);
    CHECK(seen[0].cmd == 0x0A);
    CHECK(seen[1].cmd == 0x0B);
    CHECK(seen[2].cmd == 0x0C);
}

TEST_CASE("Callers on many threads are serialized, one exchange at a time")
{
    Rig rig;

    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    rig.kb->on(SubProtocol::Legacy, 0x02, [&](const ByteBuffer& args) {
        const int now = ++inFlight;
        int prev = maxInFlight.load();
        while (now > prev && !maxInFlight.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --inFlight;
        return std::vector<ByteBuffer>{{0x02, args[0]}};
    });

    std::vector<std::thread> callers;
    std::atomic<int> ok{0};
    for (int i = 0; i < 6; ++i) {
        callers.emplace_back([&, i] {
            const auto v = value_as<ByteBuffer>(
                rig.device.sendLegacy(0x02, {static_cast<std::uint8_t>(i)}).get());
            if (v[1] == i) {
                ++ok;
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    CHECK(ok.load() == 6);
    CHECK(maxInFlight.load() == 1);
    CHECK(rig.kb->bootstrapRequests() == 1);
}

TEST_CASE("Explicit device error is a ProtocolError and skips decoding")
{
    Rig rig;
    rig.kb->on(SubProtocol::Extension, 0x12, [](const ByteBuffer&) {
        return std::vector<ByteBuffer>{{0xFF, 0x02}};
    });

    // A shape that cannot decode a 26-byte payload, and a validator that
    // would reject the reply: neither may be consulted.
    auto f = rig.device.sendExtension(0x12, {}, DecodeOptions::scalar(32, 24),
                                      [](const ByteBuffer& p) { return p[0] == 0x12; });
    try {
        f.get();
        FAIL("expected ProtocolError");
    } catch (const ProtocolError& e) {
        CHECK(e.code() == 2);
        CHECK(e.kind() == ErrorKind::Protocol);
    }

    // The queue keeps going.
    CHECK(value_as<ByteBuffer>(rig.device.sendExtension(0x00, {}).get())[0] == 0x00);
}

TEST_CASE("Short payloads surface as DecodeError")
{
    Rig rig;
    CHECK_THROWS_AS(rig.device.sendLegacy(0x01, {}, DecodeOptions::scalar(32, 23)).get(), DecodeError);
    CHECK_NOTHROW(rig.device.sendLegacy(0x01, {}).get());
}

TEST_CASE("A timeout fails its own call and does not wedge the queue")
{
    Rig rig;
    rig.kb->dropNext(1);

    auto lost = rig.device.sendLegacy(0x0E, {});
    auto next = rig.device.sendLegacy(0x0F, {});

    try {
        lost.get();
        FAIL("expected CommandTimeout");
    } catch (const CommandTimeout& e) {
        CHECK(e.commandId() == 0x0E);
        CHECK(e.subProtocol() == 0xFE);
    }
    CHECK(value_as<ByteBuffer>(next.get())[0] == 0x0F);
}

TEST_CASE("Extra validator skips non-matching replies")
{
    Rig rig;
    rig.kb->on(SubProtocol::Extension, 0x03, [](const ByteBuffer& args) {
        // A stale entry first, then the one asked for.
        return std::vector<ByteBuffer>{{0x03, static_cast<std::uint8_t>(args[0] + 1), 0xAA},
                                       {0x03, args[0], 0xBB}};
    });

    const auto v = value_as<ByteBuffer>(
        rig.device.sendExtension(0x03, {5}, DecodeOptions::raw(),
                                 [](const ByteBuffer& p) { return p[1] == 5; })
            .get());
    CHECK(v[2] == 0xBB);
}

TEST_CASE("Replies for other clients are ignored")
{
    Rig rig;
    rig.kb->on(SubProtocol::Legacy, 0x08, [](const ByteBuffer&) {
        return std::vector<ByteBuffer>{};
    });
    rig.device.lease().ensureLease().get();

    auto f = rig.device.sendLegacy(0x08, {0x00, 0x21});
    rig.kb->inject(tests::FakeKeyboard::frame(0x1234, 0xFE, {0x08, 0x00, 0x21, 0x99}));
    CHECK_THROWS_AS(f.get(), CommandTimeout);
}

TEST_CASE("Oversized arguments are rejected before queueing")
{
    Rig rig;
    CHECK_THROWS_AS(rig.device.sendLegacy(0x0F, ByteBuffer(26, 0)), std::invalid_argument);
    CHECK(rig.kb->writes().empty());
}

TEST_CASE("Commands on a closed device fail with ConnectionError")
{
    FakeHidBackend backend;
    backend.attach("/dev/hidraw1");
    FixedNonceSource nonces;
    KeyboardDevice device(backend, nonces, tests::fast_protocol());

    CHECK_THROWS_AS(device.sendLegacy(0x01, {}).get(), ConnectionError);
}

TEST_CASE("Disconnect rejects the in-flight command immediately")
{
    auto cfg = tests::fast_protocol();
    cfg.commandTimeout = std::chrono::milliseconds(5000);
    Rig rig(cfg);

    std::atomic<int> callbacks{0};
    rig.device.onDisconnect([&] { ++callbacks; });

    auto kb = rig.kb;
    rig.kb->on(SubProtocol::Legacy, 0x0E, [kb](const ByteBuffer&) {
        kb->disconnect();
        return std::vector<ByteBuffer>{};
    });

    auto inflight = rig.device.sendLegacy(0x0E, {});
    auto queued   = rig.device.sendLegacy(0x01, {});

    const auto start = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(inflight.get(), ConnectionError);
    CHECK_THROWS_AS(queued.get(), ConnectionError);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));

    CHECK(callbacks.load() == 1);
    CHECK(rig.device.lease().state() == session::LeaseState::Unleased);
}

TEST_CASE("Close rejects queued work")
{
    auto cfg = tests::fast_protocol();
    cfg.commandTimeout = std::chrono::milliseconds(5000);
    Rig rig(cfg);
    rig.kb->dropNext(1);

    auto inflight = rig.device.sendLegacy(0x0E, {});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    rig.device.close();

    CHECK_THROWS_AS(inflight.get(), ConnectionError);
    CHECK_FALSE(rig.device.isOpen());
}

TEST_CASE("Only one listener can be armed")
{
    io::PendingRequestSlot slot;
    slot.arm([](const io::protocol::WrapperPacket&) { return true; });
    CHECK(slot.armed());
    CHECK_THROWS_AS(slot.arm([](const io::protocol::WrapperPacket&) { return true; }), std::logic_error);

    slot.disarm();
    CHECK_FALSE(slot.armed());

    {
        io::ArmedListener first(slot, [](const io::protocol::WrapperPacket&) { return true; });
        CHECK_THROWS_AS(io::ArmedListener(slot, [](const io::protocol::WrapperPacket&) { return true; }),
                        std::logic_error);
    }
    CHECK_FALSE(slot.armed());
}

TEST_CASE("Listener slot delivery and abort")
{
    io::PendingRequestSlot slot;
    const auto pkt = io::protocol::WrapperPacket::fromReport(
        tests::FakeKeyboard::frame(7, 0xFE, {0x01}).data(), io::protocol::REPORT_SIZE);

    CHECK_FALSE(slot.offer(pkt));   // nobody listening

    io::ArmedListener listen(slot, [](const io::protocol::WrapperPacket& p) { return p.clientId() == 7; });
    CHECK(slot.offer(pkt));
    auto got = slot.await(std::chrono::milliseconds(10));
    REQUIRE(got);
    CHECK(got->clientId() == 7);

    CHECK_FALSE(slot.await(std::chrono::milliseconds(10)));

    slot.abort(std::make_exception_ptr(ConnectionError("gone")));
    CHECK_THROWS_AS(slot.await(std::chrono::milliseconds(1000)), ConnectionError);
}

TEST_CASE("Serial queue keeps running after a failing job")
{
    std::vector<int> order;
    std::mutex mx;
    {
        io::SerialQueue q;
        q.post([&] { std::lock_guard<std::mutex> g(mx); order.push_back(1); });
        q.post([] { throw std::runtime_error("boom"); });
        q.post([&] { std::lock_guard<std::mutex> g(mx); order.push_back(3); });
    }
    CHECK(order == std::vector<int>{1, 3});
}
