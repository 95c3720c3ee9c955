/**
 * @file test_headset_controller.cpp
 * @brief End-to-end tests for kiz::HeadsetController over the socketpair
 *        headset.
 */

#include "kiz/headset.hpp"

#include "mock_headset.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using kiz::AttributeId;
using kiz::AttributeValue;
using kiz::RequestError;
using kiz::Target;
using kiz_test::MockHeadset;
using kiz_test::WaitUntil;

namespace {

kiz::ClientConfig TestConfig() {
  kiz::ClientConfig cfg;
  cfg.session.handshake_timeout_ms = 500U;
  cfg.session.poll_interval_ms = 5U;
  cfg.request.request_timeout_ms = 1000U;
  cfg.refresh_on_connect = false;
  cfg.refresh_on_notify = false;
  return cfg;
}

struct NotifyCounter {
  std::atomic<uint32_t> count{0};
  std::atomic<uint8_t> last_target{0};

  static void OnMessage(const kiz::Message& msg, void* ctx) {
    auto* self = static_cast<NotifyCounter*>(ctx);
    self->last_target.store(static_cast<uint8_t>(msg.target));
    self->count.fetch_add(1U);
  }
};

struct EndCounter {
  std::atomic<uint32_t> count{0};
  std::atomic<uint8_t> reason{0};

  static void OnEnd(kiz::SessionEndReason r, void* ctx) {
    auto* self = static_cast<EndCounter*>(ctx);
    self->reason.store(static_cast<uint8_t>(r));
    self->count.fetch_add(1U);
  }
};

}  // namespace

// ============================================================================
// Connection
// ============================================================================

TEST_CASE("Controller without a connection", "[headset]") {
  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.State() == kiz::SessionState::kClosed);
  REQUIRE(!hs.IsConnected());
  REQUIRE(hs.GetBattery().get_error() == RequestError::kNotConnected);
  REQUIRE(hs.SetNoiseCancellation(true).get_error() ==
          RequestError::kNotConnected);
  REQUIRE(hs.RefreshAll().get_error() == RequestError::kNotConnected);
  REQUIRE(hs.Query(Target::kVersionGet).get_error() ==
          RequestError::kNotConnected);
  REQUIRE(hs.RequestStats().sent == 0U);
  hs.Disconnect();
}

TEST_CASE("Connect to a missing port fails to open", "[headset]") {
  kiz::HeadsetController hs(TestConfig());
  auto r = hs.Connect("/dev/kiz_no_such_port");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == kiz::TransportError::kOpenFailed);
  REQUIRE(hs.State() == kiz::SessionState::kClosed);
}

TEST_CASE("Connect reports a silent device as handshake timeout",
          "[headset]") {
  MockHeadset dev;
  dev.answer_handshake = false;
  dev.Start();

  kiz::ClientConfig cfg = TestConfig();
  cfg.session.handshake_timeout_ms = 50U;
  kiz::HeadsetController hs(cfg);
  auto r = hs.Connect(dev.TakeClientStream());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == kiz::TransportError::kHandshakeTimeout);
  REQUIRE(hs.State() == kiz::SessionState::kClosed);
}

TEST_CASE("Connect and disconnect", "[headset]") {
  MockHeadset dev;
  dev.Start();

  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());
  REQUIRE(hs.IsConnected());
  REQUIRE(dev.handshakes.load() == 1U);
  REQUIRE(hs.TransportStats().frames_in == 1U);

  hs.Disconnect();
  REQUIRE(hs.State() == kiz::SessionState::kClosed);
  REQUIRE(hs.GetFirmwareVersion().get_error() == RequestError::kNotConnected);

  MockHeadset second;
  second.Start();
  REQUIRE(hs.Connect(second.TakeClientStream()).has_value());
  REQUIRE(hs.GetFirmwareVersion().value() == "2.05");
}

// ============================================================================
// Getters and setters
// ============================================================================

TEST_CASE("Accepted command is served from the cache", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  const uint64_t t0 = kiz::SteadyNowMs();
  auto set = hs.SetNoiseCancellation(true);
  const uint64_t elapsed = kiz::SteadyNowMs() - t0;
  REQUIRE(set.has_value());
  REQUIRE(elapsed < 50U);
  REQUIRE(dev.commands.load() == 1U);

  auto nc = hs.GetNoiseCancellation();
  REQUIRE(nc.has_value());
  REQUIRE(nc.value());
  REQUIRE(dev.queries.load() == 0U);
}

TEST_CASE("Getters query once and then use the cache", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  auto battery = hs.GetBattery();
  REQUIRE(battery.has_value());
  REQUIRE(battery.value().state == kiz::BatteryState::kInUse);
  REQUIRE(battery.value().level == 80);
  REQUIRE(dev.queries.load() == 1U);

  REQUIRE(hs.GetBattery().value().level == 80);
  REQUIRE(dev.queries.load() == 1U);

  // One equalizer query fills both of its attributes.
  REQUIRE(hs.GetEqualizerEnabled().value());
  REQUIRE(hs.GetEqualizerPreset().value() == 2);
  REQUIRE(dev.queries.load() == 2U);

  auto presets = hs.GetEqualizerPresets();
  REQUIRE(presets.has_value());
  REQUIRE(presets.value().size() == 4U);
  REQUIRE(presets.value()[3].name == "Club");

  REQUIRE(hs.GetHeadDetection().value());
  REQUIRE(hs.GetAutoConnection().value());
  REQUIRE(!hs.GetSpecificMode().value());
  REQUIRE(dev.queries.load() == 6U);

  // Stale entries go back to the device.
  dev.SetValue(AttributeId::kBattery,
               kiz::BatteryStatus{kiz::BatteryState::kCharging, -1});
  hs.Cache().Invalidate(AttributeId::kBattery);
  REQUIRE(hs.GetBattery().value().state == kiz::BatteryState::kCharging);
  REQUIRE(dev.queries.load() == 7U);
}

TEST_CASE("Query is retried after a timeout", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::ClientConfig cfg = TestConfig();
  cfg.request.request_timeout_ms = 50U;
  cfg.query_retries = 2U;
  kiz::HeadsetController hs(cfg);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());
  dev.answer_requests = false;

  auto r = hs.GetBattery();
  REQUIRE(r.get_error() == RequestError::kTimedOut);
  REQUIRE(dev.queries.load() == 3U);
  REQUIRE(hs.RequestStats().timeouts == 3U);
}

TEST_CASE("Commands are never retried", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::ClientConfig cfg = TestConfig();
  cfg.request.request_timeout_ms = 50U;
  cfg.query_retries = 3U;
  kiz::HeadsetController hs(cfg);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());
  dev.answer_requests = false;

  REQUIRE(hs.SetHeadDetection(false).get_error() == RequestError::kTimedOut);
  REQUIRE(dev.commands.load() == 1U);
}

TEST_CASE("Rejected command reports kRejected", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());
  dev.reject_commands = true;

  REQUIRE(hs.SetAutoConnection(false).get_error() == RequestError::kRejected);
  REQUIRE(hs.GetAutoConnection().value());
}

TEST_CASE("Out of range preset fails without I/O", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  REQUIRE(hs.SetEqualizerPreset(40).get_error() ==
          RequestError::kEncodingFailed);
  REQUIRE(hs.SetEqualizerPreset(-1).get_error() ==
          RequestError::kEncodingFailed);
  REQUIRE(dev.commands.load() == 0U);

  REQUIRE(hs.SetEqualizerPreset(1).has_value());
  REQUIRE(hs.SetEqualizerEnabled(false).has_value());
  REQUIRE(hs.SetSpecificMode(true).has_value());
  REQUIRE(dev.commands.load() == 3U);
  REQUIRE(std::get<int32_t>(dev.GetValue(AttributeId::kEqualizerPreset)) == 1);
  REQUIRE(!std::get<bool>(dev.GetValue(AttributeId::kEqualizerEnabled)));
  REQUIRE(std::get<bool>(dev.GetValue(AttributeId::kSpecificMode)));
}

// ============================================================================
// Refresh
// ============================================================================

TEST_CASE("RefreshAll fills every attribute", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  REQUIRE(hs.RefreshAll().has_value());
  REQUIRE(dev.queries.load() == 8U);
  for (uint32_t i = 0; i < kiz::kAttributeCount; ++i) {
    auto cached = hs.Cache().Read(static_cast<AttributeId>(i));
    REQUIRE(cached.has_value());
    REQUIRE(cached.value().freshness == kiz::Freshness::kFresh);
  }
}

TEST_CASE("RefreshAll reports the first failure", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::ClientConfig cfg = TestConfig();
  cfg.request.request_timeout_ms = 50U;
  kiz::HeadsetController hs(cfg);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());
  dev.answer_requests = false;

  REQUIRE(hs.RefreshAll().get_error() == RequestError::kTimedOut);
}

TEST_CASE("Connect can start a background refresh", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::ClientConfig cfg = TestConfig();
  cfg.refresh_on_connect = true;
  kiz::HeadsetController hs(cfg);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  REQUIRE(WaitUntil([&] { return hs.RequestStats().replies == 8U; }));
  REQUIRE(dev.queries.load() == 8U);
  REQUIRE(hs.GetFirmwareVersion().value() == "2.05");
  REQUIRE(dev.queries.load() == 8U);
}

// ============================================================================
// Notifications and session end
// ============================================================================

TEST_CASE("Subscribers see device notifications", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  NotifyCounter counter;
  const uint32_t id = hs.Subscribe(&NotifyCounter::OnMessage, &counter);
  REQUIRE(id > 0U);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  REQUIRE(dev.Notify(Target::kBatteryGet,
                     {{AttributeId::kBattery,
                       AttributeValue(kiz::BatteryStatus{
                           kiz::BatteryState::kInUse, 55})}}));
  REQUIRE(WaitUntil([&] { return counter.count.load() == 1U; }));
  REQUIRE(static_cast<Target>(counter.last_target.load()) ==
          Target::kBatteryGet);
  REQUIRE(hs.GetBattery().value().level == 55);
  REQUIRE(dev.queries.load() == 0U);

  REQUIRE(hs.Unsubscribe(id));
  REQUIRE(dev.Notify(Target::kBatteryGet));
  REQUIRE(WaitUntil([&] { return hs.RequestStats().notifications == 2U; }));
  REQUIRE(counter.count.load() == 1U);
}

TEST_CASE("Bare notification triggers a read-back", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::ClientConfig cfg = TestConfig();
  cfg.refresh_on_notify = true;
  kiz::HeadsetController hs(cfg);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());
  REQUIRE(!hs.GetNoiseCancellation().value());
  REQUIRE(dev.queries.load() == 1U);

  dev.SetValue(AttributeId::kNoiseCancellation, true);
  REQUIRE(dev.Notify(Target::kNoiseCancellationSet));
  REQUIRE(WaitUntil([&] { return dev.queries.load() == 2U; }));
  REQUIRE(WaitUntil([&] {
    auto c = hs.Cache().Read(AttributeId::kNoiseCancellation);
    return c.has_value() && c.value().freshness == kiz::Freshness::kFresh &&
           std::get<bool>(c.value().value);
  }));
  REQUIRE(hs.GetNoiseCancellation().value());
  REQUIRE(dev.queries.load() == 2U);
}

TEST_CASE("Peer loss ends the session and fails waiters", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  EndCounter ended;
  hs.SetSessionEndHandler(&EndCounter::OnEnd, &ended);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());
  dev.answer_requests = false;

  std::atomic<uint8_t> result{0xFF};
  std::thread waiter([&] {
    auto r = hs.GetFirmwareVersion();
    result.store(r ? 0xFE : static_cast<uint8_t>(r.get_error()));
  });
  REQUIRE(WaitUntil([&] { return dev.queries.load() == 1U; }));
  dev.Stop();
  waiter.join();

  REQUIRE(result.load() == static_cast<uint8_t>(RequestError::kSessionClosed));
  REQUIRE(WaitUntil([&] { return ended.count.load() == 1U; }));
  REQUIRE(static_cast<kiz::SessionEndReason>(ended.reason.load()) ==
          kiz::SessionEndReason::kTransportLost);
  REQUIRE(!hs.IsConnected());
  REQUIRE(hs.State() == kiz::SessionState::kClosed);
  REQUIRE(hs.SetNoiseCancellation(true).get_error() ==
          RequestError::kNotConnected);
}

namespace {

void DisconnectFromCallback(const kiz::Message& /*msg*/, void* ctx) {
  static_cast<kiz::HeadsetController*>(ctx)->Disconnect();
}

}  // namespace

TEST_CASE("Disconnect from a notification callback", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  hs.Subscribe(&DisconnectFromCallback, &hs);
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  REQUIRE(dev.Notify(Target::kHeadDetectionGet));
  REQUIRE(WaitUntil([&] { return !hs.IsConnected(); }));
  REQUIRE(hs.State() == kiz::SessionState::kClosed);
}

// ============================================================================
// Reconnection
// ============================================================================

namespace {

/// Session-end handler that reconnects once, to a standby headset.
struct Reconnector {
  kiz::HeadsetController* hs = nullptr;
  std::atomic<MockHeadset*> standby{nullptr};
  std::atomic<uint32_t> attempts{0};
  std::atomic<bool> ok{false};

  static void OnEnd(kiz::SessionEndReason r, void* ctx) {
    auto* self = static_cast<Reconnector*>(ctx);
    if (r != kiz::SessionEndReason::kTransportLost) return;
    MockHeadset* dev = self->standby.exchange(nullptr);
    if (dev == nullptr) return;
    self->ok.store(self->hs->Connect(dev->TakeClientStream()).has_value());
    self->attempts.fetch_add(1U);
  }
};

}  // namespace

TEST_CASE("Reconnect from the session-end handler", "[headset]") {
  MockHeadset first;
  MockHeadset second;
  first.Start();
  second.Start();

  Reconnector rc;
  kiz::HeadsetController hs(TestConfig());
  rc.hs = &hs;
  rc.standby.store(&second);
  hs.SetSessionEndHandler(&Reconnector::OnEnd, &rc);
  REQUIRE(hs.Connect(first.TakeClientStream()).has_value());

  first.Stop();
  REQUIRE(WaitUntil([&] { return rc.attempts.load() == 1U; }, 2000U));
  REQUIRE(rc.ok.load());
  REQUIRE(hs.IsConnected());
  REQUIRE(second.handshakes.load() == 1U);

  REQUIRE(hs.GetFirmwareVersion().value() == "2.05");
  REQUIRE(second.queries.load() == 1U);

  // The parked first connection is released here, off its reader thread.
  hs.Disconnect();
  REQUIRE(hs.State() == kiz::SessionState::kClosed);
}

TEST_CASE("Concurrent connects leave one live connection", "[headset]") {
  for (int round = 0; round < 5; ++round) {
    MockHeadset a;
    MockHeadset b;
    a.Start();
    b.Start();

    kiz::ClientConfig cfg = TestConfig();
    cfg.refresh_on_notify = true;
    kiz::HeadsetController hs(cfg);
    auto stream_a = a.TakeClientStream();
    auto stream_b = b.TakeClientStream();

    std::atomic<uint32_t> succeeded{0};
    std::thread ta([&] {
      if (hs.Connect(std::move(stream_a))) succeeded.fetch_add(1U);
    });
    std::thread tb([&] {
      if (hs.Connect(std::move(stream_b))) succeeded.fetch_add(1U);
    });
    // Notifications make the readers call back into the controller while
    // connections are being swapped.
    for (int i = 0; i < 20; ++i) {
      a.Notify(Target::kBatteryGet);
      b.Notify(Target::kBatteryGet);
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ta.join();
    tb.join();

    REQUIRE(succeeded.load() == 2U);
    REQUIRE(hs.IsConnected());
    REQUIRE(a.handshakes.load() == 1U);
    REQUIRE(b.handshakes.load() == 1U);

    REQUIRE(hs.Query(Target::kVersionGet).has_value());
  }
}

// ============================================================================
// Presets
// ============================================================================

TEST_CASE("Active preset name comes from the preset list", "[headset]") {
  MockHeadset dev;
  dev.Start();
  kiz::HeadsetController hs(TestConfig());
  REQUIRE(hs.Connect(dev.TakeClientStream()).has_value());

  REQUIRE(hs.GetEqualizerPresetName().value() == "Pop");
  REQUIRE(hs.SetEqualizerPreset(3).has_value());
  REQUIRE(hs.GetEqualizerPresetName().value() == "Club");

  dev.SetValue(AttributeId::kEqualizerPreset, int32_t{9});
  hs.Cache().Invalidate(AttributeId::kEqualizerPreset);
  REQUIRE(hs.GetEqualizerPresetName().get_error() ==
          RequestError::kUnexpectedReply);
}
