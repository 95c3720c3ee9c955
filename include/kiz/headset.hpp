/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file kiz/headset.hpp
 * @brief HeadsetController - typed control surface for one headset.
 *
 * Usage:
 * @code
 *   kiz::HeadsetController headset(cfg);
 *   if (headset.Connect("/dev/rfcomm0")) {
 *     auto nc = headset.GetNoiseCancellation();
 *     headset.SetEqualizerPreset(3);
 *   }
 * @endcode
 *
 * Getters answer from the cache when the value is fresh and query the device
 * otherwise; timed-out queries are retried, commands never. Calls may come
 * from any number of threads: each blocks only itself while its request is
 * in flight. A short mutex guards swapping the current connection; joining
 * a replaced session happens after it is released.
 */

#ifndef KIZ_HEADSET_HPP_
#define KIZ_HEADSET_HPP_

#include "kiz/client_config.hpp"
#include "kiz/codec.hpp"
#include "kiz/correlator.hpp"
#include "kiz/log.hpp"
#include "kiz/session.hpp"
#include "kiz/state_cache.hpp"
#include "kiz/transport.hpp"
#include "kiz/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <variant>
#include <vector>

namespace kiz {

/// Every endpoint a full status refresh reads.
static constexpr Target kRefreshTargets[] = {
    Target::kVersionGet,          Target::kBatteryGet,
    Target::kNoiseCancellationGet, Target::kSpecificModeGet,
    Target::kEqualizerGet,        Target::kEqualizerPresetsGet,
    Target::kHeadDetectionGet,    Target::kAutoConnectionGet,
};

class HeadsetController final {
 public:
  explicit HeadsetController(const ClientConfig& cfg = ClientConfig{})
      : cfg_(cfg), cache_(cfg.staleness_ms) {}

  /// Must not run on a reader thread (i.e. inside a callback).
  ~HeadsetController() {
    ConnectionList released;
    {
      std::lock_guard<std::mutex> life(lifecycle_mtx_);
      released = Detach();
      std::lock_guard<std::mutex> lock(conn_mtx_);
      for (auto& c : retired_) released.push_back(std::move(c));
      retired_.clear();
    }
    Release(released);
  }

  HeadsetController(const HeadsetController&) = delete;
  HeadsetController& operator=(const HeadsetController&) = delete;

  // --------------------------------------------------------------------------
  // Connection
  // --------------------------------------------------------------------------

  /**
   * @brief Starts a session on an already-connected stream and waits for the
   *        handshake.
   *
   * Any previous connection is detached first and joined once no lock is
   * held. The cache is invalidated since the device may have changed while
   * disconnected. Connect and Disconnect are serialised; the last one to run
   * wins. Both may be called from a session-end or notification callback.
   */
  expected<void, TransportError> Connect(std::unique_ptr<ByteStream> stream) {
    ConnectionList released;
    expected<void, TransportError> r =
        expected<void, TransportError>::success();
    {
      std::lock_guard<std::mutex> life(lifecycle_mtx_);
      released = Detach();
      r = ConnectLocked(std::move(stream), released);
    }
    Release(released);
    return r;
  }

  /// Opens @p port (an RFCOMM tty) with the configured baud rate.
  expected<void, TransportError> Connect(const char* port) {
    SerialConfig sc = cfg_.device;
    if (port != nullptr) sc.port = port;
    auto stream = std::make_unique<SerialStream>(sc);
    auto opened = stream->Open();
    if (!opened) return opened;
    return Connect(std::unique_ptr<ByteStream>(std::move(stream)));
  }

  /// Closes the current session; outstanding calls fail with kSessionClosed.
  void Disconnect() {
    ConnectionList released;
    {
      std::lock_guard<std::mutex> life(lifecycle_mtx_);
      released = Detach();
    }
    Release(released);
  }

  /// kClosed when never connected.
  SessionState State() const {
    auto conn = Current();
    return (conn != nullptr) ? conn->session.State() : SessionState::kClosed;
  }

  bool IsConnected() const { return State() == SessionState::kReady; }

  // --------------------------------------------------------------------------
  // Getters
  // --------------------------------------------------------------------------

  expected<BatteryStatus, RequestError> GetBattery() {
    return ReadAttribute<BatteryStatus>(AttributeId::kBattery);
  }
  expected<std::string, RequestError> GetFirmwareVersion() {
    return ReadAttribute<std::string>(AttributeId::kFirmwareVersion);
  }
  expected<bool, RequestError> GetNoiseCancellation() {
    return ReadAttribute<bool>(AttributeId::kNoiseCancellation);
  }
  expected<bool, RequestError> GetSpecificMode() {
    return ReadAttribute<bool>(AttributeId::kSpecificMode);
  }
  expected<bool, RequestError> GetEqualizerEnabled() {
    return ReadAttribute<bool>(AttributeId::kEqualizerEnabled);
  }
  expected<int32_t, RequestError> GetEqualizerPreset() {
    return ReadAttribute<int32_t>(AttributeId::kEqualizerPreset);
  }
  expected<PresetList, RequestError> GetEqualizerPresets() {
    return ReadAttribute<PresetList>(AttributeId::kEqualizerPresets);
  }
  /// Name of the active preset; kUnexpectedReply when the device list does
  /// not contain the active id.
  expected<std::string, RequestError> GetEqualizerPresetName() {
    using R = expected<std::string, RequestError>;
    auto id = GetEqualizerPreset();
    if (!id) return R::error(id.get_error());
    auto presets = GetEqualizerPresets();
    if (!presets) return R::error(presets.get_error());
    const EqualizerPreset* p = FindPreset(presets.value(), id.value());
    if (p == nullptr) return R::error(RequestError::kUnexpectedReply);
    return R::success(p->name);
  }
  expected<bool, RequestError> GetHeadDetection() {
    return ReadAttribute<bool>(AttributeId::kHeadDetection);
  }
  expected<bool, RequestError> GetAutoConnection() {
    return ReadAttribute<bool>(AttributeId::kAutoConnection);
  }

  // --------------------------------------------------------------------------
  // Setters
  // --------------------------------------------------------------------------

  expected<void, RequestError> SetNoiseCancellation(bool on) {
    return Command(Target::kNoiseCancellationSet, AttributeValue(on));
  }
  expected<void, RequestError> SetSpecificMode(bool on) {
    return Command(Target::kSpecificModeSet, AttributeValue(on));
  }
  expected<void, RequestError> SetEqualizerEnabled(bool on) {
    return Command(Target::kEqualizerEnabledSet, AttributeValue(on));
  }
  /// Preset ids outside 0..31 fail with kEncodingFailed before any I/O.
  expected<void, RequestError> SetEqualizerPreset(int32_t preset_id) {
    return Command(Target::kEqualizerPresetSet, AttributeValue(preset_id));
  }
  expected<void, RequestError> SetHeadDetection(bool on) {
    return Command(Target::kHeadDetectionSet, AttributeValue(on));
  }
  expected<void, RequestError> SetAutoConnection(bool on) {
    return Command(Target::kAutoConnectionSet, AttributeValue(on));
  }

  // --------------------------------------------------------------------------
  // Bulk / low level
  // --------------------------------------------------------------------------

  /**
   * @brief Queries every readable endpoint concurrently and waits for all.
   * @return the first failure, if any; successful answers are cached anyway.
   */
  expected<void, RequestError> RefreshAll() {
    using R = expected<void, RequestError>;
    auto conn = Current();
    if (conn == nullptr) return R::error(RequestError::kNotConnected);

    std::vector<ReplyHandle> handles;
    optional<RequestError> first_error;
    for (Target t : kRefreshTargets) {
      auto h = conn->correlator.Send(Message::Query(t));
      if (h) {
        handles.push_back(h.value());
      } else if (!first_error.has_value()) {
        first_error = h.get_error();
      }
    }
    for (const auto& h : handles) {
      auto r = h.Wait();
      if (!r && !first_error.has_value()) first_error = r.get_error();
    }
    if (first_error.has_value()) return R::error(first_error.value());
    return R::success();
  }

  /// Sends a query with the configured retries and returns the raw reply.
  expected<Message, RequestError> Query(Target target) {
    auto conn = Current();
    if (conn == nullptr) return RequestResult::error(RequestError::kNotConnected);
    const uint32_t attempts = cfg_.query_retries + 1U;
    RequestResult r = RequestResult::error(RequestError::kTimedOut);
    for (uint32_t i = 0; i < attempts; ++i) {
      auto h = conn->correlator.Send(Message::Query(target));
      if (!h) return RequestResult::error(h.get_error());
      r = h.value().Wait();
      if (r || r.get_error() != RequestError::kTimedOut) return r;
      if (i + 1U < attempts) {
        KIZ_LOG_WARN("Headset", "%s timed out, retrying (%u/%u)",
                     PathOf(target), i + 1U, cfg_.query_retries);
      }
    }
    return r;
  }

  // --------------------------------------------------------------------------
  // Notifications / session end
  // --------------------------------------------------------------------------

  /// @return subscription id (>0), or 0 when the table is full.
  uint32_t Subscribe(NotificationFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(sub_mtx_);
    for (auto& s : subs_) {
      if (s.fn == nullptr) {
        s.fn = fn;
        s.ctx = ctx;
        s.id = ++next_sub_id_;
        return s.id;
      }
    }
    return 0U;
  }

  bool Unsubscribe(uint32_t id) {
    std::lock_guard<std::mutex> lock(sub_mtx_);
    for (auto& s : subs_) {
      if (s.fn != nullptr && s.id == id) {
        s = Subscriber{};
        return true;
      }
    }
    return false;
  }

  /// Invoked on the reader thread when a session ends for any reason.
  void SetSessionEndHandler(SessionEndFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(sub_mtx_);
    end_fn_ = fn;
    end_ctx_ = ctx;
  }

  StateCache& Cache() noexcept { return cache_; }
  const ClientConfig& GetConfig() const noexcept { return cfg_; }

  /// Zeroed stats when not connected.
  CorrelatorStats RequestStats() const {
    auto conn = Current();
    return (conn != nullptr) ? conn->correlator.Stats() : CorrelatorStats{};
  }

  SessionStats TransportStats() const {
    auto conn = Current();
    return (conn != nullptr) ? conn->session.Stats() : SessionStats{};
  }

 private:
  /// Correlator is declared first: the session holds a pointer to it and
  /// must be destroyed (joined) before it.
  struct Connection {
    Connection(StateCache& cache, const ClientConfig& cfg,
               std::unique_ptr<ByteStream> stream)
        : correlator(cache, cfg.request),
          session(std::move(stream), cfg.session, &correlator) {
      correlator.Attach(&session);
    }
    RequestCorrelator correlator;
    Session session;
  };

  struct Subscriber {
    NotificationFn fn = nullptr;
    void* ctx = nullptr;
    uint32_t id = 0;
  };

  using ConnectionList = std::vector<std::shared_ptr<Connection>>;

  /// Caller holds lifecycle_mtx_. Publishes the new connection on success;
  /// a failed one is appended to @p released.
  expected<void, TransportError> ConnectLocked(std::unique_ptr<ByteStream> stream,
                                               ConnectionList& released) {
    using R = expected<void, TransportError>;
    auto conn = std::make_shared<Connection>(cache_, cfg_, std::move(stream));
    conn->correlator.SetSessionEndHook(&HeadsetController::OnSessionEnded,
                                       this);
    conn->correlator.Subscribe(&HeadsetController::OnNotify, this);
    cache_.InvalidateAll();

    auto started = conn->session.Start();
    if (!started) {
      released.push_back(std::move(conn));
      return started;
    }
    if (!conn->session.WaitReady(cfg_.session.handshake_timeout_ms +
                                 cfg_.session.poll_interval_ms * 2U)) {
      const SessionEndReason reason = conn->session.EndReason();
      const bool timed_out = reason == SessionEndReason::kHandshakeTimeout ||
                             conn->session.State() == SessionState::kConnecting;
      KIZ_LOG_WARN("Headset", "connect failed: %s",
                   timed_out ? "handshake timeout" : ToString(reason));
      released.push_back(std::move(conn));
      return R::error(timed_out ? TransportError::kHandshakeTimeout
                                : TransportError::kClosed);
    }

    {
      std::lock_guard<std::mutex> lock(conn_mtx_);
      conn_ = conn;
    }
    KIZ_LOG_INFO("Headset", "connected");
    if (cfg_.refresh_on_connect) RequestRefresh(*conn);
    return R::success();
  }

  /**
   * @brief Caller holds lifecycle_mtx_. Takes the current connection and any
   *        retired one that has finished.
   *
   * A connection whose reader is the calling thread cannot be joined here:
   * it is asked to stop and parked in retired_ until it reaches Closed.
   */
  ConnectionList Detach() {
    ConnectionList out;
    std::lock_guard<std::mutex> lock(conn_mtx_);
    if (conn_ != nullptr) {
      std::shared_ptr<Connection> old = std::move(conn_);
      conn_.reset();
      if (old->session.OnReaderThread()) {
        old->session.Close();
        retired_.push_back(std::move(old));
      } else {
        out.push_back(std::move(old));
      }
    }
    for (auto it = retired_.begin(); it != retired_.end();) {
      if (!(*it)->session.OnReaderThread() &&
          (*it)->session.State() == SessionState::kClosed) {
        out.push_back(std::move(*it));
        it = retired_.erase(it);
      } else {
        ++it;
      }
    }
    return out;
  }

  /// Closes and joins @p conns. No lock may be held: readers may be inside
  /// callbacks that call back into the controller.
  static void Release(ConnectionList& conns) {
    for (auto& c : conns) {
      const bool was_ready = c->session.State() == SessionState::kReady;
      c->session.Close();
      if (was_ready) KIZ_LOG_INFO("Headset", "disconnected");
    }
    conns.clear();
  }

  std::shared_ptr<Connection> Current() const {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    return conn_;
  }

  template <typename T>
  expected<T, RequestError> ReadAttribute(AttributeId id) {
    using R = expected<T, RequestError>;
    auto cached = cache_.Read(id);
    if (cached.has_value() && cached.value().freshness == Freshness::kFresh) {
      if (const T* v = std::get_if<T>(&cached.value().value)) {
        return R::success(*v);
      }
    }
    auto reply = Query(QueryTargetFor(id));
    if (!reply) return R::error(reply.get_error());
    const AttributeValue* value = reply.value().Find(id);
    const T* typed = (value != nullptr) ? std::get_if<T>(value) : nullptr;
    if (typed == nullptr) return R::error(RequestError::kUnexpectedReply);
    return R::success(*typed);
  }

  expected<void, RequestError> Command(Target target, AttributeValue value) {
    using R = expected<void, RequestError>;
    auto conn = Current();
    if (conn == nullptr) return R::error(RequestError::kNotConnected);
    auto h = conn->correlator.Send(Message::Command(target, std::move(value)));
    if (!h) return R::error(h.get_error());
    auto r = h.value().Wait();
    if (!r) return R::error(r.get_error());
    return R::success();
  }

  /// Fire-and-forget status refresh; answers land in the cache.
  void RequestRefresh(Connection& conn) {
    for (Target t : kRefreshTargets) {
      auto h = conn.correlator.Send(Message::Query(t));
      if (!h) {
        KIZ_LOG_WARN("Headset", "refresh of %s not sent: %s", PathOf(t),
                     ToString(h.get_error()));
        return;
      }
    }
  }

  static void OnNotify(const Message& msg, void* ctx) {
    auto* self = static_cast<HeadsetController*>(ctx);
    if (msg.values.empty() && self->cfg_.refresh_on_notify) {
      auto conn = self->Current();
      if (conn != nullptr) {
        auto h = conn->correlator.Send(Message::Query(ReadBackTarget(msg.target)));
        if (!h) {
          KIZ_LOG_DEBUG("Headset", "refresh after notify not sent: %s",
                        ToString(h.get_error()));
        }
      }
    }

    Subscriber snapshot[KIZ_MAX_SUBSCRIBERS];
    {
      std::lock_guard<std::mutex> lock(self->sub_mtx_);
      for (uint32_t i = 0; i < KIZ_MAX_SUBSCRIBERS; ++i) {
        snapshot[i] = self->subs_[i];
      }
    }
    for (const auto& s : snapshot) {
      if (s.fn != nullptr) s.fn(msg, s.ctx);
    }
  }

  static void OnSessionEnded(SessionEndReason reason, void* ctx) {
    auto* self = static_cast<HeadsetController*>(ctx);
    if (reason != SessionEndReason::kClosedByOwner) {
      KIZ_LOG_WARN("Headset", "session ended: %s", ToString(reason));
    }
    SessionEndFn fn = nullptr;
    void* fn_ctx = nullptr;
    {
      std::lock_guard<std::mutex> lock(self->sub_mtx_);
      fn = self->end_fn_;
      fn_ctx = self->end_ctx_;
    }
    if (fn != nullptr) fn(reason, fn_ctx);
  }

  ClientConfig cfg_;
  StateCache cache_;

  std::mutex lifecycle_mtx_;  ///< Serialises Connect / Disconnect.
  mutable std::mutex conn_mtx_;
  std::shared_ptr<Connection> conn_;
  ConnectionList retired_;

  std::mutex sub_mtx_;
  Subscriber subs_[KIZ_MAX_SUBSCRIBERS];
  uint32_t next_sub_id_ = 0;
  SessionEndFn end_fn_ = nullptr;
  void* end_ctx_ = nullptr;
};

}  // namespace kiz

#endif  // KIZ_HEADSET_HPP_
