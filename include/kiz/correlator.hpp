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
 * @file kiz/correlator.hpp
 * @brief RequestCorrelator - matches device replies to outstanding requests.
 *
 *   caller thread                      reader thread (Session)
 *   -------------                      -----------------------
 *   Send(msg) --token--> pending_  <-- OnFrame(reply, token)
 *       |                   |              |-- StateCache::Update
 *   ReplyHandle::Wait() <---+--------------+-- resolve handle
 *                           ^-- OnTick(): deadline sweep -> kTimedOut
 *                           ^-- OnSessionEnded(): everything -> kSessionClosed
 *
 * One coarse mutex guards the pending table; handles are resolved and
 * subscribers invoked after that mutex is released. Requests are never
 * retried here.
 */

#ifndef KIZ_CORRELATOR_HPP_
#define KIZ_CORRELATOR_HPP_

#include "kiz/codec.hpp"
#include "kiz/log.hpp"
#include "kiz/platform.hpp"
#include "kiz/session.hpp"
#include "kiz/state_cache.hpp"
#include "kiz/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef KIZ_MAX_SUBSCRIBERS
#define KIZ_MAX_SUBSCRIBERS 8U
#endif

namespace kiz {

using RequestResult = expected<Message, RequestError>;

/// Notification callback, invoked on the reader thread. Must not block.
using NotificationFn = void (*)(const Message& msg, void* ctx);

/// Terminal session end, invoked on the reader thread after every pending
/// request has been failed.
using SessionEndFn = void (*)(SessionEndReason reason, void* ctx);

// ============================================================================
// ReplyHandle
// ============================================================================

/**
 * @brief Shared, single-fulfilment result slot of one request.
 *
 * Copies refer to the same slot. The first resolution wins; later ones are
 * ignored.
 */
class ReplyHandle {
 public:
  ReplyHandle() = default;

  bool Valid() const noexcept { return state_ != nullptr; }
  uint16_t Token() const noexcept { return Valid() ? state_->token : 0U; }

  bool IsReady() const {
    if (!Valid()) return true;
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->result.has_value();
  }

  /// Blocks until resolved. The correlator guarantees resolution by deadline
  /// or session end.
  RequestResult Wait() const {
    if (!Valid()) return RequestResult::error(RequestError::kNotConnected);
    std::unique_lock<std::mutex> lock(state_->mtx);
    state_->cv.wait(lock, [this] { return state_->result.has_value(); });
    return state_->result.value();
  }

  /// @return true when resolved within @p timeout_ms; Wait() then returns
  ///         immediately.
  bool WaitFor(uint32_t timeout_ms) const {
    if (!Valid()) return true;
    std::unique_lock<std::mutex> lock(state_->mtx);
    return state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                               [this] { return state_->result.has_value(); });
  }

 private:
  friend class RequestCorrelator;

  struct State {
    explicit State(uint16_t t) : token(t) {}
    std::mutex mtx;
    std::condition_variable cv;
    optional<RequestResult> result;
    uint16_t token;
  };

  explicit ReplyHandle(std::shared_ptr<State> state)
      : state_(std::move(state)) {}

  /// @return false when the slot was already resolved.
  static bool Resolve(const std::shared_ptr<State>& state,
                      RequestResult result) {
    {
      std::lock_guard<std::mutex> lock(state->mtx);
      if (state->result.has_value()) return false;
      state->result = std::move(result);
    }
    state->cv.notify_all();
    return true;
  }

  std::shared_ptr<State> state_;
};

// ============================================================================
// RequestCorrelator
// ============================================================================

struct CorrelatorConfig {
  uint32_t request_timeout_ms = 3000U;
};

struct CorrelatorStats {
  uint64_t sent = 0;
  uint64_t replies = 0;
  uint64_t unmatched_replies = 0;
  uint64_t notifications = 0;
  uint64_t timeouts = 0;
  uint64_t cancelled = 0;
  uint64_t decode_errors = 0;
  uint64_t frame_errors = 0;
};

class RequestCorrelator final : public FrameSink {
 public:
  RequestCorrelator(StateCache& cache, const CorrelatorConfig& cfg)
      : cache_(cache), cfg_(cfg) {}

  RequestCorrelator(const RequestCorrelator&) = delete;
  RequestCorrelator& operator=(const RequestCorrelator&) = delete;

  /// Binds the session requests go out on. Call before Session::Start().
  void Attach(Session* session) noexcept { session_ = session; }

  void SetSessionEndHook(SessionEndFn fn, void* ctx) noexcept {
    end_fn_ = fn;
    end_ctx_ = ctx;
  }

  /**
   * @brief Assigns a token, registers the request and writes it.
   *
   * @return handle resolving with the reply, kTimedOut, kSessionClosed or
   *         kCancelled; or an immediate kNotConnected / kEncodingFailed /
   *         kWriteFailed.
   */
  expected<ReplyHandle, RequestError> Send(Message msg) {
    using R = expected<ReplyHandle, RequestError>;
    if (session_ == nullptr || session_->State() != SessionState::kReady) {
      return R::error(RequestError::kNotConnected);
    }

    msg.token = 0U;
    auto encoded = Encode(msg);
    if (!encoded) {
      KIZ_LOG_WARN("Correlator", "cannot encode %s %s: %s",
                   ToString(msg.kind), PathOf(msg.target),
                   ToString(encoded.get_error()));
      return R::error(RequestError::kEncodingFailed);
    }
    std::vector<uint8_t>& bytes = encoded.value();

    const uint64_t now = SteadyNowMs();
    std::shared_ptr<ReplyHandle::State> state;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) return R::error(RequestError::kNotConnected);
      const uint16_t token = AllocateTokenLocked();
      if (token == 0U) return R::error(RequestError::kWriteFailed);
      state = std::make_shared<ReplyHandle::State>(token);
      Pending p;
      p.kind = msg.kind;
      p.target = msg.target;
      p.created_ms = now;
      p.deadline_ms = now + cfg_.request_timeout_ms;
      p.values = std::move(msg.values);
      p.state = state;
      pending_.emplace(token, std::move(p));
    }
    // Token bytes sit right after length, type, version and flags.
    bytes[5] = static_cast<uint8_t>(state->token >> 8);
    bytes[6] = static_cast<uint8_t>(state->token & 0xFFU);

    auto w = session_->Send(bytes.data(), static_cast<uint32_t>(bytes.size()));
    if (!w) {
      std::lock_guard<std::mutex> lock(mtx_);
      pending_.erase(state->token);
      return R::error(w.get_error() == TransportError::kNotOpen
                          ? RequestError::kNotConnected
                          : RequestError::kWriteFailed);
    }
    stats_sent_.fetch_add(1U, std::memory_order_relaxed);
    KIZ_LOG_DEBUG("Correlator", "-> #%u %s %s", state->token,
                  ToString(msg.kind), PathOf(msg.target));
    return R::success(ReplyHandle(state));
  }

  /**
   * @brief Withdraws a request; its waiters see kCancelled.
   *
   * A command already on the wire is not undone.
   * @return false when the request had already resolved.
   */
  bool Cancel(const ReplyHandle& handle) {
    if (!handle.Valid()) return false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = pending_.find(handle.state_->token);
      if (it == pending_.end() || it->second.state != handle.state_) {
        return false;
      }
      pending_.erase(it);
    }
    stats_cancelled_.fetch_add(1U, std::memory_order_relaxed);
    return ReplyHandle::Resolve(handle.state_,
                                RequestResult::error(RequestError::kCancelled));
  }

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

  uint32_t PendingCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<uint32_t>(pending_.size());
  }

  CorrelatorStats Stats() const noexcept {
    CorrelatorStats s;
    s.sent = stats_sent_.load(std::memory_order_relaxed);
    s.replies = stats_replies_.load(std::memory_order_relaxed);
    s.unmatched_replies = stats_unmatched_.load(std::memory_order_relaxed);
    s.notifications = stats_notifications_.load(std::memory_order_relaxed);
    s.timeouts = stats_timeouts_.load(std::memory_order_relaxed);
    s.cancelled = stats_cancelled_.load(std::memory_order_relaxed);
    s.decode_errors = stats_decode_errors_.load(std::memory_order_relaxed);
    s.frame_errors = stats_frame_errors_.load(std::memory_order_relaxed);
    return s;
  }

  // --------------------------------------------------------------------------
  // FrameSink (reader thread)
  // --------------------------------------------------------------------------

  void OnFrame(const Frame& frame) override {
    auto decoded = Decode(frame);
    if (!decoded) {
      stats_decode_errors_.fetch_add(1U, std::memory_order_relaxed);
      KIZ_LOG_WARN("Correlator", "dropping undecodable frame (%u bytes): %s",
                   static_cast<uint32_t>(frame.bytes.size()),
                   ToString(decoded.get_error()));
      return;
    }
    const Message& msg = decoded.value();
    const uint64_t now = SteadyNowMs();

    switch (msg.kind) {
      case MessageKind::kReply:
        HandleReply(msg, now);
        break;
      case MessageKind::kNotification:
        HandleNotification(msg, now);
        break;
      default:
        stats_decode_errors_.fetch_add(1U, std::memory_order_relaxed);
        KIZ_LOG_WARN("Correlator", "unexpected %s from device for %s",
                     ToString(msg.kind), PathOf(msg.target));
        break;
    }
  }

  void OnFrameError(FrameError /*err*/) override {
    stats_frame_errors_.fetch_add(1U, std::memory_order_relaxed);
  }

  /// Deadline sweep.
  void OnTick(uint64_t now_ms) override {
    std::vector<std::pair<uint16_t, std::shared_ptr<ReplyHandle::State>>> expired;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      for (auto it = pending_.begin(); it != pending_.end();) {
        if (now_ms >= it->second.deadline_ms) {
          expired.emplace_back(it->first, std::move(it->second.state));
          it = pending_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto& e : expired) {
      stats_timeouts_.fetch_add(1U, std::memory_order_relaxed);
      KIZ_LOG_WARN("Correlator", "request #%u timed out after %u ms", e.first,
                   cfg_.request_timeout_ms);
      ReplyHandle::Resolve(e.second,
                           RequestResult::error(RequestError::kTimedOut));
    }
  }

  void OnSessionEnded(SessionEndReason reason) override {
    std::unordered_map<uint16_t, Pending> orphans;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
      orphans.swap(pending_);
    }
    if (!orphans.empty()) {
      KIZ_LOG_INFO("Correlator", "failing %u outstanding request(s)",
                   static_cast<uint32_t>(orphans.size()));
    }
    for (auto& kv : orphans) {
      ReplyHandle::Resolve(kv.second.state,
                           RequestResult::error(RequestError::kSessionClosed));
    }
    if (end_fn_ != nullptr) end_fn_(reason, end_ctx_);
  }

 private:
  struct Pending {
    MessageKind kind = MessageKind::kQuery;
    Target target = Target::kBatteryGet;
    uint64_t created_ms = 0;
    uint64_t deadline_ms = 0;
    std::vector<AttributeSlot> values;  ///< Command payload.
    std::shared_ptr<ReplyHandle::State> state;
  };

  struct Subscriber {
    NotificationFn fn = nullptr;
    void* ctx = nullptr;
    uint32_t id = 0;
  };

  /// Next free non-zero token, or 0 when all 65535 are in flight.
  uint16_t AllocateTokenLocked() {
    for (uint32_t i = 0; i < 0xFFFFU; ++i) {
      ++next_token_;
      if (next_token_ == 0U) ++next_token_;
      if (pending_.find(next_token_) == pending_.end()) return next_token_;
    }
    return 0U;
  }

  void HandleReply(const Message& msg, uint64_t now) {
    Pending p;
    bool matched = false;
    if (msg.token != 0U) {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = pending_.find(msg.token);
      if (it != pending_.end()) {
        p = std::move(it->second);
        pending_.erase(it);
        matched = true;
      }
    }

    if (!matched) {
      stats_unmatched_.fetch_add(1U, std::memory_order_relaxed);
      KIZ_LOG_DEBUG("Correlator", "unmatched reply #%u for %s", msg.token,
                    PathOf(msg.target));
      if (msg.status == ReplyStatus::kAccepted) WriteValues(msg.values, now);
      return;
    }

    stats_replies_.fetch_add(1U, std::memory_order_relaxed);
    if (msg.target != p.target) {
      KIZ_LOG_WARN("Correlator", "reply #%u names %s, expected %s", msg.token,
                   PathOf(msg.target), PathOf(p.target));
      if (msg.status == ReplyStatus::kAccepted) WriteValues(msg.values, now);
      ReplyHandle::Resolve(p.state,
                           RequestResult::error(RequestError::kUnexpectedReply));
      return;
    }
    if (msg.status == ReplyStatus::kRejected) {
      KIZ_LOG_INFO("Correlator", "device rejected #%u %s", msg.token,
                   PathOf(msg.target));
      ReplyHandle::Resolve(p.state,
                           RequestResult::error(RequestError::kRejected));
      return;
    }

    // Device-confirmed state carries the request's creation time so a
    // notification observed while the request was in flight wins.
    if (!msg.values.empty()) {
      WriteValues(msg.values, p.created_ms);
    } else if (p.kind == MessageKind::kCommand) {
      WriteValues(p.values, p.created_ms);
    }
    KIZ_LOG_DEBUG("Correlator", "<- #%u %s", msg.token, PathOf(msg.target));
    ReplyHandle::Resolve(p.state, RequestResult::success(msg));
  }

  void HandleNotification(const Message& msg, uint64_t now) {
    stats_notifications_.fetch_add(1U, std::memory_order_relaxed);
    if (msg.values.empty()) {
      const TargetInfo& info = Describe(msg.target);
      for (uint8_t i = 0; i < info.attr_count; ++i) {
        cache_.Invalidate(info.attrs[i]);
      }
    } else {
      WriteValues(msg.values, now);
    }
    KIZ_LOG_DEBUG("Correlator", "notify %s (%u value(s))", PathOf(msg.target),
                  static_cast<uint32_t>(msg.values.size()));

    Subscriber snapshot[KIZ_MAX_SUBSCRIBERS];
    {
      std::lock_guard<std::mutex> lock(sub_mtx_);
      for (uint32_t i = 0; i < KIZ_MAX_SUBSCRIBERS; ++i) snapshot[i] = subs_[i];
    }
    for (const auto& s : snapshot) {
      if (s.fn != nullptr) s.fn(msg, s.ctx);
    }
  }

  void WriteValues(const std::vector<AttributeSlot>& values, uint64_t ts) {
    for (const auto& v : values) cache_.Update(v.id, v.value, ts);
  }

  StateCache& cache_;
  CorrelatorConfig cfg_;
  Session* session_ = nullptr;

  mutable std::mutex mtx_;
  std::unordered_map<uint16_t, Pending> pending_;
  uint16_t next_token_ = 0;
  bool closed_ = false;

  std::mutex sub_mtx_;
  Subscriber subs_[KIZ_MAX_SUBSCRIBERS];
  uint32_t next_sub_id_ = 0;

  SessionEndFn end_fn_ = nullptr;
  void* end_ctx_ = nullptr;

  std::atomic<uint64_t> stats_sent_{0};
  std::atomic<uint64_t> stats_replies_{0};
  std::atomic<uint64_t> stats_unmatched_{0};
  std::atomic<uint64_t> stats_notifications_{0};
  std::atomic<uint64_t> stats_timeouts_{0};
  std::atomic<uint64_t> stats_cancelled_{0};
  std::atomic<uint64_t> stats_decode_errors_{0};
  std::atomic<uint64_t> stats_frame_errors_{0};
};

}  // namespace kiz

#endif  // KIZ_CORRELATOR_HPP_
