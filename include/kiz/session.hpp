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
 * @file kiz/session.hpp
 * @brief Session - lifecycle of one connected headset control channel.
 *
 * Lifecycle (driven by kiz::StateMachine, only ever on the reader thread):
 *
 *   Active
 *   +-- Connecting --(handshake ack)--> Ready
 *   |        \--(handshake timeout)--+
 *   +--(stream lost / Close())-------+--> Draining --> Closed
 *
 * The reader thread is the sole reader of the ByteStream. It assembles
 * frames, hands data frames to the FrameSink while Ready, calls OnTick()
 * every poll interval and, on the way out, OnSessionEnded() so the sink can
 * fail whatever is still outstanding. Writers from any thread are serialised
 * by one write mutex. A Session never reconnects.
 */

#ifndef KIZ_SESSION_HPP_
#define KIZ_SESSION_HPP_

#include "kiz/codec.hpp"
#include "kiz/hsm.hpp"
#include "kiz/log.hpp"
#include "kiz/platform.hpp"
#include "kiz/transport.hpp"
#include "kiz/vocabulary.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace kiz {

// ============================================================================
// Types
// ============================================================================

enum class SessionState : uint8_t {
  kConnecting = 0,
  kReady,
  kDraining,
  kClosed,
};

enum class SessionEndReason : uint8_t {
  kClosedByOwner = 0,
  kTransportLost,
  kHandshakeTimeout,
};

inline const char* ToString(SessionState s) noexcept {
  switch (s) {
    case SessionState::kConnecting: return "Connecting";
    case SessionState::kReady:      return "Ready";
    case SessionState::kDraining:   return "Draining";
    case SessionState::kClosed:     return "Closed";
  }
  return "?";
}

inline const char* ToString(SessionEndReason r) noexcept {
  switch (r) {
    case SessionEndReason::kClosedByOwner:    return "closed by owner";
    case SessionEndReason::kTransportLost:    return "transport lost";
    case SessionEndReason::kHandshakeTimeout: return "handshake timeout";
  }
  return "?";
}

struct SessionConfig {
  uint32_t handshake_timeout_ms = 2000U;
  uint32_t poll_interval_ms = 20U;
  uint32_t max_frame_size = kDefaultMaxFrameSize;
};

struct SessionStats {
  uint64_t frames_in = 0;
  uint64_t frames_out = 0;
  uint64_t bytes_in = 0;
  uint64_t bytes_out = 0;
  uint64_t oversize_frames = 0;
  uint64_t bad_headers = 0;
};

/**
 * @brief Receiver of session events. All callbacks run on the reader thread
 *        and must not block.
 */
class FrameSink {
 public:
  virtual ~FrameSink() = default;

  /// Complete data frame, delivered only while Ready.
  virtual void OnFrame(const Frame& frame) = 0;
  virtual void OnFrameError(FrameError /*err*/) {}
  /// Once per poll interval while Ready.
  virtual void OnTick(uint64_t /*now_ms*/) {}
  /// Called once, in Draining, before the session reaches Closed.
  virtual void OnSessionEnded(SessionEndReason reason) = 0;
};

// ============================================================================
// Session
// ============================================================================

class Session final {
 public:
  /// @p sink must outlive the session.
  Session(std::unique_ptr<ByteStream> stream, const SessionConfig& cfg,
          FrameSink* sink)
      : stream_(std::move(stream)),
        cfg_(cfg),
        sink_(sink),
        assembler_(cfg.max_frame_size),
        sm_(*this) {
    KIZ_ASSERT(stream_ != nullptr);
    KIZ_ASSERT(sink_ != nullptr);
    if (cfg_.poll_interval_ms == 0U) cfg_.poll_interval_ms = 1U;
    BuildStateMachine();
  }

  ~Session() {
    KIZ_ASSERT(!OnReaderThread());
    Close();
  }

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * @brief Sends the handshake and starts the reader thread.
   *
   * The session stays Connecting until the device echoes the handshake.
   */
  expected<void, TransportError> Start() {
    using R = expected<void, TransportError>;
    if (started_.exchange(true, std::memory_order_acq_rel)) {
      return R::success();
    }
    sm_.Start();
    handshake_deadline_ms_ = SteadyNowMs() + cfg_.handshake_timeout_ms;

    const std::vector<uint8_t> hello = MakeHandshakeFrame();
    auto w = WriteRaw(hello.data(), static_cast<uint32_t>(hello.size()));
    if (!w) {
      KIZ_LOG_WARN("Session", "handshake write failed: %s",
                   ToString(w.get_error()));
      FinishWithoutReader(SessionEndReason::kTransportLost);
      return w;
    }
    KIZ_LOG_DEBUG("Session", "handshake sent, waiting for ack");
    reader_ = std::thread(&Session::ReaderLoop, this);
    return R::success();
  }

  /**
   * @brief Blocks until the session leaves Connecting or @p timeout_ms
   *        elapses.
   * @return true when the session is Ready.
   */
  bool WaitReady(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(state_mtx_);
    state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
      return State() != SessionState::kConnecting;
    });
    return State() == SessionState::kReady;
  }

  /// Blocks until Closed.
  void WaitClosed() {
    std::unique_lock<std::mutex> lock(state_mtx_);
    state_cv_.wait(lock, [this] { return State() == SessionState::kClosed; });
  }

  /**
   * @brief Writes one complete frame. Only valid while Ready.
   *
   * A failed write also marks the stream broken so the reader loop ends the
   * session with kTransportLost.
   */
  expected<void, TransportError> Send(const uint8_t* data, uint32_t len) {
    if (State() != SessionState::kReady) {
      return expected<void, TransportError>::error(TransportError::kNotOpen);
    }
    auto w = WriteRaw(data, len);
    if (!w) {
      write_failed_.store(true, std::memory_order_release);
      KIZ_LOG_WARN("Session", "write failed: %s", ToString(w.get_error()));
    }
    return w;
  }

  /**
   * @brief Ends the session (reason kClosedByOwner) and waits for Closed.
   *
   * From the reader thread itself (e.g. inside a sink callback) this only
   * requests the stop; the loop finishes after the callback returns.
   */
  void Close() {
    stop_requested_.store(true, std::memory_order_release);
    if (OnReaderThread()) return;
    if (reader_.joinable()) {
      reader_.join();
    } else if (started_.load(std::memory_order_acquire) &&
               State() != SessionState::kClosed) {
      FinishWithoutReader(SessionEndReason::kClosedByOwner);
    }
  }

  SessionState State() const noexcept {
    return static_cast<SessionState>(state_.load(std::memory_order_acquire));
  }

  /// Meaningful once the session reached Draining.
  SessionEndReason EndReason() const noexcept {
    return static_cast<SessionEndReason>(
        end_reason_.load(std::memory_order_acquire));
  }

  bool OnReaderThread() const noexcept {
    return reader_id_.load(std::memory_order_acquire) ==
           std::this_thread::get_id();
  }

  SessionStats Stats() const noexcept {
    SessionStats s;
    s.frames_in = frames_in_.load(std::memory_order_relaxed);
    s.frames_out = frames_out_.load(std::memory_order_relaxed);
    s.bytes_in = bytes_in_.load(std::memory_order_relaxed);
    s.bytes_out = bytes_out_.load(std::memory_order_relaxed);
    s.oversize_frames = oversize_.load(std::memory_order_relaxed);
    s.bad_headers = bad_headers_.load(std::memory_order_relaxed);
    return s;
  }

  const SessionConfig& GetConfig() const noexcept { return cfg_; }

 private:
  // --------------------------------------------------------------------------
  // State machine
  // --------------------------------------------------------------------------

  enum EventId : uint32_t {
    kEvHandshakeAck = 1,
    kEvHandshakeTimeout,
    kEvShutdown,  ///< data: const SessionEndReason*
    kEvDrained,
  };

  void BuildStateMachine() {
    st_active_ = sm_.AddState({"Active", -1, &Session::OnActive, nullptr,
                               nullptr});
    st_connecting_ = sm_.AddState({"Connecting", st_active_,
                                   &Session::OnConnecting,
                                   &Session::EnterConnecting, nullptr});
    st_ready_ = sm_.AddState({"Ready", st_active_, nullptr,
                              &Session::EnterReady, nullptr});
    st_draining_ = sm_.AddState({"Draining", -1, &Session::OnDraining,
                                 &Session::EnterDraining, nullptr});
    st_closed_ = sm_.AddState({"Closed", -1, nullptr, &Session::EnterClosed,
                               nullptr});
    sm_.SetInitialState(st_connecting_);
    sm_.SetTransitionHook(&Session::OnTransition);
  }

  static TransitionResult OnActive(Session& s, const Event& ev) {
    if (ev.id == kEvShutdown) {
      const auto* reason = static_cast<const SessionEndReason*>(ev.data);
      s.end_reason_.store(static_cast<uint8_t>(*reason),
                          std::memory_order_release);
      return s.sm_.RequestTransition(s.st_draining_);
    }
    return TransitionResult::kUnhandled;
  }

  static TransitionResult OnConnecting(Session& s, const Event& ev) {
    if (ev.id == kEvHandshakeAck) {
      return s.sm_.RequestTransition(s.st_ready_);
    }
    if (ev.id == kEvHandshakeTimeout) {
      s.end_reason_.store(
          static_cast<uint8_t>(SessionEndReason::kHandshakeTimeout),
          std::memory_order_release);
      return s.sm_.RequestTransition(s.st_draining_);
    }
    return TransitionResult::kUnhandled;
  }

  static TransitionResult OnDraining(Session& s, const Event& ev) {
    if (ev.id == kEvDrained) return s.sm_.RequestTransition(s.st_closed_);
    return TransitionResult::kHandled;
  }

  static void EnterConnecting(Session& s) { s.SetState(SessionState::kConnecting); }
  static void EnterReady(Session& s) { s.SetState(SessionState::kReady); }
  static void EnterDraining(Session& s) { s.SetState(SessionState::kDraining); }
  static void EnterClosed(Session& s) { s.SetState(SessionState::kClosed); }

  static void OnTransition(Session& s, int32_t from, int32_t to) {
    KIZ_LOG_DEBUG("Session", "%s -> %s", s.sm_.StateName(from),
                  s.sm_.StateName(to));
  }

  void SetState(SessionState st) {
    {
      std::lock_guard<std::mutex> lock(state_mtx_);
      state_.store(static_cast<uint8_t>(st), std::memory_order_release);
    }
    state_cv_.notify_all();
  }

  // --------------------------------------------------------------------------
  // Reader loop
  // --------------------------------------------------------------------------

  void ReaderLoop() {
    reader_id_.store(std::this_thread::get_id(), std::memory_order_release);
    uint8_t buf[512];
    SessionEndReason reason = SessionEndReason::kClosedByOwner;

    for (;;) {
      if (stop_requested_.load(std::memory_order_acquire)) {
        reason = SessionEndReason::kClosedByOwner;
        break;
      }
      if (write_failed_.load(std::memory_order_acquire)) {
        reason = SessionEndReason::kTransportLost;
        break;
      }
      const uint64_t now = SteadyNowMs();
      if (State() == SessionState::kConnecting &&
          now >= handshake_deadline_ms_) {
        KIZ_LOG_WARN("Session", "no handshake ack within %u ms",
                     cfg_.handshake_timeout_ms);
        sm_.Dispatch({kEvHandshakeTimeout, nullptr});
        reason = SessionEndReason::kHandshakeTimeout;
        break;
      }

      auto r = stream_->Read(buf, sizeof(buf),
                             static_cast<int32_t>(cfg_.poll_interval_ms));
      if (!r) {
        KIZ_LOG_INFO("Session", "stream ended: %s", ToString(r.get_error()));
        reason = SessionEndReason::kTransportLost;
        break;
      }
      if (r.value() > 0U) {
        bytes_in_.fetch_add(r.value(), std::memory_order_relaxed);
        assembler_.Feed(buf, r.value());
        DrainFrames();
      }
      if (State() == SessionState::kReady) sink_->OnTick(SteadyNowMs());
    }

    Finish(reason);
    reader_id_.store(std::thread::id(), std::memory_order_release);
  }

  void DrainFrames() {
    Frame frame;
    FrameError err = FrameError::kBadHeader;
    for (;;) {
      const FrameAssembler::Status st = assembler_.Next(frame, err);
      if (st == FrameAssembler::Status::kNeedMore) return;
      if (st == FrameAssembler::Status::kError) {
        if (err == FrameError::kFrameTooLarge) {
          oversize_.fetch_add(1U, std::memory_order_relaxed);
        } else {
          bad_headers_.fetch_add(1U, std::memory_order_relaxed);
        }
        KIZ_LOG_WARN("Framer", "%s, resynchronising", ToString(err));
        sink_->OnFrameError(err);
        continue;
      }
      frames_in_.fetch_add(1U, std::memory_order_relaxed);
      HandleFrame(frame);
    }
  }

  void HandleFrame(const Frame& frame) {
    if (frame.type == FrameType::kHandshake) {
      if (State() == SessionState::kConnecting) {
        KIZ_LOG_INFO("Session", "handshake acknowledged");
        sm_.Dispatch({kEvHandshakeAck, nullptr});
      }
      return;
    }
    if (State() != SessionState::kReady) {
      KIZ_LOG_DEBUG("Session", "dropping %u-byte frame before handshake",
                    static_cast<uint32_t>(frame.bytes.size()));
      return;
    }
    sink_->OnFrame(frame);
  }

  /// Draining: let the sink fail outstanding work, then close the stream.
  void Finish(SessionEndReason reason) {
    if (State() != SessionState::kDraining) {
      sm_.Dispatch({kEvShutdown, &reason});
    }
    const SessionEndReason final_reason = EndReason();
    KIZ_LOG_INFO("Session", "ending: %s", ToString(final_reason));
    sink_->OnSessionEnded(final_reason);
    {
      std::lock_guard<std::mutex> lock(write_mtx_);
      stream_->Close();
    }
    sm_.Dispatch({kEvDrained, nullptr});
  }

  /// Used when no reader thread exists (handshake write failed, or Close()
  /// before the thread came up).
  void FinishWithoutReader(SessionEndReason reason) { Finish(reason); }

  expected<void, TransportError> WriteRaw(const uint8_t* data, uint32_t len) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    auto w = stream_->Write(data, len);
    if (w) {
      frames_out_.fetch_add(1U, std::memory_order_relaxed);
      bytes_out_.fetch_add(len, std::memory_order_relaxed);
    }
    return w;
  }

  std::unique_ptr<ByteStream> stream_;
  SessionConfig cfg_;
  FrameSink* sink_;
  FrameAssembler assembler_;

  StateMachine<Session, 5> sm_;
  int32_t st_active_ = -1;
  int32_t st_connecting_ = -1;
  int32_t st_ready_ = -1;
  int32_t st_draining_ = -1;
  int32_t st_closed_ = -1;

  std::atomic<uint8_t> state_{static_cast<uint8_t>(SessionState::kConnecting)};
  std::atomic<uint8_t> end_reason_{
      static_cast<uint8_t>(SessionEndReason::kClosedByOwner)};
  std::mutex state_mtx_;
  std::condition_variable state_cv_;

  std::mutex write_mtx_;
  std::thread reader_;
  std::atomic<std::thread::id> reader_id_{};
  std::atomic<bool> started_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> write_failed_{false};
  uint64_t handshake_deadline_ms_ = 0;

  std::atomic<uint64_t> frames_in_{0};
  std::atomic<uint64_t> frames_out_{0};
  std::atomic<uint64_t> bytes_in_{0};
  std::atomic<uint64_t> bytes_out_{0};
  std::atomic<uint64_t> oversize_{0};
  std::atomic<uint64_t> bad_headers_{0};
};

}  // namespace kiz

#endif  // KIZ_SESSION_HPP_
