/**
 * @file hsm.hpp
 * @brief Header-only hierarchical state machine used for session lifecycles.
 *
 * States are declared as StateConfig records (handler, entry, exit) and
 * stored in a fixed array; events bubble from the current state to its
 * ancestors until one handles them. Transitions run exit actions up to the
 * lowest common ancestor, then entry actions down to the target.
 *
 * Not thread-safe: the owner serialises Dispatch() calls.
 */

#ifndef KIZ_HSM_HPP_
#define KIZ_HSM_HPP_

#include "kiz/platform.hpp"

#include <cstdint>

#ifndef KIZ_HSM_MAX_DEPTH
#define KIZ_HSM_MAX_DEPTH 8
#endif

namespace kiz {

// ============================================================================
// Event / TransitionResult
// ============================================================================

struct Event {
  uint32_t id;
  const void* data;  ///< Optional payload, nullptr if unused.
};

enum class TransitionResult : uint8_t {
  kHandled,    ///< Consumed, stay in the current state.
  kUnhandled,  ///< Offer the event to the parent state.
  kTransition  ///< Handler called RequestTransition().
};

// ============================================================================
// StateConfig
// ============================================================================

template <typename Context>
struct StateConfig {
  using HandlerFn = TransitionResult (*)(Context& ctx, const Event& event);
  using ActionFn = void (*)(Context& ctx);

  const char* name;      ///< Static string, used in logs.
  int32_t parent_index;  ///< -1 for a top-level state.
  HandlerFn handler;
  ActionFn on_entry;     ///< nullptr if none.
  ActionFn on_exit;      ///< nullptr if none.
};

// ============================================================================
// StateMachine
// ============================================================================

/**
 * @brief Fixed-capacity hierarchical state machine.
 *
 * @tparam Context   Owner data handed to every callback; must outlive *this.
 * @tparam MaxStates Capacity of the state table.
 *
 * @code
 *   kiz::StateMachine<Session, 4> sm(session);
 *   int32_t connecting = sm.AddState({"Connecting", -1, &OnConnecting, ...});
 *   sm.SetInitialState(connecting);
 *   sm.Start();
 *   sm.Dispatch({kEvHandshakeAck, nullptr});
 * @endcode
 */
template <typename Context, uint32_t MaxStates = 8>
class StateMachine final {
 public:
  static constexpr int32_t kNoState = -1;

  /// Called after every completed transition (from, to). Optional.
  using TransitionHook = void (*)(Context& ctx, int32_t from, int32_t to);

  explicit StateMachine(Context& ctx) noexcept : ctx_(ctx) {}

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  /// @return index of the new state, or kNoState when the table is full.
  int32_t AddState(const StateConfig<Context>& config) noexcept {
    KIZ_ASSERT(!started_);
    if (count_ >= MaxStates) return kNoState;
    states_[count_] = config;
    return static_cast<int32_t>(count_++);
  }

  void SetInitialState(int32_t index) noexcept {
    KIZ_ASSERT(!started_);
    KIZ_ASSERT(Valid(index));
    initial_ = index;
  }

  void SetTransitionHook(TransitionHook hook) noexcept { hook_ = hook; }

  /// Enters the initial state and its ancestors, outermost first.
  void Start() noexcept {
    KIZ_ASSERT(!started_ && Valid(initial_));
    started_ = true;
    current_ = initial_;
    EnterDownTo(kNoState, initial_);
  }

  /// Offers @p event to the current state, then to each ancestor in turn.
  /// An event no state handles is dropped.
  void Dispatch(const Event& event) noexcept {
    KIZ_ASSERT(started_);
    for (int32_t s = current_; s >= 0; s = Parent(s)) {
      const auto& sc = states_[static_cast<uint32_t>(s)];
      if (sc.handler == nullptr) continue;
      const TransitionResult r = sc.handler(ctx_, event);
      if (r == TransitionResult::kHandled) return;
      if (r == TransitionResult::kTransition) {
        KIZ_ASSERT(Valid(pending_));
        const int32_t target = pending_;
        pending_ = kNoState;
        TransitionTo(target);
        return;
      }
    }
  }

  /// Call from a handler and return the result.
  TransitionResult RequestTransition(int32_t target) noexcept {
    pending_ = target;
    return TransitionResult::kTransition;
  }

  int32_t CurrentState() const noexcept { return current_; }

  const char* CurrentStateName() const noexcept {
    return (current_ >= 0) ? states_[static_cast<uint32_t>(current_)].name
                           : "";
  }

  const char* StateName(int32_t index) const noexcept {
    return Valid(index) ? states_[static_cast<uint32_t>(index)].name : "";
  }

  /// True when the current state is @p index or one of its descendants.
  bool IsInState(int32_t index) const noexcept {
    for (int32_t s = current_; s >= 0; s = Parent(s)) {
      if (s == index) return true;
    }
    return false;
  }

  bool IsStarted() const noexcept { return started_; }
  uint32_t StateCount() const noexcept { return count_; }

 private:
  bool Valid(int32_t index) const noexcept {
    return index >= 0 && static_cast<uint32_t>(index) < count_;
  }

  int32_t Parent(int32_t s) const noexcept {
    return states_[static_cast<uint32_t>(s)].parent_index;
  }

  uint32_t Depth(int32_t s) const noexcept {
    uint32_t d = 0;
    for (; s >= 0; s = Parent(s)) ++d;
    return d;
  }

  int32_t CommonAncestor(int32_t a, int32_t b) const noexcept {
    uint32_t da = Depth(a);
    uint32_t db = Depth(b);
    for (; da > db; --da) a = Parent(a);
    for (; db > da; --db) b = Parent(b);
    while (a != b) {
      a = Parent(a);
      b = Parent(b);
    }
    return a;
  }

  void EnterDownTo(int32_t ancestor, int32_t target) noexcept {
    int32_t chain[KIZ_HSM_MAX_DEPTH];
    uint32_t n = 0;
    for (int32_t s = target; s >= 0 && s != ancestor; s = Parent(s)) {
      KIZ_ASSERT(n < KIZ_HSM_MAX_DEPTH);
      chain[n++] = s;
    }
    while (n > 0) {
      const auto& sc = states_[static_cast<uint32_t>(chain[--n])];
      if (sc.on_entry != nullptr) sc.on_entry(ctx_);
    }
  }

  void TransitionTo(int32_t target) noexcept {
    const int32_t source = current_;
    if (source == target) {
      const auto& sc = states_[static_cast<uint32_t>(source)];
      if (sc.on_exit != nullptr) sc.on_exit(ctx_);
      if (sc.on_entry != nullptr) sc.on_entry(ctx_);
    } else {
      const int32_t lca = CommonAncestor(source, target);
      for (int32_t s = source; s >= 0 && s != lca; s = Parent(s)) {
        const auto& sc = states_[static_cast<uint32_t>(s)];
        if (sc.on_exit != nullptr) sc.on_exit(ctx_);
      }
      // Entry actions observe the new state as current.
      current_ = target;
      EnterDownTo(lca, target);
    }
    current_ = target;
    if (hook_ != nullptr) hook_(ctx_, source, target);
  }

  Context& ctx_;
  int32_t current_ = kNoState;
  int32_t initial_ = kNoState;
  int32_t pending_ = kNoState;
  uint32_t count_ = 0;
  bool started_ = false;
  TransitionHook hook_ = nullptr;
  StateConfig<Context> states_[MaxStates]{};
};

}  // namespace kiz

#endif  // KIZ_HSM_HPP_
