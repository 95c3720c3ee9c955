/**
 * @file state_cache.hpp
 * @brief Last-known headset attribute values with freshness tracking.
 *
 * Writes are last-write-wins by timestamp, not by arrival order: a reply to
 * an old query cannot overwrite a newer notification. The cache never
 * initiates I/O.
 */

#ifndef KIZ_STATE_CACHE_HPP_
#define KIZ_STATE_CACHE_HPP_

#include "kiz/codec.hpp"
#include "kiz/log.hpp"
#include "kiz/platform.hpp"
#include "kiz/vocabulary.hpp"

#include <cstdint>
#include <mutex>

namespace kiz {

enum class Freshness : uint8_t { kFresh, kStale };

struct CachedAttribute {
  AttributeValue value;
  uint64_t updated_ms;
  Freshness freshness;
};

class StateCache final {
 public:
  static constexpr uint32_t kDefaultStalenessMs = 30000U;

  explicit StateCache(uint32_t staleness_ms = kDefaultStalenessMs) noexcept
      : staleness_ms_(staleness_ms) {}

  StateCache(const StateCache&) = delete;
  StateCache& operator=(const StateCache&) = delete;

  /**
   * @brief Stores @p value observed at @p timestamp_ms.
   * @return false when the cache already holds a newer observation.
   */
  bool Update(AttributeId id, const AttributeValue& value,
              uint64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mtx_);
    Slot& s = slots_[Index(id)];
    if (s.present && timestamp_ms < s.updated_ms) {
      KIZ_LOG_DEBUG("Cache", "%s: ignoring update older than %llu ms",
                    ToString(id),
                    static_cast<unsigned long long>(s.updated_ms));
      return false;
    }
    s.value = value;
    s.updated_ms = timestamp_ms;
    s.present = true;
    s.invalidated = false;
    return true;
  }

  optional<CachedAttribute> Read(AttributeId id) const {
    return ReadAt(id, SteadyNowMs());
  }

  /// Read with an explicit "now", for deterministic staleness checks.
  optional<CachedAttribute> ReadAt(AttributeId id, uint64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const Slot& s = slots_[Index(id)];
    if (!s.present) return {};
    const bool expired =
        now_ms > s.updated_ms && (now_ms - s.updated_ms) > staleness_ms_;
    return optional<CachedAttribute>(CachedAttribute{
        s.value, s.updated_ms,
        (s.invalidated || expired) ? Freshness::kStale : Freshness::kFresh});
  }

  /// Marks the value stale; it stays readable until replaced.
  void Invalidate(AttributeId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    slots_[Index(id)].invalidated = true;
  }

  void InvalidateAll() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& s : slots_) s.invalidated = true;
  }

  void SetStalenessWindow(uint32_t ms) {
    std::lock_guard<std::mutex> lock(mtx_);
    staleness_ms_ = ms;
  }

  uint32_t StalenessWindow() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return staleness_ms_;
  }

 private:
  struct Slot {
    AttributeValue value;
    uint64_t updated_ms = 0;
    bool present = false;
    bool invalidated = false;
  };

  static uint32_t Index(AttributeId id) noexcept {
    const uint32_t i = static_cast<uint32_t>(id);
    KIZ_ASSERT(i < kAttributeCount);
    return i;
  }

  mutable std::mutex mtx_;
  Slot slots_[kAttributeCount];
  uint32_t staleness_ms_;
};

}  // namespace kiz

#endif  // KIZ_STATE_CACHE_HPP_
