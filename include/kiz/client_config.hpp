/**
 * @file client_config.hpp
 * @brief Typed headset client settings loaded from a ConfigStore.
 *
 * Recognised keys (all optional):
 *
 *   [device]   port, baud
 *   [session]  handshake_timeout_ms, poll_interval_ms, max_frame_size,
 *              refresh_on_connect
 *   [request]  timeout_ms, query_retries
 *   [cache]    staleness_ms, refresh_on_notify
 *   [log]      level
 */

#ifndef KIZ_CLIENT_CONFIG_HPP_
#define KIZ_CLIENT_CONFIG_HPP_

#include "kiz/codec.hpp"
#include "kiz/config.hpp"
#include "kiz/correlator.hpp"
#include "kiz/log.hpp"
#include "kiz/session.hpp"
#include "kiz/state_cache.hpp"
#include "kiz/transport.hpp"
#include "kiz/vocabulary.hpp"

#include <cstdint>
#include <string>

namespace kiz {

struct ClientConfig {
  SerialConfig device;
  SessionConfig session;
  bool refresh_on_connect = true;
  CorrelatorConfig request;
  uint32_t query_retries = 1U;
  uint32_t staleness_ms = StateCache::kDefaultStalenessMs;
  bool refresh_on_notify = true;
#ifdef NDEBUG
  log::Level log_level = log::Level::kInfo;
#else
  log::Level log_level = log::Level::kDebug;
#endif
};

namespace detail {

inline uint32_t ClampU32(uint32_t v, uint32_t lo, uint32_t hi,
                         const char* what) {
  if (v < lo || v > hi) {
    const uint32_t c = (v < lo) ? lo : hi;
    KIZ_LOG_WARN("Config", "%s=%u out of range [%u, %u], using %u", what, v,
                 lo, hi, c);
    return c;
  }
  return v;
}

}  // namespace detail

/**
 * @brief Maps a loaded store onto ClientConfig.
 *
 * Missing keys keep their defaults. Out-of-range numbers are clamped with a
 * warning; an unsupported baud rate or unknown log level is rejected.
 */
inline expected<ClientConfig, ConfigError> LoadClientConfig(
    const ConfigStore& store, const ClientConfig& defaults = ClientConfig{}) {
  using R = expected<ClientConfig, ConfigError>;
  ClientConfig c = defaults;

  c.device.port = store.GetString("device", "port", c.device.port.c_str());
  c.device.baud_rate = store.GetUint("device", "baud", c.device.baud_rate);
  if (!SerialStream::IsSupportedBaud(c.device.baud_rate)) {
    KIZ_LOG_ERROR("Config", "unsupported baud rate %u", c.device.baud_rate);
    return R::error(ConfigError::kInvalidValue);
  }

  c.session.handshake_timeout_ms = detail::ClampU32(
      store.GetUint("session", "handshake_timeout_ms",
                    c.session.handshake_timeout_ms),
      10U, 60000U, "session.handshake_timeout_ms");
  c.session.poll_interval_ms = detail::ClampU32(
      store.GetUint("session", "poll_interval_ms", c.session.poll_interval_ms),
      1U, 1000U, "session.poll_interval_ms");
  c.session.max_frame_size = detail::ClampU32(
      store.GetUint("session", "max_frame_size", c.session.max_frame_size),
      64U, 0xFFFFU, "session.max_frame_size");
  c.refresh_on_connect =
      store.GetBool("session", "refresh_on_connect", c.refresh_on_connect);

  c.request.request_timeout_ms = detail::ClampU32(
      store.GetUint("request", "timeout_ms", c.request.request_timeout_ms),
      10U, 600000U, "request.timeout_ms");
  c.query_retries = detail::ClampU32(
      store.GetUint("request", "query_retries", c.query_retries), 0U, 10U,
      "request.query_retries");

  c.staleness_ms = store.GetUint("cache", "staleness_ms", c.staleness_ms);
  c.refresh_on_notify =
      store.GetBool("cache", "refresh_on_notify", c.refresh_on_notify);

  if (store.HasKey("log", "level")) {
    const char* level = store.GetString("log", "level");
    if (!log::ParseLevel(level, c.log_level)) {
      KIZ_LOG_ERROR("Config", "unknown log level '%s'", level);
      return R::error(ConfigError::kInvalidValue);
    }
  }
  return R::success(std::move(c));
}

}  // namespace kiz

#endif  // KIZ_CLIENT_CONFIG_HPP_
