/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and client_config.hpp.
 */

#include "kiz/client_config.hpp"
#include "kiz/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

// ============================================================================
// ConfigStore (no backend needed)
// ============================================================================

TEST_CASE("ConfigStore typed getters", "[config]") {
  kiz::ConfigStore store;
  REQUIRE(store.EntryCount() == 0U);
  REQUIRE(store.Set("device", "port", "/dev/rfcomm1"));
  REQUIRE(store.Set("request", "timeout_ms", "1500"));
  REQUIRE(store.Set("request", "query_retries", "-3"));
  REQUIRE(store.Set("cache", "refresh_on_notify", "off"));
  REQUIRE(store.Set("cache", "bogus", "maybe"));

  REQUIRE(std::strcmp(store.GetString("DEVICE", "Port"), "/dev/rfcomm1") == 0);
  REQUIRE(store.GetUint("request", "timeout_ms", 7U) == 1500U);
  REQUIRE(store.GetInt("request", "query_retries", 0) == -3);
  REQUIRE(store.GetUint("request", "query_retries", 2U) == 2U);
  REQUIRE(store.GetBool("cache", "refresh_on_notify", true) == false);
  REQUIRE(!store.FindBool("cache", "bogus").has_value());
  REQUIRE(store.HasSection("cache"));
  REQUIRE(!store.HasSection("log"));
  REQUIRE(store.HasKey("device", "port"));
  REQUIRE(store.EntryCount() == 5U);

  REQUIRE(store.Set("device", "port", "/dev/rfcomm2"));
  REQUIRE(store.EntryCount() == 5U);
  REQUIRE(std::strcmp(store.GetString("device", "port"), "/dev/rfcomm2") == 0);
}

// ============================================================================
// LoadClientConfig
// ============================================================================

TEST_CASE("LoadClientConfig keeps defaults for an empty store",
          "[config][client]") {
  kiz::ConfigStore store;
  auto r = kiz::LoadClientConfig(store);
  REQUIRE(r.has_value());
  const kiz::ClientConfig& c = r.value();
  REQUIRE(c.device.port == "/dev/rfcomm0");
  REQUIRE(c.device.baud_rate == 115200U);
  REQUIRE(c.session.handshake_timeout_ms == 2000U);
  REQUIRE(c.session.poll_interval_ms == 20U);
  REQUIRE(c.session.max_frame_size == 1024U);
  REQUIRE(c.refresh_on_connect);
  REQUIRE(c.request.request_timeout_ms == 3000U);
  REQUIRE(c.query_retries == 1U);
  REQUIRE(c.staleness_ms == 30000U);
  REQUIRE(c.refresh_on_notify);
}

TEST_CASE("LoadClientConfig maps every key", "[config][client]") {
  kiz::ConfigStore store;
  store.Set("device", "port", "/dev/rfcomm3");
  store.Set("device", "baud", "57600");
  store.Set("session", "handshake_timeout_ms", "500");
  store.Set("session", "poll_interval_ms", "5");
  store.Set("session", "max_frame_size", "2048");
  store.Set("session", "refresh_on_connect", "false");
  store.Set("request", "timeout_ms", "250");
  store.Set("request", "query_retries", "3");
  store.Set("cache", "staleness_ms", "1000");
  store.Set("cache", "refresh_on_notify", "no");
  store.Set("log", "level", "warn");

  auto r = kiz::LoadClientConfig(store);
  REQUIRE(r.has_value());
  const kiz::ClientConfig& c = r.value();
  REQUIRE(c.device.port == "/dev/rfcomm3");
  REQUIRE(c.device.baud_rate == 57600U);
  REQUIRE(c.session.handshake_timeout_ms == 500U);
  REQUIRE(c.session.poll_interval_ms == 5U);
  REQUIRE(c.session.max_frame_size == 2048U);
  REQUIRE(!c.refresh_on_connect);
  REQUIRE(c.request.request_timeout_ms == 250U);
  REQUIRE(c.query_retries == 3U);
  REQUIRE(c.staleness_ms == 1000U);
  REQUIRE(!c.refresh_on_notify);
  REQUIRE(c.log_level == kiz::log::Level::kWarn);
}

TEST_CASE("LoadClientConfig clamps out-of-range numbers", "[config][client]") {
  kiz::ConfigStore store;
  store.Set("session", "poll_interval_ms", "0");
  store.Set("session", "max_frame_size", "16");
  store.Set("request", "query_retries", "50");

  auto r = kiz::LoadClientConfig(store);
  REQUIRE(r.has_value());
  REQUIRE(r.value().session.poll_interval_ms == 1U);
  REQUIRE(r.value().session.max_frame_size == 64U);
  REQUIRE(r.value().query_retries == 10U);
}

TEST_CASE("LoadClientConfig rejects invalid values", "[config][client]") {
  SECTION("baud rate") {
    kiz::ConfigStore store;
    store.Set("device", "baud", "12345");
    auto r = kiz::LoadClientConfig(store);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::ConfigError::kInvalidValue);
  }
  SECTION("log level") {
    kiz::ConfigStore store;
    store.Set("log", "level", "chatty");
    auto r = kiz::LoadClientConfig(store);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::ConfigError::kInvalidValue);
  }
}

TEST_CASE("LoadClientConfig layers over caller defaults", "[config][client]") {
  kiz::ClientConfig defaults;
  defaults.device.port = "/dev/ttyUSB0";
  defaults.query_retries = 0U;

  kiz::ConfigStore store;
  store.Set("request", "timeout_ms", "900");
  auto r = kiz::LoadClientConfig(store, defaults);
  REQUIRE(r.has_value());
  REQUIRE(r.value().device.port == "/dev/ttyUSB0");
  REQUIRE(r.value().query_retries == 0U);
  REQUIRE(r.value().request.request_timeout_ms == 900U);
}

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef KIZ_CONFIG_INI_ENABLED

using IniCfg = kiz::Config<kiz::IniBackend>;

static const char kClientIni[] =
    "[device]\n"
    "port = /dev/rfcomm4\n"
    "baud = 115200\n"
    "[request]\n"
    "timeout_ms = 1200\n"
    "[cache]\n"
    "refresh_on_notify = false\n"
    "[log]\n"
    "level = INFO\n";

TEST_CASE("INI LoadBuffer into ClientConfig", "[config][ini]") {
  IniCfg cfg;
  auto loaded = cfg.LoadBuffer(kClientIni,
                               static_cast<uint32_t>(std::strlen(kClientIni)),
                               kiz::ConfigFormat::kIni);
  REQUIRE(loaded.has_value());
  REQUIRE(cfg.GetUint("request", "timeout_ms") == 1200U);

  auto r = kiz::LoadClientConfig(cfg);
  REQUIRE(r.has_value());
  REQUIRE(r.value().device.port == "/dev/rfcomm4");
  REQUIRE(r.value().request.request_timeout_ms == 1200U);
  REQUIRE(!r.value().refresh_on_notify);
  REQUIRE(r.value().log_level == kiz::log::Level::kInfo);
  // Untouched keys keep defaults.
  REQUIRE(r.value().session.handshake_timeout_ms == 2000U);
}

TEST_CASE("INI LoadFile with extension detection", "[config][ini]") {
  const char* path = "/tmp/kiz_test_client.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs(kClientIni, f);
  std::fclose(f);

  IniCfg cfg;
  auto loaded = cfg.LoadFile(path);
  REQUIRE(loaded.has_value());
  REQUIRE(std::strcmp(cfg.GetString("device", "port"), "/dev/rfcomm4") == 0);
  std::remove(path);
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  IniCfg cfg;
  auto loaded = cfg.LoadFile("/nonexistent/kizkiz.ini");
  REQUIRE(!loaded.has_value());
  REQUIRE(loaded.get_error() == kiz::ConfigError::kFileNotFound);
}

TEST_CASE("INI rejects a format it was not built with", "[config][ini]") {
  IniCfg cfg;
  auto loaded = cfg.LoadBuffer("{}", 2U, kiz::ConfigFormat::kJson);
  REQUIRE(!loaded.has_value());
  REQUIRE(loaded.get_error() == kiz::ConfigError::kFormatNotSupported);
}

#endif  // KIZ_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef KIZ_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadBuffer flattens sections", "[config][json]") {
  const char* json =
      "{\"device\": {\"port\": \"/dev/rfcomm5\", \"baud\": 9600},"
      " \"session\": {\"refresh_on_connect\": false}}";
  kiz::Config<kiz::JsonBackend> cfg;
  auto loaded = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                               kiz::ConfigFormat::kJson);
  REQUIRE(loaded.has_value());

  auto r = kiz::LoadClientConfig(cfg);
  REQUIRE(r.has_value());
  REQUIRE(r.value().device.port == "/dev/rfcomm5");
  REQUIRE(r.value().device.baud_rate == 9600U);
  REQUIRE(!r.value().refresh_on_connect);
}

TEST_CASE("JSON LoadBuffer malformed", "[config][json]") {
  const char* json = "{\"device\": ";
  kiz::Config<kiz::JsonBackend> cfg;
  auto loaded = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                               kiz::ConfigFormat::kJson);
  REQUIRE(!loaded.has_value());
  REQUIRE(loaded.get_error() == kiz::ConfigError::kParseError);
}

#endif  // KIZ_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef KIZ_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer flattens sections", "[config][yaml]") {
  const char* yaml =
      "request:\n"
      "  timeout_ms: 800\n"
      "  query_retries: 2\n"
      "cache:\n"
      "  staleness_ms: 5000\n";
  kiz::Config<kiz::YamlBackend> cfg;
  auto loaded = cfg.LoadBuffer(yaml, static_cast<uint32_t>(std::strlen(yaml)),
                               kiz::ConfigFormat::kYaml);
  REQUIRE(loaded.has_value());

  auto r = kiz::LoadClientConfig(cfg);
  REQUIRE(r.has_value());
  REQUIRE(r.value().request.request_timeout_ms == 800U);
  REQUIRE(r.value().query_retries == 2U);
  REQUIRE(r.value().staleness_ms == 5000U);
}

#endif  // KIZ_CONFIG_YAML_ENABLED
