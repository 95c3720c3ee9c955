/**
 * @file kizctl.cpp
 * @brief Command-line control for a headset on an RFCOMM tty.
 *
 * Usage:
 *   kizctl [-c config] [-p port] [-v] <command> [args]
 *
 * Commands:
 *   status                   full refresh, then every known attribute
 *   battery | version | presets
 *   nc [on|off]              noise cancellation
 *   mode [on|off]            specific mode
 *   eq [on|off|<preset-id>]  equalizer
 *   head [on|off]            head detection
 *   autoconnect [on|off]     auto connection
 *   watch                    print notifications until the session ends
 *
 * Bind the headset first, e.g. `rfcomm bind 0 <addr> <channel>`.
 */

#include "kiz/client_config.hpp"
#include "kiz/config.hpp"
#include "kiz/headset.hpp"
#include "kiz/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <thread>

// ============================================================================
// Argument Parsing
// ============================================================================

struct Options {
  const char* config_path = nullptr;
  const char* port = nullptr;
  bool verbose = false;
  const char* command = nullptr;
  const char* arg = nullptr;
};

static void PrintUsage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s [-c config] [-p port] [-v] <command> [args]\n"
               "commands:\n"
               "  status | battery | version | presets | watch\n"
               "  nc [on|off]   mode [on|off]   head [on|off]\n"
               "  autoconnect [on|off]   eq [on|off|<preset-id>]\n",
               prog);
}

static bool ParseArgs(int argc, char* argv[], Options& opts) {
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    if (std::strcmp(a, "-c") == 0 && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (std::strcmp(a, "-p") == 0 && i + 1 < argc) {
      opts.port = argv[++i];
    } else if (std::strcmp(a, "-v") == 0) {
      opts.verbose = true;
    } else if (a[0] == '-') {
      return false;
    } else if (opts.command == nullptr) {
      opts.command = a;
    } else if (opts.arg == nullptr) {
      opts.arg = a;
    } else {
      return false;
    }
  }
  return opts.command != nullptr;
}

/// "on"/"off" -> bool; anything else is an error.
static bool ParseSwitch(const char* s, bool& out) {
  if (std::strcmp(s, "on") == 0) {
    out = true;
    return true;
  }
  if (std::strcmp(s, "off") == 0) {
    out = false;
    return true;
  }
  return false;
}

// ============================================================================
// Output Helpers
// ============================================================================

static const char* OnOff(bool b) { return b ? "on" : "off"; }

static int Fail(const char* what, kiz::RequestError e) {
  std::fprintf(stderr, "%s: %s\n", what, kiz::ToString(e));
  return 1;
}

static void PrintBattery(const kiz::BatteryStatus& b) {
  switch (b.state) {
    case kiz::BatteryState::kCharging:
      std::printf("battery: charging\n");
      break;
    case kiz::BatteryState::kCalculating:
      std::printf("battery: calculating\n");
      break;
    case kiz::BatteryState::kInUse:
      std::printf("battery: %d%%\n", b.level);
      break;
  }
}

static void PrintValue(kiz::AttributeId id, const kiz::AttributeValue& v) {
  if (const auto* b = std::get_if<bool>(&v)) {
    std::printf("%s: %s\n", kiz::ToString(id), OnOff(*b));
  } else if (const auto* n = std::get_if<int32_t>(&v)) {
    std::printf("%s: %d\n", kiz::ToString(id), *n);
  } else if (const auto* bat = std::get_if<kiz::BatteryStatus>(&v)) {
    PrintBattery(*bat);
  } else if (const auto* s = std::get_if<std::string>(&v)) {
    std::printf("%s: %s\n", kiz::ToString(id), s->c_str());
  } else if (const auto* list = std::get_if<kiz::PresetList>(&v)) {
    std::printf("%s:\n", kiz::ToString(id));
    for (const auto& p : *list) {
      std::printf("  %2d  %s\n", p.id, p.name.c_str());
    }
  }
}

/// Preset id with its name from the cached preset list, when known.
static void PrintPreset(kiz::HeadsetController& hs, int32_t id) {
  const kiz::EqualizerPreset* p = nullptr;
  auto list = hs.Cache().Read(kiz::AttributeId::kEqualizerPresets);
  if (list.has_value()) {
    p = kiz::FindPreset(std::get<kiz::PresetList>(list.value().value), id);
  }
  std::printf("%s: %d (%s)\n", kiz::ToString(kiz::AttributeId::kEqualizerPreset),
              id, (p != nullptr) ? p->name.c_str() : "unnamed");
}

// ============================================================================
// Commands
// ============================================================================

static int CmdStatus(kiz::HeadsetController& hs) {
  auto r = hs.RefreshAll();
  if (!r) {
    std::fprintf(stderr, "refresh incomplete: %s\n", kiz::ToString(r.get_error()));
  }
  for (uint32_t i = 0; i < kiz::kAttributeCount; ++i) {
    const auto id = static_cast<kiz::AttributeId>(i);
    auto cached = hs.Cache().Read(id);
    if (cached.has_value() && id == kiz::AttributeId::kEqualizerPreset) {
      PrintPreset(hs, std::get<int32_t>(cached.value().value));
    } else if (cached.has_value()) {
      PrintValue(id, cached.value().value);
    } else {
      std::printf("%s: unknown\n", kiz::ToString(id));
    }
  }
  return r ? 0 : 1;
}

/// Shared shape of the on/off commands: no argument reads, one argument sets.
template <typename Getter, typename Setter>
static int CmdSwitch(const char* name, const char* arg, Getter get, Setter set) {
  if (arg == nullptr) {
    auto v = get();
    if (!v) return Fail(name, v.get_error());
    std::printf("%s: %s\n", name, OnOff(v.value()));
    return 0;
  }
  bool on = false;
  if (!ParseSwitch(arg, on)) {
    std::fprintf(stderr, "%s: expected on|off, got '%s'\n", name, arg);
    return 2;
  }
  auto r = set(on);
  if (!r) return Fail(name, r.get_error());
  std::printf("%s: %s\n", name, OnOff(on));
  return 0;
}

static int CmdEqualizer(kiz::HeadsetController& hs, const char* arg) {
  if (arg == nullptr) {
    auto enabled = hs.GetEqualizerEnabled();
    if (!enabled) return Fail("eq", enabled.get_error());
    auto preset = hs.GetEqualizerPreset();
    if (!preset) return Fail("eq", preset.get_error());
    auto name = hs.GetEqualizerPresetName();
    std::printf("eq: %s, preset %d (%s)\n", OnOff(enabled.value()),
                preset.value(), name ? name.value().c_str() : "unnamed");
    return 0;
  }
  bool on = false;
  if (ParseSwitch(arg, on)) {
    auto r = hs.SetEqualizerEnabled(on);
    if (!r) return Fail("eq", r.get_error());
    std::printf("eq: %s\n", OnOff(on));
    return 0;
  }
  int32_t id = 0;
  if (!kiz::ParsePresetId(arg, id)) {
    std::fprintf(stderr, "eq: expected on|off|<preset-id 0..%d>, got '%s'\n",
                 kiz::kMaxPresetId, arg);
    return 2;
  }
  auto r = hs.SetEqualizerPreset(id);
  if (!r) return Fail("eq", r.get_error());
  auto name = hs.GetEqualizerPresetName();
  std::printf("eq: preset %d (%s)\n", id,
              name ? name.value().c_str() : "unnamed");
  return 0;
}

static std::atomic<bool> g_stop{false};

static void OnSignal(int /*sig*/) { g_stop.store(true); }

static void OnNotification(const kiz::Message& msg, void* /*ctx*/) {
  if (msg.values.empty()) {
    std::printf("notify %s\n", kiz::PathOf(msg.target));
  }
  for (const auto& slot : msg.values) PrintValue(slot.id, slot.value);
  std::fflush(stdout);
}

static void OnSessionEnd(kiz::SessionEndReason reason, void* /*ctx*/) {
  std::printf("session ended: %s\n", kiz::ToString(reason));
  g_stop.store(true);
}

static int CmdWatch(kiz::HeadsetController& hs) {
  hs.Subscribe(&OnNotification, nullptr);
  std::signal(SIGINT, &OnSignal);
  std::signal(SIGTERM, &OnSignal);
  while (!g_stop.load() && hs.IsConnected()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return 0;
}

static int Dispatch(kiz::HeadsetController& hs, const Options& o) {
  const char* cmd = o.command;
  if (std::strcmp(cmd, "status") == 0) return CmdStatus(hs);
  if (std::strcmp(cmd, "battery") == 0) {
    auto v = hs.GetBattery();
    if (!v) return Fail("battery", v.get_error());
    PrintBattery(v.value());
    return 0;
  }
  if (std::strcmp(cmd, "version") == 0) {
    auto v = hs.GetFirmwareVersion();
    if (!v) return Fail("version", v.get_error());
    std::printf("version: %s\n", v.value().c_str());
    return 0;
  }
  if (std::strcmp(cmd, "presets") == 0) {
    auto v = hs.GetEqualizerPresets();
    if (!v) return Fail("presets", v.get_error());
    PrintValue(kiz::AttributeId::kEqualizerPresets, kiz::AttributeValue(v.value()));
    return 0;
  }
  if (std::strcmp(cmd, "nc") == 0) {
    return CmdSwitch(
        "nc", o.arg, [&] { return hs.GetNoiseCancellation(); },
        [&](bool on) { return hs.SetNoiseCancellation(on); });
  }
  if (std::strcmp(cmd, "mode") == 0) {
    return CmdSwitch(
        "mode", o.arg, [&] { return hs.GetSpecificMode(); },
        [&](bool on) { return hs.SetSpecificMode(on); });
  }
  if (std::strcmp(cmd, "head") == 0) {
    return CmdSwitch(
        "head", o.arg, [&] { return hs.GetHeadDetection(); },
        [&](bool on) { return hs.SetHeadDetection(on); });
  }
  if (std::strcmp(cmd, "autoconnect") == 0) {
    return CmdSwitch(
        "autoconnect", o.arg, [&] { return hs.GetAutoConnection(); },
        [&](bool on) { return hs.SetAutoConnection(on); });
  }
  if (std::strcmp(cmd, "eq") == 0) return CmdEqualizer(hs, o.arg);
  if (std::strcmp(cmd, "watch") == 0) return CmdWatch(hs);
  std::fprintf(stderr, "unknown command '%s'\n", cmd);
  return 2;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  Options opts;
  if (!ParseArgs(argc, argv, opts)) {
    PrintUsage(argv[0]);
    return 2;
  }

  kiz::ClientConfig cfg;
#ifdef KIZ_CONFIG_HAS_BACKEND
  if (opts.config_path != nullptr) {
    kiz::MultiConfig store;
    auto loaded = store.LoadFile(opts.config_path);
    if (!loaded) {
      std::fprintf(stderr, "cannot load %s\n", opts.config_path);
      return 2;
    }
    auto parsed = kiz::LoadClientConfig(store);
    if (!parsed) return 2;
    cfg = parsed.value();
  }
#else
  if (opts.config_path != nullptr) {
    std::fprintf(stderr, "built without a config backend, ignoring %s\n",
                 opts.config_path);
  }
#endif
  if (opts.verbose) cfg.log_level = kiz::log::Level::kDebug;
  kiz::log::Init(cfg.log_level);

  // status runs its own blocking refresh.
  if (std::strcmp(opts.command, "status") == 0) cfg.refresh_on_connect = false;

  kiz::HeadsetController headset(cfg);
  headset.SetSessionEndHandler(&OnSessionEnd, nullptr);
  auto connected = headset.Connect(opts.port != nullptr ? opts.port
                                                        : cfg.device.port.c_str());
  if (!connected) {
    std::fprintf(stderr, "connect failed: %s\n",
                 kiz::ToString(connected.get_error()));
    kiz::log::Shutdown();
    return 1;
  }
  KIZ_LOG_DEBUG("kizctl", "connected, running '%s'", opts.command);

  const int rc = Dispatch(headset, opts);
  headset.Disconnect();
  kiz::log::Shutdown();
  return rc;
}
