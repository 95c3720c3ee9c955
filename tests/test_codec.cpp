/**
 * @file test_codec.cpp
 * @brief Tests for kiz/codec.hpp: frame layout, Encode and Decode.
 */

#include "kiz/codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>
#include <vector>

// ============================================================================
// Helpers
// ============================================================================

/// Wraps @p text in a data frame carrying @p token.
static kiz::Frame DataFrame(const std::string& text, uint16_t token = 0U) {
  kiz::Frame f;
  f.type = kiz::FrameType::kData;
  const size_t total = kiz::kMinDataFrameSize + text.size();
  kiz::AppendBe16(f.bytes, static_cast<uint16_t>(total));
  f.bytes.push_back(0x80);
  f.bytes.push_back(kiz::kProtocolVersion);
  f.bytes.push_back(0x00);
  kiz::AppendBe16(f.bytes, token);
  f.bytes.insert(f.bytes.end(), text.begin(), text.end());
  return f;
}

static kiz::Frame ToFrame(const std::vector<uint8_t>& bytes) {
  kiz::Frame f;
  f.type = static_cast<kiz::FrameType>(bytes[2]);
  f.bytes = bytes;
  return f;
}

static std::string TextOf(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin() + kiz::kMinDataFrameSize, bytes.end());
}

static kiz::Message Reply(kiz::Target t, uint16_t token,
                          std::vector<kiz::AttributeSlot> values) {
  kiz::Message m;
  m.kind = kiz::MessageKind::kReply;
  m.target = t;
  m.token = token;
  m.values = std::move(values);
  return m;
}

// ============================================================================
// Targets
// ============================================================================

TEST_CASE("Target table maps paths both ways", "[codec][target]") {
  for (uint32_t i = 0; i < kiz::kTargetCount; ++i) {
    const auto t = static_cast<kiz::Target>(i);
    REQUIRE(kiz::Describe(t).target == t);
    kiz::Target back = kiz::Target::kBatteryGet;
    const char* path = kiz::PathOf(t);
    REQUIRE(kiz::FindTarget(path, std::strlen(path), back));
    REQUIRE(back == t);
  }
  kiz::Target out;
  REQUIRE(!kiz::FindTarget("/api/unknown", 12, out));
  // Prefix of a real path is not a match.
  REQUIRE(!kiz::FindTarget("/api/system/battery", 19, out));
}

TEST_CASE("Read-back and query targets", "[codec][target]") {
  REQUIRE(kiz::ReadBackTarget(kiz::Target::kNoiseCancellationSet) ==
          kiz::Target::kNoiseCancellationGet);
  REQUIRE(kiz::ReadBackTarget(kiz::Target::kEqualizerPresetSet) ==
          kiz::Target::kEqualizerGet);
  REQUIRE(kiz::ReadBackTarget(kiz::Target::kBatteryGet) ==
          kiz::Target::kBatteryGet);
  REQUIRE(kiz::QueryTargetFor(kiz::AttributeId::kEqualizerEnabled) ==
          kiz::Target::kEqualizerGet);
  REQUIRE(kiz::TargetCarries(kiz::Target::kEqualizerGet,
                             kiz::AttributeId::kEqualizerPreset));
  REQUIRE(!kiz::TargetCarries(kiz::Target::kEqualizerEnabledSet,
                              kiz::AttributeId::kEqualizerPreset));
}

// ============================================================================
// Encode
// ============================================================================

TEST_CASE("Encode query writes a GET line", "[codec][encode]") {
  auto r = kiz::Encode(kiz::Message::Query(kiz::Target::kBatteryGet));
  REQUIRE(r.has_value());
  const std::vector<uint8_t>& b = r.value();
  REQUIRE(kiz::ReadBe16(b.data()) == b.size());
  REQUIRE(b[2] == 0x80);
  REQUIRE(b[3] == kiz::kProtocolVersion);
  REQUIRE(kiz::ReadBe16(b.data() + 5) == 0U);
  REQUIRE(TextOf(b) == "GET /api/system/battery/get");
}

TEST_CASE("Encode command writes a SET line", "[codec][encode]") {
  auto nc = kiz::Encode(kiz::Message::Command(
      kiz::Target::kNoiseCancellationSet, kiz::AttributeValue(true)));
  REQUIRE(nc.has_value());
  REQUIRE(TextOf(nc.value()) ==
          "SET /api/audio/noise_cancellation/enabled/set?arg=true");

  kiz::Message preset = kiz::Message::Command(kiz::Target::kEqualizerPresetSet,
                                              kiz::AttributeValue(int32_t{7}));
  preset.token = 0x1234;
  auto p = kiz::Encode(preset);
  REQUIRE(p.has_value());
  REQUIRE(TextOf(p.value()) == "SET /api/audio/equalizer/preset_id/set?arg=7");
  REQUIRE(p.value()[5] == 0x12);
  REQUIRE(p.value()[6] == 0x34);
}

TEST_CASE("Encode rejects invalid payloads before producing bytes",
          "[codec][encode]") {
  SECTION("preset id out of range") {
    auto r = kiz::Encode(kiz::Message::Command(kiz::Target::kEqualizerPresetSet,
                                               kiz::AttributeValue(int32_t{32})));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kValueOutOfRange);
  }
  SECTION("negative preset id") {
    auto r = kiz::Encode(kiz::Message::Command(kiz::Target::kEqualizerPresetSet,
                                               kiz::AttributeValue(int32_t{-1})));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kValueOutOfRange);
  }
  SECTION("wrong value type") {
    auto r = kiz::Encode(kiz::Message::Command(
        kiz::Target::kHeadDetectionSet, kiz::AttributeValue(int32_t{1})));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kTypeMismatch);
  }
  SECTION("command without a value") {
    kiz::Message m;
    m.kind = kiz::MessageKind::kCommand;
    m.target = kiz::Target::kAutoConnectionSet;
    auto r = kiz::Encode(m);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kMissingValue);
  }
  SECTION("SET on a read-only endpoint") {
    kiz::Message m;
    m.kind = kiz::MessageKind::kCommand;
    m.target = kiz::Target::kBatteryGet;
    m.values.push_back(kiz::AttributeSlot{
        kiz::AttributeId::kBattery,
        kiz::BatteryStatus{kiz::BatteryState::kInUse, 50}});
    auto r = kiz::Encode(m);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kUnsupportedKind);
  }
  SECTION("GET on a write endpoint") {
    auto r = kiz::Encode(kiz::Message::Query(kiz::Target::kSpecificModeSet));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kUnsupportedKind);
  }
  SECTION("battery level above 100") {
    auto r = kiz::Encode(Reply(
        kiz::Target::kBatteryGet, 1,
        {{kiz::AttributeId::kBattery,
          kiz::BatteryStatus{kiz::BatteryState::kInUse, 101}}}));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kValueOutOfRange);
  }
  SECTION("empty firmware version") {
    auto r = kiz::Encode(Reply(kiz::Target::kVersionGet, 1,
                               {{kiz::AttributeId::kFirmwareVersion,
                                 std::string()}}));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kValueOutOfRange);
  }
  SECTION("accepted GET answer missing an attribute") {
    auto r = kiz::Encode(Reply(kiz::Target::kEqualizerGet, 1,
                               {{kiz::AttributeId::kEqualizerEnabled, true}}));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::EncodingError::kMissingValue);
  }
}

// ============================================================================
// Decode
// ============================================================================

TEST_CASE("Decode equalizer answer with both attributes", "[codec][decode]") {
  auto r = kiz::Decode(DataFrame(
      "<answer path=\"/api/audio/equalizer/get\"><audio>"
      "<equalizer enabled=\"false\" preset_id=\"4\"/></audio></answer>",
      0x0102));
  REQUIRE(r.has_value());
  const kiz::Message& m = r.value();
  REQUIRE(m.kind == kiz::MessageKind::kReply);
  REQUIRE(m.target == kiz::Target::kEqualizerGet);
  REQUIRE(m.token == 0x0102);
  REQUIRE(m.status == kiz::ReplyStatus::kAccepted);
  REQUIRE(*m.Find(kiz::AttributeId::kEqualizerEnabled) ==
          kiz::AttributeValue(false));
  REQUIRE(*m.Find(kiz::AttributeId::kEqualizerPreset) ==
          kiz::AttributeValue(int32_t{4}));
}

TEST_CASE("Decode battery states", "[codec][decode]") {
  auto decode = [](const char* attrs) {
    return kiz::Decode(DataFrame(
        std::string("<answer path=\"/api/system/battery/get\"><system>"
                    "<battery ") +
        attrs + "/></system></answer>"));
  };
  auto in_use = decode("state=\"in_use\" level=\"65\"");
  REQUIRE(in_use.has_value());
  REQUIRE(std::get<kiz::BatteryStatus>(
              *in_use.value().Find(kiz::AttributeId::kBattery)) ==
          kiz::BatteryStatus{kiz::BatteryState::kInUse, 65});

  auto calculating = decode("state=\"in_use\" level=\"\"");
  REQUIRE(calculating.has_value());
  REQUIRE(std::get<kiz::BatteryStatus>(
              *calculating.value().Find(kiz::AttributeId::kBattery)) ==
          kiz::BatteryStatus{kiz::BatteryState::kCalculating, -1});

  auto charging = decode("state=\"charging\" level=\"\"");
  REQUIRE(charging.has_value());
  REQUIRE(std::get<kiz::BatteryStatus>(
              *charging.value().Find(kiz::AttributeId::kBattery)) ==
          kiz::BatteryStatus{kiz::BatteryState::kCharging, -1});

  auto bad_level = decode("state=\"in_use\" level=\"high\"");
  REQUIRE(!bad_level.has_value());
  REQUIRE(bad_level.get_error() == kiz::DecodingError::kTypeMismatch);

  auto bad_state = decode("state=\"exploding\" level=\"10\"");
  REQUIRE(!bad_state.has_value());
  REQUIRE(bad_state.get_error() == kiz::DecodingError::kTypeMismatch);
}

TEST_CASE("Decode ignores unknown elements and attributes", "[codec][decode]") {
  auto r = kiz::Decode(DataFrame(
      "<answer path=\"/api/software/version/get\" firmware=\"zik2\">"
      "<extra foo=\"bar\"/>"
      "<software version=\"2.05\" sip6=\"1.0\" tts=\"true\"/>"
      "</answer>"));
  REQUIRE(r.has_value());
  REQUIRE(*r.value().Find(kiz::AttributeId::kFirmwareVersion) ==
          kiz::AttributeValue(std::string("2.05")));
}

TEST_CASE("Decode preset list", "[codec][decode]") {
  auto r = kiz::Decode(DataFrame(
      "<answer path=\"/api/audio/equalizer/presets_list/get\"><audio>"
      "<equalizer><presets_list>"
      "<preset id=\"0\" name=\"Natural\"/><junk/>"
      "<preset id=\"1\" name=\"Vocal\"/>"
      "</presets_list></equalizer></audio></answer>"));
  REQUIRE(r.has_value());
  const auto& list =
      std::get<kiz::PresetList>(*r.value().Find(kiz::AttributeId::kEqualizerPresets));
  REQUIRE(list.size() == 2U);
  REQUIRE(list[0] == kiz::EqualizerPreset{0, "Natural"});
  REQUIRE(list[1] == kiz::EqualizerPreset{1, "Vocal"});
}

TEST_CASE("Decode rejected answer and empty notification", "[codec][decode]") {
  auto rejected = kiz::Decode(DataFrame(
      "<answer path=\"/api/audio/equalizer/preset_id/set\" error=\"true\"/>", 9));
  REQUIRE(rejected.has_value());
  REQUIRE(rejected.value().status == kiz::ReplyStatus::kRejected);
  REQUIRE(rejected.value().values.empty());

  auto notify = kiz::Decode(
      DataFrame("<notify path=\"/api/audio/noise_cancellation/enabled/get\"/>"));
  REQUIRE(notify.has_value());
  REQUIRE(notify.value().kind == kiz::MessageKind::kNotification);
  REQUIRE(notify.value().token == 0U);
  REQUIRE(notify.value().values.empty());
}

TEST_CASE("Decode request lines", "[codec][decode]") {
  auto get = kiz::Decode(DataFrame("GET /api/system/head_detection/enabled/get"));
  REQUIRE(get.has_value());
  REQUIRE(get.value().kind == kiz::MessageKind::kQuery);
  REQUIRE(get.value().target == kiz::Target::kHeadDetectionGet);

  auto set = kiz::Decode(
      DataFrame("SET /api/system/auto_connection/enabled/set?arg=false", 77));
  REQUIRE(set.has_value());
  kiz::Message want = kiz::Message::Command(
      kiz::Target::kAutoConnectionSet, kiz::AttributeValue(false));
  want.token = 77;
  REQUIRE(set.value() == want);
}

TEST_CASE("Decode failures", "[codec][decode]") {
  SECTION("short frame") {
    kiz::Frame f;
    f.bytes = {0x00, 0x05, 0x80, 0x01, 0x00};
    auto r = kiz::Decode(f);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kTruncated);
  }
  SECTION("length disagrees with frame size") {
    kiz::Frame f = DataFrame("GET /api/system/battery/get");
    f.bytes.push_back('x');
    auto r = kiz::Decode(f);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kMalformed);
  }
  SECTION("empty body") {
    auto r = kiz::Decode(DataFrame(""));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kTruncated);
  }
  SECTION("truncated XML") {
    auto r = kiz::Decode(DataFrame("<answer path=\"/api/system/battery/get\"><sys"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kTruncated);
  }
  SECTION("unknown root element") {
    auto r = kiz::Decode(DataFrame("<question path=\"/api/system/battery/get\"/>"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kUnknownKind);
  }
  SECTION("unknown text kind") {
    auto r = kiz::Decode(DataFrame("PUT /api/system/battery/get"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kUnknownKind);
  }
  SECTION("unknown path") {
    auto r = kiz::Decode(DataFrame("<notify path=\"/api/flight/mode/get\"/>"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kUnknownTarget);
  }
  SECTION("missing path") {
    auto r = kiz::Decode(DataFrame("<notify/>"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kMissingField);
  }
  SECTION("accepted GET answer missing its value") {
    auto r = kiz::Decode(
        DataFrame("<answer path=\"/api/system/head_detection/enabled/get\"/>"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kMissingField);
  }
  SECTION("boolean that is not a boolean") {
    auto r = kiz::Decode(DataFrame(
        "<answer path=\"/api/audio/specific_mode/enabled/get\"><audio>"
        "<specific_mode enabled=\"yes\"/></audio></answer>"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kTypeMismatch);
  }
  SECTION("preset id out of range") {
    auto r = kiz::Decode(DataFrame(
        "<answer path=\"/api/audio/equalizer/get\"><audio>"
        "<equalizer enabled=\"true\" preset_id=\"40\"/></audio></answer>"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kTypeMismatch);
  }
  SECTION("SET without argument") {
    auto r = kiz::Decode(DataFrame("SET /api/audio/specific_mode/enabled/set"));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kMissingField);
  }
  SECTION("unsupported protocol version") {
    kiz::Frame f = DataFrame("GET /api/system/battery/get");
    f.bytes[3] = 2;
    auto r = kiz::Decode(f);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == kiz::DecodingError::kMalformed);
  }
}

// ============================================================================
// Round trip
// ============================================================================

TEST_CASE("Decode(Encode(m)) == m for every kind", "[codec][roundtrip]") {
  std::vector<kiz::Message> messages;
  messages.push_back(kiz::Message::Query(kiz::Target::kEqualizerPresetsGet));
  messages.push_back(kiz::Message::Command(kiz::Target::kEqualizerPresetSet,
                                           kiz::AttributeValue(int32_t{31})));
  messages.push_back(kiz::Message::Command(kiz::Target::kSpecificModeSet,
                                           kiz::AttributeValue(false)));
  messages.push_back(Reply(kiz::Target::kBatteryGet, 0xFFFF,
                           {{kiz::AttributeId::kBattery,
                             kiz::BatteryStatus{kiz::BatteryState::kCharging,
                                                90}}}));
  messages.push_back(Reply(kiz::Target::kBatteryGet, 3,
                           {{kiz::AttributeId::kBattery,
                             kiz::BatteryStatus{kiz::BatteryState::kCalculating,
                                                -1}}}));
  messages.push_back(Reply(
      kiz::Target::kEqualizerGet, 4,
      {{kiz::AttributeId::kEqualizerPreset, int32_t{0}},
       {kiz::AttributeId::kEqualizerEnabled, true}}));
  messages.push_back(Reply(
      kiz::Target::kEqualizerPresetsGet, 5,
      {{kiz::AttributeId::kEqualizerPresets,
        kiz::PresetList{{0, "Natural"}, {12, "Rock & <Roll>"}}}}));
  messages.push_back(Reply(kiz::Target::kVersionGet, 6,
                           {{kiz::AttributeId::kFirmwareVersion,
                             std::string("3.07")}}));
  messages.push_back(Reply(kiz::Target::kHeadDetectionSet, 7, {}));

  kiz::Message rejected = Reply(kiz::Target::kEqualizerPresetSet, 8, {});
  rejected.status = kiz::ReplyStatus::kRejected;
  messages.push_back(rejected);

  kiz::Message notify;
  notify.kind = kiz::MessageKind::kNotification;
  notify.target = kiz::Target::kNoiseCancellationGet;
  notify.values.push_back({kiz::AttributeId::kNoiseCancellation, true});
  messages.push_back(notify);

  kiz::Message bare_notify;
  bare_notify.kind = kiz::MessageKind::kNotification;
  bare_notify.target = kiz::Target::kBatteryGet;
  messages.push_back(bare_notify);

  for (const auto& m : messages) {
    INFO(kiz::ToString(m.kind) << " " << kiz::PathOf(m.target));
    auto encoded = kiz::Encode(m);
    REQUIRE(encoded.has_value());
    auto decoded = kiz::Decode(ToFrame(encoded.value()));
    REQUIRE(decoded.has_value());
    REQUIRE(decoded.value() == m);
  }
}

TEST_CASE("Handshake frame", "[codec]") {
  const std::vector<uint8_t> hs = kiz::MakeHandshakeFrame();
  REQUIRE(hs == std::vector<uint8_t>{0x00, 0x03, 0x00});
  kiz::Frame f;
  f.type = kiz::FrameType::kHandshake;
  f.bytes = hs;
  REQUIRE(kiz::IsHandshakeFrame(f));
  auto r = kiz::Decode(f);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == kiz::DecodingError::kUnknownKind);
}

// ============================================================================
// Presets
// ============================================================================

TEST_CASE("FindPreset looks presets up by id", "[codec][preset]") {
  const kiz::PresetList list = {{0, "Natural"}, {2, "Pop"}, {31, "Custom"}};
  const kiz::EqualizerPreset* pop = kiz::FindPreset(list, 2);
  REQUIRE(pop != nullptr);
  REQUIRE(pop->name == "Pop");
  REQUIRE(kiz::FindPreset(list, 31)->name == "Custom");
  REQUIRE(kiz::FindPreset(list, 1) == nullptr);
  REQUIRE(kiz::FindPreset(kiz::PresetList{}, 0) == nullptr);
}

TEST_CASE("ParsePresetId accepts only ids in range", "[codec][preset]") {
  int32_t id = -1;
  REQUIRE(kiz::ParsePresetId("0", id));
  REQUIRE(id == 0);
  REQUIRE(kiz::ParsePresetId("31", id));
  REQUIRE(id == 31);

  id = 7;
  REQUIRE(!kiz::ParsePresetId("32", id));
  REQUIRE(!kiz::ParsePresetId("-1", id));
  REQUIRE(!kiz::ParsePresetId("3x", id));
  REQUIRE(!kiz::ParsePresetId("", id));
  REQUIRE(!kiz::ParsePresetId(nullptr, id));
  // Would wrap to 2 if truncated to 32 bits.
  REQUIRE(!kiz::ParsePresetId("4294967298", id));
  REQUIRE(!kiz::ParsePresetId("99999999999999999999", id));
  REQUIRE(id == 7);
}
