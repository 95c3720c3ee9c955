/**
 * @file codec.hpp
 * @brief Wire frames and the headset Message model: encode / decode.
 *
 * Frame layout (all integers big-endian):
 *
 *   +--------+------+--------------------------------------------+
 *   | u16    | u8   | body                                       |
 *   | length | type |                                            |
 *   +--------+------+--------------------------------------------+
 *
 *   type 0x00  handshake, always exactly 00 03 00
 *   type 0x80  data: u8 version (1) | u8 flags | u16 token | text
 *
 * Outgoing text is a request line ("GET <path>", "SET <path>?arg=<v>"),
 * incoming text is an XML <answer> or <notify> document.
 *
 * Everything here is a pure function of its arguments.
 */

#ifndef KIZ_CODEC_HPP_
#define KIZ_CODEC_HPP_

#include "kiz/vocabulary.hpp"
#include "kiz/xml.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kiz {

// ============================================================================
// Wire Constants
// ============================================================================

static constexpr uint32_t kFrameHeaderSize = 3U;
static constexpr uint32_t kDataPrefixSize = 4U;  ///< version, flags, token
static constexpr uint32_t kMinDataFrameSize = kFrameHeaderSize + kDataPrefixSize;
static constexpr uint32_t kDefaultMaxFrameSize = 1024U;
static constexpr uint8_t kProtocolVersion = 1U;
static constexpr int32_t kMaxPresetId = 31;

enum class FrameType : uint8_t {
  kHandshake = 0x00,
  kData = 0x80,
};

/// One complete frame, header included.
struct Frame {
  FrameType type = FrameType::kData;
  std::vector<uint8_t> bytes;
};

inline uint16_t ReadBe16(const uint8_t* p) noexcept {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline void AppendBe16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFFU));
}

inline std::vector<uint8_t> MakeHandshakeFrame() {
  return std::vector<uint8_t>{0x00, 0x03, 0x00};
}

inline bool IsHandshakeFrame(const Frame& frame) noexcept {
  return frame.type == FrameType::kHandshake &&
         frame.bytes.size() == kFrameHeaderSize;
}

// ============================================================================
// Attribute Values
// ============================================================================

enum class AttributeId : uint8_t {
  kBattery = 0,
  kFirmwareVersion,
  kNoiseCancellation,
  kSpecificMode,
  kEqualizerEnabled,
  kEqualizerPreset,
  kEqualizerPresets,
  kHeadDetection,
  kAutoConnection,
};

static constexpr uint32_t kAttributeCount = 9U;

inline const char* ToString(AttributeId id) noexcept {
  switch (id) {
    case AttributeId::kBattery:           return "battery";
    case AttributeId::kFirmwareVersion:   return "firmware_version";
    case AttributeId::kNoiseCancellation: return "noise_cancellation";
    case AttributeId::kSpecificMode:      return "specific_mode";
    case AttributeId::kEqualizerEnabled:  return "equalizer_enabled";
    case AttributeId::kEqualizerPreset:   return "equalizer_preset";
    case AttributeId::kEqualizerPresets:  return "equalizer_presets";
    case AttributeId::kHeadDetection:     return "head_detection";
    case AttributeId::kAutoConnection:    return "auto_connection";
  }
  return "?";
}

enum class BatteryState : uint8_t {
  kInUse,        ///< Running on battery, level known.
  kCharging,     ///< Plugged in.
  kCalculating,  ///< Just unplugged, level not yet estimated.
};

inline const char* ToString(BatteryState s) noexcept {
  switch (s) {
    case BatteryState::kInUse:       return "in_use";
    case BatteryState::kCharging:    return "charging";
    case BatteryState::kCalculating: return "calculating";
  }
  return "?";
}

struct BatteryStatus {
  BatteryState state = BatteryState::kCalculating;
  int32_t level = -1;  ///< 0..100, or -1 when unknown.

  bool operator==(const BatteryStatus& o) const noexcept {
    return state == o.state && level == o.level;
  }
  bool operator!=(const BatteryStatus& o) const noexcept { return !(*this == o); }
};

struct EqualizerPreset {
  int32_t id = 0;
  std::string name;

  bool operator==(const EqualizerPreset& o) const {
    return id == o.id && name == o.name;
  }
  bool operator!=(const EqualizerPreset& o) const { return !(*this == o); }
};

using PresetList = std::vector<EqualizerPreset>;

using AttributeValue =
    std::variant<bool, int32_t, BatteryStatus, std::string, PresetList>;

enum class ValueType : uint8_t { kBool, kInt, kBattery, kString, kPresetList };

/// Variant alternative index each attribute must hold.
inline ValueType ValueTypeOf(AttributeId id) noexcept {
  switch (id) {
    case AttributeId::kBattery:          return ValueType::kBattery;
    case AttributeId::kFirmwareVersion:  return ValueType::kString;
    case AttributeId::kEqualizerPreset:  return ValueType::kInt;
    case AttributeId::kEqualizerPresets: return ValueType::kPresetList;
    default:                             return ValueType::kBool;
  }
}

struct AttributeSlot {
  AttributeId id;
  AttributeValue value;

  bool operator==(const AttributeSlot& o) const {
    return id == o.id && value == o.value;
  }
};

// ============================================================================
// Targets
// ============================================================================

enum class Method : uint8_t { kGet, kSet };

enum class Target : uint8_t {
  kBatteryGet = 0,
  kVersionGet,
  kNoiseCancellationGet,
  kNoiseCancellationSet,
  kSpecificModeGet,
  kSpecificModeSet,
  kEqualizerGet,
  kEqualizerEnabledSet,
  kEqualizerPresetSet,
  kEqualizerPresetsGet,
  kHeadDetectionGet,
  kHeadDetectionSet,
  kAutoConnectionGet,
  kAutoConnectionSet,
};

static constexpr uint32_t kTargetCount = 14U;

struct TargetInfo {
  Target target;
  const char* path;
  Method method;
  uint8_t attr_count;
  AttributeId attrs[2];
};

inline const TargetInfo& Describe(Target t) noexcept {
  static constexpr TargetInfo kTable[kTargetCount] = {
      {Target::kBatteryGet, "/api/system/battery/get", Method::kGet, 1,
       {AttributeId::kBattery, AttributeId::kBattery}},
      {Target::kVersionGet, "/api/software/version/get", Method::kGet, 1,
       {AttributeId::kFirmwareVersion, AttributeId::kFirmwareVersion}},
      {Target::kNoiseCancellationGet,
       "/api/audio/noise_cancellation/enabled/get", Method::kGet, 1,
       {AttributeId::kNoiseCancellation, AttributeId::kNoiseCancellation}},
      {Target::kNoiseCancellationSet,
       "/api/audio/noise_cancellation/enabled/set", Method::kSet, 1,
       {AttributeId::kNoiseCancellation, AttributeId::kNoiseCancellation}},
      {Target::kSpecificModeGet, "/api/audio/specific_mode/enabled/get",
       Method::kGet, 1,
       {AttributeId::kSpecificMode, AttributeId::kSpecificMode}},
      {Target::kSpecificModeSet, "/api/audio/specific_mode/enabled/set",
       Method::kSet, 1,
       {AttributeId::kSpecificMode, AttributeId::kSpecificMode}},
      {Target::kEqualizerGet, "/api/audio/equalizer/get", Method::kGet, 2,
       {AttributeId::kEqualizerEnabled, AttributeId::kEqualizerPreset}},
      {Target::kEqualizerEnabledSet, "/api/audio/equalizer/enabled/set",
       Method::kSet, 1,
       {AttributeId::kEqualizerEnabled, AttributeId::kEqualizerEnabled}},
      {Target::kEqualizerPresetSet, "/api/audio/equalizer/preset_id/set",
       Method::kSet, 1,
       {AttributeId::kEqualizerPreset, AttributeId::kEqualizerPreset}},
      {Target::kEqualizerPresetsGet, "/api/audio/equalizer/presets_list/get",
       Method::kGet, 1,
       {AttributeId::kEqualizerPresets, AttributeId::kEqualizerPresets}},
      {Target::kHeadDetectionGet, "/api/system/head_detection/enabled/get",
       Method::kGet, 1,
       {AttributeId::kHeadDetection, AttributeId::kHeadDetection}},
      {Target::kHeadDetectionSet, "/api/system/head_detection/enabled/set",
       Method::kSet, 1,
       {AttributeId::kHeadDetection, AttributeId::kHeadDetection}},
      {Target::kAutoConnectionGet, "/api/system/auto_connection/enabled/get",
       Method::kGet, 1,
       {AttributeId::kAutoConnection, AttributeId::kAutoConnection}},
      {Target::kAutoConnectionSet, "/api/system/auto_connection/enabled/set",
       Method::kSet, 1,
       {AttributeId::kAutoConnection, AttributeId::kAutoConnection}},
  };
  return kTable[static_cast<uint32_t>(t)];
}

inline const char* PathOf(Target t) noexcept { return Describe(t).path; }

inline bool FindTarget(const char* path, size_t len, Target& out) noexcept {
  for (uint32_t i = 0; i < kTargetCount; ++i) {
    const TargetInfo& info = Describe(static_cast<Target>(i));
    if (std::strlen(info.path) == len && std::memcmp(info.path, path, len) == 0) {
      out = info.target;
      return true;
    }
  }
  return false;
}

inline bool TargetCarries(Target t, AttributeId id) noexcept {
  const TargetInfo& info = Describe(t);
  for (uint8_t i = 0; i < info.attr_count; ++i) {
    if (info.attrs[i] == id) return true;
  }
  return false;
}

/// GET endpoint that reads @p id back from the device.
inline Target QueryTargetFor(AttributeId id) noexcept {
  switch (id) {
    case AttributeId::kBattery:           return Target::kBatteryGet;
    case AttributeId::kFirmwareVersion:   return Target::kVersionGet;
    case AttributeId::kNoiseCancellation: return Target::kNoiseCancellationGet;
    case AttributeId::kSpecificMode:      return Target::kSpecificModeGet;
    case AttributeId::kEqualizerEnabled:
    case AttributeId::kEqualizerPreset:   return Target::kEqualizerGet;
    case AttributeId::kEqualizerPresets:  return Target::kEqualizerPresetsGet;
    case AttributeId::kHeadDetection:     return Target::kHeadDetectionGet;
    case AttributeId::kAutoConnection:    return Target::kAutoConnectionGet;
  }
  return Target::kBatteryGet;
}

/// The GET endpoint sharing a SET endpoint's attribute; GET targets map to
/// themselves.
inline Target ReadBackTarget(Target t) noexcept {
  const TargetInfo& info = Describe(t);
  return (info.method == Method::kGet) ? t : QueryTargetFor(info.attrs[0]);
}

// ============================================================================
// Message
// ============================================================================

enum class MessageKind : uint8_t {
  kCommand,       ///< SET request.
  kQuery,         ///< GET request.
  kReply,         ///< <answer>
  kNotification,  ///< <notify>
};

inline const char* ToString(MessageKind k) noexcept {
  switch (k) {
    case MessageKind::kCommand:      return "command";
    case MessageKind::kQuery:        return "query";
    case MessageKind::kReply:        return "reply";
    case MessageKind::kNotification: return "notification";
  }
  return "?";
}

enum class ReplyStatus : uint8_t { kAccepted, kRejected };

struct Message {
  MessageKind kind = MessageKind::kQuery;
  Target target = Target::kBatteryGet;
  uint16_t token = 0;  ///< 0 means unsolicited / not yet assigned.
  ReplyStatus status = ReplyStatus::kAccepted;
  std::vector<AttributeSlot> values;

  static Message Query(Target t) {
    Message m;
    m.kind = MessageKind::kQuery;
    m.target = t;
    return m;
  }

  static Message Command(Target t, AttributeValue v) {
    Message m;
    m.kind = MessageKind::kCommand;
    m.target = t;
    m.values.push_back(AttributeSlot{Describe(t).attrs[0], std::move(v)});
    return m;
  }

  const AttributeValue* Find(AttributeId id) const noexcept {
    for (const auto& s : values) {
      if (s.id == id) return &s.value;
    }
    return nullptr;
  }

  /// Value order is not significant; ids are unique within a message.
  bool operator==(const Message& o) const {
    if (kind != o.kind || target != o.target || token != o.token ||
        status != o.status || values.size() != o.values.size()) {
      return false;
    }
    for (const auto& s : values) {
      const AttributeValue* other = o.Find(s.id);
      if (other == nullptr || !(*other == s.value)) return false;
    }
    return true;
  }
  bool operator!=(const Message& o) const { return !(*this == o); }
};

// ============================================================================
// Internal helpers
// ============================================================================

namespace detail {

inline bool ParseInt32(const std::string& text, int32_t& out) noexcept {
  if (text.empty()) return false;
  const char* begin = text.c_str();
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(begin, &end, 10);
  if (errno != 0 || end == begin || *end != '\0') return false;
  if (v < INT32_MIN || v > INT32_MAX) return false;
  out = static_cast<int32_t>(v);
  return true;
}

inline bool ParseBoolText(const std::string& text, bool& out) noexcept {
  if (text == "true") {
    out = true;
    return true;
  }
  if (text == "false") {
    out = false;
    return true;
  }
  return false;
}

inline bool HoldsType(const AttributeValue& v, ValueType t) noexcept {
  return v.index() == static_cast<size_t>(t);
}

inline bool ValidPresetId(int32_t id) noexcept {
  return id >= 0 && id <= kMaxPresetId;
}

/// Domain check for a value already known to have the attribute's type.
inline bool InDomain(AttributeId id, const AttributeValue& v) noexcept {
  switch (id) {
    case AttributeId::kBattery: {
      const auto& b = std::get<BatteryStatus>(v);
      if (b.state == BatteryState::kInUse) {
        return b.level >= 0 && b.level <= 100;
      }
      if (b.state == BatteryState::kCalculating) return b.level == -1;
      return b.level == -1 || (b.level >= 0 && b.level <= 100);
    }
    case AttributeId::kFirmwareVersion:
      return !std::get<std::string>(v).empty();
    case AttributeId::kEqualizerPreset:
      return ValidPresetId(std::get<int32_t>(v));
    default:
      return true;
  }
}

/// XML element path holding each attribute inside <answer>/<notify>.
inline const char* ElementPath(AttributeId id) noexcept {
  switch (id) {
    case AttributeId::kBattery:           return "system/battery";
    case AttributeId::kFirmwareVersion:   return "software";
    case AttributeId::kNoiseCancellation: return "audio/noise_cancellation";
    case AttributeId::kSpecificMode:      return "audio/specific_mode";
    case AttributeId::kEqualizerEnabled:
    case AttributeId::kEqualizerPreset:   return "audio/equalizer";
    case AttributeId::kEqualizerPresets:  return "audio/equalizer/presets_list";
    case AttributeId::kHeadDetection:     return "system/head_detection";
    case AttributeId::kAutoConnection:    return "system/auto_connection";
  }
  return "";
}

inline void WriteValueElement(XmlElement& root, const AttributeSlot& slot) {
  XmlElement& e = root.Ensure(ElementPath(slot.id));
  switch (slot.id) {
    case AttributeId::kBattery: {
      const auto& b = std::get<BatteryStatus>(slot.value);
      e.SetAttribute("state", (b.state == BatteryState::kCharging) ? "charging"
                                                                   : "in_use");
      e.SetAttribute("level", (b.level >= 0) ? std::to_string(b.level) : "");
      break;
    }
    case AttributeId::kFirmwareVersion:
      e.SetAttribute("version", std::get<std::string>(slot.value));
      break;
    case AttributeId::kEqualizerPreset:
      e.SetAttribute("preset_id", std::to_string(std::get<int32_t>(slot.value)));
      break;
    case AttributeId::kEqualizerPresets:
      for (const auto& p : std::get<PresetList>(slot.value)) {
        XmlElement preset("preset");
        preset.SetAttribute("id", std::to_string(p.id));
        preset.SetAttribute("name", p.name);
        e.children.push_back(std::move(preset));
      }
      break;
    default:
      e.SetAttribute("enabled", std::get<bool>(slot.value) ? "true" : "false");
      break;
  }
}

/// Reads one attribute out of a document. kMissingField when the element or
/// a required XML attribute is absent.
inline expected<AttributeValue, DecodingError> ReadValueElement(
    const XmlElement& root, AttributeId id) {
  using R = expected<AttributeValue, DecodingError>;
  const XmlElement* e = root.Find(ElementPath(id));
  if (e == nullptr) return R::error(DecodingError::kMissingField);

  switch (id) {
    case AttributeId::kBattery: {
      const std::string* state = e->Attribute("state");
      if (state == nullptr) return R::error(DecodingError::kMissingField);
      const std::string* level = e->Attribute("level");
      BatteryStatus b;
      const bool have_level = level != nullptr && !level->empty();
      if (have_level && !ParseInt32(*level, b.level)) {
        return R::error(DecodingError::kTypeMismatch);
      }
      if (*state == "charging") {
        b.state = BatteryState::kCharging;
        if (!have_level) b.level = -1;
      } else if (*state == "in_use") {
        b.state = have_level ? BatteryState::kInUse : BatteryState::kCalculating;
        if (!have_level) b.level = -1;
      } else {
        return R::error(DecodingError::kTypeMismatch);
      }
      if (!InDomain(id, b)) return R::error(DecodingError::kTypeMismatch);
      return R::success(AttributeValue(b));
    }
    case AttributeId::kFirmwareVersion: {
      const std::string* version = e->Attribute("version");
      if (version == nullptr) return R::error(DecodingError::kMissingField);
      return R::success(AttributeValue(*version));
    }
    case AttributeId::kEqualizerPreset: {
      const std::string* text = e->Attribute("preset_id");
      if (text == nullptr) return R::error(DecodingError::kMissingField);
      int32_t id_value = 0;
      if (!ParseInt32(*text, id_value) || !ValidPresetId(id_value)) {
        return R::error(DecodingError::kTypeMismatch);
      }
      return R::success(AttributeValue(id_value));
    }
    case AttributeId::kEqualizerPresets: {
      PresetList list;
      for (const auto& child : e->children) {
        if (child.name != "preset") continue;
        const std::string* pid = child.Attribute("id");
        const std::string* pname = child.Attribute("name");
        if (pid == nullptr || pname == nullptr) {
          return R::error(DecodingError::kMissingField);
        }
        EqualizerPreset p;
        if (!ParseInt32(*pid, p.id)) {
          return R::error(DecodingError::kTypeMismatch);
        }
        p.name = *pname;
        list.push_back(std::move(p));
      }
      return R::success(AttributeValue(std::move(list)));
    }
    default: {
      const std::string* text = e->Attribute("enabled");
      if (text == nullptr) return R::error(DecodingError::kMissingField);
      bool b = false;
      if (!ParseBoolText(*text, b)) {
        return R::error(DecodingError::kTypeMismatch);
      }
      return R::success(AttributeValue(b));
    }
  }
}

inline expected<void, EncodingError> CheckValues(const Message& m) {
  using R = expected<void, EncodingError>;
  for (size_t i = 0; i < m.values.size(); ++i) {
    const AttributeSlot& s = m.values[i];
    if (!TargetCarries(m.target, s.id) ||
        !HoldsType(s.value, ValueTypeOf(s.id))) {
      return R::error(EncodingError::kTypeMismatch);
    }
    for (size_t j = 0; j < i; ++j) {
      if (m.values[j].id == s.id) return R::error(EncodingError::kTypeMismatch);
    }
    if (!InDomain(s.id, s.value)) {
      return R::error(EncodingError::kValueOutOfRange);
    }
  }
  return R::success();
}

inline expected<std::string, EncodingError> EncodeText(const Message& m) {
  using R = expected<std::string, EncodingError>;
  const TargetInfo& info = Describe(m.target);

  auto checked = CheckValues(m);
  if (!checked) return R::error(checked.get_error());

  switch (m.kind) {
    case MessageKind::kQuery: {
      if (info.method != Method::kGet || !m.values.empty()) {
        return R::error(EncodingError::kUnsupportedKind);
      }
      return R::success(std::string("GET ") + info.path);
    }
    case MessageKind::kCommand: {
      if (info.method != Method::kSet) {
        return R::error(EncodingError::kUnsupportedKind);
      }
      if (m.values.size() != 1U) return R::error(EncodingError::kMissingValue);
      std::string text("SET ");
      text += info.path;
      text += "?arg=";
      const AttributeValue& v = m.values[0].value;
      if (std::holds_alternative<bool>(v)) {
        text += std::get<bool>(v) ? "true" : "false";
      } else {
        text += std::to_string(std::get<int32_t>(v));
      }
      return R::success(std::move(text));
    }
    case MessageKind::kReply:
    case MessageKind::kNotification: {
      const bool reply = m.kind == MessageKind::kReply;
      // An accepted GET answer carries every attribute of its endpoint.
      if (reply && m.status == ReplyStatus::kAccepted &&
          info.method == Method::kGet && m.values.size() != info.attr_count) {
        return R::error(EncodingError::kMissingValue);
      }
      if (!reply && m.status == ReplyStatus::kRejected) {
        return R::error(EncodingError::kUnsupportedKind);
      }
      XmlElement root(reply ? "answer" : "notify");
      root.SetAttribute("path", info.path);
      if (m.status == ReplyStatus::kRejected) root.SetAttribute("error", "true");
      for (const auto& s : m.values) WriteValueElement(root, s);
      return R::success(ToXml(root));
    }
  }
  return R::error(EncodingError::kUnsupportedKind);
}

inline expected<Message, DecodingError> DecodeRequestLine(const char* text,
                                                          size_t len,
                                                          MessageKind kind) {
  using R = expected<Message, DecodingError>;
  const char* path = text + 4;  // past "GET " / "SET "
  size_t path_len = len - 4U;
  const char* arg = nullptr;
  size_t arg_len = 0;
  if (kind == MessageKind::kCommand) {
    static constexpr char kArg[] = "?arg=";
    const char* q = static_cast<const char*>(std::memchr(path, '?', path_len));
    if (q == nullptr) return R::error(DecodingError::kMissingField);
    const size_t rest = len - static_cast<size_t>(q - text);
    if (rest < sizeof(kArg) - 1U || std::memcmp(q, kArg, sizeof(kArg) - 1U) != 0) {
      return R::error(DecodingError::kMalformed);
    }
    path_len = static_cast<size_t>(q - path);
    arg = q + sizeof(kArg) - 1U;
    arg_len = rest - (sizeof(kArg) - 1U);
  }

  Message m;
  m.kind = kind;
  if (!FindTarget(path, path_len, m.target)) {
    return R::error(DecodingError::kUnknownTarget);
  }
  const TargetInfo& info = Describe(m.target);
  const Method expected_method =
      (kind == MessageKind::kQuery) ? Method::kGet : Method::kSet;
  if (info.method != expected_method) {
    return R::error(DecodingError::kMalformed);
  }
  if (kind == MessageKind::kCommand) {
    const std::string arg_text(arg, arg_len);
    const AttributeId id = info.attrs[0];
    if (ValueTypeOf(id) == ValueType::kBool) {
      bool b = false;
      if (!ParseBoolText(arg_text, b)) {
        return R::error(DecodingError::kTypeMismatch);
      }
      m.values.push_back(AttributeSlot{id, AttributeValue(b)});
    } else {
      int32_t n = 0;
      if (!ParseInt32(arg_text, n) || !InDomain(id, AttributeValue(n))) {
        return R::error(DecodingError::kTypeMismatch);
      }
      m.values.push_back(AttributeSlot{id, AttributeValue(n)});
    }
  }
  return R::success(std::move(m));
}

inline expected<Message, DecodingError> DecodeDocument(const char* text,
                                                       size_t len) {
  using R = expected<Message, DecodingError>;
  auto doc = ParseXml(text, len);
  if (!doc) return R::error(doc.get_error());
  const XmlElement& root = doc.value();

  Message m;
  if (root.name == "answer") {
    m.kind = MessageKind::kReply;
  } else if (root.name == "notify") {
    m.kind = MessageKind::kNotification;
  } else {
    return R::error(DecodingError::kUnknownKind);
  }

  const std::string* path = root.Attribute("path");
  if (path == nullptr) return R::error(DecodingError::kMissingField);
  if (!FindTarget(path->data(), path->size(), m.target)) {
    return R::error(DecodingError::kUnknownTarget);
  }
  const std::string* err = root.Attribute("error");
  if (m.kind == MessageKind::kReply && err != nullptr && *err == "true") {
    m.status = ReplyStatus::kRejected;
  }

  const TargetInfo& info = Describe(m.target);
  const bool values_required = m.kind == MessageKind::kReply &&
                               m.status == ReplyStatus::kAccepted &&
                               info.method == Method::kGet;
  for (uint8_t i = 0; i < info.attr_count; ++i) {
    auto v = ReadValueElement(root, info.attrs[i]);
    if (v) {
      m.values.push_back(AttributeSlot{info.attrs[i], std::move(v).value()});
    } else if (v.get_error() != DecodingError::kMissingField || values_required) {
      return R::error(v.get_error());
    }
  }
  return R::success(std::move(m));
}

}  // namespace detail

// ============================================================================
// Encode / Decode
// ============================================================================

/**
 * @brief Serialises @p message into one complete data frame.
 *
 * Validation happens before any byte is produced: values must belong to the
 * target endpoint, hold the right type and lie inside the attribute domain.
 */
inline expected<std::vector<uint8_t>, EncodingError> Encode(
    const Message& message) {
  using R = expected<std::vector<uint8_t>, EncodingError>;
  auto text = detail::EncodeText(message);
  if (!text) return R::error(text.get_error());

  const size_t total = kMinDataFrameSize + text.value().size();
  if (total > 0xFFFFU) return R::error(EncodingError::kValueOutOfRange);

  std::vector<uint8_t> out;
  out.reserve(total);
  AppendBe16(out, static_cast<uint16_t>(total));
  out.push_back(static_cast<uint8_t>(FrameType::kData));
  out.push_back(kProtocolVersion);
  out.push_back(0U);  // flags
  AppendBe16(out, message.token);
  out.insert(out.end(), text.value().begin(), text.value().end());
  return R::success(std::move(out));
}

/**
 * @brief Parses one complete data frame.
 *
 * Unknown XML elements and attributes are skipped. A missing required field
 * fails this decode only.
 */
inline expected<Message, DecodingError> Decode(const Frame& frame) {
  using R = expected<Message, DecodingError>;
  const std::vector<uint8_t>& b = frame.bytes;
  if (b.size() < kFrameHeaderSize) return R::error(DecodingError::kTruncated);
  if (ReadBe16(b.data()) != b.size()) return R::error(DecodingError::kMalformed);
  if (b[2] != static_cast<uint8_t>(FrameType::kData)) {
    return R::error(DecodingError::kUnknownKind);
  }
  if (b.size() < kMinDataFrameSize) return R::error(DecodingError::kTruncated);
  if (b[3] != kProtocolVersion) return R::error(DecodingError::kMalformed);

  const uint16_t token = ReadBe16(b.data() + 5);
  const char* text = reinterpret_cast<const char*>(b.data() + kMinDataFrameSize);
  const size_t len = b.size() - kMinDataFrameSize;
  if (len == 0U) return R::error(DecodingError::kTruncated);

  expected<Message, DecodingError> decoded = R::error(DecodingError::kUnknownKind);
  if (text[0] == '<') {
    decoded = detail::DecodeDocument(text, len);
  } else if (len >= 4U && std::memcmp(text, "GET ", 4) == 0) {
    decoded = detail::DecodeRequestLine(text, len, MessageKind::kQuery);
  } else if (len >= 4U && std::memcmp(text, "SET ", 4) == 0) {
    decoded = detail::DecodeRequestLine(text, len, MessageKind::kCommand);
  }
  if (decoded) decoded.value().token = token;
  return decoded;
}

// ============================================================================
// Presets
// ============================================================================

inline const EqualizerPreset* FindPreset(const PresetList& presets,
                                         int32_t id) noexcept {
  for (const auto& p : presets) {
    if (p.id == id) return &p;
  }
  return nullptr;
}

/// Decimal preset id in 0..kMaxPresetId; anything else, including values
/// that do not fit in 32 bits, is rejected.
inline bool ParsePresetId(const char* text, int32_t& out) {
  if (text == nullptr) return false;
  int32_t v = 0;
  if (!detail::ParseInt32(text, v) || !detail::ValidPresetId(v)) return false;
  out = v;
  return true;
}

}  // namespace kiz

#endif  // KIZ_CODEC_HPP_
