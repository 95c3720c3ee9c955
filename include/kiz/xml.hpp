/**
 * @file xml.hpp
 * @brief Minimal tag/attribute XML reader and writer for headset payloads.
 *
 * The device answers with small documents such as:
 *
 *   <answer path="/api/system/battery/get">
 *     <system><battery state="in_use" level="80"/></system>
 *   </answer>
 *
 * Only what that schema needs is supported: nested elements, attributes
 * (single or double quoted), the five predefined entities, an optional
 * <?xml ...?> prolog and comments. Character data is skipped. Anything else
 * is reported as DecodingError::kMalformed; running out of input before the
 * root element closes is DecodingError::kTruncated.
 */

#ifndef KIZ_XML_HPP_
#define KIZ_XML_HPP_

#include "kiz/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#ifndef KIZ_XML_MAX_DEPTH
#define KIZ_XML_MAX_DEPTH 16U
#endif

namespace kiz {

// ============================================================================
// XmlElement
// ============================================================================

struct XmlElement {
  std::string name;
  std::vector<std::pair<std::string, std::string>> attributes;
  std::vector<XmlElement> children;

  XmlElement() = default;
  explicit XmlElement(std::string n) : name(std::move(n)) {}

  const std::string* Attribute(const char* attr) const noexcept {
    for (const auto& a : attributes) {
      if (a.first == attr) return &a.second;
    }
    return nullptr;
  }

  XmlElement& SetAttribute(const char* attr, std::string value) {
    for (auto& a : attributes) {
      if (a.first == attr) {
        a.second = std::move(value);
        return *this;
      }
    }
    attributes.emplace_back(attr, std::move(value));
    return *this;
  }

  /// First direct child with the given name, or nullptr.
  const XmlElement* Child(const char* child_name) const noexcept {
    for (const auto& c : children) {
      if (c.name == child_name) return &c;
    }
    return nullptr;
  }

  /// Walks a '/'-separated chain of child names ("audio/equalizer").
  const XmlElement* Find(const char* path) const {
    const XmlElement* cur = this;
    const char* p = path;
    while (cur != nullptr && *p != '\0') {
      const char* slash = std::strchr(p, '/');
      const size_t len = (slash != nullptr) ? static_cast<size_t>(slash - p)
                                            : std::strlen(p);
      const XmlElement* next = nullptr;
      for (const auto& c : cur->children) {
        if (c.name.size() == len && c.name.compare(0, len, p, len) == 0) {
          next = &c;
          break;
        }
      }
      cur = next;
      p += len;
      if (*p == '/') ++p;
    }
    return cur;
  }

  /// Creates (or reuses) the chain of children named by path, returns leaf.
  XmlElement& Ensure(const char* path) {
    XmlElement* cur = this;
    const char* p = path;
    while (*p != '\0') {
      const char* slash = std::strchr(p, '/');
      const size_t len = (slash != nullptr) ? static_cast<size_t>(slash - p)
                                            : std::strlen(p);
      std::string part(p, len);
      XmlElement* next = nullptr;
      for (auto& c : cur->children) {
        if (c.name == part) {
          next = &c;
          break;
        }
      }
      if (next == nullptr) {
        cur->children.emplace_back(std::move(part));
        next = &cur->children.back();
      }
      cur = next;
      p += len;
      if (*p == '/') ++p;
    }
    return *cur;
  }
};

// ============================================================================
// Writer
// ============================================================================

namespace detail {

inline void AppendEscaped(std::string& out, const std::string& text) {
  for (char c : text) {
    switch (c) {
      case '&':  out += "&amp;";  break;
      case '<':  out += "&lt;";   break;
      case '>':  out += "&gt;";   break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default:   out += c;        break;
    }
  }
}

inline void AppendElement(std::string& out, const XmlElement& e) {
  out += '<';
  out += e.name;
  for (const auto& a : e.attributes) {
    out += ' ';
    out += a.first;
    out += "=\"";
    AppendEscaped(out, a.second);
    out += '"';
  }
  if (e.children.empty()) {
    out += "/>";
    return;
  }
  out += '>';
  for (const auto& c : e.children) AppendElement(out, c);
  out += "</";
  out += e.name;
  out += '>';
}

}  // namespace detail

/// Compact serialisation: no prolog, no whitespace, attribute order kept.
inline std::string ToXml(const XmlElement& root) {
  std::string out;
  out.reserve(128);
  detail::AppendElement(out, root);
  return out;
}

// ============================================================================
// Reader
// ============================================================================

namespace detail {

class XmlReader {
 public:
  XmlReader(const char* data, size_t len) noexcept
      : p_(data), end_(data + len) {}

  expected<XmlElement, DecodingError> ParseDocument() {
    auto r = SkipMisc();
    if (!r) return expected<XmlElement, DecodingError>::error(r.get_error());
    if (AtEnd()) {
      return expected<XmlElement, DecodingError>::error(
          DecodingError::kTruncated);
    }
    XmlElement root;
    auto e = ParseElement(root, 0U);
    if (!e) return expected<XmlElement, DecodingError>::error(e.get_error());
    r = SkipMisc();
    if (!r) return expected<XmlElement, DecodingError>::error(r.get_error());
    if (!AtEnd()) {
      return expected<XmlElement, DecodingError>::error(
          DecodingError::kMalformed);
    }
    return expected<XmlElement, DecodingError>::success(std::move(root));
  }

 private:
  using Result = expected<void, DecodingError>;

  bool AtEnd() const noexcept { return p_ >= end_; }

  static bool IsSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  }

  static bool IsNameChar(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.' ||
           c == ':';
  }

  bool StartsWith(const char* lit) const noexcept {
    const size_t n = std::strlen(lit);
    return static_cast<size_t>(end_ - p_) >= n && std::memcmp(p_, lit, n) == 0;
  }

  void SkipSpace() noexcept {
    while (!AtEnd() && IsSpace(*p_)) ++p_;
  }

  /// Skips whitespace, comments and processing instructions.
  Result SkipMisc() noexcept {
    for (;;) {
      SkipSpace();
      if (StartsWith("<!--")) {
        if (!SkipPast("-->")) return Result::error(DecodingError::kTruncated);
      } else if (StartsWith("<?")) {
        if (!SkipPast("?>")) return Result::error(DecodingError::kTruncated);
      } else {
        return Result::success();
      }
    }
  }

  bool SkipPast(const char* lit) noexcept {
    const size_t n = std::strlen(lit);
    while (static_cast<size_t>(end_ - p_) >= n) {
      if (std::memcmp(p_, lit, n) == 0) {
        p_ += n;
        return true;
      }
      ++p_;
    }
    p_ = end_;
    return false;
  }

  Result ParseName(std::string& out) {
    const char* start = p_;
    while (!AtEnd() && IsNameChar(*p_)) ++p_;
    if (AtEnd()) return Result::error(DecodingError::kTruncated);
    if (p_ == start) return Result::error(DecodingError::kMalformed);
    out.assign(start, static_cast<size_t>(p_ - start));
    return Result::success();
  }

  Result ParseAttrValue(std::string& out) {
    if (AtEnd()) return Result::error(DecodingError::kTruncated);
    const char quote = *p_;
    if (quote != '"' && quote != '\'') {
      return Result::error(DecodingError::kMalformed);
    }
    ++p_;
    out.clear();
    while (!AtEnd() && *p_ != quote) {
      if (*p_ == '<') return Result::error(DecodingError::kMalformed);
      if (*p_ == '&') {
        auto r = ParseEntity(out);
        if (!r) return r;
        continue;
      }
      out += *p_;
      ++p_;
    }
    if (AtEnd()) return Result::error(DecodingError::kTruncated);
    ++p_;  // closing quote
    return Result::success();
  }

  Result ParseEntity(std::string& out) {
    static constexpr struct {
      const char* ref;
      char ch;
    } kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'},    {"&gt;", '>'},
        {"&quot;", '"'}, {"&apos;", '\''},
    };
    for (const auto& e : kEntities) {
      if (StartsWith(e.ref)) {
        out += e.ch;
        p_ += std::strlen(e.ref);
        return Result::success();
      }
    }
    return Result::error(std::memchr(p_, ';', static_cast<size_t>(end_ - p_)) ==
                                 nullptr
                             ? DecodingError::kTruncated
                             : DecodingError::kMalformed);
  }

  Result ParseElement(XmlElement& elem, uint32_t depth) {
    if (depth >= KIZ_XML_MAX_DEPTH) {
      return Result::error(DecodingError::kMalformed);
    }
    if (*p_ != '<') return Result::error(DecodingError::kMalformed);
    ++p_;
    auto r = ParseName(elem.name);
    if (!r) return r;

    // Attributes
    for (;;) {
      SkipSpace();
      if (AtEnd()) return Result::error(DecodingError::kTruncated);
      if (*p_ == '/') {
        ++p_;
        if (AtEnd()) return Result::error(DecodingError::kTruncated);
        if (*p_ != '>') return Result::error(DecodingError::kMalformed);
        ++p_;
        return Result::success();
      }
      if (*p_ == '>') {
        ++p_;
        break;
      }
      std::string key;
      r = ParseName(key);
      if (!r) return r;
      SkipSpace();
      if (AtEnd()) return Result::error(DecodingError::kTruncated);
      if (*p_ != '=') return Result::error(DecodingError::kMalformed);
      ++p_;
      SkipSpace();
      std::string value;
      r = ParseAttrValue(value);
      if (!r) return r;
      elem.attributes.emplace_back(std::move(key), std::move(value));
    }

    // Content: children, comments and ignored character data
    for (;;) {
      while (!AtEnd() && *p_ != '<') ++p_;
      if (AtEnd()) return Result::error(DecodingError::kTruncated);
      if (StartsWith("<!--")) {
        if (!SkipPast("-->")) return Result::error(DecodingError::kTruncated);
        continue;
      }
      if (StartsWith("</")) {
        p_ += 2;
        std::string closing;
        r = ParseName(closing);
        if (!r) return r;
        SkipSpace();
        if (AtEnd()) return Result::error(DecodingError::kTruncated);
        if (*p_ != '>' || closing != elem.name) {
          return Result::error(DecodingError::kMalformed);
        }
        ++p_;
        return Result::success();
      }
      if (static_cast<size_t>(end_ - p_) < 2U) {
        return Result::error(DecodingError::kTruncated);
      }
      elem.children.emplace_back();
      r = ParseElement(elem.children.back(), depth + 1U);
      if (!r) return r;
    }
  }

  const char* p_;
  const char* end_;
};

}  // namespace detail

inline expected<XmlElement, DecodingError> ParseXml(const char* data,
                                                    size_t len) {
  detail::XmlReader reader(data, len);
  return reader.ParseDocument();
}

inline expected<XmlElement, DecodingError> ParseXml(const std::string& text) {
  return ParseXml(text.data(), text.size());
}

}  // namespace kiz

#endif  // KIZ_XML_HPP_
