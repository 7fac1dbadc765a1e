#pragma once

// streamjson: a small, header-only C++17 incremental JSON parser.
// Feed arbitrary chunks and query any path at any time; malformed input is tolerated.

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#if defined(_M_X64) || defined(__SSE2__)
  #if defined(_MSC_VER)
    #include <intrin.h>
  #endif
  #include <immintrin.h>
#endif
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace streamjson {

// Config: floating-point parsing backend.
// Override by defining STREAMJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef STREAMJSON_USE_FROM_CHARS_DOUBLE
  #define STREAMJSON_USE_FROM_CHARS_DOUBLE 0
#endif

namespace detail {

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(const char* buf, std::size_t size, std::size_t& i) noexcept {
  // Fast path: SSE2 scan 16 bytes at a time (available on MSVC x64 and most x86).
#if defined(_M_X64) || defined(__SSE2__)
  while (i + 16 <= size) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
    const __m128i is_space = _mm_cmpeq_epi8(v, _mm_set1_epi8(' '));
    const __m128i is_nl = _mm_cmpeq_epi8(v, _mm_set1_epi8('\n'));
    const __m128i is_cr = _mm_cmpeq_epi8(v, _mm_set1_epi8('\r'));
    const __m128i is_tab = _mm_cmpeq_epi8(v, _mm_set1_epi8('\t'));
    const __m128i is_ws_v = _mm_or_si128(_mm_or_si128(is_space, is_nl), _mm_or_si128(is_cr, is_tab));
    const unsigned ws_mask = static_cast<unsigned>(_mm_movemask_epi8(is_ws_v));
    if (ws_mask == 0xFFFFu) {
      i += 16;
      continue;
    }

    const unsigned non = (~ws_mask) & 0xFFFFu;
#if defined(_MSC_VER)
    unsigned long idx = 0;
    _BitScanForward(&idx, non);
    i += static_cast<std::size_t>(idx);
#else
    i += static_cast<std::size_t>(__builtin_ctz(non));
#endif
    return;
  }
#endif

  while (i < size && is_ws(buf[i])) ++i;
}

// Index of the first '"' or '\\' at or after `i`, or `size` if there is none.
inline std::size_t find_quote_or_backslash(const char* buf, std::size_t size, std::size_t i) noexcept {
#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  while (i + 16 <= size) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
    const __m128i any = _mm_or_si128(_mm_cmpeq_epi8(v, q), _mm_cmpeq_epi8(v, bs));
    const int mask = _mm_movemask_epi8(any);
    if (mask == 0) {
      i += 16;
      continue;
    }
#if defined(_MSC_VER)
    unsigned long bit = 0;
    _BitScanForward(&bit, static_cast<unsigned long>(mask));
    return i + static_cast<std::size_t>(bit);
#else
    return i + static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
  }
#endif

  while (i < size && buf[i] != '"' && buf[i] != '\\') ++i;
  return i;
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool is_letter(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Permissive: "1.2.3" and "1-2" scan as one number token.
inline bool is_number_char(char c) noexcept {
  return is_digit(c) || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-';
}

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

inline bool parse_u4_unsafe(const char* p, std::uint32_t& out_cp) noexcept {
  const int h0 = hex_val(p[0]);
  const int h1 = hex_val(p[1]);
  const int h2 = hex_val(p[2]);
  const int h3 = hex_val(p[3]);
  if ((h0 | h1 | h2 | h3) < 0) return false;
  out_cp = (static_cast<std::uint32_t>(h0) << 12) |
           (static_cast<std::uint32_t>(h1) << 8) |
           (static_cast<std::uint32_t>(h2) << 4) |
           static_cast<std::uint32_t>(h3);
  return true;
}

// -?[0-9]+ within int64 range. Leading zeros are accepted.
inline bool parse_int64(std::string_view token, std::int64_t& out) noexcept {
  std::size_t i = 0;
  bool neg = false;
  if (i < token.size() && token[i] == '-') {
    neg = true;
    ++i;
  }
  if (i >= token.size()) return false;

  const std::uint64_t max_pos = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  const std::uint64_t limit = neg ? max_pos + 1ull : max_pos;
  std::uint64_t acc = 0;
  for (; i < token.size(); ++i) {
    if (!is_digit(token[i])) return false;
    const std::uint64_t d = static_cast<std::uint64_t>(token[i] - '0');
    if (acc > (limit - d) / 10u) return false;
    acc = acc * 10u + d;
  }

  if (!neg) {
    out = static_cast<std::int64_t>(acc);
  } else if (acc == max_pos + 1ull) {
    out = std::numeric_limits<std::int64_t>::min();
  } else {
    out = -static_cast<std::int64_t>(acc);
  }
  return true;
}

// The whole token must be consumed. Overflow to infinity is a failure; underflow is not.
inline bool parse_double(std::string_view token, double& out) {
  // Backend choice:
  // - strtod: often quite fast on MSVC/Windows and very robust.
  // - from_chars: locale-free and allocation-free, but performance varies by STL.
#if defined(STREAMJSON_USE_FROM_CHARS_DOUBLE) && STREAMJSON_USE_FROM_CHARS_DOUBLE
#if defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto r = std::from_chars(first, last, v, std::chars_format::general);
    if (r.ptr != last) return false;
    if (r.ec == std::errc::result_out_of_range) {
      // from_chars leaves `v` untouched on range errors; tell overflow from underflow by the exponent sign.
      const std::string_view::size_type e = token.find_first_of("eE");
      if (e == std::string_view::npos || e + 1 >= token.size() || token[e + 1] != '-') return false;
      out = 0.0;
      return true;
    }
    if (r.ec != std::errc{}) return false;
    out = v;
    return true;
  }
#endif
#endif

  // Token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  std::string heap;
  char stack_buf[kStackCap];
  const char* cstr = nullptr;
  if (token.size() < kStackCap) {
    if (!token.empty()) std::memcpy(stack_buf, token.data(), token.size());
    stack_buf[token.size()] = '\0';
    cstr = stack_buf;
  } else {
    heap.assign(token.data(), token.size());
    cstr = heap.c_str();
  }

  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(cstr, &end);
  if (end != cstr + token.size()) return false;
  if (errno == ERANGE && std::isinf(v)) return false;
  out = v;
  return true;
}

// Non-negative base-10 array index.
inline bool parse_index(std::string_view s, std::size_t& out) noexcept {
  if (s.empty()) return false;
  std::size_t acc = 0;
  for (char c : s) {
    if (!is_digit(c)) return false;
    const std::size_t d = static_cast<std::size_t>(c - '0');
    if (acc > ((std::numeric_limits<std::size_t>::max)() - d) / 10u) return false;
    acc = acc * 10u + d;
  }
  out = acc;
  return true;
}

} // namespace detail

// -----------------------------
// Decoded values
// -----------------------------

class value {
public:
  using array = std::vector<value>;
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}

  static value integer(std::int64_t i) {
    value v;
    v.data_ = i;
    return v;
  }

  static value number(double d) {
    value v;
    v.data_ = d;
    return v;
  }

  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2:
      case 3: return kind::number;
      case 4: return kind::string;
      case 5: return kind::array;
      case 6: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return is_int() || std::holds_alternative<double>(data_); }
  bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }

  std::int64_t as_int() const {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return *i;
    if (std::holds_alternative<double>(data_)) throw std::runtime_error("streamjson: number is not int");
    throw std::bad_variant_access();
  }

  double as_double() const {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return static_cast<double>(*i);
    return std::get<double>(data_);
  }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }
  std::string& as_string() { return std::get<std::string>(data_); }

  // Element count for arrays and objects, 0 otherwise.
  std::size_t size() const noexcept {
    if (const auto* a = std::get_if<array>(&data_)) return a->size();
    if (const auto* o = std::get_if<object>(&data_)) return o->size();
    return 0;
  }

  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    const auto& o = std::get<object>(data_);
    for (const auto& kv : o) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  const value* at(std::size_t index) const noexcept {
    if (!is_array()) return nullptr;
    const auto& a = std::get<array>(data_);
    return index < a.size() ? &a[index] : nullptr;
  }

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 int, 3 double, 4 string, 5 array, 6 object
  std::variant<std::monostate, bool, std::int64_t, double, std::string, array, object> data_;
};

// -----------------------------
// Tokenizer
// -----------------------------

enum class token_kind {
  object_start,
  object_end,
  array_start,
  array_end,
  key,
  string,
  number,
  boolean,
  null,
  colon,
  comma,
  end_of_input,
  invalid
};

inline const char* to_string(token_kind k) noexcept {
  switch (k) {
    case token_kind::object_start: return "object_start";
    case token_kind::object_end: return "object_end";
    case token_kind::array_start: return "array_start";
    case token_kind::array_end: return "array_end";
    case token_kind::key: return "key";
    case token_kind::string: return "string";
    case token_kind::number: return "number";
    case token_kind::boolean: return "boolean";
    case token_kind::null: return "null";
    case token_kind::colon: return "colon";
    case token_kind::comma: return "comma";
    case token_kind::end_of_input: return "end_of_input";
    case token_kind::invalid: return "invalid";
  }
  return "unknown";
}

struct token {
  token_kind kind{token_kind::end_of_input};
  // Raw input, quotes included for keys and strings.
  // Points into the tokenizer buffer: valid until the next append(), compact() or reset().
  std::string_view text{};
  // Absolute offsets over everything appended since construction (or reset()).
  std::size_t start{0};
  std::size_t end{0};
  // An incomplete token carries the longest prefix known so far.
  bool complete{true};
};

class tokenizer {
public:
  tokenizer() = default;
  explicit tokenizer(std::size_t initial_capacity) { buffer_.reserve(initial_capacity); }

  // Never blocks, never fails.
  void append(std::string_view bytes) { buffer_.append(bytes.data(), bytes.size()); }

  token next_token() {
    if (!std::holds_alternative<no_pending>(pending_)) return resume();

    detail::skip_ws(buffer_.data(), buffer_.size(), pos_);
    if (pos_ >= buffer_.size()) return make(token_kind::end_of_input, base_ + pos_, true);

    const std::size_t start = base_ + pos_;
    const char c = buffer_[pos_];
    switch (c) {
      case '{':
        ++pos_;
        expecting_key_ = true;
        return make(token_kind::object_start, start, true);
      case '}':
        ++pos_;
        expecting_key_ = false;
        return make(token_kind::object_end, start, true);
      case '[':
        ++pos_;
        expecting_key_ = false;
        return make(token_kind::array_start, start, true);
      case ']':
        ++pos_;
        return make(token_kind::array_end, start, true);
      case ':':
        ++pos_;
        expecting_key_ = false;
        return make(token_kind::colon, start, true);
      case ',':
        ++pos_;
        expecting_key_ = true;
        return make(token_kind::comma, start, true);
      case '"':
        ++pos_;
        return scan_string(start, expecting_key_ ? token_kind::key : token_kind::string, false);
      case 't': return scan_literal(start, token_kind::boolean, "true");
      case 'f': return scan_literal(start, token_kind::boolean, "false");
      case 'n': return scan_literal(start, token_kind::null, "null");
      default:
        if (c == '-' || detail::is_digit(c)) return scan_number(start);
        ++pos_;
        return make(token_kind::invalid, start, true);
    }
  }

  // Drop bytes no future token can refer to. Offsets stay absolute.
  void compact() {
    const std::size_t n = discardable();
    if (n == 0) return;
    buffer_.erase(0, n);
    base_ += n;
    pos_ -= n;
  }

  // Bytes compact() would release right now.
  std::size_t discardable() const noexcept {
    if (const std::size_t* start = pending_start()) return *start - base_;
    return pos_;
  }

  void reset() {
    buffer_.clear();
    base_ = 0;
    pos_ = 0;
    pending_ = no_pending{};
    expecting_key_ = false;
  }

  void reserve(std::size_t n) { buffer_.reserve(n); }

  std::size_t position() const noexcept { return base_ + pos_; }
  std::size_t buffered() const noexcept { return buffer_.size(); }
  bool has_pending() const noexcept { return !std::holds_alternative<no_pending>(pending_); }
  bool expecting_key() const noexcept { return expecting_key_; }

private:
  struct no_pending {};

  struct pending_string {
    std::size_t start{0};
    token_kind kind{token_kind::string};
    bool escape{false};
  };

  struct pending_number {
    std::size_t start{0};
  };

  struct pending_literal {
    std::size_t start{0};
    token_kind kind{token_kind::null};
    std::string_view literal{};
  };

  using pending_state = std::variant<no_pending, pending_string, pending_number, pending_literal>;

  token make(token_kind kind, std::size_t start, bool complete) const noexcept {
    token t;
    t.kind = kind;
    t.start = start;
    t.end = base_ + pos_;
    t.text = std::string_view(buffer_.data() + (start - base_), t.end - start);
    t.complete = complete;
    return t;
  }

  const std::size_t* pending_start() const noexcept {
    if (const auto* s = std::get_if<pending_string>(&pending_)) return &s->start;
    if (const auto* n = std::get_if<pending_number>(&pending_)) return &n->start;
    if (const auto* l = std::get_if<pending_literal>(&pending_)) return &l->start;
    return nullptr;
  }

  token resume() {
    if (const auto* s = std::get_if<pending_string>(&pending_)) {
      const pending_string p = *s;
      return scan_string(p.start, p.kind, p.escape);
    }
    if (const auto* n = std::get_if<pending_number>(&pending_)) {
      return scan_number(n->start);
    }
    const pending_literal l = std::get<pending_literal>(pending_);
    return scan_literal(l.start, l.kind, l.literal);
  }

  token scan_string(std::size_t start, token_kind kind, bool escape) {
    const char* base = buffer_.data();
    const std::size_t n = buffer_.size();
    while (pos_ < n) {
      if (escape) {
        escape = false;
        ++pos_;
        continue;
      }
      pos_ = detail::find_quote_or_backslash(base, n, pos_);
      if (pos_ >= n) break;
      if (base[pos_++] == '\\') {
        escape = true;
        continue;
      }
      pending_ = no_pending{};
      return make(kind, start, true);
    }
    pending_ = pending_string{start, kind, escape};
    return make(kind, start, false);
  }

  token scan_number(std::size_t start) {
    const std::size_t n = buffer_.size();
    while (pos_ < n && detail::is_number_char(buffer_[pos_])) ++pos_;
    // Running out of bytes is not a terminator: more digits may follow.
    if (pos_ < n) {
      pending_ = no_pending{};
      return make(token_kind::number, start, true);
    }
    pending_ = pending_number{start};
    return make(token_kind::number, start, false);
  }

  token scan_literal(std::size_t start, token_kind kind, std::string_view literal) {
    const std::size_t n = buffer_.size();
    std::size_t matched = base_ + pos_ - start;
    while (matched < literal.size() && pos_ < n) {
      if (buffer_[pos_] != literal[matched]) return invalid_word(start);
      ++pos_;
      ++matched;
    }
    // A full match at end of input stays open: "true" may yet become "truex".
    if (matched < literal.size() || pos_ >= n) {
      pending_ = pending_literal{start, kind, literal};
      return make(kind, start, false);
    }
    if (detail::is_letter(buffer_[pos_])) return invalid_word(start);
    pending_ = no_pending{};
    return make(kind, start, true);
  }

  // Swallow the rest of a bogus word so recovery skips it in one step.
  token invalid_word(std::size_t start) {
    const std::size_t n = buffer_.size();
    while (pos_ < n && detail::is_letter(buffer_[pos_])) ++pos_;
    pending_ = no_pending{};
    return make(token_kind::invalid, start, true);
  }

  std::string buffer_;
  std::size_t base_{0}; // absolute offset of buffer_[0]
  std::size_t pos_{0};  // cursor, relative to buffer_
  pending_state pending_{};
  bool expecting_key_{false};
};

// -----------------------------
// Scalar decoding
// -----------------------------

namespace detail {

// Strips the bounding quotes. A partial string has no closing quote yet.
inline std::string_view string_body(std::string_view text, bool complete) noexcept {
  if (!text.empty() && text.front() == '"') text.remove_prefix(1);
  if (complete && !text.empty() && text.back() == '"') text.remove_suffix(1);
  return text;
}

// Decodes backslash escapes to UTF-8. Tolerant: unknown escapes stay verbatim and lone
// surrogates become U+FFFD. When `complete` is false a trailing escape that could still
// grow is held back, so successive calls on a growing prefix only ever extend the output.
inline std::string unescape(std::string_view s, bool complete) {
  std::string out;
  out.reserve(s.size());
  const std::size_t n = s.size();
  std::size_t i = 0;

  while (i < n) {
    const char c = s[i];
    if (c != '\\') {
      out.push_back(c);
      ++i;
      continue;
    }
    if (i + 1 >= n) {
      if (complete) out.push_back('\\');
      break;
    }

    const char esc = s[i + 1];
    switch (esc) {
      case '"': out.push_back('"'); i += 2; continue;
      case '\\': out.push_back('\\'); i += 2; continue;
      case '/': out.push_back('/'); i += 2; continue;
      case 'b': out.push_back('\b'); i += 2; continue;
      case 'f': out.push_back('\f'); i += 2; continue;
      case 'n': out.push_back('\n'); i += 2; continue;
      case 'r': out.push_back('\r'); i += 2; continue;
      case 't': out.push_back('\t'); i += 2; continue;
      case 'u': break;
      default:
        out.push_back('\\');
        out.push_back(esc);
        i += 2;
        continue;
    }

    if (i + 6 > n) {
      if (complete) out.append(s.data() + i, n - i);
      break;
    }
    std::uint32_t cp = 0;
    if (!parse_u4_unsafe(s.data() + i + 2, cp)) {
      out.append(s.data() + i, 2);
      i += 2;
      continue;
    }

    if (cp >= 0xD800u && cp <= 0xDBFFu) {
      const std::size_t j = i + 6;
      if (j + 6 <= n) {
        std::uint32_t low = 0;
        if (s[j] == '\\' && s[j + 1] == 'u' && parse_u4_unsafe(s.data() + j + 2, low) &&
            low >= 0xDC00u && low <= 0xDFFFu) {
          const std::uint32_t hi = cp - 0xD800u;
          const std::uint32_t lo = low - 0xDC00u;
          append_utf8(out, 0x10000u + ((hi << 10) | lo));
          i = j + 6;
          continue;
        }
      } else if (!complete && (j == n || (s[j] == '\\' && (j + 1 == n || s[j + 1] == 'u')))) {
        // The low half may still be on its way.
        break;
      }
      append_utf8(out, 0xFFFDu);
      i = j;
      continue;
    }
    if (cp >= 0xDC00u && cp <= 0xDFFFu) cp = 0xFFFDu;
    append_utf8(out, cp);
    i += 6;
  }
  return out;
}

inline std::string decode_string(std::string_view text, bool complete, bool decode_escapes) {
  const std::string_view body = string_body(text, complete);
  if (decode_escapes) return unescape(body, complete);
  return std::string(body);
}

// Integer first, then float, then the raw text: the value type degrades instead of failing.
inline value decode_number(std::string_view text) {
  if (text.find_first_of(".eE") == std::string_view::npos) {
    std::int64_t i = 0;
    if (parse_int64(text, i)) return value::integer(i);
  }
  double d = 0.0;
  if (parse_double(text, d)) return value::number(d);
  return value(std::string(text));
}

inline value decode_scalar(token_kind kind, std::string_view text, bool decode_escapes) {
  switch (kind) {
    case token_kind::key:
    case token_kind::string: return value(decode_string(text, true, decode_escapes));
    case token_kind::number: return decode_number(text);
    case token_kind::boolean: return value(text == "true");
    case token_kind::null: return value(nullptr);
    default: return value(std::string(text));
  }
}

} // namespace detail

// -----------------------------
// Partial tree
// -----------------------------

class node {
public:
  using member = std::pair<std::string, std::unique_ptr<node>>;
  using members = std::vector<member>;
  using elements = std::vector<std::unique_ptr<node>>;

  enum class kind { object, array, value };

  explicit node(kind k) noexcept : kind_(k) {}

  node(const node&) = delete;
  node& operator=(const node&) = delete;

  // Subtrees are torn down with an explicit worklist, not one stack frame per level.
  ~node() {
    if (members_.empty() && elements_.empty()) return;
    std::vector<std::unique_ptr<node>> doomed;
    release_children(doomed);
    while (!doomed.empty()) {
      std::unique_ptr<node> n = std::move(doomed.back());
      doomed.pop_back();
      n->release_children(doomed);
    }
  }

  kind type() const noexcept { return kind_; }
  bool is_object() const noexcept { return kind_ == kind::object; }
  bool is_array() const noexcept { return kind_ == kind::array; }
  bool is_value() const noexcept { return kind_ == kind::value; }

  // Containers: the closing delimiter was seen. Values: the token terminated.
  bool complete() const noexcept { return complete_; }

  // Non-owning back-reference; nullptr for the root and for detached containers.
  const node* parent() const noexcept { return parent_; }

  const value& scalar() const noexcept { return scalar_; }
  const members& object_members() const noexcept { return members_; }
  const elements& array_elements() const noexcept { return elements_; }

  std::size_t size() const noexcept {
    if (is_object()) return members_.size();
    if (is_array()) return elements_.size();
    return 0;
  }

  const node* find(std::string_view key) const {
    const auto it = index_.find(std::string(key));
    return it == index_.end() ? nullptr : members_[it->second].second.get();
  }

  const node* at(std::size_t index) const noexcept {
    return index < elements_.size() ? elements_[index].get() : nullptr;
  }

  // Plain copy of the subtree, with no references back into the tree.
  value to_value() const {
    switch (kind_) {
      case kind::object: {
        value::object o;
        o.reserve(members_.size());
        for (const auto& m : members_) o.emplace_back(m.first, m.second->to_value());
        return value(std::move(o));
      }
      case kind::array: {
        value::array a;
        a.reserve(elements_.size());
        for (const auto& e : elements_) a.emplace_back(e->to_value());
        return value(std::move(a));
      }
      case kind::value: break;
    }
    return scalar_;
  }

private:
  // Last assignment to a key wins; the key keeps its first position.
  node* set_member(std::string key, std::unique_ptr<node> child) {
    child->parent_ = this;
    const auto slot = index_.emplace(key, members_.size());
    if (!slot.second) {
      auto& m = members_[slot.first->second];
      m.second = std::move(child);
      return m.second.get();
    }
    members_.emplace_back(std::move(key), std::move(child));
    return members_.back().second.get();
  }

  node* push_element(std::unique_ptr<node> child) {
    child->parent_ = this;
    elements_.push_back(std::move(child));
    return elements_.back().get();
  }

  void release_children(std::vector<std::unique_ptr<node>>& out) {
    for (auto& m : members_) out.push_back(std::move(m.second));
    for (auto& e : elements_) out.push_back(std::move(e));
    members_.clear();
    elements_.clear();
    index_.clear();
  }

  kind kind_;
  bool complete_{false};
  node* parent_{nullptr};
  value scalar_;
  members members_;
  // key -> position in members_
  std::unordered_map<std::string, std::size_t> index_;
  elements elements_;

  friend class parser;
};

// -----------------------------
// Incremental parser
// -----------------------------

struct parser_options {
  std::size_t initial_buffer_capacity{1024};
  std::size_t initial_stack_capacity{16};
  // Containers nested deeper than this are tracked for balance but not materialized.
  std::size_t max_depth{256};
  // Release consumed input once this many bytes are discardable. 0 keeps the whole stream.
  std::size_t compact_threshold{64 * 1024};
  // Interpret backslash escapes in keys and strings. Off: escapes pass through verbatim.
  bool decode_escapes{false};
};

class parser {
public:
  parser() : parser(parser_options{}) {}

  explicit parser(parser_options opt) : opt_(opt), tokens_(opt.initial_buffer_capacity) {
    stack_.reserve(opt_.initial_stack_capacity);
  }

  parser(const parser&) = delete;
  parser& operator=(const parser&) = delete;

  parser(parser&&) noexcept = default;
  parser& operator=(parser&&) noexcept = default;

  // Feed the next chunk and fold every token it makes derivable into the tree.
  void append(std::string_view chunk) {
    if (opt_.compact_threshold != 0 && tokens_.discardable() >= opt_.compact_threshold) {
      tokens_.compact();
    }
    tokens_.append(chunk);
    drain();
  }

  // Best-known value at `path`, or std::nullopt when nothing is known there yet.
  // The empty path is never found. Containers come back as plain copies.
  std::optional<value> get(std::initializer_list<std::string_view> path) const {
    return lookup(path.begin(), path.end());
  }

  std::optional<value> get(const std::vector<std::string>& path) const {
    return lookup(path.begin(), path.end());
  }

  // A root container was opened and every container has been closed since.
  bool is_completed() const noexcept { return started_ && stack_.empty(); }

  bool started() const noexcept { return started_; }
  // Open containers, including those nested past max_depth.
  std::size_t depth() const noexcept { return stack_.size() + overflow_; }

  const node* root() const noexcept { return root_.get(); }
  const tokenizer& source() const noexcept { return tokens_; }
  const parser_options& options() const noexcept { return opt_; }

  // Forget the current document; the next append() starts a new one.
  void reset() {
    tokens_.reset();
    stack_.clear();
    root_.reset();
    overflow_ = 0;
    started_ = false;
  }

private:
  struct frame {
    node* target{nullptr};
    // Owns a container that found no slot in its parent; it is dropped when it closes.
    std::unique_ptr<node> detached;
    std::optional<std::string> pending_key;
    bool expecting_key{false};
    bool expecting_value{false};
  };

  void drain() {
    for (;;) {
      const token t = tokens_.next_token();
      if (t.kind == token_kind::end_of_input) return;
      if (!t.complete) {
        // Nothing more can be learned until more bytes arrive.
        if (started_) fold_partial(t);
        return;
      }
      if (t.kind == token_kind::invalid) continue;
      if (!started_) {
        // Leading junk before the first container is skipped.
        if (t.kind == token_kind::object_start) open_root(node::kind::object);
        if (t.kind == token_kind::array_start) open_root(node::kind::array);
        continue;
      }
      fold(t);
    }
  }

  void open_root(node::kind k) {
    root_ = std::make_unique<node>(k);
    frame f;
    f.target = root_.get();
    f.expecting_key = (k == node::kind::object);
    f.expecting_value = (k == node::kind::array);
    stack_.push_back(std::move(f));
    started_ = true;
  }

  void fold(const token& t) {
    // Input after the document closed is ignored.
    if (stack_.empty()) return;
    if (overflow_ != 0) {
      skip_nested(t.kind);
      return;
    }
    frame& top = stack_.back();

    switch (t.kind) {
      case token_kind::object_start: open_container(node::kind::object); break;
      case token_kind::array_start: open_container(node::kind::array); break;
      case token_kind::object_end:
      case token_kind::array_end: close_container(); break;
      case token_kind::key:
        if (top.target->is_object()) {
          top.pending_key = detail::decode_string(t.text, true, opt_.decode_escapes);
          top.expecting_key = false;
        } else {
          // The tokenizer flags every string after ',' as a key, array elements included.
          add_scalar(top, token_kind::string, t.text);
        }
        break;
      case token_kind::colon:
        if (top.target->is_object()) {
          top.expecting_key = false;
          top.expecting_value = true;
        }
        break;
      case token_kind::comma:
        if (top.target->is_object()) {
          top.expecting_key = true;
          top.expecting_value = false;
          top.pending_key.reset();
        } else if (top.target->is_array()) {
          top.expecting_value = true;
        }
        break;
      case token_kind::string:
      case token_kind::number:
      case token_kind::boolean:
      case token_kind::null: add_scalar(top, t.kind, t.text); break;
      default: break;
    }
  }

  // Only a string under a pending object key is exposed before it terminates.
  void fold_partial(const token& t) {
    if (stack_.empty() || overflow_ != 0 || t.kind != token_kind::string) return;
    frame& top = stack_.back();
    if (!top.target->is_object() || !top.pending_key) return;

    auto child = std::make_unique<node>(node::kind::value);
    child->scalar_ = value(detail::decode_string(t.text, false, opt_.decode_escapes));
    top.target->set_member(*top.pending_key, std::move(child));
  }

  void add_scalar(frame& f, token_kind kind, std::string_view text) {
    auto child = std::make_unique<node>(node::kind::value);
    child->scalar_ = detail::decode_scalar(kind, text, opt_.decode_escapes);
    child->complete_ = true;
    // A value with no slot to fill is dropped.
    (void)place(f, child);
  }

  // Attaches `child` to the frame's container. On failure `child` is left untouched.
  bool place(frame& f, std::unique_ptr<node>& child) {
    node& parent = *f.target;
    if (parent.is_object()) {
      if (!f.pending_key) return false;
      parent.set_member(std::move(*f.pending_key), std::move(child));
      f.pending_key.reset();
      f.expecting_value = false;
      return true;
    }
    if (parent.is_array()) {
      parent.push_element(std::move(child));
      f.expecting_value = false;
      return true;
    }
    return false;
  }

  void open_container(node::kind k) {
    if (stack_.size() >= opt_.max_depth) {
      // Too deep: the slot is spent but nothing is built.
      frame& top = stack_.back();
      top.pending_key.reset();
      top.expecting_key = false;
      top.expecting_value = false;
      overflow_ = 1;
      return;
    }
    auto child = std::make_unique<node>(k);
    frame f;
    f.target = child.get();
    f.expecting_key = (k == node::kind::object);
    f.expecting_value = (k == node::kind::array);
    if (!place(stack_.back(), child)) f.detached = std::move(child);
    stack_.push_back(std::move(f));
  }

  // Either end token closes whatever container is innermost.
  void close_container() {
    stack_.back().target->complete_ = true;
    stack_.pop_back();
    if (!stack_.empty()) {
      frame& up = stack_.back();
      up.expecting_key = false;
      up.expecting_value = false;
    }
  }

  // Past max_depth only the nesting level is tracked, so closers still balance.
  void skip_nested(token_kind kind) noexcept {
    if (kind == token_kind::object_start || kind == token_kind::array_start) {
      ++overflow_;
    } else if (kind == token_kind::object_end || kind == token_kind::array_end) {
      --overflow_;
    }
  }

  template <class It>
  std::optional<value> lookup(It first, It last) const {
    if (!root_ || first == last) return std::nullopt;
    const node* cur = root_.get();
    for (; first != last; ++first) {
      const std::string_view segment(*first);
      if (cur->is_object()) {
        cur = cur->find(segment);
      } else if (cur->is_array()) {
        std::size_t index = 0;
        if (!detail::parse_index(segment, index)) return std::nullopt;
        cur = cur->at(index);
      } else {
        return std::nullopt;
      }
      if (!cur) return std::nullopt;
    }
    return cur->to_value();
  }

  parser_options opt_;
  tokenizer tokens_;
  std::unique_ptr<node> root_;
  std::vector<frame> stack_;
  std::size_t overflow_{0};
  bool started_{false};
};

} // namespace streamjson
