#pragma once

// vtree: a small, header-only C++17 value tree.
// Arena-owned JSON-compatible values, dotted-path lookup, typed coercion and a strict JSON codec.

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
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
#include <map>
#include <memory>
#include <memory_resource>
#include <new>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace vtree {

// Config: floating-point parsing backend.
// Override by defining VTREE_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef VTREE_USE_FROM_CHARS_DOUBLE
  #define VTREE_USE_FROM_CHARS_DOUBLE 0
#endif

// Integer width: 128-bit where the compiler provides it, 64-bit otherwise.
#if defined(__SIZEOF_INT128__)
  #define VTREE_HAS_INT128 1
#else
  #define VTREE_HAS_INT128 0
#endif

#if VTREE_HAS_INT128
__extension__ typedef __int128 integer_t;
__extension__ typedef unsigned __int128 uinteger_t;
#else
typedef std::int64_t integer_t;
typedef std::uint64_t uinteger_t;
#endif

enum class error_code {
  ok = 0,
  incompatible_root_type,
  unknown_reference,
  unsupported_type,
  missing_constant,
  duplicate_template,
  unexpected_eof,
  invalid_value,
  invalid_number,
  number_out_of_range,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  nesting_too_deep
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::incompatible_root_type: return "incompatible_root_type";
    case error_code::unknown_reference: return "unknown_reference";
    case error_code::unsupported_type: return "unsupported_type";
    case error_code::missing_constant: return "missing_constant";
    case error_code::duplicate_template: return "duplicate_template";
    case error_code::unexpected_eof: return "unexpected_eof";
    case error_code::invalid_value: return "invalid_value";
    case error_code::invalid_number: return "invalid_number";
    case error_code::number_out_of_range: return "number_out_of_range";
    case error_code::invalid_string: return "invalid_string";
    case error_code::invalid_escape: return "invalid_escape";
    case error_code::invalid_unicode_escape: return "invalid_unicode_escape";
    case error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
    case error_code::expected_colon: return "expected_colon";
    case error_code::expected_comma_or_end: return "expected_comma_or_end";
    case error_code::expected_key_string: return "expected_key_string";
    case error_code::trailing_characters: return "trailing_characters";
    case error_code::nesting_too_deep: return "nesting_too_deep";
  }
  return "unknown";
}

struct error {
  error_code code{error_code::ok};
  // Position fields are only meaningful for decode errors.
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  // Offending path, constant name, template key or type name.
  std::string detail{};

  explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline error make_error(error_code code, std::string_view detail = {}) {
  error e;
  e.code = code;
  e.detail.assign(detail.data(), detail.size());
  return e;
}

inline bool is_decode_error(error_code code) noexcept {
  switch (code) {
    case error_code::unexpected_eof:
    case error_code::invalid_value:
    case error_code::invalid_number:
    case error_code::number_out_of_range:
    case error_code::invalid_string:
    case error_code::invalid_escape:
    case error_code::invalid_unicode_escape:
    case error_code::invalid_utf16_surrogate:
    case error_code::expected_colon:
    case error_code::expected_comma_or_end:
    case error_code::expected_key_string:
    case error_code::trailing_characters:
    case error_code::nesting_too_deep:
      return true;
    default:
      return false;
  }
}

// One-line message, e.g. "vtree: unknown_reference: `user.name`".
inline std::string describe(const error& e) {
  std::string out = "vtree: ";
  out += to_string(e.code);
  if (!e.detail.empty()) {
    out += ": `";
    out += e.detail;
    out += '`';
  }
  if (is_decode_error(e.code)) {
    out += " at line ";
    out += std::to_string(e.line);
    out += ", column ";
    out += std::to_string(e.column);
  }
  return out;
}

class exception : public std::runtime_error {
public:
  explicit exception(error e) : std::runtime_error(describe(e)), err_(std::move(e)) {}

  const error& err() const noexcept { return err_; }
  error_code code() const noexcept { return err_.code; }

private:
  error err_;
};

template <class T>
struct result {
  T val{};
  error err;
};

struct store_options {
  std::size_t initial_block_size{64 * 1024};
  std::size_t reserve_output{0};
  std::size_t reserve_json{0};
};

struct parse_options {
  std::size_t max_depth{256};
  bool require_eof{true};
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(const char* buf, std::size_t size, std::size_t& i) noexcept {
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

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= '0' && uc <= '9') return static_cast<int>(uc - '0');
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= 'a' && lc <= 'f') return 10 + static_cast<int>(lc - 'a');
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

inline bool parse_u4(std::string_view s, std::size_t& i, std::uint32_t& out_cp) noexcept {
  if (i + 4 > s.size()) return false;
  std::uint32_t v = 0;
  for (std::size_t k = 0; k < 4; ++k) {
    const int h = hex_val(s[i + k]);
    if (h < 0) return false;
    v = (v << 4) | static_cast<std::uint32_t>(h);
  }
  i += 4;
  out_cp = v;
  return true;
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline double parse_double(std::string_view token) {
#if defined(VTREE_USE_FROM_CHARS_DOUBLE) && VTREE_USE_FROM_CHARS_DOUBLE
#if defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto r = std::from_chars(first, last, v, std::chars_format::general);
    if (r.ec == std::errc{} && r.ptr == last) return v;
  }
#endif
#endif

  // Token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

// Result of scanning one JSON number token.
struct number_token {
  std::string_view text;
  bool has_fraction{false};
  bool has_exponent{false};
};

// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
inline bool scan_number(std::string_view s, std::size_t& i, number_token& out) noexcept {
  const std::size_t start = i;
  const std::size_t size = s.size();
  if (i >= size) return false;

  if (s[i] == '-') {
    ++i;
    if (i >= size) return false;
  }

  if (s[i] == '0') {
    ++i;
    if (i < size && is_digit(s[i])) return false;
  } else {
    if (s[i] < '1' || s[i] > '9') return false;
    while (i < size && is_digit(s[i])) ++i;
  }

  if (i < size && s[i] == '.') {
    out.has_fraction = true;
    ++i;
    if (i >= size || !is_digit(s[i])) return false;
    while (i < size && is_digit(s[i])) ++i;
  }

  if (i < size && (s[i] == 'e' || s[i] == 'E')) {
    out.has_exponent = true;
    ++i;
    if (i >= size) return false;
    if (s[i] == '+' || s[i] == '-') {
      ++i;
      if (i >= size) return false;
    }
    if (!is_digit(s[i])) return false;
    while (i < size && is_digit(s[i])) ++i;
  }

  out.text = s.substr(start, i - start);
  return true;
}

// Array index segment: unsigned base-10, no sign, no whitespace.
inline bool parse_index(std::string_view token, std::size_t& out) noexcept {
  if (token.empty()) return false;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  auto r = std::from_chars(first, last, out);
  return r.ec == std::errc{} && r.ptr == last;
}

inline std::size_t find_first_escape(std::string_view s) noexcept {
  const char* p = s.data();
  const std::size_t n = s.size();
  std::size_t i = 0;

#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  const __m128i k1f = _mm_set1_epi8(0x1F);
  const __m128i zero = _mm_setzero_si128();

  while (i + 16 <= n) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p + i));
    const __m128i is_q = _mm_cmpeq_epi8(v, q);
    const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
    // Unsigned check for v <= 0x1F using saturated subtract.
    const __m128i sub = _mm_subs_epu8(v, k1f);
    const __m128i is_ctrl = _mm_cmpeq_epi8(sub, zero);
    const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), is_ctrl);
    const int mask = _mm_movemask_epi8(any);
    if (mask != 0) {
#if defined(_MSC_VER)
      unsigned long bit = 0;
      _BitScanForward(&bit, static_cast<unsigned long>(mask));
      return i + static_cast<std::size_t>(bit);
#else
      return i + static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
    }
    i += 16;
  }
#endif

  for (; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(p[i]);
    if (p[i] == '"' || p[i] == '\\' || uc <= 0x1F) return i;
  }
  return n;
}

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";

  const char* data = s.data();
  const std::size_t n = s.size();
  const std::size_t first = find_first_escape(s);

  out.push_back('"');
  if (first == n) {
    out.append(data, n);
    out.push_back('"');
    return;
  }

  if (first > 0) out.append(data, first);

  std::size_t chunk_begin = first;
  for (std::size_t i = first; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);

    const char* esc = nullptr;
    switch (data[i]) {
      case '"': esc = "\\\""; break;
      case '\\': esc = "\\\\"; break;
      case '\b': esc = "\\b"; break;
      case '\f': esc = "\\f"; break;
      case '\n': esc = "\\n"; break;
      case '\r': esc = "\\r"; break;
      case '\t': esc = "\\t"; break;
      default: break;
    }

    if (esc != nullptr) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append(esc, 2);
      chunk_begin = i + 1;
      continue;
    }

    if (uc <= 0x1F) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append("\\u00", 4);
      out.push_back(hex[(uc >> 4) & 0xF]);
      out.push_back(hex[uc & 0xF]);
      chunk_begin = i + 1;
    }
  }

  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

constexpr uinteger_t integer_max_magnitude = (~uinteger_t(0)) >> 1;

// std::to_chars has no 128-bit overload in strict mode.
inline void dump_integer(std::string& out, integer_t v) {
  char buf[48];
  char* const end = buf + sizeof(buf);
  char* p = end;
  uinteger_t mag = (v < 0) ? uinteger_t(0) - static_cast<uinteger_t>(v) : static_cast<uinteger_t>(v);
  do {
    *--p = static_cast<char>('0' + static_cast<int>(mag % 10));
    mag /= 10;
  } while (mag != 0);
  if (v < 0) *--p = '-';
  out.append(p, static_cast<std::size_t>(end - p));
}

// `text` is an integer token already checked by scan_number. False on overflow.
inline bool parse_integer(std::string_view text, integer_t& out) noexcept {
  const bool neg = !text.empty() && text.front() == '-';
  if (neg) text.remove_prefix(1);
  const uinteger_t limit = integer_max_magnitude + (neg ? 1u : 0u);

  uinteger_t mag = 0;
  for (char c : text) {
    const unsigned d = static_cast<unsigned>(c - '0');
    if (mag > (limit - d) / 10) return false;
    mag = mag * 10 + d;
  }
  if (!neg) out = static_cast<integer_t>(mag);
  else if (mag == 0) out = 0;
  else out = -static_cast<integer_t>(mag - 1) - 1;
  return true;
}

template <class T>
struct is_integer_type
    : std::integral_constant<bool, std::is_integral<T>::value || std::is_same<T, integer_t>::value> {};

// Shortest round-trip decimal without exponent. The widest finite double needs ~330 chars.
inline std::string_view format_fixed(char (&buf)[512], double d) {
  auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("vtree: failed to format float");
  }
  return std::string_view(buf, static_cast<std::size_t>(r.ptr - buf));
}

// Display form: `1`, `2.5`, `0.0001`, `nan`, `inf`, `-inf`.
inline void append_plain_float(std::string& out, double d) {
  if (std::isnan(d)) {
    out.append("nan", 3);
    return;
  }
  if (std::isinf(d)) {
    out.append(d < 0 ? "-inf" : "inf");
    return;
  }
  char buf[512];
  const std::string_view text = format_fixed(buf, d);
  out.append(text.data(), text.size());
}

inline void dump_indent(std::string& out, int indent) {
  out.append(static_cast<std::size_t>(indent), ' ');
}

inline bool starts_with(std::string_view s, std::string_view prefix) noexcept {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view s, std::string_view suffix) noexcept {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <class T>
struct always_false : std::false_type {};

// Readable name of T for unsupported_type diagnostics.
template <class T>
std::string type_name() {
#if defined(__clang__) || defined(__GNUC__)
  const std::string_view sig = __PRETTY_FUNCTION__;
  const std::size_t b = sig.find("T = ");
  if (b != std::string_view::npos) {
    std::size_t e = sig.find(';', b);
    if (e == std::string_view::npos) e = sig.rfind(']');
    if (e != std::string_view::npos && e > b + 4) return std::string(sig.substr(b + 4, e - b - 4));
  }
#endif
  return typeid(T).name();
}

} // namespace detail

// -----------------------------
// PMR arena
// -----------------------------

namespace pmr {

// Monotonic bump allocator over a list of blocks. Deallocation is a no-op; memory comes back
// only through clear() (rewind, keep blocks) or release() (free blocks).
class arena_resource final : public std::pmr::memory_resource {
public:
  explicit arena_resource(std::size_t initial_block_size = 64 * 1024)
      : initial_block_size_(initial_block_size ? initial_block_size : 64 * 1024) {}

  arena_resource(const arena_resource&) = delete;
  arena_resource& operator=(const arena_resource&) = delete;

  ~arena_resource() override { release(); }

  void clear() noexcept {
    for (auto& b : blocks_) b.used = 0;
    current_block_ = 0;
  }

  void release() noexcept {
    for (auto& b : blocks_) ::operator delete(b.ptr);
    blocks_.clear();
    current_block_ = 0;
  }

  // Commit at least `bytes` of free space up front.
  void reserve_bytes(std::size_t bytes) {
    std::size_t free_bytes = 0;
    for (std::size_t idx = current_block_; idx < blocks_.size(); ++idx) {
      free_bytes += blocks_[idx].size - blocks_[idx].used;
    }
    if (free_bytes >= bytes) return;
    push_block(bytes - free_bytes);
    current_block_ = blocks_.size() == 1 ? 0 : current_block_;
  }

  std::size_t blocks() const noexcept { return blocks_.size(); }

  std::size_t bytes_committed() const noexcept {
    std::size_t sum = 0;
    for (const auto& b : blocks_) sum += b.size;
    return sum;
  }

  std::size_t bytes_used() const noexcept {
    std::size_t sum = 0;
    for (const auto& b : blocks_) sum += b.used;
    return sum;
  }

private:
  struct block {
    std::byte* ptr{nullptr};
    std::size_t size{0};
    std::size_t used{0};
  };

  std::vector<block> blocks_;
  std::size_t initial_block_size_;
  std::size_t current_block_{0};

  block& push_block(std::size_t min_size) {
    block nb;
    nb.size = (min_size <= initial_block_size_) ? initial_block_size_ : min_size;
    nb.ptr = static_cast<std::byte*>(::operator new(nb.size));
    blocks_.push_back(nb);
    return blocks_.back();
  }

  static void* try_block(block& b, std::size_t bytes, std::size_t alignment) noexcept {
    const std::uintptr_t base = reinterpret_cast<std::uintptr_t>(b.ptr) + b.used;
    const std::uintptr_t aligned = (base + (alignment - 1)) & ~(static_cast<std::uintptr_t>(alignment) - 1u);
    const std::size_t padding = static_cast<std::size_t>(aligned - base);
    if (b.used + padding + bytes > b.size) return nullptr;
    b.used += padding + bytes;
    return reinterpret_cast<void*>(aligned);
  }

  void* do_allocate(std::size_t bytes, std::size_t alignment) override {
    if (bytes == 0) bytes = 1;
    if (alignment == 0) alignment = alignof(std::max_align_t);
    if ((alignment & (alignment - 1)) != 0) {
      // alignment must be power-of-two per pmr contract
      throw std::bad_alloc();
    }

    for (std::size_t idx = current_block_; idx < blocks_.size(); ++idx) {
      if (void* p = try_block(blocks_[idx], bytes, alignment)) {
        current_block_ = idx;
        return p;
      }
    }

    push_block(bytes + alignment);
    current_block_ = blocks_.size() - 1;
    return try_block(blocks_.back(), bytes, alignment);
  }

  void do_deallocate(void*, std::size_t, std::size_t) override {
    // monotonic: no-op
  }

  bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
    return this == &other;
  }
};

} // namespace pmr

// -----------------------------
// Value tree
// -----------------------------

enum class kind { null, boolean, integer, floating, string, array, object };

inline const char* to_string(kind k) noexcept {
  switch (k) {
    case kind::null: return "null";
    case kind::boolean: return "boolean";
    case kind::integer: return "integer";
    case kind::floating: return "float";
    case kind::string: return "string";
    case kind::array: return "array";
    case kind::object: return "object";
  }
  return "unknown";
}

class store;
class value;
class object;
class array;

// Return type of a typed fetch for each kind.
template <kind K> struct kind_traits;
template <> struct kind_traits<kind::null> { using get_type = std::optional<std::nullptr_t>; };
template <> struct kind_traits<kind::boolean> { using get_type = std::optional<bool>; };
template <> struct kind_traits<kind::integer> { using get_type = std::optional<integer_t>; };
template <> struct kind_traits<kind::floating> { using get_type = std::optional<double>; };
template <> struct kind_traits<kind::string> { using get_type = std::optional<std::string_view>; };
template <> struct kind_traits<kind::array> { using get_type = array*; };
template <> struct kind_traits<kind::object> { using get_type = object*; };

class object {
public:
  using map_type = std::pmr::map<std::pmr::string, value*, std::less<>>;
  using const_iterator = map_type::const_iterator;

  struct member {
    std::string_view key;
    value* val;
  };

  explicit object(store* owner);

  // Insert or replace. A null `v` stores a Null value; the replaced child stays alive in the arena.
  void put(std::string_view key, value* v);

  value* get(std::string_view key) const noexcept {
    auto it = members_.find(key);
    return it == members_.end() ? nullptr : it->second;
  }

  template <kind K>
  typename kind_traits<K>::get_type get_t(std::string_view key) const;

  bool contains(std::string_view key) const noexcept { return members_.find(key) != members_.end(); }
  std::size_t count() const noexcept { return members_.size(); }

  value* chain(std::initializer_list<std::string_view> keys) const noexcept {
    return chain_range(keys.begin(), keys.end());
  }

  template <class Container>
  value* chain(const Container& keys) const noexcept {
    return chain_range(std::begin(keys), std::end(keys));
  }

  bool eql(const object& other) const noexcept;

  std::vector<member> items() const;

  const_iterator begin() const noexcept { return members_.begin(); }
  const_iterator end() const noexcept { return members_.end(); }

private:
  store* owner_;
  map_type members_;

  template <class It>
  value* chain_range(It first, It last) const noexcept;
};

class array {
public:
  using vector_type = std::pmr::vector<value*>;
  using const_iterator = vector_type::const_iterator;

  // Forward, single-pass cursor. Obtain a fresh one from array::iterator() to start over.
  class cursor {
  public:
    explicit cursor(const vector_type* items) noexcept : items_(items) {}

    value* next() noexcept {
      if (items_ == nullptr || index_ >= items_->size()) return nullptr;
      return (*items_)[index_++];
    }

  private:
    const vector_type* items_;
    std::size_t index_{0};
  };

  explicit array(store* owner);

  // A null `v` appends a Null value.
  void append(value* v);

  value* get(std::size_t index) const noexcept {
    return index < items_.size() ? items_[index] : nullptr;
  }

  std::size_t count() const noexcept { return items_.size(); }

  bool eql(const array& other) const noexcept;

  cursor iterator() const noexcept { return cursor(&items_); }
  std::vector<value*> items() const { return std::vector<value*>(items_.begin(), items_.end()); }

  const_iterator begin() const noexcept { return items_.begin(); }
  const_iterator end() const noexcept { return items_.end(); }

private:
  store* owner_;
  vector_type items_;
};

class value {
public:
  value(const value&) = delete;
  value& operator=(const value&) = delete;

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::integer;
      case 3: return kind::floating;
      case 4: return kind::string;
      case 5: return kind::array;
      case 6: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_boolean() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_integer() const noexcept { return std::holds_alternative<integer_t>(data_); }
  bool is_float() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::pmr::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<vtree::array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<vtree::object>(data_); }
  bool is_container() const noexcept { return is_array() || is_object(); }

  bool as_boolean() const { return std::get<bool>(data_); }
  integer_t as_integer() const { return std::get<integer_t>(data_); }
  double as_float() const { return std::get<double>(data_); }
  std::string_view as_string() const {
    const auto& s = std::get<std::pmr::string>(data_);
    return std::string_view(s.data(), s.size());
  }

  const vtree::array& as_array() const { return std::get<vtree::array>(data_); }
  const vtree::object& as_object() const { return std::get<vtree::object>(data_); }
  vtree::array& as_array() { return std::get<vtree::array>(data_); }
  vtree::object& as_object() { return std::get<vtree::object>(data_); }

  // Object-only. Throws std::logic_error on any other kind.
  void put(std::string_view key, value* v) {
    if (!is_object()) throw std::logic_error("vtree: put() requires an object value");
    as_object().put(key, v);
  }

  // Array-only. Throws std::logic_error on any other kind.
  void append(value* v) {
    if (!is_array()) throw std::logic_error("vtree: append() requires an array value");
    as_array().append(v);
  }

  value* get(std::string_view key) const noexcept {
    return is_object() ? as_object().get(key) : nullptr;
  }

  template <kind K>
  typename kind_traits<K>::get_type get_t(std::string_view key) const {
    if (!is_object()) return typename kind_traits<K>::get_type{};
    return as_object().get_t<K>(key);
  }

  value* chain(std::initializer_list<std::string_view> keys) const noexcept {
    return is_object() ? as_object().chain(keys) : nullptr;
  }

  template <class Container>
  value* chain(const Container& keys) const noexcept {
    return is_object() ? as_object().chain(keys) : nullptr;
  }

  // Number of children. Scalars have none to count: throws std::logic_error.
  std::size_t count() const {
    switch (type()) {
      case kind::array: return as_array().count();
      case kind::object: return as_object().count();
      case kind::null:
      case kind::boolean:
      case kind::integer:
      case kind::floating:
      case kind::string:
        break;
    }
    throw std::logic_error("vtree: count() requires an array or object value");
  }

  array::cursor iterator() const {
    if (!is_array()) throw std::logic_error("vtree: iterator() requires an array value");
    return as_array().iterator();
  }

  bool eql(const value& other) const noexcept;

  // Display form of a scalar; containers have none and yield "".
  std::string to_string() const;

  std::string to_json(bool pretty = false) const;

  // Deep copy through the codec into `target`.
  value* clone(store& target) const;

  store& owner() const noexcept { return *owner_; }

private:
  // index: 0 null, 1 boolean, 2 integer, 3 float, 4 string, 5 array, 6 object
  using storage = std::variant<std::monostate, bool, integer_t, double, std::pmr::string, vtree::array, vtree::object>;

  explicit value(store* owner) noexcept : owner_(owner), data_(std::monostate{}) {}

  store* owner_;
  storage data_;

  friend class store;
};

// -----------------------------
// Encoding
// -----------------------------

namespace detail {

// JSON number form of a float: fixed notation with a decimal point always present.
inline void dump_float(std::string& out, double d) {
  if (!std::isfinite(d)) {
    throw exception(make_error(error_code::unsupported_type, "non-finite float"));
  }
  char buf[512];
  const std::string_view text = format_fixed(buf, d);
  out.append(text.data(), text.size());
  if (text.find('.') == std::string_view::npos) out.append(".0", 2);
}

} // namespace detail

inline void dump_to(std::string& out, const value& v, bool pretty = false, int indent = 0) {
  switch (v.type()) {
    case kind::null:
      out.append("null", 4);
      return;
    case kind::boolean:
      if (v.as_boolean()) out.append("true", 4);
      else out.append("false", 5);
      return;
    case kind::integer:
      detail::dump_integer(out, v.as_integer());
      return;
    case kind::floating:
      detail::dump_float(out, v.as_float());
      return;
    case kind::string:
      detail::dump_escaped(out, v.as_string());
      return;
    case kind::array: {
      const auto& a = v.as_array();
      out.push_back('[');
      if (a.count() == 0) {
        out.push_back(']');
        return;
      }
      if (pretty) out.push_back('\n');
      std::size_t idx = 0;
      for (const value* child : a) {
        if (pretty) detail::dump_indent(out, indent + 2);
        dump_to(out, *child, pretty, indent + 2);
        if (++idx != a.count()) out.push_back(',');
        if (pretty) out.push_back('\n');
      }
      if (pretty) detail::dump_indent(out, indent);
      out.push_back(']');
      return;
    }
    case kind::object: {
      const auto& o = v.as_object();
      out.push_back('{');
      if (o.count() == 0) {
        out.push_back('}');
        return;
      }
      if (pretty) out.push_back('\n');
      std::size_t idx = 0;
      for (const auto& kv : o) {
        if (pretty) detail::dump_indent(out, indent + 2);
        detail::dump_escaped(out, std::string_view(kv.first.data(), kv.first.size()));
        if (pretty) out.append(": ", 2);
        else out.push_back(':');
        dump_to(out, *kv.second, pretty, indent + 2);
        if (++idx != o.count()) out.push_back(',');
        if (pretty) out.push_back('\n');
      }
      if (pretty) detail::dump_indent(out, indent);
      out.push_back('}');
      return;
    }
  }
}

inline std::string dump(const value& v, bool pretty = false) {
  std::string out;
  dump_to(out, v, pretty, 0);
  return out;
}

// -----------------------------
// Store
// -----------------------------

// Owner of one value tree. Every value created through a store lives until the store is
// destroyed or reset(); overwriting a child (object::put) does not reclaim the old one.
// Not thread-safe: one store serves one build/render at a time.
class store {
public:
  store() : store(store_options{}) {}

  explicit store(store_options opt) : arena_(opt.initial_block_size) {
    output_.reserve(opt.reserve_output);
    json_buf_.reserve(opt.reserve_json);
  }

  store(const store&) = delete;
  store& operator=(const store&) = delete;
  store(store&&) = delete;
  store& operator=(store&&) = delete;

  // -- root binding --

  value* root() const noexcept { return root_; }

  // Fetch the root, creating it on first use. Fails if the root is already bound to the other
  // container kind (or `k` is not a container kind).
  result<value*> root(kind k) {
    result<value*> r;
    if (k != kind::object && k != kind::array) {
      r.err = make_error(error_code::incompatible_root_type, to_string(k));
      return r;
    }
    if (root_ != nullptr) {
      if (root_->type() != k) {
        r.err = make_error(error_code::incompatible_root_type, to_string(k));
        return r;
      }
      r.val = root_;
      return r;
    }
    root_ = (k == kind::object) ? create_object() : create_array();
    r.val = root_;
    return r;
  }

  value* root_or_throw(kind k) {
    auto r = root(k);
    if (r.err) throw exception(std::move(r.err));
    return r.val;
  }

  // The first container created on an empty store becomes the root; later ones are detached.
  value* make_object() {
    value* v = create_object();
    if (root_ == nullptr) root_ = v;
    return v;
  }

  value* make_array() {
    value* v = create_array();
    if (root_ == nullptr) root_ = v;
    return v;
  }

  // Always detached.
  value* create_object() {
    value* v = new_value();
    v->data_.emplace<vtree::object>(this);
    return v;
  }

  value* create_array() {
    value* v = new_value();
    v->data_.emplace<vtree::array>(this);
    return v;
  }

  value* make_string(std::string_view s) {
    value* v = new_value();
    v->data_.emplace<std::pmr::string>(s.data(), s.size(), resource());
    return v;
  }

  value* make_integer(integer_t i) {
    value* v = new_value();
    v->data_.emplace<integer_t>(i);
    return v;
  }

  value* make_float(double d) {
    value* v = new_value();
    v->data_.emplace<double>(d);
    return v;
  }

  value* make_boolean(bool b) {
    value* v = new_value();
    v->data_.emplace<bool>(b);
    return v;
  }

  value* make_null() { return new_value(); }

  // -- lookups --

  // Exact key on the root object.
  value* get(std::string_view key) const noexcept {
    return root_ != nullptr ? root_->get(key) : nullptr;
  }

  template <kind K>
  typename kind_traits<K>::get_type get_t(std::string_view key) const {
    if (root_ == nullptr) return typename kind_traits<K>::get_type{};
    return root_->get_t<K>(key);
  }

  value* chain(std::initializer_list<std::string_view> keys) const noexcept {
    return root_ != nullptr ? root_->chain(keys) : nullptr;
  }

  template <class Container>
  value* chain(const Container& keys) const noexcept {
    return root_ != nullptr ? root_->chain(keys) : nullptr;
  }

  // Dotted path (`foo.bar.2.baz`); the overlay is consulted before the root.
  value* get_value(std::string_view path) const;

  result<value*> get_ref(std::string_view path) const {
    result<value*> r;
    r.val = get_value(path);
    if (r.val == nullptr) r.err = make_error(error_code::unknown_reference, path);
    return r;
  }

  result<std::string> get_value_string(std::string_view path) const {
    result<std::string> r;
    const value* v = get_value(path);
    if (v == nullptr) {
      r.err = make_error(error_code::unknown_reference, path);
      return r;
    }
    r.val = v->to_string();
    return r;
  }

  template <class T>
  result<T> get_coerce(std::string_view path) const;

  template <class T>
  T get_coerce_or_throw(std::string_view path) const {
    auto r = get_coerce<T>(path);
    if (r.err) throw exception(std::move(r.err));
    return r.val;
  }

  // -- overlay ("partial data") --

  void set_partial_data(vtree::object* overlay) noexcept { partial_data_ = overlay; }
  vtree::object* partial_data() const noexcept { return partial_data_; }

  // -- named constants --

  void add_const(std::string_view name, value* v) {
    constants_[std::string(name)] = v != nullptr ? v : make_null();
  }

  bool has_const(std::string_view name) const {
    return constants_.find(std::string(name)) != constants_.end();
  }

  template <class T>
  result<T> get_const(std::string_view name) const;

  // -- codec --

  // Compact JSON of the whole tree; "" when no root is bound.
  std::string to_json() {
    if (root_ == nullptr) return std::string();
    json_buf_.clear();
    dump_to(json_buf_, *root_, false, 0);
    return json_buf_;
  }

  // Pretty JSON of the whole tree with a trailing newline; "" when no root is bound.
  std::string to_pretty_json() {
    if (root_ == nullptr) return std::string();
    json_buf_.clear();
    dump_to(json_buf_, *root_, true, 0);
    json_buf_.push_back('\n');
    return json_buf_;
  }

  // Decode `json` and bind it as the root. On failure the root is left untouched.
  error from_json(std::string_view json, parse_options opt = {});

  void from_json_or_throw(std::string_view json, parse_options opt = {}) {
    error e = from_json(json, opt);
    if (e) throw exception(std::move(e));
  }

  // Decode any JSON value into a detached value.
  result<value*> parse_value(std::string_view json, parse_options opt = {});

  // -- output accumulation --

  // Append rendered text. The first write after construction/reset drops one leading newline.
  void write(std::string_view text) {
    if (!output_started_) {
      output_started_ = true;
      if (detail::starts_with(text, "\r\n")) text.remove_prefix(2);
      else if (detail::starts_with(text, "\n")) text.remove_prefix(1);
    }
    output_.append(text.data(), text.size());
  }

  // Drop one trailing line terminator from the output buffer.
  void chomp_output_buffer() noexcept {
    if (detail::ends_with(output_, "\r\n")) {
      output_.resize(output_.size() - 2);
    } else if (detail::ends_with(output_, "\n")) {
      output_.pop_back();
    }
  }

  std::string_view output() const noexcept { return std::string_view(output_.data(), output_.size()); }

  void clear_output() noexcept {
    output_.clear();
    output_started_ = false;
  }

  // -- lifecycle --

  // Drop the root, overlay and constants, clear both buffers and rewind the arena.
  // Every value previously created through this store becomes invalid.
  void reset() noexcept {
    root_ = nullptr;
    partial_data_ = nullptr;
    constants_.clear();
    clear_output();
    json_buf_.clear();
    arena_.clear();
  }

  pmr::arena_resource& arena() noexcept { return arena_; }
  const pmr::arena_resource& arena() const noexcept { return arena_; }
  std::pmr::memory_resource* resource() noexcept { return &arena_; }

private:
  pmr::arena_resource arena_;
  value* root_{nullptr};
  vtree::object* partial_data_{nullptr};
  std::unordered_map<std::string, value*> constants_;
  std::string output_;
  bool output_started_{false};
  std::string json_buf_;

  value* new_value() {
    void* p = arena_.allocate(sizeof(value), alignof(value));
    return ::new (p) value(this);
  }
};

// -----------------------------
// Object / array / value members
// -----------------------------

inline object::object(store* owner) : owner_(owner), members_(owner->resource()) {}

inline void object::put(std::string_view key, value* v) {
  if (v == nullptr) v = owner_->make_null();
  auto it = members_.find(key);
  if (it != members_.end()) {
    it->second = v;
    return;
  }
  members_.emplace(std::pmr::string(key.data(), key.size(), owner_->resource()), v);
}

namespace detail {

template <kind K>
typename kind_traits<K>::get_type unwrap(value* v) {
  using R = typename kind_traits<K>::get_type;
  if (v == nullptr || v->type() != K) return R{};
  if constexpr (K == kind::object) {
    return &v->as_object();
  } else if constexpr (K == kind::array) {
    return &v->as_array();
  } else if constexpr (K == kind::string) {
    return R(v->as_string());
  } else if constexpr (K == kind::integer) {
    return R(v->as_integer());
  } else if constexpr (K == kind::floating) {
    return R(v->as_float());
  } else if constexpr (K == kind::boolean) {
    return R(v->as_boolean());
  } else {
    return R(nullptr);
  }
}

} // namespace detail

template <kind K>
typename kind_traits<K>::get_type object::get_t(std::string_view key) const {
  return detail::unwrap<K>(get(key));
}

template <class It>
value* object::chain_range(It first, It last) const noexcept {
  if (first == last) return nullptr;
  const object* current = this;
  for (It it = first; it != last;) {
    value* v = current->get(std::string_view(*it));
    if (v == nullptr) return nullptr;
    const bool at_end = (++it == last);
    if (!v->is_object()) return at_end ? v : nullptr;
    // Chains end on leaves; landing on an object is a miss.
    if (at_end) return nullptr;
    current = &v->as_object();
  }
  return nullptr;
}

inline bool object::eql(const object& other) const noexcept {
  if (count() != other.count()) return false;
  for (const auto& kv : members_) {
    const value* rhs = other.get(std::string_view(kv.first.data(), kv.first.size()));
    if (rhs == nullptr || !kv.second->eql(*rhs)) return false;
  }
  return true;
}

inline std::vector<object::member> object::items() const {
  std::vector<member> out;
  out.reserve(members_.size());
  for (const auto& kv : members_) {
    out.push_back(member{std::string_view(kv.first.data(), kv.first.size()), kv.second});
  }
  return out;
}

inline array::array(store* owner) : owner_(owner), items_(owner->resource()) {}

inline void array::append(value* v) {
  items_.push_back(v != nullptr ? v : owner_->make_null());
}

inline bool array::eql(const array& other) const noexcept {
  if (count() != other.count()) return false;
  for (std::size_t i = 0; i < items_.size(); ++i) {
    if (!items_[i]->eql(*other.items_[i])) return false;
  }
  return true;
}

inline bool value::eql(const value& other) const noexcept {
  if (type() != other.type()) return false;
  switch (type()) {
    case kind::null: return true;
    case kind::boolean: return as_boolean() == other.as_boolean();
    case kind::integer: return as_integer() == other.as_integer();
    case kind::floating: return as_float() == other.as_float();
    case kind::string: return as_string() == other.as_string();
    case kind::array: return as_array().eql(other.as_array());
    case kind::object: return as_object().eql(other.as_object());
  }
  return false;
}

inline std::string value::to_string() const {
  std::string out;
  switch (type()) {
    case kind::null:
      break;
    case kind::boolean:
      out = as_boolean() ? "true" : "false";
      break;
    case kind::integer:
      detail::dump_integer(out, as_integer());
      break;
    case kind::floating:
      detail::append_plain_float(out, as_float());
      break;
    case kind::string:
      out.assign(as_string().data(), as_string().size());
      break;
    case kind::array:
    case kind::object:
      break;
  }
  return out;
}

inline std::string value::to_json(bool pretty) const {
  return dump(*this, pretty);
}

inline value* value::clone(store& target) const {
  const std::string json = to_json();
  // The encoder has no depth limit, so neither does the copy.
  parse_options opt;
  opt.max_depth = (std::numeric_limits<std::size_t>::max)();
  auto r = target.parse_value(json, opt);
  // The text came from our own encoder; a failure here means the encoder is broken.
  if (r.err) throw exception(std::move(r.err));
  return r.val;
}

// -----------------------------
// Decoding
// -----------------------------

namespace detail {

struct tree_parser {
  store* st{nullptr};
  std::string_view s;
  std::size_t i{0};
  parse_options opt;

  value* run(error& e) {
    skip_ws(s.data(), s.size(), i);
    value* v = parse_value(0, e);
    if (e) return nullptr;

    skip_ws(s.data(), s.size(), i);
    if (opt.require_eof && i != s.size()) {
      set_error(e, error_code::trailing_characters);
      return nullptr;
    }
    return v;
  }

  void set_error(error& e, error_code code, std::size_t at = std::numeric_limits<std::size_t>::max()) {
    if (e) return;
    e.code = code;
    e.offset = (at == std::numeric_limits<std::size_t>::max()) ? i : at;
    update_line_col(s, e.offset, e.line, e.column);
  }

  value* parse_value(std::size_t depth, error& e) {
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep);
      return nullptr;
    }
    if (i >= s.size()) {
      set_error(e, error_code::unexpected_eof);
      return nullptr;
    }

    const char c = s[i];
    switch (c) {
      case 'n': return parse_literal("null", 4, e) ? st->make_null() : nullptr;
      case 't': return parse_literal("true", 4, e) ? st->make_boolean(true) : nullptr;
      case 'f': return parse_literal("false", 5, e) ? st->make_boolean(false) : nullptr;
      case '"': {
        std::string out;
        if (!parse_string(out, e)) return nullptr;
        return st->make_string(out);
      }
      case '[': return parse_array(depth + 1, e);
      case '{': return parse_object(depth + 1, e);
      default:
        if (c == '-' || is_digit(c)) return parse_number(e);
        set_error(e, error_code::invalid_value);
        return nullptr;
    }
  }

  bool parse_literal(const char* lit, std::size_t len, error& e) {
    if (i + len > s.size()) {
      set_error(e, error_code::unexpected_eof);
      return false;
    }
    if (std::memcmp(s.data() + i, lit, len) != 0) {
      set_error(e, error_code::invalid_value);
      return false;
    }
    i += len;
    return true;
  }

  // A token with a fraction or exponent is a float; anything else must fit integer_t.
  value* parse_number(error& e) {
    const std::size_t start = i;
    number_token tok;
    if (!scan_number(s, i, tok)) {
      set_error(e, error_code::invalid_number, start);
      return nullptr;
    }
    if (tok.has_fraction || tok.has_exponent) {
      return st->make_float(parse_double(tok.text));
    }
    integer_t n = 0;
    if (!parse_integer(tok.text, n)) {
      set_error(e, error_code::number_out_of_range, start);
      return nullptr;
    }
    return st->make_integer(n);
  }

  bool parse_string(std::string& out, error& e) {
    // JSON string: " ... ", disallow raw control chars.
    if (i >= s.size() || s[i] != '"') {
      set_error(e, error_code::invalid_string);
      return false;
    }
    const std::size_t quote_pos = i;
    ++i;
    out.clear();

    const char* base = s.data();
    const std::size_t n = s.size();
    std::size_t chunk_begin = i;

    while (i < n) {
      const unsigned char uc = static_cast<unsigned char>(base[i]);
      const char c = base[i];

      if (c == '"') {
        if (i > chunk_begin) out.append(base + chunk_begin, i - chunk_begin);
        ++i;
        return true;
      }

      if (c == '\\') {
        if (i > chunk_begin) out.append(base + chunk_begin, i - chunk_begin);
        ++i;
        if (i >= n) {
          set_error(e, error_code::unexpected_eof, quote_pos);
          return false;
        }
        const char esc = base[i++];
        switch (esc) {
          case '"': out.push_back('"'); break;
          case '\\': out.push_back('\\'); break;
          case '/': out.push_back('/'); break;
          case 'b': out.push_back('\b'); break;
          case 'f': out.push_back('\f'); break;
          case 'n': out.push_back('\n'); break;
          case 'r': out.push_back('\r'); break;
          case 't': out.push_back('\t'); break;
          case 'u': {
            std::uint32_t cp = 0;
            if (!parse_u4(s, i, cp)) {
              set_error(e, error_code::invalid_unicode_escape, i);
              return false;
            }
            if (cp >= 0xD800u && cp <= 0xDBFFu) {
              if (i + 2 > n || base[i] != '\\' || base[i + 1] != 'u') {
                set_error(e, error_code::invalid_utf16_surrogate, i);
                return false;
              }
              i += 2;
              std::uint32_t low = 0;
              if (!parse_u4(s, i, low)) {
                set_error(e, error_code::invalid_unicode_escape, i);
                return false;
              }
              if (low < 0xDC00u || low > 0xDFFFu) {
                set_error(e, error_code::invalid_utf16_surrogate, i);
                return false;
              }
              cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
            } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
              set_error(e, error_code::invalid_utf16_surrogate, i);
              return false;
            }
            append_utf8(out, cp);
            break;
          }
          default:
            set_error(e, error_code::invalid_escape, i - 1);
            return false;
        }
        chunk_begin = i;
        continue;
      }

      if (uc <= 0x1F) {
        set_error(e, error_code::invalid_string, i);
        return false;
      }

      ++i;
    }

    set_error(e, error_code::unexpected_eof, quote_pos);
    return false;
  }

  value* parse_array(std::size_t depth, error& e) {
    ++i; // '['
    skip_ws(s.data(), s.size(), i);

    value* arr = st->create_array();
    if (i < s.size() && s[i] == ']') {
      ++i;
      return arr;
    }

    while (true) {
      skip_ws(s.data(), s.size(), i);
      value* elem = parse_value(depth, e);
      if (e) return nullptr;
      arr->as_array().append(elem);

      skip_ws(s.data(), s.size(), i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      const char c = s[i++];
      if (c == ',') continue;
      if (c == ']') return arr;
      set_error(e, error_code::expected_comma_or_end, i - 1);
      return nullptr;
    }
  }

  value* parse_object(std::size_t depth, error& e) {
    ++i; // '{'
    skip_ws(s.data(), s.size(), i);

    value* obj = st->create_object();
    if (i < s.size() && s[i] == '}') {
      ++i;
      return obj;
    }

    std::string key;
    while (true) {
      skip_ws(s.data(), s.size(), i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      if (s[i] != '"') {
        set_error(e, error_code::expected_key_string);
        return nullptr;
      }
      if (!parse_string(key, e)) return nullptr;

      skip_ws(s.data(), s.size(), i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      if (s[i] != ':') {
        set_error(e, error_code::expected_colon);
        return nullptr;
      }
      ++i;

      skip_ws(s.data(), s.size(), i);
      value* child = parse_value(depth, e);
      if (e) return nullptr;
      // Duplicate keys: last one wins, as with put().
      obj->as_object().put(key, child);

      skip_ws(s.data(), s.size(), i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      const char c = s[i++];
      if (c == ',') continue;
      if (c == '}') return obj;
      set_error(e, error_code::expected_comma_or_end, i - 1);
      return nullptr;
    }
  }
};

} // namespace detail

inline result<value*> store::parse_value(std::string_view json, parse_options opt) {
  detail::tree_parser p;
  p.st = this;
  p.s = json;
  p.opt = opt;
  result<value*> r;
  r.val = p.run(r.err);
  if (r.err) r.val = nullptr;
  return r;
}

inline error store::from_json(std::string_view json, parse_options opt) {
  auto r = parse_value(json, opt);
  if (r.err) return std::move(r.err);
  if (!r.val->is_container()) {
    return make_error(error_code::incompatible_root_type, to_string(r.val->type()));
  }
  if (root_ != nullptr && root_->type() != r.val->type()) {
    return make_error(error_code::incompatible_root_type, to_string(r.val->type()));
  }
  root_ = r.val;
  return error{};
}

// -----------------------------
// Path resolution
// -----------------------------

namespace detail {

// Walk `path` from `current`. A scalar reached before the path ends is the result.
inline value* resolve_path(value* current, std::string_view path) {
  std::size_t pos = 0;
  while (true) {
    const std::size_t dot = path.find('.', pos);
    const std::string_view token =
        (dot == std::string_view::npos) ? path.substr(pos) : path.substr(pos, dot - pos);

    switch (current->type()) {
      case kind::object:
        current = current->as_object().get(token);
        if (current == nullptr) return nullptr;
        break;
      case kind::array: {
        std::size_t index = 0;
        if (!parse_index(token, index)) return nullptr;
        current = current->as_array().get(index);
        if (current == nullptr) return nullptr;
        break;
      }
      case kind::null:
      case kind::boolean:
      case kind::integer:
      case kind::floating:
      case kind::string:
        return current;
    }

    if (dot == std::string_view::npos) return current;
    pos = dot + 1;
  }
}

inline value* resolve_path(const object& start, std::string_view path) {
  const std::size_t dot = path.find('.');
  value* head = start.get(path.substr(0, dot));
  if (head == nullptr || dot == std::string_view::npos) return head;
  return resolve_path(head, path.substr(dot + 1));
}

} // namespace detail

inline value* store::get_value(std::string_view path) const {
  // Overlay shadows the root: exact key first, then a dotted walk.
  if (partial_data_ != nullptr) {
    if (value* v = partial_data_->get(path)) return v;
    if (value* v = detail::resolve_path(*partial_data_, path)) return v;
  }
  if (root_ == nullptr) return nullptr;
  return detail::resolve_path(root_, path);
}

// -----------------------------
// Coercion
// -----------------------------

namespace detail {

template <class T>
struct is_char_type
    : std::integral_constant<bool, std::is_same<T, char>::value || std::is_same<T, wchar_t>::value ||
                                       std::is_same<T, char16_t>::value || std::is_same<T, char32_t>::value> {};

template <class T>
struct is_optional : std::false_type {};
template <class T>
struct is_optional<std::optional<T>> : std::true_type {};

template <class T>
struct is_text
    : std::integral_constant<bool, std::is_same<T, std::string>::value || std::is_same<T, std::string_view>::value ||
                                       std::is_same<T, const char*>::value || std::is_same<T, char*>::value> {};

template <class T>
struct is_char_array : std::false_type {};
template <std::size_t N>
struct is_char_array<char[N]> : std::true_type {};

template <class T>
struct is_text_list : std::false_type {};
template <class A>
struct is_text_list<std::vector<std::string, A>> : std::true_type {};
template <class A>
struct is_text_list<std::vector<std::string_view, A>> : std::true_type {};

template <class T>
struct is_tree_value
    : std::integral_constant<bool, std::is_same<T, value>::value || std::is_same<T, value*>::value ||
                                       std::is_same<T, const value*>::value> {};

template <class T, class = void>
struct is_streamable : std::false_type {};
template <class T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

// Closed set of source kinds accepted by coerce_string().
enum class coerce_class { boolean, integer, floating, text, text_list, empty, optional, tree_value, streamable, unsupported };

template <class T>
constexpr coerce_class classify() noexcept {
  using U = std::remove_cv_t<std::remove_reference_t<T>>;
  if constexpr (std::is_same_v<U, bool>) return coerce_class::boolean;
  else if constexpr (detail::is_char_type<U>::value) return coerce_class::unsupported;
  else if constexpr (detail::is_integer_type<U>::value) return coerce_class::integer;
  else if constexpr (std::is_floating_point_v<U>) return coerce_class::floating;
  else if constexpr (std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::nullopt_t>) return coerce_class::empty;
  else if constexpr (detail::is_text<U>::value || detail::is_char_array<U>::value) return coerce_class::text;
  else if constexpr (detail::is_text_list<U>::value) return coerce_class::text_list;
  else if constexpr (detail::is_optional<U>::value) return coerce_class::optional;
  else if constexpr (detail::is_tree_value<U>::value) return coerce_class::tree_value;
  else if constexpr (std::is_pointer_v<U> || std::is_member_pointer_v<U> || std::is_enum_v<U>)
    return coerce_class::unsupported;
  else if constexpr (detail::is_streamable<U>::value) return coerce_class::streamable;
  else return coerce_class::unsupported;
}

// Display string for an externally typed value. Types outside the closed set fail with
// unsupported_type naming the type.
template <class T>
result<std::string> coerce_string(const T& v) {
  result<std::string> r;
  constexpr coerce_class cls = classify<T>();
  if constexpr (cls == coerce_class::boolean) {
    r.val = v ? "true" : "false";
  } else if constexpr (cls == coerce_class::integer) {
    if constexpr (std::is_same_v<std::remove_cv_t<T>, integer_t>) {
      detail::dump_integer(r.val, v);
    } else {
      char buf[48];
      auto tc = std::to_chars(buf, buf + sizeof(buf), v);
      r.val.assign(buf, static_cast<std::size_t>(tc.ptr - buf));
    }
  } else if constexpr (cls == coerce_class::floating) {
    detail::append_plain_float(r.val, static_cast<double>(v));
  } else if constexpr (cls == coerce_class::text) {
    if constexpr (std::is_pointer_v<std::remove_cv_t<T>>) {
      if (v != nullptr) r.val = v;
    } else {
      r.val = std::string(std::string_view(v));
    }
  } else if constexpr (cls == coerce_class::text_list) {
    bool first = true;
    for (const auto& s : v) {
      if (!first) r.val.push_back('\n');
      r.val.append(s.data(), s.size());
      first = false;
    }
  } else if constexpr (cls == coerce_class::empty) {
    (void)v;
  } else if constexpr (cls == coerce_class::optional) {
    if (v.has_value()) return coerce_string(*v);
  } else if constexpr (cls == coerce_class::tree_value) {
    if constexpr (std::is_pointer_v<std::remove_cv_t<T>>) {
      if (v != nullptr) r.val = v->to_string();
    } else {
      r.val = v.to_string();
    }
  } else if constexpr (cls == coerce_class::streamable) {
    std::ostringstream os;
    os << v;
    r.val = os.str();
  } else {
    (void)v;
    r.err = make_error(error_code::unsupported_type, detail::type_name<T>());
  }
  return r;
}

namespace detail {

template <class T>
bool fits(integer_t v) noexcept {
  if constexpr (std::is_same_v<T, integer_t> || sizeof(T) >= sizeof(integer_t)) {
    return std::is_signed_v<T> || std::is_same_v<T, integer_t> || v >= 0;
  } else if constexpr (std::is_signed_v<T>) {
    return v >= static_cast<integer_t>((std::numeric_limits<T>::min)()) &&
           v <= static_cast<integer_t>((std::numeric_limits<T>::max)());
  } else {
    return v >= 0 && static_cast<uinteger_t>(v) <= static_cast<uinteger_t>((std::numeric_limits<T>::max)());
  }
}

// Convert a resolved value to T. `missing` is the code used when `v` is null.
template <class T>
result<T> coerce_value(value* v, std::string_view name, error_code missing) {
  result<T> r;
  if (v == nullptr) {
    r.err = make_error(missing, name);
    return r;
  }
  auto mismatch = [&r, name]() { r.err = make_error(error_code::unknown_reference, name); };

  if constexpr (std::is_same_v<T, value*>) {
    r.val = v;
  } else if constexpr (std::is_same_v<T, bool>) {
    if (v->is_boolean()) r.val = v->as_boolean();
    else mismatch();
  } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
    if (v->is_string()) r.val = T(v->as_string());
    else mismatch();
  } else if constexpr (is_integer_type<T>::value) {
    if (!v->is_integer()) {
      mismatch();
    } else if (!fits<T>(v->as_integer())) {
      r.err = make_error(error_code::number_out_of_range, name);
    } else {
      r.val = static_cast<T>(v->as_integer());
    }
  } else if constexpr (std::is_floating_point_v<T>) {
    if (v->is_float()) r.val = static_cast<T>(v->as_float());
    else mismatch();
  } else {
    static_assert(always_false<T>::value, "vtree: unsupported target type for coercion");
  }
  return r;
}

} // namespace detail

template <class T>
result<T> store::get_coerce(std::string_view path) const {
  return detail::coerce_value<T>(get_value(path), path, error_code::unknown_reference);
}

template <class T>
result<T> store::get_const(std::string_view name) const {
  auto it = constants_.find(std::string(name));
  value* v = (it == constants_.end()) ? nullptr : it->second;
  return detail::coerce_value<T>(v, name, error_code::missing_constant);
}

// -----------------------------
// Text helpers for render routines
// -----------------------------

// Trim ASCII whitespace from both ends.
inline std::string_view strip(std::string_view s) noexcept {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && (detail::is_ws(s[b]) || s[b] == '\v' || s[b] == '\f')) ++b;
  while (e > b && (detail::is_ws(s[e - 1]) || s[e - 1] == '\v' || s[e - 1] == '\f')) --e;
  return s.substr(b, e - b);
}

// Drop one trailing line terminator.
inline std::string_view chomp(std::string_view s) noexcept {
  if (detail::ends_with(s, "\r\n")) return s.substr(0, s.size() - 2);
  if (detail::ends_with(s, "\n")) return s.substr(0, s.size() - 1);
  return s;
}

// Standalone decode: a fresh store holding the parsed tree as its root.
inline std::unique_ptr<store> parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto st = std::make_unique<store>();
  st->from_json_or_throw(json, opt);
  return st;
}

} // namespace vtree
