#include "test_common.hpp"

#include <string>

using namespace vtree;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

std::string random_string(rng& r, std::size_t max_len) {
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    switch (r.next_u32() % 16u) {
      case 0: out.push_back('"'); break;
      case 1: out.push_back('\\'); break;
      case 2: out.push_back('\n'); break;
      case 3: out.push_back('.'); break;
      case 4: out.push_back(static_cast<char>(r.next_u32() % 0x20u)); break;
      default: out.push_back(static_cast<char>(' ' + (r.next_u32() % 95u))); break;
    }
  }
  return out;
}

value* random_value(store& st, rng& r, int depth);

value* random_scalar(store& st, rng& r) {
  switch (r.next_u32() % 5u) {
    case 0: return st.make_null();
    case 1: return st.make_boolean(r.coin());
    case 2: return st.make_integer(static_cast<std::int64_t>(r.next_u64()));
    case 3: {
      const double base = static_cast<double>(static_cast<std::int32_t>(r.next_u32() % 2000000u) - 1000000);
      return st.make_float(base / 1024.0);
    }
    default: return st.make_string(random_string(r, 20));
  }
}

value* random_value(store& st, rng& r, int depth) {
  if (depth <= 0) return random_scalar(st, r);
  switch (r.next_u32() % 3u) {
    case 0: {
      value* a = st.create_array();
      const std::size_t n = r.range(8);
      for (std::size_t i = 0; i < n; ++i) a->append(random_value(st, r, depth - 1));
      return a;
    }
    case 1: {
      value* o = st.create_object();
      const std::size_t n = r.range(8);
      for (std::size_t i = 0; i < n; ++i) o->put(random_string(r, 10), random_value(st, r, depth - 1));
      return o;
    }
    default:
      return random_scalar(st, r);
  }
}

} // namespace

void test_random() {
  rng r;
  store src;
  store dst;
  // Deterministic pseudo-fuzz: build random trees, encode, decode into another store and compare.
  for (int iter = 0; iter < 1000; ++iter) {
    src.reset();
    dst.reset();

    value* root = r.coin() ? src.make_object() : src.make_array();
    const std::size_t n = r.range(6);
    for (std::size_t i = 0; i < n; ++i) {
      if (root->is_object()) root->put(random_string(r, 8), random_value(src, r, 3));
      else root->append(random_value(src, r, 3));
    }

    const std::string compact = src.to_json();
    vtree_test::check_ok(dst.from_json(compact));
    VTREE_CHECK(dst.root()->eql(*root));
    VTREE_CHECK(root->eql(*dst.root()));

    // Encoding is idempotent under decode/encode.
    VTREE_CHECK(dst.to_json() == compact);

    value* pretty_copy = dst.parse_value(src.to_pretty_json()).val;
    VTREE_CHECK(pretty_copy != nullptr);
    VTREE_CHECK(pretty_copy->eql(*root));

    value* cloned = root->clone(dst);
    VTREE_CHECK(cloned->eql(*root));
  }
}
