#include "test_common.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

using namespace vtree;

namespace {

struct point {
  int x;
  int y;
};

std::ostream& operator<<(std::ostream& os, const point& p) {
  return os << "(" << p.x << ", " << p.y << ")";
}

struct opaque {
  int id;
};

enum color { red, green };
enum class shade { light, dark };

template <class T>
std::string coerced(const T& v) {
  auto r = coerce_string(v);
  vtree_test::check_ok(r.err);
  return r.val;
}

} // namespace

static void test_coerce_string_closed_set() {
  VTREE_CHECK(coerced(true) == "true");
  VTREE_CHECK(coerced(false) == "false");
  VTREE_CHECK(coerced(42) == "42");
  VTREE_CHECK(coerced(-7L) == "-7");
  VTREE_CHECK(coerced(std::uint64_t{18446744073709551615ull}) == "18446744073709551615");
  VTREE_CHECK(coerced(std::uint8_t{7}) == "7");
  VTREE_CHECK(coerced(std::int8_t{-3}) == "-3");
  VTREE_CHECK(coerced(integer_t{-9000}) == "-9000");
  VTREE_CHECK(coerced(2.5) == "2.5");
  VTREE_CHECK(coerced(0.25f) == "0.25");
  VTREE_CHECK(coerced(std::string("text")) == "text");
  VTREE_CHECK(coerced(std::string_view("view")) == "view");
  VTREE_CHECK(coerced("literal") == "literal");
  const char* cstr = "pointer";
  VTREE_CHECK(coerced(cstr) == "pointer");
  const char* null_cstr = nullptr;
  VTREE_CHECK(coerced(null_cstr).empty());
  VTREE_CHECK(coerced(nullptr).empty());
  VTREE_CHECK(coerced(std::nullopt).empty());

  VTREE_CHECK(coerced(std::vector<std::string>{"a", "b", "c"}) == "a\nb\nc");
  VTREE_CHECK(coerced(std::vector<std::string_view>{"one"}) == "one");
  VTREE_CHECK(coerced(std::vector<std::string>{}).empty());

  VTREE_CHECK(coerced(std::optional<int>(5)) == "5");
  VTREE_CHECK(coerced(std::optional<int>()).empty());
  VTREE_CHECK(coerced(std::optional<std::string>("x")) == "x");

  VTREE_CHECK(coerced(point{1, 2}) == "(1, 2)");
}

static void test_coerce_tree_values() {
  store st;
  value* n = st.make_integer(12);
  const value* cn = n;
  value* none = nullptr;
  VTREE_CHECK(coerced(n) == "12");
  VTREE_CHECK(coerced(cn) == "12");
  VTREE_CHECK(coerced(*n) == "12");
  VTREE_CHECK(coerced(none).empty());
  VTREE_CHECK(coerced(st.create_object()).empty());
}

static void test_coerce_string_rejects_unknown_types() {
  {
    auto r = coerce_string(opaque{1});
    vtree_test::check_err(r.err, error_code::unsupported_type);
    VTREE_CHECK(r.err.detail.find("opaque") != std::string::npos);
    VTREE_CHECK(r.val.empty());
  }
  {
    // Single characters are ambiguous between text and number.
    auto r = coerce_string('c');
    vtree_test::check_err(r.err, error_code::unsupported_type);
  }
  {
    auto r = coerce_string(std::vector<int>{1, 2});
    vtree_test::check_err(r.err, error_code::unsupported_type);
  }
  {
    auto r = coerce_string(std::optional<opaque>(opaque{2}));
    vtree_test::check_err(r.err, error_code::unsupported_type);
  }
  {
    // Pointers other than C strings and tree values have no display form.
    int x = 5;
    auto r = coerce_string(&x);
    vtree_test::check_err(r.err, error_code::unsupported_type);
    VTREE_CHECK(r.val.empty());
  }
  {
    store st;
    value* obj = st.create_object();
    value* arr = st.create_array();
    auto ro = coerce_string(&obj->as_object());
    vtree_test::check_err(ro.err, error_code::unsupported_type);
    auto ra = coerce_string(&arr->as_array());
    vtree_test::check_err(ra.err, error_code::unsupported_type);
  }
  {
    auto r = coerce_string(green);
    vtree_test::check_err(r.err, error_code::unsupported_type);
    auto rs = coerce_string(shade::dark);
    vtree_test::check_err(rs.err, error_code::unsupported_type);
  }
  static_assert(classify<bool>() == coerce_class::boolean, "bool");
  static_assert(classify<const std::string&>() == coerce_class::text, "string");
  static_assert(classify<char>() == coerce_class::unsupported, "char");
  static_assert(classify<wchar_t>() == coerce_class::unsupported, "wchar_t");
  static_assert(classify<unsigned char>() == coerce_class::integer, "unsigned char");
  static_assert(classify<const void*>() == coerce_class::unsupported, "void*");
  static_assert(classify<color>() == coerce_class::unsupported, "enum");
  static_assert(classify<opaque>() == coerce_class::unsupported, "opaque");
}

static void test_get_coerce() {
  store st;
  vtree_test::check_ok(st.from_json(R"({"name":"Ada","age":36,"ratio":0.5,"admin":true,"big":100000,"neg":-1,"user":{"id":7}})"));

  VTREE_CHECK(st.get_coerce<std::string>("name").val == "Ada");
  VTREE_CHECK(st.get_coerce<std::string_view>("name").val == "Ada");
  VTREE_CHECK(st.get_coerce<std::int64_t>("age").val == 36);
  VTREE_CHECK(st.get_coerce<int>("user.id").val == 7);
  VTREE_CHECK(st.get_coerce<double>("ratio").val == 0.5);
  VTREE_CHECK(st.get_coerce<float>("ratio").val == 0.5f);
  VTREE_CHECK(st.get_coerce<bool>("admin").val == true);
  VTREE_CHECK(st.get_coerce<value*>("user").val->is_object());

  // Kind mismatch reads as an unresolved reference.
  vtree_test::check_err(st.get_coerce<int>("name").err, error_code::unknown_reference);
  vtree_test::check_err(st.get_coerce<double>("age").err, error_code::unknown_reference);
  vtree_test::check_err(st.get_coerce<std::string>("age").err, error_code::unknown_reference);
  vtree_test::check_err(st.get_coerce<bool>("name").err, error_code::unknown_reference);
  vtree_test::check_err(st.get_coerce<int>("nope").err, error_code::unknown_reference);

  // Narrowing never wraps.
  vtree_test::check_err(st.get_coerce<std::int16_t>("big").err, error_code::number_out_of_range);
  vtree_test::check_err(st.get_coerce<unsigned>("neg").err, error_code::number_out_of_range);
  VTREE_CHECK(st.get_coerce<std::int16_t>("age").val == 36);
  VTREE_CHECK(st.get_coerce<std::uint8_t>("age").val == 36);
  vtree_test::check_err(st.get_coerce<std::uint8_t>("big").err, error_code::number_out_of_range);

#if VTREE_HAS_INT128
  // Integers wider than 64 bits decode, and only narrow where they fit.
  vtree_test::check_ok(st.from_json(R"({"wide":9223372036854775808})"));
  vtree_test::check_err(st.get_coerce<std::int64_t>("wide").err, error_code::number_out_of_range);
  VTREE_CHECK(st.get_coerce<std::uint64_t>("wide").val == 9223372036854775808ull);
  VTREE_CHECK(st.get_coerce<integer_t>("wide").val == static_cast<integer_t>(9223372036854775808ull));
#endif

  VTREE_CHECK(st.get_coerce_or_throw<std::string>("name") == "Ada");
  VTREE_EXPECT_THROW(vtree::exception, st.get_coerce_or_throw<int>("nope"));
}

static void test_constants() {
  store st;
  st.add_const("limit", st.make_integer(10));
  st.add_const("label", st.make_string("Total"));
  st.add_const("empty", nullptr);

  VTREE_CHECK(st.has_const("limit"));
  VTREE_CHECK(st.get_const<int>("limit").val == 10);
  VTREE_CHECK(st.get_const<std::string>("label").val == "Total");
  VTREE_CHECK(st.get_const<value*>("empty").val->is_null());

  auto missing = st.get_const<int>("nope");
  vtree_test::check_err(missing.err, error_code::missing_constant);
  VTREE_CHECK(missing.err.detail == "nope");
  vtree_test::check_err(st.get_const<int>("label").err, error_code::unknown_reference);

  // Later registration replaces the earlier one.
  st.add_const("limit", st.make_integer(20));
  VTREE_CHECK(st.get_const<std::int64_t>("limit").val == 20);

  // Constants are not part of the tree.
  VTREE_CHECK(st.get_value("limit") == nullptr);
}

void test_coerce() {
  test_coerce_string_closed_set();
  test_coerce_tree_values();
  test_coerce_string_rejects_unknown_types();
  test_get_coerce();
  test_constants();
}
