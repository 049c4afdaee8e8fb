#include "test_common.hpp"

#include <vtree/registry.hpp>

#include <string>

using namespace vtree;

static error render_greeting(store& st) {
  auto name = st.get_value_string("name");
  if (name.err) return name.err;
  st.write("\nHello, ");
  st.write(name.val);
  st.write("!\n");
  return error{};
}

static void test_template_key() {
  VTREE_CHECK(template_key("src/app/views", "src/app/views/users/index.zmpl") == "users/index");
  VTREE_CHECK(template_key("src/app/views/", "src/app/views/index.html") == "index");
  VTREE_CHECK(template_key("views", "views\\admin\\edit.zmpl") == "admin/edit");
  VTREE_CHECK(template_key("", "/layouts/main.zmpl") == "layouts/main");
  VTREE_CHECK(template_key("views", "views/.hidden") == ".hidden");
  VTREE_CHECK(template_key("views", "views/partials/_row") == "partials/_row");
  // A root that is only a name prefix of a directory is not stripped.
  VTREE_CHECK(template_key("view", "views/a.zmpl") == "views/a");
}

static void test_validate_and_find() {
  template_registry reg;
  VTREE_CHECK(reg.empty());
  reg.add("app", "users/index", render_greeting);
  reg.add("app", "users/show", render_greeting);
  reg.add("admin", "users/index", render_greeting);
  VTREE_CHECK(reg.size() == 3);
  vtree_test::check_ok(reg.validate());

  VTREE_CHECK(reg.find("users/show") != nullptr);
  VTREE_CHECK(reg.find("nope") == nullptr);
  const template_entry* admin = reg.find_prefixed("admin", "users/index");
  VTREE_CHECK(admin != nullptr);
  VTREE_CHECK(admin->prefix == "admin");
  VTREE_CHECK(reg.find_prefixed("admin", "users/show") == nullptr);

  reg.add("app", "users/show", render_greeting);
  const error e = reg.validate();
  vtree_test::check_err(e, error_code::duplicate_template);
  VTREE_CHECK(e.detail == "app:users/show");
}

static void test_render() {
  template_registry reg;
  reg.add("app", "greeting", render_greeting);

  store st;
  vtree_test::check_ok(st.from_json(R"({"name":"Ada"})"));
  st.write("stale output");

  auto r = reg.render("greeting", st);
  vtree_test::check_ok(r.err);
  VTREE_CHECK(r.val == "Hello, Ada!\n");

  vtree_test::check_err(reg.render("missing", st).err, error_code::unknown_reference);

  store empty;
  auto failed = reg.render("greeting", empty);
  vtree_test::check_err(failed.err, error_code::unknown_reference);
  VTREE_CHECK(failed.val.empty());
}

static void test_render_partial_swaps_overlay() {
  template_registry reg;
  reg.add("app", "partials/greeting", render_greeting);
  reg.add("app", "partials/broken", [](store& st) -> error {
    st.write("half");
    return make_error(error_code::unknown_reference, "missing.field");
  });
  reg.add("app", "page", [&reg](store& st) -> error {
    st.write("<main>");
    value* args = st.create_object();
    args->put("name", st.make_string("partial arg"));
    if (error e = reg.render_partial("partials/greeting", st, &args->as_object())) return e;
    st.write("</main>");
    return error{};
  });
  reg.add("app", "broken_page", [&reg](store& st) -> error {
    value* args = st.create_object();
    return reg.render_partial("partials/broken", st, &args->as_object());
  });

  store st;
  vtree_test::check_ok(st.from_json(R"({"name":"root"})"));
  value* outer = st.create_object();
  outer->put("other", st.make_integer(1));
  st.set_partial_data(&outer->as_object());

  auto r = reg.render("page", st);
  vtree_test::check_ok(r.err);
  // The partial saw its own args and its trailing newline was chomped. Its leading newline
  // stays: only the first write into the buffer is trimmed.
  VTREE_CHECK(r.val == "<main>\nHello, partial arg!</main>");
  // The previous overlay is back in place.
  VTREE_CHECK(st.partial_data() == &outer->as_object());
  VTREE_CHECK(st.get_value_string("name").val == "root");
  VTREE_CHECK(st.get_value("other")->as_integer() == 1);

  // Restored on failure too.
  auto failed = reg.render("broken_page", st);
  vtree_test::check_err(failed.err, error_code::unknown_reference);
  VTREE_CHECK(failed.err.detail == "missing.field");
  VTREE_CHECK(st.partial_data() == &outer->as_object());

  vtree_test::check_err(reg.render_partial("nope", st, nullptr), error_code::unknown_reference);
}

void test_registry() {
  test_template_key();
  test_validate_and_find();
  test_render();
  test_render_partial_swaps_overlay();
}
