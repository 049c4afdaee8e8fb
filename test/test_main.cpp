#include "test_common.hpp"

#include <iostream>

void test_store();
void test_tree();
void test_path();
void test_numbers();
void test_strings();
void test_errors();
void test_structure();
void test_coerce();
void test_output();
void test_registry();
void test_random();

static void test_smoke() {
  using namespace vtree;

  store st;
  value* root = st.make_object();
  value* user = st.create_object();
  user->put("name", st.make_string("Ada"));
  root->put("user", user);
  root->put("visits", st.make_integer(3));

  VTREE_CHECK(st.get_value("user.name")->as_string() == "Ada");
  VTREE_CHECK(st.to_json() == R"({"user":{"name":"Ada"},"visits":3})");

  store back;
  vtree_test::check_ok(back.from_json(st.to_json()));
  VTREE_CHECK(back.root()->eql(*root));
}

int main() {
  test_smoke();
  test_store();
  test_tree();
  test_path();
  test_numbers();
  test_strings();
  test_errors();
  test_structure();
  test_coerce();
  test_output();
  test_registry();
  test_random();

  std::cout << "vtree tests passed\n";
  return 0;
}
