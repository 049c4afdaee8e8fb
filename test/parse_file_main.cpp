#include <vtree/vtree.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

static bool slurp_file(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static void print_error(const char* path, const vtree::error& e) {
  std::cerr << "parse failed: " << path << "\n";
  std::cerr << "  " << vtree::describe(e) << "\n";
  std::cerr << "  code=" << vtree::to_string(e.code)
            << " offset=" << e.offset
            << " line=" << e.line
            << " column=" << e.column << "\n";
}

// 0 ok, 1 decode failure, 2 unreadable or empty.
static int load(const char* path, vtree::store& st, bool report) {
  std::string s;
  if (!slurp_file(path, s) || s.empty()) {
    if (report) std::cerr << "failed to read file or file is empty: " << path << "\n";
    return 2;
  }
  const vtree::error e = st.from_json(std::string_view{s.data(), s.size()});
  if (e) {
    if (report) print_error(path, e);
    return 1;
  }
  return 0;
}

static int run_list(const char* list_path) {
  std::ifstream in(list_path);
  if (!in) {
    std::cerr << "failed to read list file: " << list_path << "\n";
    return 2;
  }

  bool any_fail = false;
  bool any_io_fail = false;
  vtree::store st;
  std::string path;
  while (std::getline(in, path)) {
    if (path.empty()) continue;
    st.reset();
    const int rc = load(path.c_str(), st, false);
    if (rc == 0) {
      std::cout << path << "\tOK\n";
    } else {
      std::cout << path << "\tFAIL\n";
      any_fail = true;
      if (rc == 2) any_io_fail = true;
    }
  }
  return any_io_fail ? 2 : (any_fail ? 1 : 0);
}

static int usage() {
  std::cerr << "usage: vtree_parse_file <file.json>\n";
  std::cerr << "       vtree_parse_file --pretty <file.json>\n";
  std::cerr << "       vtree_parse_file --get <path> <file.json>\n";
  std::cerr << "       vtree_parse_file --list <paths.txt>\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc == 3 && std::string_view{argv[1]} == "--list") return run_list(argv[2]);

  vtree::store st;
  try {
    if (argc == 3 && std::string_view{argv[1]} == "--pretty") {
      const int rc = load(argv[2], st, true);
      if (rc != 0) return rc;
      std::cout << st.to_pretty_json();
      return 0;
    }

    if (argc == 4 && std::string_view{argv[1]} == "--get") {
      const int rc = load(argv[3], st, true);
      if (rc != 0) return rc;
      auto r = st.get_ref(argv[2]);
      if (r.err) {
        std::cerr << vtree::describe(r.err) << "\n";
        return 1;
      }
      if (r.val->is_container()) std::cout << r.val->to_json(true) << "\n";
      else std::cout << r.val->to_string() << "\n";
      return 0;
    }
  } catch (const vtree::exception& ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }

  if (argc != 2) return usage();
  return load(argv[1], st, true);
}
