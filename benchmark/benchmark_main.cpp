#include <vtree/vtree.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock_type = std::chrono::steady_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

// Array of records shaped like typical view data.
std::string make_payload(std::size_t n_records, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_records * (str_len + 96));
  s.push_back('[');
  for (std::size_t i = 0; i < n_records; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"active\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";
    for (std::size_t k = 0; k < str_len; ++k) s.push_back(static_cast<char>(ch(rng)));
    if ((i % 16) == 0) s += "\\n\\u4F60\\u597D";
    s += "\",\"score\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "0.5";
    s += ",\"tags\":[\"a\",\"b\"],\"owner\":{\"email\":\"x@example.com\"}}";
  }
  s.push_back(']');
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t units{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<bench_result> all;
  all.reserve(runs);
  for (std::size_t r = 0; r < runs; ++r) all.push_back(fn());
  std::nth_element(all.begin(), all.begin() + (all.size() / 2), all.end(),
                   [](const bench_result& a, const bench_result& b) { return a.seconds < b.seconds; });
  return all[all.size() / 2];
}

double elapsed(clock_type::time_point t0) {
  return std::chrono::duration<double>(clock_type::now() - t0).count();
}

void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.units) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s)\n";
}

void print_ops(const char* name, const bench_result& r) {
  const double mops = (r.seconds > 0.0) ? (static_cast<double>(r.units) / r.seconds / 1e6) : 0.0;
  std::cout << name << ": " << mops << " Mops/s (" << r.seconds << " s)\n";
}

[[noreturn]] void die(const char* what, const vtree::error& e) {
  std::cerr << what << ": " << vtree::describe(e) << "\n";
  std::exit(1);
}

// A fresh store per document.
bench_result bench_parse_fresh(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    vtree::store st;
    const vtree::error e = st.from_json(json);
    do_not_optimize(e.code);
    do_not_optimize(st.root());
  }
  return {elapsed(t0), json.size() * iters};
}

// One store reset between documents, so arena blocks are reused.
bench_result bench_parse_reuse(vtree::store& st, std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    st.reset();
    const vtree::error e = st.from_json(json);
    do_not_optimize(e.code);
    do_not_optimize(st.root());
  }
  return {elapsed(t0), json.size() * iters};
}

bench_result bench_dump(std::string_view json, std::size_t iters, bool pretty) {
  vtree::store st;
  if (vtree::error e = st.from_json(json)) die("input parse failed", e);

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    const std::string out = pretty ? st.to_pretty_json() : st.to_json();
    bytes += out.size();
    do_not_optimize(out.size());
  }
  return {elapsed(t0), bytes};
}

bench_result bench_path_lookup(std::string_view json, std::size_t n_records, std::size_t iters) {
  vtree::store st;
  if (vtree::error e = st.from_json(json)) die("input parse failed", e);

  std::vector<std::string> paths;
  paths.reserve(n_records * 2);
  for (std::size_t i = 0; i < n_records; ++i) {
    paths.push_back(std::to_string(i) + ".name");
    paths.push_back(std::to_string(i) + ".owner.email");
  }

  const auto t0 = clock_type::now();
  std::size_t hits = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    for (const auto& p : paths) {
      const vtree::value* v = st.get_value(p);
      hits += (v != nullptr);
    }
  }
  do_not_optimize(hits);
  return {elapsed(t0), paths.size() * iters};
}

// Resolve, coerce and write, the way generated render code drives a store.
bench_result bench_render(std::string_view json, std::size_t n_records, std::size_t iters) {
  vtree::store st;
  if (vtree::error e = st.from_json(json)) die("input parse failed", e);

  std::vector<std::string> paths;
  paths.reserve(n_records);
  for (std::size_t i = 0; i < n_records; ++i) paths.push_back(std::to_string(i) + ".id");

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    st.clear_output();
    for (const auto& p : paths) {
      auto r = st.get_value_string(p);
      if (r.err) die("render failed", r.err);
      st.write("<td>");
      st.write(r.val);
      st.write("</td>\n");
    }
    st.chomp_output_buffer();
    bytes += st.output().size();
  }
  do_not_optimize(bytes);
  return {elapsed(t0), paths.size() * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_records = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_records = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_records, str_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  {
    vtree::store st;
    if (vtree::error e = st.from_json(payload)) die("warm-up parse failed", e);
    do_not_optimize(st.root());
  }

  print_mbps("parse(fresh store)", run_median(runs, [&] { return bench_parse_fresh(payload, iters); }));

  vtree::store reused;
  reused.arena().reserve_bytes(payload.size() * 8u);
  print_mbps("parse(reset store)", run_median(runs, [&] { return bench_parse_reuse(reused, payload, iters); }));
  // Read stats after timing to avoid affecting the measured parse throughput.
  std::cout << "arena used bytes: " << reused.arena().bytes_used()
            << ", committed bytes: " << reused.arena().bytes_committed()
            << ", blocks: " << reused.arena().blocks() << "\n";

  print_mbps("to_json", run_median(runs, [&] { return bench_dump(payload, iters, false); }));
  print_mbps("to_pretty_json", run_median(runs, [&] { return bench_dump(payload, iters, true); }));

  const std::size_t lookup_iters = std::max<std::size_t>(1, iters / 10);
  print_ops("get_value", run_median(runs, [&] { return bench_path_lookup(payload, n_records, lookup_iters); }));
  print_ops("get_value_string+write", run_median(runs, [&] { return bench_render(payload, n_records, lookup_iters); }));

  return 0;
}
