#include <vtree/vtree.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <json/json.h>

#include <rapidjson/document.h>
#include <rapidjson/pointer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

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

std::string make_payload(std::size_t n_records) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_records * 128);
  s.push_back('[');
  for (std::size_t i = 0; i < n_records; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"active\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";
    for (std::size_t k = 0; k < 24; ++k) s.push_back(static_cast<char>(ch(rng)));
    if ((i % 16) == 0) s += "\\n\\u4F60\\u597D";
    s += "\",\"score\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "0.5";
    s += ",\"owner\":{\"email\":\"x@example.com\"}}";
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

[[noreturn]] void die(const char* what) {
  std::cerr << what << "\n";
  std::exit(1);
}

std::unique_ptr<Json::CharReader> make_jsoncpp_reader() {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = true;
  return std::unique_ptr<Json::CharReader>(builder.newCharReader());
}

// -- parse --

bench_result bench_vtree_parse(vtree::store& st, std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    st.reset();
    const vtree::error e = st.from_json(json);
    do_not_optimize(e.code);
    do_not_optimize(st.root());
  }
  return {elapsed(t0), json.size() * iters};
}

bench_result bench_nlohmann_parse(std::string_view json_text, std::size_t iters) {
  using nlohmann::json;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    json j = json::parse(json_text, /*callback=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/false);
    do_not_optimize(j.is_discarded());
  }
  return {elapsed(t0), json_text.size() * iters};
}

bench_result bench_jsoncpp_parse(std::string_view json, std::size_t iters) {
  const auto reader = make_jsoncpp_reader();
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Json::Value root;
    std::string errs;
    const bool ok = reader->parse(json.data(), json.data() + json.size(), &root, &errs);
    do_not_optimize(ok);
  }
  return {elapsed(t0), json.size() * iters};
}

bench_result bench_rapidjson_parse(std::string_view json_text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    rapidjson::Document d;
    d.Parse(json_text.data(), json_text.size());
    do_not_optimize(d.HasParseError());
  }
  return {elapsed(t0), json_text.size() * iters};
}

// -- dump --

bench_result bench_vtree_dump(std::string_view json, std::size_t iters) {
  vtree::store st;
  if (st.from_json(json)) die("vtree: input parse failed");

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    const std::string out = st.to_json();
    bytes += out.size();
    do_not_optimize(out.size());
  }
  return {elapsed(t0), bytes};
}

bench_result bench_nlohmann_dump(std::string_view json_text, std::size_t iters) {
  const nlohmann::json j = nlohmann::json::parse(json_text, nullptr, false, false);
  if (j.is_discarded()) die("nlohmann: input parse failed");

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    const std::string out = j.dump();
    bytes += out.size();
    do_not_optimize(out.size());
  }
  return {elapsed(t0), bytes};
}

bench_result bench_jsoncpp_dump(std::string_view json_text, std::size_t iters) {
  Json::Value root;
  std::string errs;
  if (!make_jsoncpp_reader()->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errs)) {
    die("jsoncpp: input parse failed");
  }

  Json::StreamWriterBuilder wb;
  wb["indentation"] = "";
  wb["emitUTF8"] = true;
  wb["precision"] = 17;
  wb["precisionType"] = "significant";

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    const std::string out = Json::writeString(wb, root);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  return {elapsed(t0), bytes};
}

bench_result bench_rapidjson_dump(std::string_view json_text, std::size_t iters) {
  rapidjson::Document d;
  d.Parse(json_text.data(), json_text.size());
  if (d.HasParseError()) die("rapidjson: input parse failed");

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    d.Accept(w);
    bytes += sb.GetSize();
    do_not_optimize(sb.GetSize());
  }
  return {elapsed(t0), bytes};
}

// -- lookup by path, each library in its own path syntax --

bench_result bench_vtree_lookup(std::string_view json, std::size_t n_records, std::size_t iters) {
  vtree::store st;
  if (st.from_json(json)) die("vtree: input parse failed");
  std::vector<std::string> paths;
  for (std::size_t i = 0; i < n_records; ++i) paths.push_back(std::to_string(i) + ".owner.email");

  const auto t0 = clock_type::now();
  std::size_t hits = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    for (const auto& p : paths) hits += (st.get_value(p) != nullptr);
  }
  do_not_optimize(hits);
  return {elapsed(t0), paths.size() * iters};
}

bench_result bench_nlohmann_lookup(std::string_view json_text, std::size_t n_records, std::size_t iters) {
  const nlohmann::json j = nlohmann::json::parse(json_text, nullptr, false, false);
  if (j.is_discarded()) die("nlohmann: input parse failed");
  std::vector<nlohmann::json::json_pointer> paths;
  for (std::size_t i = 0; i < n_records; ++i) {
    paths.emplace_back("/" + std::to_string(i) + "/owner/email");
  }

  const auto t0 = clock_type::now();
  std::size_t hits = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    for (const auto& p : paths) hits += j.contains(p) ? 1u : 0u;
  }
  do_not_optimize(hits);
  return {elapsed(t0), paths.size() * iters};
}

bench_result bench_jsoncpp_lookup(std::string_view json_text, std::size_t n_records, std::size_t iters) {
  Json::Value root;
  std::string errs;
  if (!make_jsoncpp_reader()->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errs)) {
    die("jsoncpp: input parse failed");
  }
  std::vector<Json::Path> paths;
  for (std::size_t i = 0; i < n_records; ++i) {
    paths.emplace_back("[" + std::to_string(i) + "].owner.email");
  }

  const auto t0 = clock_type::now();
  std::size_t hits = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    for (const auto& p : paths) hits += p.resolve(root).isNull() ? 0u : 1u;
  }
  do_not_optimize(hits);
  return {elapsed(t0), paths.size() * iters};
}

bench_result bench_rapidjson_lookup(std::string_view json_text, std::size_t n_records, std::size_t iters) {
  rapidjson::Document d;
  d.Parse(json_text.data(), json_text.size());
  if (d.HasParseError()) die("rapidjson: input parse failed");
  std::vector<rapidjson::Pointer> paths;
  for (std::size_t i = 0; i < n_records; ++i) {
    const std::string p = "/" + std::to_string(i) + "/owner/email";
    paths.emplace_back(p.c_str(), p.size());
  }

  const auto t0 = clock_type::now();
  std::size_t hits = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    for (const auto& p : paths) hits += (p.Get(d) != nullptr);
  }
  do_not_optimize(hits);
  return {elapsed(t0), paths.size() * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_records = 2000;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_records = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  std::cout << "sizeof(vtree::value): " << sizeof(vtree::value) << "\n";
  std::cout << "sizeof(rapidjson::Value): " << sizeof(rapidjson::Value) << "\n";

  const std::string payload = make_payload(n_records);
  std::cout << "payload bytes: " << payload.size() << "\n";

  vtree::store st;
  st.arena().reserve_bytes(payload.size() * 8u);
  const std::size_t lookup_iters = std::max<std::size_t>(1, iters / 10);

  std::cout << "\n== Parse ==\n";
  print_mbps("vtree parse", run_median(runs, [&] { return bench_vtree_parse(st, payload, iters); }));
  print_mbps("nlohmann parse", run_median(runs, [&] { return bench_nlohmann_parse(payload, iters); }));
  print_mbps("jsoncpp parse", run_median(runs, [&] { return bench_jsoncpp_parse(payload, iters); }));
  print_mbps("rapidjson parse", run_median(runs, [&] { return bench_rapidjson_parse(payload, iters); }));
  std::cout << "vtree arena used: " << st.arena().bytes_used()
            << ", committed: " << st.arena().bytes_committed()
            << ", blocks: " << st.arena().blocks() << "\n";

  std::cout << "\n== Dump ==\n";
  print_mbps("vtree to_json", run_median(runs, [&] { return bench_vtree_dump(payload, iters); }));
  print_mbps("nlohmann dump", run_median(runs, [&] { return bench_nlohmann_dump(payload, iters); }));
  print_mbps("jsoncpp dump", run_median(runs, [&] { return bench_jsoncpp_dump(payload, iters); }));
  print_mbps("rapidjson dump", run_median(runs, [&] { return bench_rapidjson_dump(payload, iters); }));

  std::cout << "\n== Path lookup ==\n";
  print_ops("vtree get_value", run_median(runs, [&] { return bench_vtree_lookup(payload, n_records, lookup_iters); }));
  print_ops("nlohmann json_pointer", run_median(runs, [&] { return bench_nlohmann_lookup(payload, n_records, lookup_iters); }));
  print_ops("jsoncpp Path", run_median(runs, [&] { return bench_jsoncpp_lookup(payload, n_records, lookup_iters); }));
  print_ops("rapidjson Pointer", run_median(runs, [&] { return bench_rapidjson_lookup(payload, n_records, lookup_iters); }));

  return 0;
}
