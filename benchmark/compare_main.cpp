#include <streamjson/streamjson.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/document.h>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

std::string make_payload(std::size_t n_objects, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_objects * (str_len + 64));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";
    for (std::size_t k = 0; k < str_len; ++k) s.push_back(static_cast<char>(ch(rng)));
    if ((i % 16) == 0) s += "\\n\\u4F60\\u597D";
    s += "\",\"val\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += "}";
  }
  s.push_back(']');
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s)" << "\n";
}

// -----------------------------
// Whole document at once
// -----------------------------

bench_result bench_streamjson_parse(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    streamjson::parser p;
    p.append(json);
    do_not_optimize(p.is_completed());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_nlohmann_parse(std::string_view json_text, std::size_t iters) {
  using nlohmann::json;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    json j = json::parse(json_text, /*callback=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/false);
    do_not_optimize(j.is_discarded());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

Json::CharReaderBuilder jsoncpp_builder() {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = true;
  return builder;
}

bench_result bench_jsoncpp_parse(std::string_view json, std::size_t iters) {
  const Json::CharReaderBuilder builder = jsoncpp_builder();

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Json::Value root;
    std::string errs;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    const bool ok = reader->parse(json.data(), json.data() + json.size(), &root, &errs);
    do_not_optimize(ok);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_rapidjson_parse(std::string_view json_text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    rapidjson::Document d;
    d.Parse(json_text.data(), json_text.size());
    do_not_optimize(d.HasParseError());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

// -----------------------------
// Polling a growing stream
// -----------------------------
// A consumer looks at the document after every chunk. Batch parsers re-parse the whole
// received prefix each time; streamjson folds in only the new bytes.

bench_result bench_streamjson_poll(std::string_view json, std::size_t chunk) {
  const auto t0 = clock_type::now();
  streamjson::parser p;
  std::size_t seen = 0;
  for (std::size_t off = 0; off < json.size(); off += chunk) {
    p.append(json.substr(off, chunk));
    if (const streamjson::node* root = p.root()) seen += root->size();
  }
  do_not_optimize(seen);
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size()};
}

bench_result bench_nlohmann_poll(std::string_view json, std::size_t chunk) {
  const auto t0 = clock_type::now();
  std::size_t seen = 0;
  for (std::size_t off = 0; off < json.size(); off += chunk) {
    const std::size_t end = std::min(json.size(), off + chunk);
    auto j = nlohmann::json::parse(json.substr(0, end), nullptr, false, false);
    if (!j.is_discarded()) seen += j.size();
  }
  do_not_optimize(seen);
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size()};
}

bench_result bench_jsoncpp_poll(std::string_view json, std::size_t chunk) {
  const Json::CharReaderBuilder builder = jsoncpp_builder();
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  const auto t0 = clock_type::now();
  std::size_t seen = 0;
  for (std::size_t off = 0; off < json.size(); off += chunk) {
    const std::size_t end = std::min(json.size(), off + chunk);
    Json::Value root;
    std::string errs;
    if (reader->parse(json.data(), json.data() + end, &root, &errs)) seen += root.size();
  }
  do_not_optimize(seen);
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size()};
}

bench_result bench_rapidjson_poll(std::string_view json, std::size_t chunk) {
  const auto t0 = clock_type::now();
  std::size_t seen = 0;
  for (std::size_t off = 0; off < json.size(); off += chunk) {
    const std::size_t end = std::min(json.size(), off + chunk);
    rapidjson::Document d;
    d.Parse(json.data(), end);
    if (!d.HasParseError() && d.IsArray()) seen += d.Size();
  }
  do_not_optimize(seen);
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size()};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 200;
  std::size_t runs = 5;
  std::size_t chunk = 4096;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));
  if (argc >= 5) chunk = std::max<std::size_t>(1, static_cast<std::size_t>(std::stoull(argv[4])));

  const std::string payload = make_payload(n_objects, 24);
  std::cout << "payload bytes: " << payload.size() << ", chunk: " << chunk << "\n";

  // Warm-up
  {
    streamjson::parser p;
    p.append(payload);
    if (!p.is_completed()) {
      std::cerr << "streamjson: payload did not complete\n";
      return 1;
    }
  }
  {
    auto j = nlohmann::json::parse(payload, nullptr, false, false);
    do_not_optimize(j.type());
  }
  {
    rapidjson::Document d;
    d.Parse(payload.data(), payload.size());
    do_not_optimize(d.GetType());
  }

  std::cout << "\n== Parse (whole document) ==\n";
  print_mbps("streamjson parse", run_median(runs, [&] { return bench_streamjson_parse(payload, iters); }));
  print_mbps("nlohmann parse", run_median(runs, [&] { return bench_nlohmann_parse(payload, iters); }));
  print_mbps("jsoncpp parse", run_median(runs, [&] { return bench_jsoncpp_parse(payload, iters); }));
  print_mbps("rapidjson parse", run_median(runs, [&] { return bench_rapidjson_parse(payload, iters); }));

  std::cout << "\n== Poll after every chunk ==\n";
  print_mbps("streamjson append", run_median(runs, [&] { return bench_streamjson_poll(payload, chunk); }));
  print_mbps("nlohmann re-parse", run_median(runs, [&] { return bench_nlohmann_poll(payload, chunk); }));
  print_mbps("jsoncpp re-parse", run_median(runs, [&] { return bench_jsoncpp_poll(payload, chunk); }));
  print_mbps("rapidjson re-parse", run_median(runs, [&] { return bench_rapidjson_poll(payload, chunk); }));

  return 0;
}
