#include <streamjson/streamjson.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

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
  s += "{\"items\":[";
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
  s += "],\"message\":\"";
  for (std::size_t k = 0; k < str_len * 64; ++k) s.push_back(static_cast<char>(ch(rng)));
  s += "\"}";
  return s;
}

// One flat object with `n_keys` members.
std::string make_wide_payload(std::size_t n_keys) {
  std::string s;
  s.reserve(n_keys * 16);
  s.push_back('{');
  for (std::size_t i = 0; i < n_keys; ++i) {
    if (i) s.push_back(',');
    s += "\"k";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += "\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
  }
  s.push_back('}');
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

// Feed the payload in `chunk`-byte slices.
bench_result bench_stream(std::string_view json, std::size_t chunk, std::size_t iters, bool decode) {
  streamjson::parser_options opt;
  opt.decode_escapes = decode;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    streamjson::parser p(opt);
    for (std::size_t off = 0; off < json.size(); off += chunk) p.append(json.substr(off, chunk));
    do_not_optimize(p.is_completed());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

// Feed in slices and query a path after each one, the way a consumer polls a stream.
bench_result bench_stream_polling(std::string_view json, std::size_t chunk, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    streamjson::parser p;
    for (std::size_t off = 0; off < json.size(); off += chunk) {
      p.append(json.substr(off, chunk));
      auto v = p.get({"message"});
      do_not_optimize(v.has_value());
    }
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_tokenize(std::string_view json, std::size_t chunk, std::size_t iters) {
  const auto t0 = clock_type::now();
  std::size_t count = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    streamjson::tokenizer t;
    for (std::size_t off = 0; off < json.size(); off += chunk) {
      t.append(json.substr(off, chunk));
      for (;;) {
        const streamjson::token tok = t.next_token();
        if (tok.kind == streamjson::token_kind::end_of_input || !tok.complete) break;
        ++count;
      }
      t.compact();
    }
  }
  do_not_optimize(count);
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

void print_mbps(const std::string& name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, str_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  {
    streamjson::parser p;
    p.append(payload);
    do_not_optimize(p.is_completed());
  }

  for (std::size_t chunk : {std::size_t{16}, std::size_t{256}, std::size_t{4096}, payload.size()}) {
    const std::string suffix = "(chunk=" + std::to_string(chunk) + ")";
    print_mbps("tokenize" + suffix, run_median(runs, [&] { return bench_tokenize(payload, chunk, iters); }));
    print_mbps("parse" + suffix, run_median(runs, [&] { return bench_stream(payload, chunk, iters, false); }));
    print_mbps("parse(decode)" + suffix, run_median(runs, [&] { return bench_stream(payload, chunk, iters, true); }));
  }
  print_mbps("parse+get(chunk=64)", run_median(runs, [&] { return bench_stream_polling(payload, 64, iters); }));


  const std::string wide = make_wide_payload(n_objects * 80);
  std::cout << "wide object bytes: " << wide.size() << "\n";
  print_mbps("parse(wide object)", run_median(runs, [&] { return bench_stream(wide, 4096, 1, false); }));

  return 0;
}
