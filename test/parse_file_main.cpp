#include <streamjson/streamjson.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

static std::string slurp_file(const char* path, bool& ok) {
  std::ifstream in(path, std::ios::binary);
  ok = static_cast<bool>(in);
  if (!ok) return {};
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static nlohmann::json to_nlohmann(const streamjson::value& v) {
  using kind = streamjson::value::kind;
  switch (v.type()) {
    case kind::null: return nullptr;
    case kind::boolean: return v.as_bool();
    case kind::number:
      if (v.is_int()) return v.as_int();
      return v.as_double();
    case kind::string: return v.as_string();
    case kind::array: {
      nlohmann::json a = nlohmann::json::array();
      for (const auto& e : v.as_array()) a.push_back(to_nlohmann(e));
      return a;
    }
    case kind::object: {
      nlohmann::json o = nlohmann::json::object();
      for (const auto& kv : v.as_object()) o[kv.first] = to_nlohmann(kv.second);
      return o;
    }
  }
  return nullptr;
}

// "a/b/0" -> {"a", "b", "0"}. Empty segments are kept: "a//b" addresses the key "".
static std::vector<std::string> split_path(std::string_view s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (;;) {
    const std::size_t slash = s.find('/', start);
    out.emplace_back(s.substr(start, slash - start));
    if (slash == std::string_view::npos) break;
    start = slash + 1;
  }
  return out;
}

struct run_options {
  std::size_t chunk{16};
  streamjson::parser_options parser;
  std::vector<std::string> paths;
};

// 0: complete document, 1: stream ended before the document closed, 2: I/O failure.
static int stream_one(const char* path, const run_options& opt, bool print) {
  bool ok = false;
  const std::string s = slurp_file(path, ok);
  if (!ok) return 2;

  streamjson::parser p(opt.parser);
  const std::string_view view(s);
  for (std::size_t off = 0; off < view.size(); off += opt.chunk) p.append(view.substr(off, opt.chunk));

  if (print) {
    std::cout << "completed: " << (p.is_completed() ? "yes" : "no") << ", depth: " << p.depth()
              << ", bytes: " << p.source().position() << "\n";
    for (const std::string& spec : opt.paths) {
      const auto v = p.get(split_path(spec));
      std::cout << spec << "\t";
      if (v) {
        // Invalid UTF-8 in raw strings is replaced instead of thrown on.
        std::cout << to_nlohmann(*v).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
      } else {
        std::cout << "<not found>";
      }
      std::cout << "\n";
    }
  }
  return p.is_completed() ? 0 : 1;
}

static void usage() {
  std::cerr << "usage: streamjson_parse_file [--chunk N] [--decode] [--get a/b/0]... <file.json>\n";
  std::cerr << "       streamjson_parse_file [--chunk N] [--decode] --list <paths.txt>\n";
}

int main(int argc, char** argv) {
  run_options opt;
  const char* list_file = nullptr;
  const char* file = nullptr;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--chunk" && i + 1 < argc) {
      try {
        opt.chunk = static_cast<std::size_t>(std::stoull(argv[++i]));
      } catch (const std::exception&) {
        std::cerr << "invalid chunk size: " << argv[i] << "\n";
        return 2;
      }
      if (opt.chunk == 0) opt.chunk = 1;
    } else if (arg == "--decode") {
      opt.parser.decode_escapes = true;
    } else if (arg == "--get" && i + 1 < argc) {
      opt.paths.emplace_back(argv[++i]);
    } else if (arg == "--list" && i + 1 < argc) {
      list_file = argv[++i];
    } else if (!file && !arg.empty() && arg.front() != '-') {
      file = argv[i];
    } else {
      usage();
      return 2;
    }
  }

  if (list_file) {
    std::ifstream in(list_file);
    if (!in) {
      std::cerr << "failed to read list file: " << list_file << "\n";
      return 2;
    }

    bool any_incomplete = false;
    bool any_io_fail = false;
    std::string path;
    while (std::getline(in, path)) {
      if (path.empty()) continue;
      const int rc = stream_one(path.c_str(), opt, false);
      if (rc == 0) {
        std::cout << path << "\tOK\n";
      } else if (rc == 1) {
        std::cout << path << "\tINCOMPLETE\n";
        any_incomplete = true;
      } else {
        std::cout << path << "\tIOFAIL\n";
        any_io_fail = true;
      }
    }
    return any_io_fail ? 2 : (any_incomplete ? 1 : 0);
  }

  if (!file) {
    usage();
    return 2;
  }

  const int rc = stream_one(file, opt, true);
  if (rc == 2) std::cerr << "failed to read file: " << file << "\n";
  return rc;
}
