#include "test_common.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace streamjson;

static void test_whitespace_everywhere() {
  parser p;
  p.append(" \t\r\n{ \"a\" \n:\t[ 1 ,\r\n 2 ] , \"b\" : { } }\n ");
  STREAMJSON_CHECK(p.is_completed());
  STREAMJSON_CHECK(streamjson_test::is_int(p.get({"a", "1"}), 2));
  const auto b = p.get({"b"});
  STREAMJSON_CHECK(b && b->is_object() && b->size() == 0);
}

static void test_deep_nesting() {
  constexpr int kDepth = 500;
  parser p;
  STREAMJSON_CHECK(p.options().max_depth == 256);
  p.append(std::string(kDepth, '['));
  STREAMJSON_CHECK(p.depth() == static_cast<std::size_t>(kDepth));
  p.append("1");
  p.append(std::string(kDepth - 1, ']'));
  STREAMJSON_CHECK(p.depth() == 1);
  STREAMJSON_CHECK(!p.is_completed());
  p.append("]");
  STREAMJSON_CHECK(p.is_completed());

  // The tree stops at max_depth; the innermost kept array lost its only element.
  std::vector<std::string> path(255, "0");
  const auto inner = p.get(path);
  STREAMJSON_CHECK(inner && inner->is_array() && inner->size() == 0);
  path.push_back("0");
  STREAMJSON_CHECK(!p.get(path));
}

static void test_nesting_past_limit_keeps_balance() {
  parser_options opt;
  opt.max_depth = 2;
  parser p(opt);
  p.append(R"({"a":[[[1]],{"x":"y"}],"b":{"c":{"d":"e"}},"f":2})");
  STREAMJSON_CHECK(p.is_completed());
  STREAMJSON_CHECK(p.root()->size() == 3);

  const auto a = p.get({"a"});
  STREAMJSON_CHECK(a && a->is_array() && a->size() == 0);
  const auto b = p.get({"b"});
  STREAMJSON_CHECK(b && b->is_object() && b->size() == 0);
  STREAMJSON_CHECK(streamjson_test::is_int(p.get({"f"}), 2));

  // Partial strings below the limit are not exposed either.
  parser q(opt);
  q.append(R"({"a":{"b":{"s":"par)");
  STREAMJSON_CHECK(q.depth() == 3);
  const auto qa = q.get({"a"});
  STREAMJSON_CHECK(qa && qa->size() == 0);
}

static void test_hostile_nesting() {
  {
    // A flood of openers neither overflows the stack on lookup nor on teardown.
    parser p;
    p.append(std::string(2000000, '['));
    STREAMJSON_CHECK(p.depth() == 2000000);
    const auto first = p.get({"0"});
    STREAMJSON_CHECK(first && first->is_array());
    p.append(std::string(2000000, '}'));
    STREAMJSON_CHECK(p.is_completed());
  }
  {
    // Even with the limit lifted, destroying a very deep tree is iterative.
    constexpr std::size_t kDepth = 200000;
    parser_options opt;
    opt.max_depth = kDepth + 1;
    auto p = std::make_unique<parser>(opt);
    p->append(std::string(kDepth, '['));
    STREAMJSON_CHECK(p->depth() == kDepth);
    const auto leaf = p->get(std::vector<std::string>(kDepth - 1, "0"));
    STREAMJSON_CHECK(leaf && leaf->is_array() && leaf->size() == 0);
    p->reset();
    STREAMJSON_CHECK(p->root() == nullptr);
    p->append(std::string(kDepth, '{'));
    p.reset();
  }
}

static void test_wide_object() {
  constexpr int kKeys = 200000;
  std::string json = "{";
  for (int i = 0; i < kKeys; ++i) {
    if (i) json += ',';
    json += "\"k" + std::to_string(i) + "\":" + std::to_string(i);
  }
  // A repeated key replaces the value in place.
  json += ",\"k0\":\"again\",\"tail\":\"";
  parser p;
  p.append(json);
  for (int i = 0; i < 64; ++i) p.append("x");
  p.append("\"}");

  STREAMJSON_CHECK(p.is_completed());
  STREAMJSON_CHECK(p.root()->size() == static_cast<std::size_t>(kKeys) + 1);
  STREAMJSON_CHECK(streamjson_test::is_int(p.get({"k199999"}), kKeys - 1));
  STREAMJSON_CHECK(streamjson_test::is_string(p.get({"k0"}), "again"));
  STREAMJSON_CHECK(p.root()->object_members()[0].first == "k0");
  STREAMJSON_CHECK(streamjson_test::is_string(p.get({"tail"}), std::string(64, 'x')));
  STREAMJSON_CHECK(p.root()->object_members().back().first == "tail");
}

static std::string long_document(int items) {
  std::string json = "{\"items\":[";
  for (int i = 0; i < items; ++i) {
    if (i) json += ',';
    json += "{\"i\":" + std::to_string(i) + ",\"s\":\"item-" + std::to_string(i) + "\"}";
  }
  json += "],\"done\":true}";
  return json;
}

static void test_compaction_bounds_buffer() {
  const std::string json = long_document(1000);
  parser_options opt;
  opt.compact_threshold = 16;
  parser p(opt);
  streamjson_test::feed_chunked(p, json, 7);

  STREAMJSON_CHECK(p.is_completed());
  STREAMJSON_CHECK(p.source().position() == json.size());
  STREAMJSON_CHECK(p.source().buffered() < 64);
  STREAMJSON_CHECK(streamjson_test::is_int(p.get({"items", "999", "i"}), 999));
  STREAMJSON_CHECK(streamjson_test::is_string(p.get({"items", "500", "s"}), "item-500"));
  STREAMJSON_CHECK(streamjson_test::is_bool(p.get({"done"}), true));
}

static void test_compaction_disabled() {
  const std::string json = long_document(50);
  parser_options opt;
  opt.compact_threshold = 0;
  parser p(opt);
  streamjson_test::feed_chunked(p, json, 3);

  STREAMJSON_CHECK(p.is_completed());
  STREAMJSON_CHECK(p.source().buffered() == json.size());
}

static void test_chunking_does_not_matter() {
  const std::string json = long_document(40);
  parser whole;
  whole.append(json);
  const value expected = whole.root()->to_value();

  for (std::size_t chunk : {1u, 2u, 5u, 13u, 64u}) {
    parser p;
    streamjson_test::feed_chunked(p, json, chunk);
    STREAMJSON_CHECK(p.is_completed());
    STREAMJSON_CHECK(p.root()->to_value() == expected);
  }
}

static void test_options_are_kept() {
  parser_options opt;
  opt.initial_buffer_capacity = 4;
  opt.initial_stack_capacity = 1;
  opt.decode_escapes = true;
  parser p(opt);
  STREAMJSON_CHECK(p.options().decode_escapes);
  STREAMJSON_CHECK(p.options().compact_threshold == 64 * 1024);
  p.append(R"([[[{"k":"\t"}]]])");
  STREAMJSON_CHECK(streamjson_test::is_string(p.get({"0", "0", "0", "k"}), "\t"));
}

void test_structure() {
  test_whitespace_everywhere();
  test_deep_nesting();
  test_nesting_past_limit_keeps_balance();
  test_hostile_nesting();
  test_wide_object();
  test_compaction_bounds_buffer();
  test_compaction_disabled();
  test_chunking_does_not_matter();
  test_options_are_kept();
}
