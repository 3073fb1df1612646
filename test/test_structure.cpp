#include "test_common.hpp"

#include <string>

using namespace tjson;

static void test_primitives_and_whitespace() {
  {
    auto r = parse(" \t\r\nnull\n\t ");
    TJSON_CHECK(!r.err);
    TJSON_CHECK(r.val.is_null());
  }
  {
    auto r = parse(" true ");
    TJSON_CHECK(!r.err);
    TJSON_CHECK(r.val.is_bool());
    TJSON_CHECK(r.val.as_bool() == true);
  }
  {
    auto r = parse("false");
    TJSON_CHECK(!r.err);
    TJSON_CHECK(r.val.is_bool());
    TJSON_CHECK(r.val.as_bool() == false);
  }
  {
    auto r = parse("\"ok\"");
    TJSON_CHECK(!r.err);
    TJSON_CHECK(r.val.is_string());
    TJSON_CHECK(r.val.as_string() == "ok");
  }
}

static void test_empty_containers() {
  {
    auto r = parse("{}");
    TJSON_CHECK(!r.err);
    TJSON_CHECK(r.val.is_object());
    TJSON_CHECK(r.val.as_object().empty());
  }
  {
    auto r = parse("[]");
    TJSON_CHECK(!r.err);
    TJSON_CHECK(r.val.is_array());
    TJSON_CHECK(r.val.as_array().empty());
  }
  {
    auto r = parse(R"({"a":[],"b":{},"c":""})");
    TJSON_CHECK(!r.err);
    const value* a = r.val.find("a");
    const value* b = r.val.find("b");
    const value* c = r.val.find("c");
    TJSON_CHECK(a && a->is_array() && a->as_array().empty());
    TJSON_CHECK(b && b->is_object() && b->as_object().empty());
    TJSON_CHECK(c && c->is_string() && c->as_string().empty());
  }
}

static void test_mixed_array_in_object() {
  auto r = parse("{\"x\":[1,2.5,-3e2,true,false,null,\"s\"]}");
  TJSON_CHECK(!r.err);
  TJSON_CHECK(r.val.is_object());
  TJSON_CHECK(r.val.as_object().size() == 1);

  const value* x = r.val.find("x");
  TJSON_CHECK(x && x->is_array());
  const auto& a = x->as_array();
  TJSON_CHECK(a.size() == 7);
  TJSON_CHECK(a[0].as_number() == 1.0);
  TJSON_CHECK(a[1].as_number() == 2.5);
  TJSON_CHECK(a[2].as_number() == -300.0);
  TJSON_CHECK(a[3].as_bool() == true);
  TJSON_CHECK(a[4].as_bool() == false);
  TJSON_CHECK(a[5].is_null());
  TJSON_CHECK(a[6].as_string() == "s");

  value::object o;
  o.emplace("x", value(value::array{value(1.0), value(2.5), value(-300.0), value(true), value(false), value(nullptr), value("s")}));
  TJSON_CHECK(r.val == value(std::move(o)));
}

static void test_nested_structure() {
  const char* json = R"(
  {
    "a": [1, 2, 3],
    "b": {"x": true, "y": null, "z": {"deep": [[], [{}]]}},
    "s": "ok"
  }
  )";

  auto r = parse(json);
  TJSON_CHECK(!r.err);
  TJSON_CHECK(r.val.is_object());

  const value* a = r.val.find("a");
  TJSON_CHECK(a && a->is_array());
  TJSON_CHECK(a->as_array().size() == 3);
  TJSON_CHECK(a->as_array()[2].as_number() == 3.0);

  const value* b = r.val.find("b");
  TJSON_CHECK(b && b->is_object());
  const value* x = b->find("x");
  const value* y = b->find("y");
  TJSON_CHECK(x && x->as_bool() == true);
  TJSON_CHECK(y && y->is_null());

  const value* deep = b->find("z")->find("deep");
  TJSON_CHECK(deep && deep->as_array().size() == 2);
  TJSON_CHECK(deep->as_array()[1].as_array()[0].is_object());

  TJSON_CHECK(r.val.find("missing") == nullptr);
  TJSON_CHECK(a->find("a") == nullptr);
}

static void test_duplicate_keys_last_write_wins() {
  auto r = parse(R"({"a":1,"a":2})");
  TJSON_CHECK(!r.err);
  TJSON_CHECK(r.val.as_object().size() == 1);
  const value* a = r.val.find("a");
  TJSON_CHECK(a != nullptr);
  TJSON_CHECK(a->as_number() == 2.0);

  auto r2 = parse(R"({"a":{"k":1},"b":0,"a":[true]})");
  TJSON_CHECK(!r2.err);
  TJSON_CHECK(r2.val.find("a")->is_array());
}

static void test_string_content_that_looks_like_syntax() {
  auto r = parse(R"({"{":"}","true":"null","q":"\"","n":"1e5"})");
  TJSON_CHECK(!r.err);
  TJSON_CHECK(r.val.find("{")->as_string() == "}");
  TJSON_CHECK(r.val.find("true")->as_string() == "null");
  TJSON_CHECK(r.val.find("q")->as_string() == "\"");
  TJSON_CHECK(r.val.find("n")->is_string());
}

static void test_require_eof_option() {
  {
    auto r = parse("true 123");
    tjson_test::check_err(r.err, error_code::unexpected_token);
    TJSON_CHECK(r.err.offset == 5);
  }
  {
    parse_options opt;
    opt.require_eof = false;
    auto r = parse("true 123", opt);
    TJSON_CHECK(!r.err);
    TJSON_CHECK(r.val.is_bool());
    TJSON_CHECK(r.val.as_bool() == true);
  }
}

static void test_max_depth_option() {
  parse_options opt;
  opt.max_depth = 2;
  {
    auto r = parse("[[0]]", opt);
    TJSON_CHECK(!r.err);
  }
  {
    auto r = parse("[[[0]]]", opt);
    tjson_test::check_err(r.err, error_code::nesting_too_deep);
  }
  {
    auto r = parse(R"({"a":{"b":{"c":1}}})", opt);
    tjson_test::check_err(r.err, error_code::nesting_too_deep);
  }

  // Default depth rejects pathological nesting instead of exhausting the stack.
  const std::string deep = std::string(10000, '[') + std::string(10000, ']');
  tjson_test::check_err(parse(deep).err, error_code::nesting_too_deep);
}

static void test_parse_tokens_directly() {
  auto t = tokenize(R"({"k": [1, "v"]})");
  TJSON_CHECK(!t.err);
  auto r = parse_tokens(t.tokens);
  TJSON_CHECK(!r.err);
  TJSON_CHECK(r.val == parse(R"({"k":[1,"v"]})").val);

  // A truncated token sequence reports end of input, not a partial tree.
  t.tokens.pop_back();
  auto truncated = parse_tokens(t.tokens);
  tjson_test::check_err(truncated.err, error_code::unexpected_end_of_input);
  TJSON_CHECK(truncated.val.is_null());
}

static void test_cursor_moves_forward_only() {
  auto t = tokenize("[1,2]");
  TJSON_CHECK(!t.err);
  cursor cur(t.tokens);
  TJSON_CHECK(cur.position() == 0);
  TJSON_CHECK(cur.peek().is_punct('['));
  TJSON_CHECK(cur.next().is_punct('['));
  TJSON_CHECK(cur.position() == 1);
  cur.advance();
  TJSON_CHECK(cur.peek().is_punct(','));
  while (!cur.at_end()) cur.advance();
  TJSON_CHECK(cur.position() == t.tokens.size());

  // Reading past the end yields an empty token and does not move.
  TJSON_CHECK(cur.peek().text.empty());
  TJSON_CHECK(cur.next().text.empty());
  cur.advance();
  TJSON_CHECK(cur.position() == t.tokens.size());

  const std::vector<token> none;
  cursor empty(none);
  TJSON_CHECK(empty.at_end());
  TJSON_CHECK(empty.next().text.empty());
  TJSON_CHECK(empty.position() == 0);
}

static void test_repeated_parses_are_independent() {
  const char* json = R"({"a":[1,2,{"b":null}]})";
  auto r1 = parse(json);
  auto r2 = parse(json);
  TJSON_CHECK(!r1.err && !r2.err);
  TJSON_CHECK(r1.val == r2.val);
  TJSON_CHECK(!(r1.val != r2.val));
  TJSON_CHECK(r1.val != parse("[]").val);
}

void test_structure() {
  test_primitives_and_whitespace();
  test_empty_containers();
  test_mixed_array_in_object();
  test_nested_structure();
  test_duplicate_keys_last_write_wins();
  test_string_content_that_looks_like_syntax();
  test_require_eof_option();
  test_max_depth_option();
  test_parse_tokens_directly();
  test_cursor_moves_forward_only();
  test_repeated_parses_are_independent();
}
