#pragma once

// tjson: a small, header-only C++17 JSON library.
// Pipeline: bytes -> tokenize() -> tokens -> recursive descent over a cursor -> value -> serialize().

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tjson {

enum class error_code {
  ok = 0,

  // tokenizer
  unterminated_string,
  dangling_escape,
  unterminated_escape,
  invalid_escape_sequence,
  unescaped_control_character,
  invalid_unicode_escape,
  invalid_utf16_surrogate,

  // parser
  unexpected_token,
  unexpected_end_of_input,
  malformed_number,
  nesting_too_deep
};

inline bool is_tokenize_error(error_code c) noexcept {
  return c >= error_code::unterminated_string && c <= error_code::invalid_utf16_surrogate;
}

inline bool is_parse_error(error_code c) noexcept {
  return c >= error_code::unexpected_token && c <= error_code::nesting_too_deep;
}

inline const char* describe(error_code c) noexcept {
  switch (c) {
    case error_code::ok: return "ok";
    case error_code::unterminated_string: return "unterminated string";
    case error_code::dangling_escape: return "dangling escape at end of input";
    case error_code::unterminated_escape: return "whitespace after escape character";
    case error_code::invalid_escape_sequence: return "invalid escape sequence";
    case error_code::unescaped_control_character: return "unescaped control character in string";
    case error_code::invalid_unicode_escape: return "invalid \\u escape";
    case error_code::invalid_utf16_surrogate: return "invalid UTF-16 surrogate pair";
    case error_code::unexpected_token: return "unexpected token";
    case error_code::unexpected_end_of_input: return "unexpected end of input";
    case error_code::malformed_number: return "malformed number";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown error";
}

// First failure of a tokenize/parse call. `offset` is a byte offset into the source.
struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline void set_error(error& e, error_code code, std::size_t at, std::string_view src) {
  if (e) return;
  e.code = code;
  e.offset = at;
  update_line_col(src, at, e.line, e.column);
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline bool parse_u4(std::string_view s, std::size_t& i, std::uint32_t& out_cp) noexcept {
  if (i + 4 > s.size()) return false;
  std::uint32_t v = 0;
  for (std::size_t k = 0; k < 4; ++k) {
    const int h = hex_val(s[i + k]);
    if (h < 0) return false;
    v = (v << 4) | static_cast<std::uint32_t>(h);
  }
  i += 4;
  out_cp = v;
  return true;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
inline bool is_number_text(std::string_view t) noexcept {
  std::size_t i = 0;
  const std::size_t n = t.size();
  if (i < n && t[i] == '-') ++i;
  if (i >= n) return false;

  if (t[i] == '0') {
    ++i;
  } else if (t[i] >= '1' && t[i] <= '9') {
    while (i < n && is_digit(t[i])) ++i;
  } else {
    return false;
  }

  if (i < n && t[i] == '.') {
    ++i;
    if (i >= n || !is_digit(t[i])) return false;
    while (i < n && is_digit(t[i])) ++i;
  }

  if (i < n && (t[i] == 'e' || t[i] == 'E')) {
    ++i;
    if (i < n && (t[i] == '+' || t[i] == '-')) ++i;
    if (i >= n || !is_digit(t[i])) return false;
    while (i < n && is_digit(t[i])) ++i;
  }
  return i == n;
}

inline double parse_double(std::string_view token) {
  // token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

} // namespace detail

// -----------------------------
// Tokens
// -----------------------------

enum class token_kind { punctuation, quote, literal };

struct token {
  token_kind kind{token_kind::literal};
  std::string text;
  std::size_t offset{0};

  bool is_punct(char c) const noexcept {
    return kind == token_kind::punctuation && text.size() == 1 && text[0] == c;
  }
  bool is_quote() const noexcept { return kind == token_kind::quote; }
  bool is_literal() const noexcept { return kind == token_kind::literal; }
};

struct tokenize_options {
  // Off: `\uXXXX` is kept verbatim (backslash included) in the string content.
  bool decode_unicode_escapes{false};
};

struct tokenize_result {
  std::vector<token> tokens;
  error err;
};

struct tokenizer {
  std::string_view s;
  std::size_t i{0};
  tokenize_options opt;

  std::vector<token> out;
  std::string cur;
  std::size_t cur_start{0};
  std::size_t string_start{0};
  std::size_t escape_start{0};
  bool in_string{false};
  bool escape{false};

  tokenize_result run() {
    tokenize_result r;
    while (i < s.size()) {
      if (!step(r.err)) return r;
    }
    if (escape) {
      set_error(r.err, error_code::dangling_escape, escape_start);
      return r;
    }
    if (in_string) {
      set_error(r.err, error_code::unterminated_string, string_start);
      return r;
    }
    flush();
    r.tokens = std::move(out);
    return r;
  }

  void set_error(error& e, error_code code, std::size_t at) {
    detail::set_error(e, code, at, s);
  }

  void flush() {
    if (cur.empty()) return;
    out.push_back(token{token_kind::literal, std::move(cur), cur_start});
    cur.clear();
  }

  void emit(token_kind kind, char c) {
    out.push_back(token{kind, std::string(1, c), i});
  }

  void append(char c) {
    if (cur.empty() && !in_string) cur_start = i;
    cur.push_back(c);
  }

  bool step(error& e) {
    if (escape) return take_escape(e);
    if (in_string) return take_string_char(e);

    const char c = s[i];
    switch (c) {
      case ' ':
      case '\t':
      case '\r':
      case '\n':
        flush();
        ++i;
        return true;
      case '{':
      case '}':
      case '[':
      case ']':
      case ':':
      case ',':
      case '+':
      case '-':
        flush();
        emit(token_kind::punctuation, c);
        ++i;
        return true;
      case '"':
        flush();
        emit(token_kind::quote, c);
        in_string = true;
        string_start = i;
        cur_start = i + 1;
        ++i;
        return true;
      case '\\':
        set_error(e, error_code::invalid_escape_sequence, i);
        return false;
      case 'e':
      case 'E':
        // 1e10 -> "1" "e" "10"
        if (!cur.empty() && detail::is_digit(cur.back())) {
          flush();
          out.push_back(token{token_kind::literal, std::string(1, c), i});
          ++i;
          return true;
        }
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20u) {
          set_error(e, error_code::unescaped_control_character, i);
          return false;
        }
        break;
    }
    append(c);
    ++i;
    return true;
  }

  bool take_string_char(error& e) {
    const char c = s[i];
    if (c == '"') {
      flush();
      emit(token_kind::quote, c);
      in_string = false;
      ++i;
      return true;
    }
    if (c == '\\') {
      escape = true;
      escape_start = i;
      ++i;
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20u) {
      set_error(e, error_code::unescaped_control_character, i);
      return false;
    }
    append(c);
    ++i;
    return true;
  }

  bool take_escape(error& e) {
    const char c = s[i];
    switch (c) {
      case '"': cur.push_back('"'); break;
      case '\\': cur.push_back('\\'); break;
      case '/': cur.push_back('/'); break;
      case 'b': cur.push_back('\b'); break;
      case 'f': cur.push_back('\f'); break;
      case 'n': cur.push_back('\n'); break;
      case 'r': cur.push_back('\r'); break;
      case 't': cur.push_back('\t'); break;
      case ' ':
      case '\t':
      case '\r':
      case '\n':
        set_error(e, error_code::unterminated_escape, escape_start);
        return false;
      case 'u':
        if (opt.decode_unicode_escapes) {
          ++i;
          escape = false;
          return take_unicode_escape(e);
        }
        cur.push_back('\\');
        cur.push_back('u');
        break;
      default:
        set_error(e, error_code::invalid_escape_sequence, escape_start);
        return false;
    }
    escape = false;
    ++i;
    return true;
  }

  // `i` is just past the 'u'.
  bool take_unicode_escape(error& e) {
    std::uint32_t cp = 0;
    if (!detail::parse_u4(s, i, cp)) {
      set_error(e, error_code::invalid_unicode_escape, escape_start);
      return false;
    }
    if (cp >= 0xD800u && cp <= 0xDBFFu) {
      if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
        set_error(e, error_code::invalid_utf16_surrogate, i);
        return false;
      }
      const std::size_t low_start = i;
      i += 2;
      std::uint32_t low = 0;
      if (!detail::parse_u4(s, i, low)) {
        set_error(e, error_code::invalid_unicode_escape, low_start);
        return false;
      }
      if (low < 0xDC00u || low > 0xDFFFu) {
        set_error(e, error_code::invalid_utf16_surrogate, low_start);
        return false;
      }
      cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
    } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
      set_error(e, error_code::invalid_utf16_surrogate, escape_start);
      return false;
    }
    detail::append_utf8(cur, cp);
    return true;
  }
};

inline tokenize_result tokenize(std::string_view json, tokenize_options opt = {}) {
  tokenizer t;
  t.s = json;
  t.opt = opt;
  return t.run();
}

// Read position in a token sequence. Only moves forward.
// Past the end, peek()/next() return an empty literal token and the position
// stays put.
class cursor {
public:
  explicit cursor(const std::vector<token>& tokens) noexcept : tokens_(&tokens) {}

  bool at_end() const noexcept { return pos_ >= tokens_->size(); }
  const token& peek() const { return at_end() ? end_token() : (*tokens_)[pos_]; }
  const token& next() {
    if (at_end()) return end_token();
    return (*tokens_)[pos_++];
  }
  void advance() noexcept {
    if (!at_end()) ++pos_;
  }
  std::size_t position() const noexcept { return pos_; }

private:
  static const token& end_token() {
    static const token sentinel{};
    return sentinel;
  }

  const std::vector<token>* tokens_;
  std::size_t pos_{0};
};

// -----------------------------
// Value tree
// -----------------------------

class value {
public:
  using array = std::vector<value>;
  using object = std::map<std::string, value, std::less<>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}
  value(double d) : data_(d) {}
  // Integers are stored as doubles; this keeps value(1) from being ambiguous.
  template <class Int, std::enable_if_t<std::is_integral_v<Int> && !std::is_same_v<Int, bool>, int> = 0>
  value(Int n) : data_(static_cast<double>(n)) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  static value number(double d) { return value(d); }

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::array;
      case 5: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  double as_number() const { return std::get<double>(data_); }
  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  const value* find(std::string_view key) const {
    if (!is_object()) return nullptr;
    const auto& o = std::get<object>(data_);
    const auto it = o.find(key);
    return it == o.end() ? nullptr : &it->second;
  }

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 number, 3 string, 4 array, 5 object
  std::variant<std::monostate, bool, double, std::string, array, object> data_;
};

// -----------------------------
// Parser
// -----------------------------

struct parse_options {
  std::size_t max_depth{256};
  bool require_eof{true};
  bool decode_unicode_escapes{false};
};

struct parse_result {
  value val;
  error err;
};

struct parser {
  // Source text, used only to derive line/column. May be empty.
  std::string_view s;
  std::size_t end_offset{0};
  parse_options opt;

  parse_result run(const std::vector<token>& tokens) {
    parse_result r;
    cursor cur(tokens);
    value v = parse_value(cur, 0, r.err);
    if (r.err) return r;

    if (opt.require_eof && !cur.at_end()) {
      set_error(r.err, error_code::unexpected_token, cur.peek().offset);
      return r;
    }
    r.val = std::move(v);
    return r;
  }

  void set_error(error& e, error_code code, std::size_t at) {
    detail::set_error(e, code, at, s);
  }

  bool expect_more(const cursor& cur, error& e) {
    if (!cur.at_end()) return true;
    set_error(e, error_code::unexpected_end_of_input, end_offset);
    return false;
  }

  value parse_value(cursor& cur, std::size_t depth, error& e) {
    if (!expect_more(cur, e)) return nullptr;
    const token& t = cur.peek();
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep, t.offset);
      return nullptr;
    }

    switch (t.kind) {
      case token_kind::quote: {
        cur.advance();
        std::string out;
        if (!parse_string(cur, out, e)) return nullptr;
        return value(std::move(out));
      }
      case token_kind::punctuation:
        if (t.is_punct('{')) {
          cur.advance();
          return parse_object(cur, depth + 1, e);
        }
        if (t.is_punct('[')) {
          cur.advance();
          return parse_array(cur, depth + 1, e);
        }
        if (t.is_punct('-') || t.is_punct('+')) return parse_number(cur, e);
        set_error(e, error_code::unexpected_token, t.offset);
        return nullptr;
      case token_kind::literal:
        if (t.text == "true") {
          cur.advance();
          return value(true);
        }
        if (t.text == "false") {
          cur.advance();
          return value(false);
        }
        if (t.text == "null") {
          cur.advance();
          return nullptr;
        }
        return parse_number(cur, e);
    }
    set_error(e, error_code::unexpected_token, t.offset);
    return nullptr;
  }

  // The opening quote has been consumed.
  bool parse_string(cursor& cur, std::string& out, error& e) {
    out.clear();
    if (!expect_more(cur, e)) return false;
    if (cur.peek().is_literal()) out = cur.next().text;

    if (!expect_more(cur, e)) return false;
    const token& close = cur.next();
    if (!close.is_quote()) {
      set_error(e, error_code::unexpected_token, close.offset);
      return false;
    }
    return true;
  }

  static bool adjacent(const token& prev, const token& next) noexcept {
    return prev.offset + prev.text.size() == next.offset;
  }

  // sign? digits(.digits)? (e sign? digits)?, each piece its own token and
  // contiguous in the source.
  value parse_number(cursor& cur, error& e) {
    const token& first = cur.peek();
    std::string text;

    const token* prev = nullptr;
    if (first.is_punct('-') || first.is_punct('+')) {
      prev = &cur.next();
      text += prev->text;
      if (!expect_more(cur, e)) return nullptr;
      if (!cur.peek().is_literal() || !adjacent(*prev, cur.peek())) {
        set_error(e, error_code::malformed_number, first.offset);
        return nullptr;
      }
    }
    prev = &cur.next();
    text += prev->text;

    if (!cur.at_end() && cur.peek().is_literal() && adjacent(*prev, cur.peek()) &&
        (cur.peek().text == "e" || cur.peek().text == "E")) {
      prev = &cur.next();
      text += prev->text;
      if (!expect_more(cur, e)) return nullptr;
      if (cur.peek().is_punct('-') || cur.peek().is_punct('+')) {
        if (!adjacent(*prev, cur.peek())) {
          set_error(e, error_code::malformed_number, first.offset);
          return nullptr;
        }
        prev = &cur.next();
        text += prev->text;
        if (!expect_more(cur, e)) return nullptr;
      }
      if (!cur.peek().is_literal() || !adjacent(*prev, cur.peek())) {
        set_error(e, error_code::malformed_number, first.offset);
        return nullptr;
      }
      text += cur.next().text;
    }

    if (!detail::is_number_text(text)) {
      set_error(e, error_code::malformed_number, first.offset);
      return nullptr;
    }
    const double d = detail::parse_double(text);
    if (!std::isfinite(d)) {
      set_error(e, error_code::malformed_number, first.offset);
      return nullptr;
    }
    return value(d);
  }

  // The '[' has been consumed.
  value parse_array(cursor& cur, std::size_t depth, error& e) {
    value::array a;
    if (!expect_more(cur, e)) return nullptr;
    if (cur.peek().is_punct(']')) {
      cur.advance();
      return value(std::move(a));
    }

    while (true) {
      value elem = parse_value(cur, depth, e);
      if (e) return nullptr;
      a.emplace_back(std::move(elem));

      if (!expect_more(cur, e)) return nullptr;
      const token& t = cur.next();
      if (t.is_punct(',')) continue;
      if (t.is_punct(']')) return value(std::move(a));
      set_error(e, error_code::unexpected_token, t.offset);
      return nullptr;
    }
  }

  // The '{' has been consumed. Duplicate keys: last one wins.
  value parse_object(cursor& cur, std::size_t depth, error& e) {
    value::object o;
    if (!expect_more(cur, e)) return nullptr;
    if (cur.peek().is_punct('}')) {
      cur.advance();
      return value(std::move(o));
    }

    while (true) {
      if (!expect_more(cur, e)) return nullptr;
      const token& open = cur.next();
      if (!open.is_quote()) {
        set_error(e, error_code::unexpected_token, open.offset);
        return nullptr;
      }
      std::string key;
      if (!parse_string(cur, key, e)) return nullptr;

      if (!expect_more(cur, e)) return nullptr;
      const token& colon = cur.next();
      if (!colon.is_punct(':')) {
        set_error(e, error_code::unexpected_token, colon.offset);
        return nullptr;
      }

      value v = parse_value(cur, depth, e);
      if (e) return nullptr;
      o.insert_or_assign(std::move(key), std::move(v));

      if (!expect_more(cur, e)) return nullptr;
      const token& t = cur.next();
      if (t.is_punct(',')) continue;
      if (t.is_punct('}')) return value(std::move(o));
      set_error(e, error_code::unexpected_token, t.offset);
      return nullptr;
    }
  }
};

inline parse_result parse_tokens(const std::vector<token>& tokens, parse_options opt = {}) {
  parser p;
  p.opt = opt;
  if (!tokens.empty()) p.end_offset = tokens.back().offset + tokens.back().text.size();
  return p.run(tokens);
}

inline parse_result parse(std::string_view json, parse_options opt = {}) {
  tokenize_options topt;
  topt.decode_unicode_escapes = opt.decode_unicode_escapes;
  tokenize_result t = tokenize(json, topt);
  if (t.err) {
    parse_result r;
    r.err = t.err;
    return r;
  }

  parser p;
  p.s = json;
  p.end_offset = json.size();
  p.opt = opt;
  return p.run(t.tokens);
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) {
    throw std::runtime_error(std::string("tjson: parse failed: ") + describe(r.err.code) +
                             " at line " + std::to_string(r.err.line) +
                             ", column " + std::to_string(r.err.column));
  }
  return std::move(r.val);
}

// -----------------------------
// Serializer
// -----------------------------

namespace detail {

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";

  const char* data = s.data();
  const std::size_t n = s.size();

  out.push_back('"');
  std::size_t chunk_begin = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);

    const char* esc = nullptr;
    switch (data[i]) {
      case '"': esc = "\\\""; break;
      case '\\': esc = "\\\\"; break;
      case '\b': esc = "\\b"; break;
      case '\f': esc = "\\f"; break;
      case '\n': esc = "\\n"; break;
      case '\r': esc = "\\r"; break;
      case '\t': esc = "\\t"; break;
      default: break;
    }

    if (esc != nullptr) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append(esc, 2);
      chunk_begin = i + 1;
      continue;
    }

    if (uc <= 0x1F) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append("\\u00", 4);
      out.push_back(hex[(uc >> 4) & 0xF]);
      out.push_back(hex[uc & 0xF]);
      chunk_begin = i + 1;
    }
  }

  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

inline void dump_double(std::string& out, double d) {
  if (!std::isfinite(d)) {
    throw std::runtime_error("tjson: cannot serialize NaN/Inf as JSON number");
  }
  char buf[64];
  auto r = std::to_chars(buf, buf + sizeof(buf), d);
  if (r.ec == std::errc{}) {
    out.append(buf, static_cast<std::size_t>(r.ptr - buf));
    return;
  }

  const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(buf)) {
    throw std::runtime_error("tjson: failed to format double");
  }
  out.append(buf, static_cast<std::size_t>(n));
}

inline void dump_indent(std::string& out, int indent) {
  out.append(static_cast<std::size_t>(indent), ' ');
}

constexpr int kIndentStep = 4;

} // namespace detail

inline void serialize_to(std::string& out, const value& v, bool pretty = true, int indent = 0) {
  switch (v.type()) {
    case value::kind::null:
      out += "null";
      return;
    case value::kind::boolean:
      out += v.as_bool() ? "true" : "false";
      return;
    case value::kind::number:
      detail::dump_double(out, v.as_number());
      return;
    case value::kind::string:
      detail::dump_escaped(out, v.as_string());
      return;
    case value::kind::array: {
      const auto& a = v.as_array();
      out.push_back('[');
      if (pretty && !a.empty()) out.push_back('\n');
      for (std::size_t idx = 0; idx < a.size(); ++idx) {
        if (pretty) detail::dump_indent(out, indent + detail::kIndentStep);
        serialize_to(out, a[idx], pretty, indent + detail::kIndentStep);
        if (idx + 1 != a.size()) out.push_back(',');
        if (pretty) out.push_back('\n');
      }
      if (pretty && !a.empty()) detail::dump_indent(out, indent);
      out.push_back(']');
      return;
    }
    case value::kind::object: {
      const auto& o = v.as_object();
      out.push_back('{');
      if (pretty && !o.empty()) out.push_back('\n');
      std::size_t idx = 0;
      for (const auto& kv : o) {
        if (pretty) detail::dump_indent(out, indent + detail::kIndentStep);
        detail::dump_escaped(out, kv.first);
        if (pretty) {
          out.append(": ", 2);
        } else {
          out.push_back(':');
        }
        serialize_to(out, kv.second, pretty, indent + detail::kIndentStep);
        if (++idx != o.size()) out.push_back(',');
        if (pretty) out.push_back('\n');
      }
      if (pretty && !o.empty()) detail::dump_indent(out, indent);
      out.push_back('}');
      return;
    }
  }
}

inline std::string serialize(const value& v, bool pretty = true) {
  struct serialize_reserve_hints {
    std::size_t compact{256};
    std::size_t pretty{256};
  };
  thread_local serialize_reserve_hints hints;

  std::string out;
  std::size_t& hint = pretty ? hints.pretty : hints.compact;
  out.reserve(hint);
  serialize_to(out, v, pretty, 0);

  constexpr std::size_t min_hint = 256;
  constexpr std::size_t max_hint = 16u * 1024u * 1024u;
  const std::size_t sz = out.size();
  hint = (sz < min_hint) ? min_hint : (sz > max_hint ? max_hint : sz);
  return out;
}

} // namespace tjson
