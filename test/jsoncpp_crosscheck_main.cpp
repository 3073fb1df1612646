#include "crosscheck_common.hpp"

#include <json/json.h>

#include <memory>
#include <string>
#include <string_view>

namespace {

std::string compare(const tjson::value& a, const Json::Value& b, const std::string& where) {
  switch (a.type()) {
    case tjson::value::kind::null:
      return b.isNull() ? std::string() : where + ": expected null";
    case tjson::value::kind::boolean:
      if (!b.isBool() || b.asBool() != a.as_bool()) return where + ": boolean differs";
      return {};
    case tjson::value::kind::number:
      if (!b.isNumeric() || !tjson_crosscheck::same_number(a.as_number(), b.asDouble())) {
        return where + ": number differs";
      }
      return {};
    case tjson::value::kind::string:
      if (!b.isString() || b.asString() != a.as_string()) return where + ": string differs";
      return {};
    case tjson::value::kind::array: {
      const auto& arr = a.as_array();
      if (!b.isArray() || b.size() != arr.size()) return where + ": array shape differs";
      for (Json::ArrayIndex i = 0; i < b.size(); ++i) {
        std::string r = compare(arr[i], b[i], where + "[" + std::to_string(i) + "]");
        if (!r.empty()) return r;
      }
      return {};
    }
    case tjson::value::kind::object: {
      const auto& obj = a.as_object();
      if (!b.isObject() || b.size() != obj.size()) return where + ": object shape differs";
      for (const auto& kv : obj) {
        if (!b.isMember(kv.first)) return where + ": missing key \"" + kv.first + "\"";
        std::string r = compare(kv.second, b[kv.first], where + "." + kv.first);
        if (!r.empty()) return r;
      }
      return {};
    }
  }
  return where + ": unknown kind";
}

std::string check_against_jsoncpp(std::string_view text, const tjson::parse_result& r) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = true;
  builder["failIfExtra"] = true;

  Json::Value root;
  std::string errs;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  const bool ok = reader->parse(text.data(), text.data() + text.size(), &root, &errs);

  if (!ok && r.err) return {};
  if (!ok) return "jsoncpp rejected, tjson accepted: " + errs;
  if (r.err) return std::string("tjson rejected (") + tjson::describe(r.err.code) + "), jsoncpp accepted";
  return compare(r.val, root, "$");
}

} // namespace

int main(int argc, char** argv) {
  return tjson_crosscheck::run_main("tjson_crosscheck_jsoncpp", argc, argv, check_against_jsoncpp);
}
