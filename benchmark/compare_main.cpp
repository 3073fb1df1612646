#include "bench_common.hpp"

#include <tjson/tjson.hpp>

#include <json/json.h>
#include <nlohmann/json.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

using tjson_bench::keep;

namespace {

struct run_config {
  std::size_t iters{100};
  std::size_t runs{5};
};

template <class Body>
void measure(const char* label, const run_config& cfg, Body&& body) {
  tjson_bench::report(label, tjson_bench::median_of(cfg.runs, [&] { return tjson_bench::time_loop(cfg.iters, body); }));
}

bool jsoncpp_read(std::string_view text, Json::Value& root, std::string& errs) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["strictRoot"] = true;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), &root, &errs);
}

void compare_parse(std::string_view text, const run_config& cfg) {
  std::cout << "\n== parse ==\n";
  measure("tjson", cfg, [&] {
    auto r = tjson::parse(text);
    keep(r.err.code);
    return text.size();
  });
  measure("nlohmann", cfg, [&] {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    keep(j.is_discarded());
    return text.size();
  });
  measure("jsoncpp", cfg, [&] {
    Json::Value root;
    std::string errs;
    keep(jsoncpp_read(text, root, errs));
    return text.size();
  });
  measure("rapidjson", cfg, [&] {
    rapidjson::Document d;
    d.Parse(text.data(), text.size());
    keep(d.HasParseError());
    return text.size();
  });
}

bool compare_serialize(std::string_view text, const run_config& cfg) {
  const tjson::parse_result ours = tjson::parse(text);
  const nlohmann::json nl = nlohmann::json::parse(text, nullptr, false);
  Json::Value jc;
  std::string errs;
  rapidjson::Document rj;
  rj.Parse(text.data(), text.size());
  if (ours.err || nl.is_discarded() || !jsoncpp_read(text, jc, errs) || rj.HasParseError()) {
    std::cerr << "payload rejected by a library\n";
    return false;
  }

  Json::StreamWriterBuilder jw;
  jw["indentation"] = "";
  jw["precision"] = 17;

  std::cout << "\n== serialize (compact) ==\n";
  measure("tjson", cfg, [&] {
    const std::string out = tjson::serialize(ours.val, /*pretty=*/false);
    return out.size();
  });
  measure("nlohmann", cfg, [&] {
    const std::string out = nl.dump();
    return out.size();
  });
  measure("jsoncpp", cfg, [&] {
    const std::string out = Json::writeString(jw, jc);
    return out.size();
  });
  measure("rapidjson", cfg, [&] {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    rj.Accept(w);
    return sb.GetSize();
  });
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::size_t count = 2000;
  run_config cfg;
  tjson_bench::read_args(argc, argv, count, cfg.iters, cfg.runs);

  const std::string payload = tjson_bench::make_records(count, 24);
  std::cout << "payload bytes: " << payload.size() << "\n";
  std::cout << "sizeof(tjson::value): " << sizeof(tjson::value)
            << ", sizeof(tjson::token): " << sizeof(tjson::token) << "\n";

  compare_parse(payload, cfg);
  return compare_serialize(payload, cfg) ? 0 : 1;
}
