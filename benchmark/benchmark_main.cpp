#include "bench_common.hpp"

#include <tjson/tjson.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using tjson_bench::keep;
using tjson_bench::sample;

int main(int argc, char** argv) {
  std::size_t count = 2000;
  std::size_t iters = 100;
  std::size_t runs = 5;
  tjson_bench::read_args(argc, argv, count, iters, runs);

  const std::string payload = tjson_bench::make_records(count, 24);
  const std::string_view text = payload;
  std::cout << "payload bytes: " << payload.size() << "\n";

  const tjson::tokenize_result tokens = tjson::tokenize(text);
  const tjson::parse_result tree = tjson::parse(text);
  if (tokens.err || tree.err) {
    std::cerr << "benchmark payload rejected: "
              << tjson::describe(tokens.err ? tokens.err.code : tree.err.code) << "\n";
    return 1;
  }

  tjson_bench::report("tokenize", tjson_bench::median_of(runs, [&] {
    return tjson_bench::time_loop(iters, [&] {
      auto r = tjson::tokenize(text);
      keep(r.tokens.size());
      return text.size();
    });
  }));

  tjson_bench::report("parse_tokens", tjson_bench::median_of(runs, [&] {
    return tjson_bench::time_loop(iters, [&] {
      auto r = tjson::parse_tokens(tokens.tokens);
      keep(r.val.type());
      return text.size();
    });
  }));

  tjson_bench::report("parse", tjson_bench::median_of(runs, [&] {
    return tjson_bench::time_loop(iters, [&] {
      auto r = tjson::parse(text);
      keep(r.err.code);
      return text.size();
    });
  }));

  for (const bool pretty : {false, true}) {
    const sample s = tjson_bench::median_of(runs, [&] {
      return tjson_bench::time_loop(iters, [&] {
        const std::string out = tjson::serialize(tree.val, pretty);
        keep(out.size());
        return out.size();
      });
    });
    tjson_bench::report(pretty ? "serialize(pretty)" : "serialize(compact)", s);
  }
  return 0;
}
