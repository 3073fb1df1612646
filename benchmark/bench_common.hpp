#pragma once

// Timing and payload helpers shared by tjson_benchmark and tjson_compare.

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace tjson_bench {

template <class T>
inline void keep(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

struct sample {
  double seconds{0.0};
  std::size_t bytes{0};
};

// Runs `body` `iters` times; `body` returns the bytes it processed.
template <class Body>
sample time_loop(std::size_t iters, Body&& body) {
  using clock = std::chrono::steady_clock;
  sample s;
  const auto start = clock::now();
  for (std::size_t n = 0; n < iters; ++n) s.bytes += body();
  s.seconds = std::chrono::duration<double>(clock::now() - start).count();
  return s;
}

template <class Fn>
sample median_of(std::size_t runs, Fn&& fn) {
  std::vector<sample> all;
  for (std::size_t r = 0; r < (runs == 0 ? 1 : runs); ++r) all.push_back(fn());
  const auto mid = all.begin() + static_cast<std::ptrdiff_t>(all.size() / 2);
  std::nth_element(all.begin(), mid, all.end(),
                   [](const sample& a, const sample& b) { return a.seconds < b.seconds; });
  return *mid;
}

inline void report(const char* label, const sample& s) {
  const double mib = static_cast<double>(s.bytes) / (1024.0 * 1024.0);
  std::cout << label << ": " << (s.seconds > 0.0 ? mib / s.seconds : 0.0)
            << " MiB/s (" << s.seconds << " s)\n";
}

// An array of small records. Every record carries a signed exponent number
// so the tokenizer's sign/exponent splitting stays on the hot path.
inline std::string make_records(std::size_t count, std::size_t name_len) {
  std::uint64_t state = 0x9E3779B97F4A7C15ull;
  auto next_letter = [&state] {
    state ^= state << 13;
    state ^= state >> 7;
    state ^= state << 17;
    return static_cast<char>('a' + static_cast<int>(state % 26));
  };

  std::string out = "[";
  out.reserve(count * (name_len + 96));
  for (std::size_t n = 0; n < count; ++n) {
    if (n != 0) out += ",\n";
    out += "{\"seq\": " + std::to_string(n);
    out += ", \"active\": ";
    out += (n & 1) ? "false" : "true";
    out += ", \"label\": \"";
    for (std::size_t k = 0; k < name_len; ++k) out.push_back(next_letter());
    if (n % 8 == 0) out += "\\t\\\"q\\\"";
    out += "\", \"weight\": ";
    out += (n % 4 == 0) ? "-2.5e-3" : "1024.75";
    out += ", \"parent\": null, \"path\": [1, 2, 3]}";
  }
  out += "]";
  return out;
}

inline void read_args(int argc, char** argv, std::size_t& count, std::size_t& iters, std::size_t& runs) {
  if (argc >= 2) count = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));
}

} // namespace tjson_bench
