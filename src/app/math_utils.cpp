#include "app/math_utils.hpp"

#include <array>
#include <charconv>
#include <system_error>
#include <cstdlib>
#include <string>

namespace dupscan::app {

double bytes_to_mib(uint64_t bytes) { return static_cast<double>(bytes) / 1024.0 / 1024.0; }

double to_mib_per_sec(uint64_t bytes, double sec) {
  if (sec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytes) / sec / 1024.0 / 1024.0;
}

// Incremental mean: count is the 1-based index of `sample`.
double update_running_mean(double mean, double sample, uint64_t count) {
  if (count == 0) {
    return mean;
  }
  return mean + (sample - mean) / static_cast<double>(count);
}

std::string format_shortest(double v) {
  std::array<char, 64> buf{};
  const auto sci = std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::scientific);
  if (sci.ec != std::errc{}) {
    return std::to_string(v);
  }
  std::string out(buf.data(), sci.ptr);
  const auto e = out.find('e');
  if (e == std::string::npos) {
    return out;  // inf or nan
  }
  const int exp = std::atoi(out.c_str() + e + 1);
  if (exp < -4 || exp >= 6) {
    return out;
  }
  const auto fixed = std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::fixed);
  if (fixed.ec != std::errc{}) {
    return out;
  }
  return std::string(buf.data(), fixed.ptr);
}

}  // namespace dupscan::app
