#pragma once

#include <cstdint>
#include <string>

namespace dupscan::app {

double bytes_to_mib(uint64_t bytes);
double to_mib_per_sec(uint64_t bytes, double sec);
double update_running_mean(double mean, double sample, uint64_t count);

// Shortest text that parses back to `v`. Exponent form is used when the
// decimal exponent is below -4 or at least 6, e.g. 4.76837158203125e-06.
std::string format_shortest(double v);

}  // namespace dupscan::app
