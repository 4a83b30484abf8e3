#include "utils/byte_format.hpp"
#include <cstdio>

namespace codedrop {
namespace utils {

std::string format_byte_count(std::uint64_t bytes, bool si) {
  const std::uint64_t unit = si ? 1000 : 1024;
  if (bytes < unit) {
    return std::to_string(bytes) + " B";
  }

  // Largest exponent with unit^exp <= bytes, integer math avoids log() rounding at the edges
  int exp = 0;
  double divisor = 1.0;
  for (std::uint64_t value = bytes; value >= unit && exp < 6; value /= unit) {
    ++exp;
    divisor *= static_cast<double>(unit);
  }

  const char* prefixes = si ? "kMGTPE" : "KMGTPE";
  std::string prefix(1, prefixes[exp - 1]);
  if (!si) {
    prefix += 'i';
  }

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f %sB", static_cast<double>(bytes) / divisor, prefix.c_str());
  return buffer;
}

} // namespace utils
} // namespace codedrop
