#ifndef CODEDROP_UTILS_BYTE_FORMAT_HPP
#define CODEDROP_UTILS_BYTE_FORMAT_HPP

#include <cstdint>
#include <string>

namespace codedrop {
namespace utils {

// Human readable byte count, e.g. 1126 -> "1.1 KiB".
// Binary units (KiB, MiB, ...) by default, SI units (kB, MB, ...) when si is set.
std::string format_byte_count(std::uint64_t bytes, bool si = false);

} // namespace utils
} // namespace codedrop

#endif // CODEDROP_UTILS_BYTE_FORMAT_HPP
