#ifndef LARGEFILE_TEXT_TRANSFORM_HPP
#define LARGEFILE_TEXT_TRANSFORM_HPP

#include <algorithm> // For std::count, std::transform
#include <cstddef>
#include <vector>

namespace largefile_common {

// Upper-cases ASCII a-z in place. Other bytes (UTF-8 multi-byte sequences
// included) pass through, so the chunk keeps its length.
inline void to_upper_ascii(std::vector<char> &data) {
  std::transform(data.begin(), data.end(), data.begin(), [](char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
  });
}

inline std::size_t count_line_terminators(const std::vector<char> &data) {
  return static_cast<std::size_t>(std::count(data.begin(), data.end(), '\n'));
}

} // namespace largefile_common

#endif // LARGEFILE_TEXT_TRANSFORM_HPP
