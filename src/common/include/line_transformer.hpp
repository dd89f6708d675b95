#ifndef LARGEFILE_LINE_TRANSFORMER_HPP
#define LARGEFILE_LINE_TRANSFORMER_HPP

#include <cstddef> // For size_t
#include <iostream>
#include <string>

namespace largefile_common {

struct TransformResult {
  std::size_t bytes_processed = 0;
  std::size_t lines_processed = 0;
  double elapsed_seconds = 0.0;
};

// Streams `input` through to_upper_ascii() into `output` (truncated first),
// `chunk_size` bytes at a time, writing progress lines and the final summary
// to `out`.
//
// Throws FilesystemError if the input cannot be stat'ed or read (the output is
// left untouched in that case) or the output cannot be opened, written or
// closed.
TransformResult transform_file(const std::string &input,
                               const std::string &output,
                               std::size_t chunk_size,
                               std::ostream &out = std::cout);

} // namespace largefile_common

#endif // LARGEFILE_LINE_TRANSFORMER_HPP
