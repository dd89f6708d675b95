// common/include/file_utils.hpp
#ifndef LARGEFILE_FILE_UTILS_HPP
#define LARGEFILE_FILE_UTILS_HPP

#include <cstddef> // For size_t
#include <iostream>
#include <string>

#include "filesystem_error.hpp"

namespace largefile_common {

struct GenerationResult {
  std::size_t lines_written = 0;
  std::size_t bytes_written = 0;
};

// Number of whole copies of `line` that fit in `target_size` bytes (floor).
// Throws std::invalid_argument if `line` is empty.
std::size_t compute_line_count(std::size_t target_size,
                               const std::string &line);

// Size of the file generate_line_file() produces for the same arguments.
std::size_t expected_file_size(std::size_t target_size,
                               const std::string &line);

// Creates (or truncates) `path` and writes `line` compute_line_count() times.
// Prints nothing. Throws FilesystemError on open/write/close failure; a
// failure partway leaves the truncated file in place.
GenerationResult generate_line_file(const std::string &path,
                                    std::size_t target_size,
                                    const std::string &line);

// Generator entry point: runs generate_line_file(), prints the single
// confirmation line to `out` and returns 0, or reports the error to `err` and
// returns 1.
int run_generator(const std::string &path, std::size_t target_size,
                  const std::string &line, std::ostream &out = std::cout,
                  std::ostream &err = std::cerr);

} // namespace largefile_common

#endif // LARGEFILE_FILE_UTILS_HPP
