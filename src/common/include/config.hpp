// common/include/config.hpp
#ifndef LARGEFILE_CONFIG_HPP
#define LARGEFILE_CONFIG_HPP

#include <cstddef> // For size_t
#include <string>

namespace largefile_common {
namespace config {

static_assert(sizeof(std::size_t) >= 8,
              "TARGET_FILE_SIZE does not fit in a 32-bit size_t");

// --- Generator ---
// Labelled "10GB" upstream, but computed as 10000 MiB.
const std::size_t TARGET_FILE_SIZE = 10000ULL * 1024 * 1024;
const std::string LINE_TEXT = "This is a line of text to be transformed. "
                              "Adding more text to increase the size of each "
                              "line.\n";
const std::string GENERATED_FILE_NAME = "large-input.txt";

// --- Transformer ---
const std::string TRANSFORMED_FILE_NAME = "large-output.txt";
const std::size_t CHUNK_SIZE = 64 * 1024; // 64 KB
const unsigned int PROGRESS_STEP_PERCENT = 10;

} // namespace config
} // namespace largefile_common

#endif // LARGEFILE_CONFIG_HPP
