#include "line_transformer.hpp"
#include "chunk_reader.hpp"
#include "filesystem_error.hpp"
#include "text_transform.hpp"
#include "transform_metrics.hpp"

#include <cerrno>
#include <cstdint>
#include <filesystem> // Requires C++17
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace largefile_common {

TransformResult transform_file(const std::string &input,
                               const std::string &output,
                               std::size_t chunk_size, std::ostream &out) {
  std::error_code ec;
  std::uintmax_t input_size = fs::file_size(input, ec);
  if (ec) {
    throw FilesystemError("Could not get input file size", input, ec);
  }

  ChunkReader reader(input, chunk_size);

  errno = 0;
  std::ofstream outfile(output,
                        std::ios::binary | std::ios::out | std::ios::trunc);
  if (!outfile) {
    throw FilesystemError("Could not open file for writing", output,
                          FilesystemError::last_errno());
  }

  TransformMetrics metrics(static_cast<std::size_t>(input_size), out);
  metrics.start_timer();

  while (!reader.eof()) {
    std::vector<char> chunk = reader.read_next_chunk();
    if (chunk.empty()) {
      break;
    }
    std::size_t lines = count_line_terminators(chunk);
    to_upper_ascii(chunk);

    outfile.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!outfile) {
      throw FilesystemError("Failed to write to file", output,
                            FilesystemError::last_errno());
    }
    metrics.record_chunk(chunk.size(), lines);
  }

  outfile.close();
  if (!outfile) {
    throw FilesystemError("Failed to close file", output,
                          FilesystemError::last_errno());
  }
  metrics.stop_timer();
  metrics.print_summary();

  TransformResult result;
  result.bytes_processed = metrics.bytes_processed();
  result.lines_processed = metrics.lines_processed();
  result.elapsed_seconds = metrics.elapsed_seconds();
  return result;
}

} // namespace largefile_common
