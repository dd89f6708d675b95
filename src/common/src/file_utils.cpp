#include "file_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace largefile_common {

std::size_t compute_line_count(std::size_t target_size,
                               const std::string &line) {
  if (line.empty()) {
    throw std::invalid_argument("compute_line_count: line must not be empty");
  }
  // std::string::size() is the UTF-8 byte length, the same bytes we write.
  return target_size / line.size();
}

std::size_t expected_file_size(std::size_t target_size,
                               const std::string &line) {
  return compute_line_count(target_size, line) * line.size();
}

GenerationResult generate_line_file(const std::string &path,
                                    std::size_t target_size,
                                    const std::string &line) {
  const std::size_t num_lines = compute_line_count(target_size, line);

  // Binary mode: no newline translation, so bytes on disk == bytes measured.
  errno = 0;
  std::ofstream outfile(path,
                        std::ios::binary | std::ios::out | std::ios::trunc);
  if (!outfile) {
    throw FilesystemError("Could not open file for writing", path,
                          FilesystemError::last_errno());
  }

  GenerationResult result;
  const auto line_size = static_cast<std::streamsize>(line.size());
  for (std::size_t i = 0; i < num_lines; ++i) {
    outfile.write(line.data(), line_size);
    if (!outfile) {
      throw FilesystemError("Failed to write to file", path,
                            FilesystemError::last_errno());
    }
    ++result.lines_written;
    result.bytes_written += line.size();
  }

  outfile.close();
  if (!outfile) {
    throw FilesystemError("Failed to close file", path,
                          FilesystemError::last_errno());
  }
  return result;
}

int run_generator(const std::string &path, std::size_t target_size,
                  const std::string &line, std::ostream &out,
                  std::ostream &err) {
  try {
    generate_line_file(path, target_size, line);
    out << "File created successfully at " << path << std::endl;
  } catch (const std::exception &e) {
    err << "Generator Exception in main: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

} // namespace largefile_common
