#ifndef LARGEFILE_CHUNK_READER_HPP
#define LARGEFILE_CHUNK_READER_HPP

#include <cstddef> // For size_t
#include <fstream>
#include <string>
#include <vector>

namespace largefile_common {

// Sequential binary reader handing out fixed-size chunks of a file.
class ChunkReader {
public:
  // Throws std::invalid_argument for chunk_size == 0 and FilesystemError if
  // the file cannot be opened.
  ChunkReader(const std::string &filename, std::size_t chunk_size);
  ~ChunkReader();

  // Next chunk of at most chunk_size bytes; empty once the file is exhausted.
  std::vector<char> read_next_chunk();
  bool eof() const;
  std::size_t total_chunks() const;
  std::size_t file_size() const;
  std::size_t chunks_read() const;

private:
  std::string m_filename;
  std::ifstream m_file_stream;
  std::size_t m_chunk_size;
  std::size_t m_file_size;
  std::size_t m_total_chunks;
  std::size_t m_chunks_read_count;
  bool m_eof;
};

} // namespace largefile_common

#endif // LARGEFILE_CHUNK_READER_HPP
