#include "chunk_reader.hpp"
#include "filesystem_error.hpp"
#include <cerrno>
#include <stdexcept>

namespace largefile_common {

ChunkReader::ChunkReader(const std::string &filename, std::size_t chunk_size)
    : m_filename(filename), m_chunk_size(chunk_size), m_file_size(0),
      m_total_chunks(0), m_chunks_read_count(0), m_eof(false) {
  if (m_chunk_size == 0) {
    throw std::invalid_argument("ChunkReader: chunk size must be positive");
  }

  errno = 0;
  m_file_stream.open(filename, std::ios::binary | std::ios::in);
  if (!m_file_stream) {
    throw FilesystemError("ChunkReader: Could not open file", filename,
                          FilesystemError::last_errno());
  }

  m_file_stream.seekg(0, std::ios::end);
  m_file_size = static_cast<std::size_t>(m_file_stream.tellg());
  m_file_stream.seekg(0, std::ios::beg);

  if (m_file_size == 0) {
    m_eof = true;
  } else {
    m_total_chunks =
        (m_file_size + m_chunk_size - 1) / m_chunk_size; // Ceiling division
  }
}

ChunkReader::~ChunkReader() {
  if (m_file_stream.is_open()) {
    m_file_stream.close();
  }
}

std::vector<char> ChunkReader::read_next_chunk() {
  if (m_eof || !m_file_stream.is_open()) {
    m_eof = true;
    return {};
  }

  std::vector<char> buffer(m_chunk_size);
  errno = 0;
  m_file_stream.read(buffer.data(), static_cast<std::streamsize>(m_chunk_size));
  std::streamsize bytes_read = m_file_stream.gcount();

  // A short read sets failbit together with eofbit; anything else is an error.
  if (m_file_stream.bad() || (m_file_stream.fail() && !m_file_stream.eof())) {
    m_eof = true;
    throw FilesystemError("ChunkReader: Read failed", m_filename,
                          FilesystemError::last_errno());
  }

  if (bytes_read == 0) {
    m_eof = true;
    return {};
  }

  if (bytes_read < static_cast<std::streamsize>(m_chunk_size) ||
      m_file_stream.peek() == std::char_traits<char>::eof()) {
    m_eof = true;
  }

  buffer.resize(static_cast<std::size_t>(bytes_read));
  m_chunks_read_count++;
  return buffer;
}

bool ChunkReader::eof() const { return m_eof; }

std::size_t ChunkReader::total_chunks() const { return m_total_chunks; }

std::size_t ChunkReader::file_size() const { return m_file_size; }

std::size_t ChunkReader::chunks_read() const { return m_chunks_read_count; }

} // namespace largefile_common
