// common/include/filesystem_error.hpp
#ifndef LARGEFILE_FILESYSTEM_ERROR_HPP
#define LARGEFILE_FILESYSTEM_ERROR_HPP

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

namespace largefile_common {

// Raised for any open/read/write/close/stat failure on a file.
class FilesystemError : public std::runtime_error {
public:
  FilesystemError(const std::string &message, const std::string &path,
                  std::error_code code = std::error_code())
      : std::runtime_error(format(message, path, code)), m_path(path),
        m_code(code) {}

  const std::string &path() const { return m_path; }
  const std::error_code &code() const { return m_code; }

  // Snapshot of errno, empty when errno is not set.
  static std::error_code last_errno() {
    int err = errno;
    if (err == 0) {
      return std::error_code();
    }
    return std::error_code(err, std::generic_category());
  }

private:
  static std::string format(const std::string &message,
                            const std::string &path,
                            const std::error_code &code) {
    std::string text = message + ": " + path;
    if (code) {
      text += " (" + code.message() + ")";
    }
    return text;
  }

  std::string m_path;
  std::error_code m_code;
};

} // namespace largefile_common

#endif // LARGEFILE_FILESYSTEM_ERROR_HPP
