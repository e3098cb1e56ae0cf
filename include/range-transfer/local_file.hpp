#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace rangexfer {

/**
 * @brief Destination file of a fetch, opened read+write without truncation
 *
 * Its current size is the only resume checkpoint.
 */
class LocalFile {
public:
  /**
   * @throws IoError if the file cannot be opened or created
   */
  explicit LocalFile(const std::filesystem::path &path);
  ~LocalFile();

  LocalFile(const LocalFile &) = delete;
  LocalFile &operator=(const LocalFile &) = delete;

  uint64_t size() const;
  void seek(uint64_t offset);
  void write(const char *data, size_t length);

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_;
};

/**
 * @brief Bounded write buffer in front of a LocalFile
 *
 * Bytes reach the file when the buffer fills or on flush(). The destructor
 * does not flush; callers flush explicitly so write errors surface.
 */
class BufferedFileWriter {
public:
  BufferedFileWriter(LocalFile &file, size_t capacity);

  BufferedFileWriter(const BufferedFileWriter &) = delete;
  BufferedFileWriter &operator=(const BufferedFileWriter &) = delete;

  void write(const char *data, size_t length);
  void flush();

  size_t pending() const { return used_; }
  uint64_t bytesWritten() const { return bytes_written_; }

private:
  LocalFile &file_;
  std::vector<char> buffer_;
  size_t used_{0};
  uint64_t bytes_written_{0};
};

} // namespace rangexfer
