#include <range-transfer/errors.hpp>
#include <range-transfer/local_file.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace rangexfer {

namespace {

std::string describe(const std::string &operation,
                     const std::filesystem::path &path) {
  return operation + " " + path.string() + ": " + strerror(errno);
}

} // namespace

LocalFile::LocalFile(const std::filesystem::path &path)
    : path_(path), fd_(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666)) {
  if (fd_ == -1) {
    throw IoError(describe("open", path_));
  }
}

LocalFile::~LocalFile() { close(fd_); }

uint64_t LocalFile::size() const {
  struct stat st {};
  if (fstat(fd_, &st) == -1) {
    throw IoError(describe("stat", path_));
  }
  return static_cast<uint64_t>(st.st_size);
}

void LocalFile::seek(uint64_t offset) {
  if (lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == -1) {
    throw IoError(describe("seek", path_));
  }
}

void LocalFile::write(const char *data, size_t length) {
  while (length > 0) {
    ssize_t written = ::write(fd_, data, length);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw IoError(describe("write", path_));
    }
    data += written;
    length -= static_cast<size_t>(written);
  }
}

BufferedFileWriter::BufferedFileWriter(LocalFile &file, size_t capacity)
    : file_(file), buffer_(std::max<size_t>(capacity, 1)) {}

void BufferedFileWriter::write(const char *data, size_t length) {
  bytes_written_ += length;
  if (used_ == 0 && length >= buffer_.size()) {
    file_.write(data, length);
    return;
  }
  while (length > 0) {
    size_t room = buffer_.size() - used_;
    size_t take = std::min(room, length);
    std::memcpy(buffer_.data() + used_, data, take);
    used_ += take;
    data += take;
    length -= take;
    if (used_ == buffer_.size()) {
      flush();
    }
  }
}

void BufferedFileWriter::flush() {
  if (used_ == 0) {
    return;
  }
  file_.write(buffer_.data(), used_);
  used_ = 0;
}

} // namespace rangexfer
