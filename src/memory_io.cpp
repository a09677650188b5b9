/**
 * @file memory_io.cpp
 * @brief Whole-file memory I/O implementation
 *
 * @details Provides implementations for:
 *
 *          - MappedFile: RAII wrapper for mmap
 *
 *          - MemoryLoader::load_file - Map file into memory
 *
 *          - MemoryLoader::store_file - Write a new clip file
 *
 *          - MemoryLoader::read / seek - libavformat I/O callbacks
 */

#include "clip_forge/memory_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

#include "clip_forge/logging.hpp"

namespace clip_forge {

// **---- MappedFile Implementation ----**

void MappedFile::release() {
  if (data_) {
    munmap(data_, size_);
  }
  if (fd_ != -1) {
    close(fd_);
  }
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

MappedFile::~MappedFile() { release(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

// **---- MemoryLoader Implementation ----**

bool MemoryLoader::load_file(const std::string &path, MappedFile &file) {
  TIMER_START(load_file);

  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    LOG_ERROR("Failed to open file: {} ({})", path, std::strerror(errno));
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    LOG_ERROR("Failed to stat file: {} ({})", path, std::strerror(errno));
    close(fd);
    return false;
  }

  /// mmap rejects zero-length mappings; an empty clip is still a clip
  void *addr = nullptr;
  if (sb.st_size > 0) {
    addr = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE | MAP_POPULATE,
                fd, 0);
    if (addr == MAP_FAILED) {
      LOG_ERROR("Failed to mmap file: {} ({})", path, std::strerror(errno));
      close(fd);
      return false;
    }
    /// Every transform reads front to back exactly once
    madvise(addr, sb.st_size, MADV_SEQUENTIAL);
  }

  file.release();
  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = static_cast<size_t>(sb.st_size);
  file.fd_ = fd;

  TIMER_END(load_file);
  return true;
}

bool MemoryLoader::store_file(const std::string &path, const uint8_t *data,
                              size_t size) {
  TIMER_START(store_file);

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to create file: {} ({})", path, std::strerror(errno));
    return false;
  }

  size_t written = 0;
  while (written < size) {
    ssize_t n = write(fd, data + written, size - written);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("Failed to write file: {} ({})", path, std::strerror(errno));
      close(fd);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  /// The catalog row is only inserted once the bytes are durable
  if (fsync(fd) == -1) {
    LOG_ERROR("Failed to sync file: {} ({})", path, std::strerror(errno));
    close(fd);
    return false;
  }

  if (close(fd) == -1) {
    LOG_ERROR("Failed to close file: {} ({})", path, std::strerror(errno));
    return false;
  }

  TIMER_END(store_file);
  return true;
}

int MemoryLoader::read(void *opaque, uint8_t *buf, int buf_size) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);
  size_t bytes_left = bd->size - bd->pos;
  if (bytes_left == 0)
    return AVERROR_EOF;
  size_t copy = std::min(bytes_left, static_cast<size_t>(buf_size));
  memcpy(buf, bd->ptr + bd->pos, copy);
  bd->pos += copy;
  return static_cast<int>(copy);
}

int64_t MemoryLoader::seek(void *opaque, int64_t offset, int whence) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);

  if (whence & AVSEEK_SIZE)
    return static_cast<int64_t>(bd->size);

  int64_t new_pos = static_cast<int64_t>(bd->pos);
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    new_pos = offset;
    break;
  case SEEK_CUR:
    new_pos += offset;
    break;
  case SEEK_END:
    new_pos = static_cast<int64_t>(bd->size) + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  if (new_pos < 0 || new_pos > static_cast<int64_t>(bd->size))
    return AVERROR(EINVAL);

  bd->pos = static_cast<size_t>(new_pos);
  return new_pos;
}

} // namespace clip_forge
