/**
 * @file memory_io.hpp
 * @brief Whole-file memory I/O for clip transforms
 *
 * @details Provides:
 *          - MappedFile: RAII read-only mapping of a stored clip
 *
 *          - MemoryLoader: file mapping, whole-buffer writes and the
 *            libavformat I/O callbacks used to probe from RAM
 *
 * @attention Trim and merge materialise whole clips in memory. The upload
 *            duration ceiling bounds how large those buffers can get.
 */

#ifndef CLIP_FORGE_MEMORY_IO_HPP
#define CLIP_FORGE_MEMORY_IO_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace clip_forge {

/**
 * @brief MemReaderState: State for custom libavformat I/O from a buffer.
 */
struct alignas(CACHE_LINE_SIZE) MemReaderState {
  const uint8_t *ptr; //< Pointer to buffer start
  size_t size;        //< Total buffer size
  size_t pos;         //< Current read position
};

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note A zero-byte file is a valid, open mapping with a null data pointer.
 *       Supports move semantics but not copy.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  /// Disable copy
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  /// Enable move
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_valid() const { return fd_ != -1; }

private:
  friend class MemoryLoader;
  void release();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/**
 * @class MemoryLoader
 * @brief Loads clips into RAM, writes transform outputs and provides
 *        custom I/O callbacks for libavformat.
 *
 * @attention ROBUSTNESS:
 *
 * - Uses mmap for read access (zero-copy)
 *
 * - Output files are created exclusively (O_EXCL) so a name collision
 *   can never overwrite an existing clip
 *
 * - Short writes are retried until the buffer is drained
 *
 * - Logs meaningful error messages with errno text
 */
class MemoryLoader {
public:
  /**
   * @brief Map an entire file into memory using mmap.
   * @param path Path to the file
   * @param file Output MappedFile object (takes ownership of the mapping)
   * @return true on success, false on failure
   */
  static bool load_file(const std::string &path, MappedFile &file);

  /**
   * @brief Write a buffer to a new file and flush it to disk.
   * @param path Destination path (must not exist yet)
   * @param data Bytes to write
   * @param size Number of bytes
   * @return true on success, false on failure
   */
  static bool store_file(const std::string &path, const uint8_t *data,
                         size_t size);

  /// Convenience overload for owned buffers
  static bool store_file(const std::string &path,
                         const std::vector<uint8_t> &buffer) {
    return store_file(path, buffer.data(), buffer.size());
  }

  /**
   * @brief libavformat read callback for custom I/O.
   */
  static int read(void *opaque, uint8_t *buf, int buf_size);

  /**
   * @brief libavformat seek callback for custom I/O.
   * @note Handles all seek modes including AVSEEK_SIZE.
   */
  static int64_t seek(void *opaque, int64_t offset, int whence);
};

} // namespace clip_forge

#endif // CLIP_FORGE_MEMORY_IO_HPP
