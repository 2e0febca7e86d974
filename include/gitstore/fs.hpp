#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitstore::fs {

bool exists(const std::filesystem::path &p);
void ensure_parent_dir(const std::filesystem::path &p);

std::vector<std::uint8_t> read_file(const std::filesystem::path &p);

// Write to a writer-unique temp file beside `p`, then rename it into place.
// Readers see the old content or the new content, never a mix.
void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}
inline std::string_view as_text(std::span<const std::uint8_t> b) {
  return {reinterpret_cast<const char *>(b.data()), b.size()};
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data, int level = 1);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// Inflate one zlib stream from the front of `data`, which may continue past its
// end (as inside a pack). Throws DecodeError("size") unless exactly
// `expected_size` bytes come out; nothing is allocated up front from it.
std::vector<std::uint8_t> z_inflate_exact(std::span<const std::uint8_t> data,
                                          std::size_t expected_size);

/**
 * "<path>.lock" taken with O_CREAT|O_EXCL. While held, the owner writes the
 * new content into the lock file and commit() renames it over <path>.
 * Dropping an uncommitted lock removes it.
 */
class LockFile {
public:
  // Returns false from try_acquire() if someone else holds the lock.
  explicit LockFile(std::filesystem::path target);
  ~LockFile();
  LockFile(const LockFile &) = delete;
  LockFile &operator=(const LockFile &) = delete;

  [[nodiscard]] bool try_acquire();
  void write(std::span<const std::uint8_t> data);
  void commit();
  // Give up the lock and delete `target` instead of replacing it.
  void commit_delete();

  [[nodiscard]] const std::filesystem::path &lock_path() const { return lock_path_; }

private:
  void release() noexcept;

  std::filesystem::path target_;
  std::filesystem::path lock_path_;
  int fd_ = -1;
  bool held_ = false;
};

} // namespace gitstore::fs
