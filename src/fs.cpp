#include "gitstore/fs.hpp"

#include "gitstore/consts.hpp"
#include "gitstore/errors.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>
#include <zlib.h>

namespace gitstore::fs {

namespace {

std::filesystem::path unique_temp_for(const std::filesystem::path &p) {
  static std::atomic<std::uint64_t> counter{0};
  auto tmp = p;
  tmp += ".tmp-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1));
  return tmp;
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw IoError(p.parent_path(), "mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError(p, "open for read failed");
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw IoError(p, "read failed");
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  const auto tmp = unique_temp_for(p);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw IoError(tmp, "open temp for write failed");
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs) {
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      throw IoError(tmp, "flush temp failed");
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignore;
    std::filesystem::remove(tmp, ignore);
    throw IoError(p, "atomic replace failed: " + ec.message());
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data, int level) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), level);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) {
    throw std::runtime_error("zlib inflateInit failed");
  }
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw DecodeError("zlib", zs.msg ? zs.msg : "inflate failed");
    }
    out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw DecodeError("zlib", "truncated stream");
    }
  }
  inflateEnd(&zs);
  return out;
}

std::vector<std::uint8_t> z_inflate_exact(std::span<const std::uint8_t> data,
                                          std::size_t expected_size) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) {
    throw std::runtime_error("zlib inflateInit failed");
  }
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  // Grow with the stream; the declared size comes from untrusted headers.
  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> chunk{};
  int rc = Z_OK;
  while (rc == Z_OK) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      const std::string msg = rc == Z_BUF_ERROR ? "truncated stream"
                              : zs.msg           ? zs.msg
                                                 : "inflate failed";
      inflateEnd(&zs);
      throw DecodeError("zlib", msg);
    }
    const std::size_t produced = chunk.size() - zs.avail_out;
    if (produced > expected_size - out.size()) {
      inflateEnd(&zs);
      throw DecodeError("size", "inflated data exceeds declared size " +
                                    std::to_string(expected_size));
    }
    out.insert(out.end(), chunk.data(), chunk.data() + produced);
  }
  inflateEnd(&zs);
  if (out.size() != expected_size) {
    throw DecodeError("size", "inflated " + std::to_string(out.size()) +
                                  " bytes, declared " + std::to_string(expected_size));
  }
  return out;
}

// LockFile

LockFile::LockFile(std::filesystem::path target) : target_(std::move(target)) {
  lock_path_ = target_;
  lock_path_ += consts::kLockSuffix;
}

LockFile::~LockFile() { release(); }

bool LockFile::try_acquire() {
  ensure_parent_dir(lock_path_);
  fd_ = ::open(lock_path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0666);
  if (fd_ < 0) {
    if (errno == EEXIST) {
      return false;
    }
    throw IoError(lock_path_, std::string("cannot create lock: ") + std::strerror(errno));
  }
  held_ = true;
  return true;
}

void LockFile::write(std::span<const std::uint8_t> data) {
  std::size_t off = 0;
  while (off < data.size()) {
    const auto n = ::write(fd_, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw IoError(lock_path_, std::string("write failed: ") + std::strerror(errno));
    }
    off += static_cast<std::size_t>(n);
  }
}

void LockFile::commit() {
  if (::close(fd_) != 0) {
    fd_ = -1;
    throw IoError(lock_path_, std::string("close failed: ") + std::strerror(errno));
  }
  fd_ = -1;
  std::error_code ec;
  std::filesystem::rename(lock_path_, target_, ec);
  if (ec) {
    throw IoError(target_, "rename lock into place failed: " + ec.message());
  }
  held_ = false;
}

void LockFile::commit_delete() {
  std::error_code ec;
  std::filesystem::remove(target_, ec);
  if (ec) {
    throw IoError(target_, "delete failed: " + ec.message());
  }
  release();
}

void LockFile::release() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  if (held_) {
    std::error_code ec;
    std::filesystem::remove(lock_path_, ec);
    held_ = false;
  }
}

} // namespace gitstore::fs
