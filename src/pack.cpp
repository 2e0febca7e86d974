#include "gitstore/pack.hpp"

#include "gitstore/consts.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/fs.hpp"
#include "gitstore/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace gitstore {

namespace {

constexpr std::size_t kFanoutEntries = 256;
constexpr std::size_t kIdxHeaderLen = 8;
constexpr std::size_t kPackHeaderLen = 12;

std::uint32_t read_u32_be(const std::uint8_t *p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint64_t read_u64_be(const std::uint8_t *p) {
  return (static_cast<std::uint64_t>(read_u32_be(p)) << 32) | read_u32_be(p + 4);
}

std::optional<ObjectKind> pack_type_to_kind(unsigned type) {
  switch (type) {
  case 1:
    return ObjectKind::Commit;
  case 2:
    return ObjectKind::Tree;
  case 3:
    return ObjectKind::Blob;
  case 4:
    return ObjectKind::Tag;
  default:
    return std::nullopt;
  }
}

constexpr unsigned kOfsDelta = 6;
constexpr unsigned kRefDelta = 7;

// Bounds-checked forward reader over a byte span.
class ByteReader {
public:
  ByteReader(std::span<const std::uint8_t> data, std::size_t pos, std::string_view field)
      : data_(data), pos_(pos), field_(field) {}

  std::uint8_t next() {
    if (pos_ >= data_.size()) {
      throw DecodeError(field_, "unexpected end of data");
    }
    return data_[pos_++];
  }
  std::span<const std::uint8_t> take(std::size_t n) {
    if (data_.size() - pos_ < n) {
      throw DecodeError(field_, "unexpected end of data");
    }
    auto out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
  }
  [[nodiscard]] std::span<const std::uint8_t> rest() const { return data_.subspan(pos_); }
  [[nodiscard]] bool done() const { return pos_ >= data_.size(); }

  // Little-endian base-128 varint, as used for delta sizes.
  std::uint64_t varint() {
    std::uint64_t v = 0;
    unsigned shift = 0;
    std::uint8_t c = 0;
    do {
      c = next();
      if (shift > 63) {
        throw DecodeError(field_, "varint overflow");
      }
      v |= static_cast<std::uint64_t>(c & 0x7fU) << shift;
      shift += 7;
    } while (c & 0x80U);
    return v;
  }

private:
  std::span<const std::uint8_t> data_;
  std::size_t pos_;
  std::string_view field_;
};

class PackCursor final : public IdCursor {
public:
  explicit PackCursor(const PackBackend &pack) : pack_(pack) {}
  std::optional<ObjectId> next() override {
    if (i_ >= pack_.object_count()) {
      return std::nullopt;
    }
    return pack_.id_at(i_++);
  }

private:
  const PackBackend &pack_;
  std::size_t i_ = 0;
};

} // namespace

// MappedFile

MappedFile::MappedFile(const std::filesystem::path &path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    throw IoError(path, std::string("open failed: ") + std::strerror(errno));
  }
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    throw IoError(path, std::string("stat failed: ") + std::strerror(err));
  }
  size_ = static_cast<std::size_t>(st.st_size);
  if (size_ == 0) {
    ::close(fd);
    throw DecodeError("pack", "empty file " + path.string());
  }
  void *m = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
  ::close(fd);
  if (m == MAP_FAILED) {
    throw IoError(path, std::string("mmap failed: ") + std::strerror(errno));
  }
  data_ = static_cast<const std::uint8_t *>(m);
}

MappedFile::~MappedFile() {
  if (data_) {
    ::munmap(const_cast<std::uint8_t *>(data_), size_);
  }
}

// PackBackend

PackBackend::PackBackend(const std::filesystem::path &idx_path, HashAlgo algo)
    : algo_(algo), pack_path_(std::filesystem::path(idx_path).replace_extension(".pack")),
      idx_(idx_path), pack_(pack_path_) {
  const auto idx = idx_.bytes();
  const std::size_t hlen = raw_size(algo_);
  const std::size_t fixed = kIdxHeaderLen + (kFanoutEntries * 4);
  if (idx.size() < fixed + (2 * hlen)) {
    throw DecodeError("idx", "index too small: " + idx_path.string());
  }
  if (read_u32_be(idx.data()) != consts::kIdxSignature ||
      read_u32_be(idx.data() + 4) != consts::kIdxVersion) {
    throw DecodeError("idx", "unsupported index version: " + idx_path.string());
  }
  fanout_ = idx.subspan(kIdxHeaderLen, kFanoutEntries * 4);
  std::uint32_t prev = 0;
  for (std::size_t i = 0; i < kFanoutEntries; ++i) {
    const std::uint32_t v = read_u32_be(fanout_.data() + (4 * i));
    if (v < prev) {
      throw DecodeError("idx", "fan-out table not monotonic");
    }
    prev = v;
  }
  count_ = prev;

  const std::size_t ids_off = fixed;
  const std::size_t crc_off = ids_off + (count_ * hlen);
  const std::size_t ofs_off = crc_off + (count_ * 4);
  const std::size_t large_off = ofs_off + (count_ * 4);
  const std::size_t trailer = 2 * hlen;
  if (idx.size() < large_off + trailer) {
    throw DecodeError("idx", "index truncated: " + idx_path.string());
  }
  ids_ = idx.subspan(ids_off, count_ * hlen);
  offsets_ = idx.subspan(ofs_off, count_ * 4);
  large_offsets_ = idx.subspan(large_off, idx.size() - large_off - trailer);

  const auto pack = pack_.bytes();
  if (pack.size() < kPackHeaderLen + hlen || read_u32_be(pack.data()) != consts::kPackSignature) {
    throw DecodeError("pack", "bad pack signature: " + pack_path_.string());
  }
  const std::uint32_t version = read_u32_be(pack.data() + 4);
  if (version != 2 && version != 3) {
    throw DecodeError("pack", "unsupported pack version " + std::to_string(version));
  }
  if (read_u32_be(pack.data() + 8) != count_) {
    throw DecodeError("pack", "object count disagrees with index: " + pack_path_.string());
  }
  if (log::tracing()) {
    log::trace("pack", "loaded " + pack_path_.filename().string() + " (" +
                           std::to_string(count_) + " objects)");
  }
}

ObjectId PackBackend::id_at(std::size_t i) const {
  const std::size_t hlen = raw_size(algo_);
  return ObjectId(algo_, ids_.subspan(i * hlen, hlen));
}

std::optional<std::size_t> PackBackend::find_index(std::span<const std::uint8_t> raw) const {
  const std::size_t hlen = raw_size(algo_);
  const unsigned first = raw[0];
  std::size_t lo = first == 0 ? 0 : read_u32_be(fanout_.data() + (4 * (first - 1)));
  std::size_t hi = read_u32_be(fanout_.data() + (4 * first));
  while (lo < hi) {
    const std::size_t mid = lo + ((hi - lo) / 2);
    const int cmp = std::memcmp(ids_.data() + (mid * hlen), raw.data(), hlen);
    if (cmp == 0) {
      return mid;
    }
    if (cmp < 0) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  return std::nullopt;
}

std::uint64_t PackBackend::offset_at(std::size_t i) const {
  const std::uint32_t v = read_u32_be(offsets_.data() + (4 * i));
  if ((v & 0x80000000U) == 0) {
    return v;
  }
  const std::size_t large = v & 0x7fffffffU;
  if ((large + 1) * 8 > large_offsets_.size()) {
    throw DecodeError("idx", "large offset out of range");
  }
  return read_u64_be(large_offsets_.data() + (large * 8));
}

bool PackBackend::contains(const ObjectId &id) const {
  return id.algo() == algo_ && find_index(id.bytes()).has_value();
}

std::optional<RawObject> PackBackend::read(const ObjectId &id) const {
  if (id.algo() != algo_) {
    return std::nullopt;
  }
  const auto i = find_index(id.bytes());
  if (!i) {
    return std::nullopt;
  }
  return read_at(offset_at(*i), 0);
}

std::unique_ptr<IdCursor> PackBackend::ids() const { return std::make_unique<PackCursor>(*this); }

RawObject PackBackend::read_at(std::uint64_t offset, int depth) const {
  if (depth > consts::kMaxDeltaDepth) {
    throw DecodeError("delta", "delta chain too deep in " + pack_path_.string());
  }
  const std::size_t hlen = raw_size(algo_);
  const auto pack = pack_.bytes();
  const auto objects = pack.first(pack.size() - hlen); // drop trailing checksum
  if (offset < kPackHeaderLen || offset >= objects.size()) {
    throw DecodeError("pack", "offset out of range");
  }
  ByteReader in(objects, static_cast<std::size_t>(offset), "pack");

  // type/size header: 3 type bits, then size in 4 + 7n bits
  std::uint8_t c = in.next();
  const unsigned type = (c >> 4U) & 0x7U;
  std::uint64_t size = c & 0x0fU;
  unsigned shift = 4;
  while (c & 0x80U) {
    c = in.next();
    if (shift > 57) {
      throw DecodeError("pack", "entry size overflow");
    }
    size |= static_cast<std::uint64_t>(c & 0x7fU) << shift;
    shift += 7;
  }

  if (const auto kind = pack_type_to_kind(type)) {
    return RawObject{.kind = *kind,
                     .body = fs::z_inflate_exact(in.rest(), static_cast<std::size_t>(size))};
  }

  RawObject base;
  if (type == kOfsDelta) {
    c = in.next();
    std::uint64_t rel = c & 0x7fU;
    while (c & 0x80U) {
      c = in.next();
      rel = ((rel + 1) << 7U) | (c & 0x7fU);
    }
    if (rel == 0 || rel > offset) {
      throw DecodeError("delta", "bad base offset");
    }
    base = read_at(offset - rel, depth + 1);
  } else if (type == kRefDelta) {
    const auto base_raw = in.take(hlen);
    const auto bi = find_index(base_raw);
    if (!bi) {
      throw DecodeError("delta", "base " + to_hex(base_raw) + " not in pack");
    }
    base = read_at(offset_at(*bi), depth + 1);
  } else {
    throw DecodeError("type", "unknown pack entry type " + std::to_string(type));
  }
  const auto delta = fs::z_inflate_exact(in.rest(), static_cast<std::size_t>(size));
  return RawObject{.kind = base.kind, .body = apply_delta(base.body, delta)};
}

std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta) {
  ByteReader in(delta, 0, "delta");
  const std::uint64_t base_size = in.varint();
  const std::uint64_t result_size = in.varint();
  if (base_size != base.size()) {
    throw DecodeError("delta", "base size mismatch");
  }
  // result_size is untrusted; reserve no more than the inputs' combined size.
  std::vector<std::uint8_t> out;
  out.reserve(static_cast<std::size_t>(
      std::min<std::uint64_t>(result_size, base.size() + delta.size())));

  while (!in.done()) {
    const std::uint8_t op = in.next();
    if (op & 0x80U) {
      std::uint64_t off = 0;
      std::uint64_t len = 0;
      for (unsigned b = 0; b < 4; ++b) {
        if (op & (1U << b)) {
          off |= static_cast<std::uint64_t>(in.next()) << (8 * b);
        }
      }
      for (unsigned b = 0; b < 3; ++b) {
        if (op & (0x10U << b)) {
          len |= static_cast<std::uint64_t>(in.next()) << (8 * b);
        }
      }
      if (len == 0) {
        len = 0x10000;
      }
      if (off + len > base.size()) {
        throw DecodeError("delta", "copy out of base bounds");
      }
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(off),
                 base.begin() + static_cast<std::ptrdiff_t>(off + len));
    } else if (op != 0) {
      const auto lit = in.take(op);
      out.insert(out.end(), lit.begin(), lit.end());
    } else {
      throw DecodeError("delta", "reserved opcode 0");
    }
    if (out.size() > result_size) {
      throw DecodeError("delta", "result larger than declared");
    }
  }
  if (out.size() != result_size) {
    throw DecodeError("delta", "result size mismatch");
  }
  return out;
}

} // namespace gitstore
