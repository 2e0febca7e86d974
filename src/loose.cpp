#include "gitstore/loose.hpp"

#include "gitstore/codec.hpp"
#include "gitstore/consts.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/fs.hpp"
#include "gitstore/log.hpp"

#include <algorithm>
#include <cctype>

namespace gfs = gitstore::fs;
namespace stdfs = std::filesystem;

namespace gitstore {

namespace {

bool all_hex(std::string_view s) {
  return std::ranges::all_of(s, [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c));
  });
}

// Walks objects/xx/ directories lazily, one directory entry per step.
class LooseCursor final : public IdCursor {
public:
  LooseCursor(const stdfs::path &objects_dir, HashAlgo algo) : algo_(algo) {
    std::error_code ec;
    outer_ = stdfs::directory_iterator(objects_dir, ec);
    if (ec) {
      outer_ = stdfs::directory_iterator{};
    }
  }

  std::optional<ObjectId> next() override {
    for (;;) {
      while (inner_ != stdfs::directory_iterator{}) {
        const std::string name = inner_->path().filename().string();
        std::error_code ec;
        inner_.increment(ec);
        if (ec) {
          inner_ = stdfs::directory_iterator{};
        }
        if (name.size() != hex_size(algo_) - consts::kFanoutDirHexLen || !all_hex(name)) {
          continue; // temp files and strays
        }
        if (auto id = ObjectId::from_hex(prefix_ + name)) {
          return id;
        }
      }
      if (!advance_outer()) {
        return std::nullopt;
      }
    }
  }

private:
  bool advance_outer() {
    std::error_code ec;
    while (outer_ != stdfs::directory_iterator{}) {
      const auto entry = *outer_;
      outer_.increment(ec);
      if (ec) {
        outer_ = stdfs::directory_iterator{};
      }
      const std::string name = entry.path().filename().string();
      if (name.size() != consts::kFanoutDirHexLen || !all_hex(name) || !entry.is_directory(ec)) {
        continue;
      }
      inner_ = stdfs::directory_iterator(entry.path(), ec);
      if (ec) {
        log::warn("loose", "cannot list " + entry.path().string() + ": " + ec.message());
        inner_ = stdfs::directory_iterator{};
        continue;
      }
      prefix_ = name;
      return true;
    }
    return false;
  }

  HashAlgo algo_;
  stdfs::directory_iterator outer_;
  stdfs::directory_iterator inner_;
  std::string prefix_;
};

} // namespace

LooseBackend::LooseBackend(stdfs::path objects_dir, HashAlgo algo, int compression_level)
    : objects_dir_(std::move(objects_dir)), algo_(algo), level_(compression_level) {}

stdfs::path LooseBackend::path_for_oid(const ObjectId &object_id) const {
  const std::string hex = object_id.hex();
  const stdfs::path dir = objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

bool LooseBackend::contains(const ObjectId &id) const {
  return id.algo() == algo_ && gfs::exists(path_for_oid(id));
}

std::optional<RawObject> LooseBackend::read(const ObjectId &id) const {
  if (id.algo() != algo_) {
    return std::nullopt;
  }
  const auto path = path_for_oid(id);
  std::vector<std::uint8_t> compressed;
  try {
    compressed = gfs::read_file(path);
  } catch (const IoError &) {
    if (!gfs::exists(path)) {
      return std::nullopt;
    }
    throw;
  }
  return parse_framed(gfs::z_decompress(compressed));
}

bool LooseBackend::write(const ObjectId &id, ObjectKind kind,
                         std::span<const std::uint8_t> body) const {
  const auto path = path_for_oid(id);
  if (gfs::exists(path)) {
    return false;
  }
  // Racing writers of the same id each rename a complete file into place;
  // whichever lands last wins with identical bytes.
  const auto compressed = gfs::z_compress(frame(kind, body), level_);
  gfs::write_file_atomic(path, compressed);
  return true;
}

std::unique_ptr<IdCursor> LooseBackend::ids() const {
  return std::make_unique<LooseCursor>(objects_dir_, algo_);
}

} // namespace gitstore
