#include "gitstore/object_store.hpp"

#include "gitstore/codec.hpp"
#include "gitstore/consts.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/log.hpp"

#include <algorithm>
#include <mutex>

namespace stdfs = std::filesystem;

namespace gitstore {

namespace {

// Loose ids first, then each pack's ids minus anything an earlier source had.
// Holds its own copy of the loose backend and shares the packs, so it stays
// valid after the store that made it is gone.
class StoreCursor final : public IdCursor {
public:
  StoreCursor(LooseBackend loose, std::vector<std::shared_ptr<const PackBackend>> packs)
      : loose_(std::move(loose)), packs_(std::move(packs)), current_(loose_.ids()) {}

  std::optional<ObjectId> next() override {
    for (;;) {
      if (current_) {
        while (auto id = current_->next()) {
          if (!shadowed(*id)) {
            return id;
          }
        }
      }
      if (next_pack_ >= packs_.size()) {
        current_.reset();
        return std::nullopt;
      }
      current_ = packs_[next_pack_++]->ids();
    }
  }

private:
  // true if `id` was (or will have been) yielded from an earlier source
  bool shadowed(const ObjectId &id) const {
    if (next_pack_ == 0) {
      return false; // still on the loose pass
    }
    if (loose_.contains(id)) {
      return true;
    }
    const std::size_t this_pack = next_pack_ - 1;
    for (std::size_t i = 0; i < this_pack; ++i) {
      if (packs_[i]->contains(id)) {
        return true;
      }
    }
    return false;
  }

  LooseBackend loose_;
  std::vector<std::shared_ptr<const PackBackend>> packs_;
  std::unique_ptr<IdCursor> current_;
  std::size_t next_pack_ = 0;
};

template <class T> T expect_kind(Object obj, const ObjectId &id) {
  if (auto *p = std::get_if<T>(&obj)) {
    return std::move(*p);
  }
  throw DecodeError("kind", "object " + id.hex() + " is a " +
                                std::string(kind_name(kind_of(obj))));
}

} // namespace

ObjectStore::ObjectStore(stdfs::path objects_dir, StoreOptions opts)
    : objects_dir_(std::move(objects_dir)), opts_(opts),
      loose_(objects_dir_, opts.algo, opts.compression) {
  reload_packs();
}

void ObjectStore::reload_packs() {
  std::vector<stdfs::path> idx_files;
  std::error_code ec;
  const auto pack_dir = objects_dir_ / consts::kPackDir;
  for (stdfs::directory_iterator it(pack_dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto &p = it->path();
    if (p.extension() == ".idx" && p.filename().string().starts_with("pack-")) {
      idx_files.push_back(p);
    }
  }
  std::ranges::sort(idx_files);

  std::vector<std::shared_ptr<const PackBackend>> loaded;
  for (const auto &idx : idx_files) {
    try {
      loaded.push_back(std::make_shared<const PackBackend>(idx, opts_.algo));
    } catch (const Error &e) {
      // a compactor may still be writing this pack; it shows up on the next reload
      log::warn("object_store", "skipping pack " + idx.filename().string() + ": " + e.what());
    }
  }

  const std::unique_lock lock(packs_mutex_);
  packs_ = std::move(loaded);
}

std::size_t ObjectStore::pack_count() const {
  const std::shared_lock lock(packs_mutex_);
  return packs_.size();
}

std::vector<std::shared_ptr<const PackBackend>> ObjectStore::packs_snapshot() const {
  const std::shared_lock lock(packs_mutex_);
  return packs_;
}

bool ObjectStore::has(const ObjectId &id) const {
  if (loose_.contains(id)) {
    return true;
  }
  const auto packs = packs_snapshot();
  return std::ranges::any_of(packs, [&](const auto &p) { return p->contains(id); });
}

RawObject ObjectStore::read_raw(const ObjectId &id) const {
  if (auto raw = loose_.read(id)) {
    return std::move(*raw);
  }
  for (const auto &p : packs_snapshot()) {
    if (auto raw = p->read(id)) {
      return std::move(*raw);
    }
  }
  throw ObjectNotFound(id);
}

Object ObjectStore::get(const ObjectId &id) const {
  const auto raw = read_raw(id);
  return deserialize(raw.kind, raw.body, opts_.algo);
}

Blob ObjectStore::read_blob(const ObjectId &id) const { return expect_kind<Blob>(get(id), id); }
Tree ObjectStore::read_tree(const ObjectId &id) const { return expect_kind<Tree>(get(id), id); }
Commit ObjectStore::read_commit(const ObjectId &id) const {
  return expect_kind<Commit>(get(id), id);
}
Tag ObjectStore::read_tag(const ObjectId &id) const { return expect_kind<Tag>(get(id), id); }

ObjectId ObjectStore::add(const Object &obj) const {
  const auto body = serialize(obj);
  return add_raw(kind_of(obj), body);
}

ObjectId ObjectStore::add_raw(ObjectKind kind, std::span<const std::uint8_t> body) const {
  const ObjectId id = digest(kind, body, opts_.algo);
  if (has(id)) {
    return id;
  }
  if (loose_.write(id, kind, body) && log::tracing()) {
    log::trace("object_store", "wrote " + std::string(kind_name(kind)) + " " + id.hex());
  }
  return id;
}

ObjectIdRange ObjectStore::iter_all() const {
  return ObjectIdRange(std::make_unique<StoreCursor>(loose_, packs_snapshot()));
}

void ObjectStore::verify(const ObjectId &id) const {
  const auto raw = read_raw(id);
  const ObjectId actual = digest(raw.kind, raw.body, opts_.algo);
  if (actual != id) {
    throw DecodeError("digest", "object " + id.hex() + " hashes to " + actual.hex());
  }
}

} // namespace gitstore
