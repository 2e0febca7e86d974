#pragma once
#include "gitstore/backend.hpp"
#include "gitstore/hash.hpp"
#include "gitstore/loose.hpp"
#include "gitstore/object.hpp"
#include "gitstore/pack.hpp"

#include <filesystem>
#include <iterator>
#include <memory>
#include <shared_mutex>
#include <span>
#include <vector>

namespace gitstore {

struct StoreOptions {
  HashAlgo algo = HashAlgo::Sha1;
  int compression = 1; // zlib level for new loose objects
};

/**
 * Single-pass input range over object ids. Each ObjectStore::iter_all() call
 * returns a fresh, independent range.
 */
class ObjectIdRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ObjectId;
    using difference_type = std::ptrdiff_t;
    using pointer = const ObjectId *;
    using reference = const ObjectId &;

    iterator() = default;
    explicit iterator(IdCursor *cursor) : cursor_(cursor) { ++*this; }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator &operator++() {
      current_ = cursor_ ? cursor_->next() : std::nullopt;
      if (!current_) {
        cursor_ = nullptr;
      }
      return *this;
    }
    void operator++(int) { ++*this; }
    bool operator==(const iterator &other) const { return cursor_ == other.cursor_; }

  private:
    IdCursor *cursor_ = nullptr;
    std::optional<ObjectId> current_;
  };

  explicit ObjectIdRange(std::unique_ptr<IdCursor> cursor) : cursor_(std::move(cursor)) {}

  iterator begin() { return iterator(cursor_.get()); }
  iterator end() { return {}; }

  // Pull interface, for callers that prefer it to range-for.
  std::optional<ObjectId> next() { return cursor_->next(); }

private:
  std::unique_ptr<IdCursor> cursor_;
};

/**
 * Content-addressable object store over loose objects and any packs in
 * objects/pack. Reads check loose storage first, then packs, so a fresh write
 * is never shadowed by a stale pack. Writes always go to loose storage.
 */
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir, StoreOptions opts = {});

  [[nodiscard]] HashAlgo algo() const { return opts_.algo; }
  [[nodiscard]] const std::filesystem::path &objects_dir() const { return objects_dir_; }

  [[nodiscard]] bool has(const ObjectId &id) const;

  // Throws ObjectNotFound if absent, DecodeError if corrupt.
  [[nodiscard]] Object get(const ObjectId &id) const;
  [[nodiscard]] RawObject read_raw(const ObjectId &id) const;

  // Typed reads; DecodeError("kind") if the object has another kind.
  [[nodiscard]] Blob read_blob(const ObjectId &id) const;
  [[nodiscard]] Tree read_tree(const ObjectId &id) const;
  [[nodiscard]] Commit read_commit(const ObjectId &id) const;
  [[nodiscard]] Tag read_tag(const ObjectId &id) const;

  // Idempotent: adding content already present is a no-op returning its id.
  ObjectId add(const Object &obj) const;
  ObjectId add_raw(ObjectKind kind, std::span<const std::uint8_t> body) const;

  // Every stored id exactly once, in unspecified order. The range may outlive
  // the store; packs loaded at the time of the call stay mapped until it ends.
  [[nodiscard]] ObjectIdRange iter_all() const;

  // Re-read the digest of the stored bytes; DecodeError("digest") on mismatch.
  void verify(const ObjectId &id) const;

  // Pick up packs added (or removed) by an external compactor.
  void reload_packs();

  [[nodiscard]] std::size_t pack_count() const;

private:
  [[nodiscard]] std::vector<std::shared_ptr<const PackBackend>> packs_snapshot() const;

  std::filesystem::path objects_dir_;
  StoreOptions opts_;
  LooseBackend loose_;
  mutable std::shared_mutex packs_mutex_;
  std::vector<std::shared_ptr<const PackBackend>> packs_;
};

} // namespace gitstore
