#pragma once
#include "gitstore/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace gitstore {

// Read-only memory mapping of a whole file.
class MappedFile {
public:
  explicit MappedFile(const std::filesystem::path &path);
  ~MappedFile();
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  [[nodiscard]] std::span<const std::uint8_t> bytes() const { return {data_, size_}; }

private:
  const std::uint8_t *data_ = nullptr;
  std::size_t size_ = 0;
};

/**
 * A pack-<hash>.pack / pack-<hash>.idx pair written by an external compactor.
 * Consumed read-only: version 2 idx (fan-out, sorted ids, CRCs, 31-bit and
 * 64-bit offsets) and version 2/3 pack entries, including OFS_DELTA and
 * REF_DELTA entries whose base lives in the same pack.
 */
class PackBackend final : public ObjectBackend {
public:
  PackBackend(const std::filesystem::path &idx_path, HashAlgo algo);

  [[nodiscard]] bool contains(const ObjectId &id) const override;
  [[nodiscard]] std::optional<RawObject> read(const ObjectId &id) const override;
  [[nodiscard]] std::unique_ptr<IdCursor> ids() const override;

  [[nodiscard]] std::size_t object_count() const { return count_; }
  [[nodiscard]] ObjectId id_at(std::size_t i) const;
  [[nodiscard]] const std::filesystem::path &pack_path() const { return pack_path_; }

private:
  [[nodiscard]] std::optional<std::size_t> find_index(std::span<const std::uint8_t> raw) const;
  [[nodiscard]] std::uint64_t offset_at(std::size_t i) const;
  [[nodiscard]] RawObject read_at(std::uint64_t offset, int depth) const;

  HashAlgo algo_;
  std::filesystem::path pack_path_;
  MappedFile idx_;
  MappedFile pack_;
  std::size_t count_ = 0;
  std::span<const std::uint8_t> fanout_;
  std::span<const std::uint8_t> ids_;
  std::span<const std::uint8_t> offsets_;
  std::span<const std::uint8_t> large_offsets_;
};

/**
 * Apply a git delta: base size varint, result size varint, then copy
 * (high bit set) and insert (1..127) instructions. Throws DecodeError("delta").
 */
std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta);

} // namespace gitstore
