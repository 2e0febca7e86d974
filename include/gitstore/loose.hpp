#pragma once
#include "gitstore/backend.hpp"

#include <filesystem>
#include <span>

namespace gitstore {

/**
 * One zlib-deflated file per object at objects/<2 hex>/<remaining hex>,
 * holding "<kind> <size>\0<body>".
 */
class LooseBackend final : public ObjectBackend {
public:
  LooseBackend(std::filesystem::path objects_dir, HashAlgo algo, int compression_level);

  [[nodiscard]] bool contains(const ObjectId &id) const override;
  [[nodiscard]] std::optional<RawObject> read(const ObjectId &id) const override;
  [[nodiscard]] std::unique_ptr<IdCursor> ids() const override;

  // Write unless already present. Returns true if this call created the file.
  bool write(const ObjectId &id, ObjectKind kind, std::span<const std::uint8_t> body) const;

  // Get filesystem path for an id.
  [[nodiscard]] std::filesystem::path path_for_oid(const ObjectId &id) const;

private:
  std::filesystem::path objects_dir_;
  HashAlgo algo_;
  int level_;
};

} // namespace gitstore
