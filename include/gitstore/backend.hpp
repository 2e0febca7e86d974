#pragma once
#include "gitstore/hash.hpp"
#include "gitstore/object.hpp"

#include <memory>
#include <optional>

namespace gitstore {

// Pull-style enumeration of object ids. Finite; nullopt marks the end.
class IdCursor {
public:
  virtual ~IdCursor() = default;
  virtual std::optional<ObjectId> next() = 0;
};

/**
 * One physical representation of (part of) the object set. Loose and packed
 * storage both implement this; ObjectStore layers them behind one contract.
 */
class ObjectBackend {
public:
  virtual ~ObjectBackend() = default;

  // Cheap existence check; never decompresses.
  [[nodiscard]] virtual bool contains(const ObjectId &id) const = 0;

  // nullopt if absent; DecodeError if present but corrupt.
  [[nodiscard]] virtual std::optional<RawObject> read(const ObjectId &id) const = 0;

  // A fresh, independent cursor over every id this backend holds.
  [[nodiscard]] virtual std::unique_ptr<IdCursor> ids() const = 0;
};

} // namespace gitstore
