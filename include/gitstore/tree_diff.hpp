#pragma once
#include "gitstore/hash.hpp"
#include "gitstore/object_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitstore {

enum class ChangeKind : std::uint8_t { Added, Removed, Modified };

std::string_view change_kind_name(ChangeKind kind);

// One path-level difference between two trees. The old_* fields are empty for
// Added records and the new_* fields are empty for Removed ones.
struct ChangeRecord {
  ChangeKind kind;
  std::string path; // "dir/file", '/'-separated, no leading '/'
  std::optional<std::uint32_t> old_mode;
  std::optional<std::uint32_t> new_mode;
  std::optional<ObjectId> old_id;
  std::optional<ObjectId> new_id;

  bool operator==(const ChangeRecord &) const = default;
};

/**
 * Compare two trees recursively. nullopt stands for the empty tree.
 *
 * Both sides are walked in canonical entry order at once; subtrees whose ids
 * match on both sides are skipped without being loaded. Added or removed
 * subtrees expand to one record per leaf beneath them. Records come out in
 * canonical path order.
 */
std::vector<ChangeRecord> diff_trees(const ObjectStore &store, const std::optional<ObjectId> &a,
                                     const std::optional<ObjectId> &b);

} // namespace gitstore
