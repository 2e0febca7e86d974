#pragma once
#include "gitstore/hash.hpp"
#include "gitstore/object.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitstore {

/**
 * The one canonical ordering of tree entries, shared by the codec
 * (serialization order) and the tree differ (merge-walk order).
 *
 * Names compare byte-wise (unsigned) as if every tree-mode entry had a
 * trailing '/'. So "foo" (file) < "foo.txt" < "foo" (dir, read "foo/").
 * A file and a directory with the same literal name are distinct keys.
 * Returns <0, 0 or >0.
 */
int compare_entry_names(std::string_view a, bool a_is_tree, std::string_view b, bool b_is_tree);

inline int compare_tree_entries(const TreeEntry &a, const TreeEntry &b) {
  return compare_entry_names(a.name, a.is_tree(), b.name, b.is_tree());
}
inline bool tree_entry_less(const TreeEntry &a, const TreeEntry &b) {
  return compare_tree_entries(a, b) < 0;
}

// Non-empty, no '/', no NUL, not "." or "..".
bool is_valid_entry_name(std::string_view name);

/**
 * Git object header used for hashing and loose storage:
 *   "<kind> <size>\0"
 */
std::string object_header(ObjectKind kind, std::size_t size);

// Canonical body bytes (no header). Pure and deterministic.
std::vector<std::uint8_t> serialize(const Object &obj);

// Tree body from entries in any order; throws std::invalid_argument on duplicates.
std::vector<std::uint8_t> encode_tree(std::vector<TreeEntry> entries);

// Digest of header + body.
ObjectId digest(ObjectKind kind, std::span<const std::uint8_t> body, HashAlgo algo);
ObjectId digest(const Object &obj, HashAlgo algo);

/**
 * Decode a body of the given kind. `algo` fixes the id width inside trees,
 * commits and tags. Throws DecodeError naming the offending field.
 */
Object deserialize(ObjectKind kind, std::span<const std::uint8_t> body, HashAlgo algo);

// header + body, the uncompressed content of a loose object file.
std::vector<std::uint8_t> frame(ObjectKind kind, std::span<const std::uint8_t> body);

// Split "<kind> <size>\0<body>", validating kind and size.
RawObject parse_framed(std::span<const std::uint8_t> bytes);

} // namespace gitstore
