#pragma once
#include "gitstore/consts.hpp"
#include "gitstore/hash.hpp"
#include "gitstore/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gitstore {

enum class ObjectKind : std::uint8_t { Blob, Tree, Commit, Tag };

std::string_view kind_name(ObjectKind kind);
std::optional<ObjectKind> parse_kind(std::string_view name);

// Modes a tree entry may carry (see consts::kMode*).
bool is_valid_mode(std::uint32_t mode);

struct Blob {
  std::vector<std::uint8_t> data;

  static Blob from_string(std::string_view text);
  [[nodiscard]] std::string_view text() const {
    return {reinterpret_cast<const char *>(data.data()), data.size()};
  }
  bool operator==(const Blob &) const = default;
};

struct TreeEntry {
  std::uint32_t mode; // e.g., consts::kModeFile, consts::kModeTree (octal)
  std::string name;   // single path segment (no '/')
  ObjectId id;

  [[nodiscard]] bool is_tree() const { return mode == consts::kModeTree; }
  bool operator==(const TreeEntry &) const = default;
};

/**
 * Directory listing. Entries are kept in canonical order (see
 * compare_tree_entries) whatever order they are added in, so two trees with the
 * same entry set compare equal and serialize identically.
 */
class Tree {
public:
  Tree() = default;
  // Throws std::invalid_argument on a bad entry or a duplicate name.
  explicit Tree(std::vector<TreeEntry> entries);

  // Insert, or replace the entry with the same name and directory-ness.
  void upsert(TreeEntry entry);
  bool remove(std::string_view name, bool is_tree);
  [[nodiscard]] const TreeEntry *find(std::string_view name) const;

  [[nodiscard]] const std::vector<TreeEntry> &entries() const { return entries_; }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }

  bool operator==(const Tree &) const = default;

private:
  std::vector<TreeEntry> entries_;
};

struct Commit {
  ObjectId tree;
  std::vector<ObjectId> parents; // 0 = root, 1 = normal, 2+ = merge
  Signature author;
  Signature committer;
  std::optional<std::string> encoding;
  // Headers after committer/encoding (e.g. "gpgsig"), value without continuation spaces.
  std::vector<std::pair<std::string, std::string>> extra_headers;
  std::string message;

  bool operator==(const Commit &) const = default;
};

// Annotated tag.
struct Tag {
  ObjectId object;
  ObjectKind target_kind = ObjectKind::Commit;
  std::string name;
  std::optional<Signature> tagger;
  std::string message;

  bool operator==(const Tag &) const = default;
};

using Object = std::variant<Blob, Tree, Commit, Tag>;

ObjectKind kind_of(const Object &obj);

// Undecoded body plus its kind, as read from a backend.
struct RawObject {
  ObjectKind kind;
  std::vector<std::uint8_t> body;
};

} // namespace gitstore
