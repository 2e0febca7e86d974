#include "gitstore/object.hpp"

#include "gitstore/codec.hpp"

#include <algorithm>
#include <stdexcept>

namespace gitstore {

std::string_view kind_name(ObjectKind kind) {
  switch (kind) {
  case ObjectKind::Blob:
    return consts::kTypeBlob;
  case ObjectKind::Tree:
    return consts::kTypeTree;
  case ObjectKind::Commit:
    return consts::kTypeCommit;
  case ObjectKind::Tag:
    return consts::kTypeTag;
  }
  throw std::logic_error("unknown object kind");
}

std::optional<ObjectKind> parse_kind(std::string_view name) {
  if (name == consts::kTypeBlob)
    return ObjectKind::Blob;
  if (name == consts::kTypeTree)
    return ObjectKind::Tree;
  if (name == consts::kTypeCommit)
    return ObjectKind::Commit;
  if (name == consts::kTypeTag)
    return ObjectKind::Tag;
  return std::nullopt;
}

bool is_valid_mode(std::uint32_t mode) {
  return mode == consts::kModeTree || mode == consts::kModeFile ||
         mode == consts::kModeExecutable || mode == consts::kModeSymlink ||
         mode == consts::kModeGitlink;
}

Blob Blob::from_string(std::string_view text) {
  return Blob{.data = {text.begin(), text.end()}};
}

// Tree

namespace {

void check_entry(const TreeEntry &e) {
  if (!is_valid_entry_name(e.name)) {
    throw std::invalid_argument("tree entry: invalid name '" + e.name + "'");
  }
  if (!is_valid_mode(e.mode)) {
    throw std::invalid_argument("tree entry: invalid mode for '" + e.name + "'");
  }
}

} // namespace

Tree::Tree(std::vector<TreeEntry> entries) : entries_(std::move(entries)) {
  for (const auto &e : entries_) {
    check_entry(e);
  }
  std::ranges::sort(entries_, tree_entry_less);
  const auto dup = std::ranges::adjacent_find(entries_, [](const TreeEntry &a, const TreeEntry &b) {
    return compare_tree_entries(a, b) == 0;
  });
  if (dup != entries_.end()) {
    throw std::invalid_argument("tree: duplicate entry '" + dup->name + "'");
  }
}

void Tree::upsert(TreeEntry entry) {
  check_entry(entry);
  const auto it = std::ranges::lower_bound(entries_, entry, tree_entry_less);
  if (it != entries_.end() && compare_tree_entries(*it, entry) == 0) {
    *it = std::move(entry);
  } else {
    entries_.insert(it, std::move(entry));
  }
}

bool Tree::remove(std::string_view name, bool is_tree) {
  const auto it = std::ranges::find_if(entries_, [&](const TreeEntry &e) {
    return e.name == name && e.is_tree() == is_tree;
  });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

const TreeEntry *Tree::find(std::string_view name) const {
  const auto it = std::ranges::find(entries_, name, &TreeEntry::name);
  return it == entries_.end() ? nullptr : &*it;
}

ObjectKind kind_of(const Object &obj) {
  return static_cast<ObjectKind>(obj.index());
}

} // namespace gitstore
