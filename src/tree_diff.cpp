#include "gitstore/tree_diff.hpp"

#include "gitstore/codec.hpp"

namespace gitstore {

namespace {

std::string join_path(const std::string &prefix, const std::string &name) {
  return prefix.empty() ? name : prefix + "/" + name;
}

class TreeDiffer {
public:
  explicit TreeDiffer(const ObjectStore &store) : store_(store) {}

  void walk(const std::optional<ObjectId> &a, const std::optional<ObjectId> &b,
            const std::string &prefix) {
    if (a && b && *a == *b) {
      return; // identical subtree: pruned by id alone
    }
    const Tree ta = a ? store_.read_tree(*a) : Tree{};
    const Tree tb = b ? store_.read_tree(*b) : Tree{};
    const auto &ea = ta.entries();
    const auto &eb = tb.entries();

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < ea.size() || j < eb.size()) {
      int cmp = 0;
      if (i == ea.size()) {
        cmp = 1;
      } else if (j == eb.size()) {
        cmp = -1;
      } else {
        cmp = compare_tree_entries(ea[i], eb[j]);
      }

      if (cmp < 0) {
        removed(ea[i++], prefix);
      } else if (cmp > 0) {
        added(eb[j++], prefix);
      } else {
        changed(ea[i++], eb[j++], prefix);
      }
    }
  }

  std::vector<ChangeRecord> take() { return std::move(out_); }

private:
  void added(const TreeEntry &e, const std::string &prefix) {
    const auto path = join_path(prefix, e.name);
    if (e.is_tree()) {
      walk(std::nullopt, e.id, path);
      return;
    }
    out_.push_back(ChangeRecord{.kind = ChangeKind::Added,
                                .path = path,
                                .old_mode = std::nullopt,
                                .new_mode = e.mode,
                                .old_id = std::nullopt,
                                .new_id = e.id});
  }

  void removed(const TreeEntry &e, const std::string &prefix) {
    const auto path = join_path(prefix, e.name);
    if (e.is_tree()) {
      walk(e.id, std::nullopt, path);
      return;
    }
    out_.push_back(ChangeRecord{.kind = ChangeKind::Removed,
                                .path = path,
                                .old_mode = e.mode,
                                .new_mode = std::nullopt,
                                .old_id = e.id,
                                .new_id = std::nullopt});
  }

  // Same name, same directory-ness.
  void changed(const TreeEntry &a, const TreeEntry &b, const std::string &prefix) {
    if (a.id == b.id && a.mode == b.mode) {
      return;
    }
    const auto path = join_path(prefix, a.name);
    if (a.is_tree()) {
      walk(a.id, b.id, path);
      return;
    }
    out_.push_back(ChangeRecord{.kind = ChangeKind::Modified,
                                .path = path,
                                .old_mode = a.mode,
                                .new_mode = b.mode,
                                .old_id = a.id,
                                .new_id = b.id});
  }

  const ObjectStore &store_;
  std::vector<ChangeRecord> out_;
};

} // namespace

std::string_view change_kind_name(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:
    return "added";
  case ChangeKind::Removed:
    return "removed";
  case ChangeKind::Modified:
    return "modified";
  }
  return "unknown";
}

std::vector<ChangeRecord> diff_trees(const ObjectStore &store, const std::optional<ObjectId> &a,
                                     const std::optional<ObjectId> &b) {
  TreeDiffer differ{store};
  differ.walk(a, b, "");
  return differ.take();
}

} // namespace gitstore
