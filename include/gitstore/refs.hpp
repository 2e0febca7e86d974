#pragma once
#include "gitstore/hash.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gitstore {

// "ref: <name>": a pointer at another ref name, not resolved when stored.
struct SymbolicTarget {
  std::string name;
  bool operator==(const SymbolicTarget &) const = default;
};

using RefValue = std::variant<ObjectId, SymbolicTarget>;

inline bool is_symbolic(const RefValue &v) { return std::holds_alternative<SymbolicTarget>(v); }

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);
// "refs/tags/<tag>"
std::string tags_ref(std::string_view tag);

// git check-ref-format rules, plus: one-level names must be upper-case ("HEAD").
bool is_valid_ref_name(std::string_view name);

/**
 * Mutable name -> target mapping stored under a repository directory:
 * loose files (refs/..., HEAD) shadowing entries of the packed-refs file.
 * Knows nothing about object bodies; ids it stores may be dangling.
 *
 * Every update takes "<ref>.lock" (O_EXCL), so a contended or stale update
 * surfaces as RefRaceError for the caller to retry.
 */
class RefStore {
public:
  RefStore(std::filesystem::path git_dir, HashAlgo algo);

  [[nodiscard]] RefValue read_ref(std::string_view name) const;
  [[nodiscard]] std::optional<RefValue> try_read_ref(std::string_view name) const;

  // Follow symbolic links to an id. RefNotFound / DanglingRef / RefCycle.
  [[nodiscard]] ObjectId resolve(std::string_view name) const;

  // Name of the direct ref at the end of the chain (which may not exist yet).
  [[nodiscard]] std::string resolve_final_name(std::string_view name) const;

  /**
   * Point the final ref of `name`'s chain at `id`; symbolic links on the way
   * stay symbolic. With `expected_old`, this is a compare-and-swap against the
   * currently resolved value and throws RefRaceError on mismatch.
   */
  void set_direct(std::string_view name, const ObjectId &id,
                  const std::optional<ObjectId> &expected_old = std::nullopt);

  // Like set_direct, but the final ref must not exist yet.
  void create_direct(std::string_view name, const ObjectId &id);

  void set_symbolic(std::string_view name, std::string_view target);

  // Delete exactly `name` (no link following), loose and packed.
  void delete_ref(std::string_view name,
                  const std::optional<ObjectId> &expected_old = std::nullopt);

  // All refs whose name starts with `prefix`, sorted by name.
  [[nodiscard]] std::vector<std::pair<std::string, RefValue>>
  iter_refs(std::string_view prefix = "") const;

  // Peeled target recorded in packed-refs for an annotated tag ref, if any.
  [[nodiscard]] std::optional<ObjectId> peeled(std::string_view name) const;

private:
  struct PackedRefs {
    std::string header;
    std::map<std::string, ObjectId> refs;
    std::map<std::string, ObjectId> peeled;
  };

  [[nodiscard]] std::filesystem::path ref_path(std::string_view name) const;
  [[nodiscard]] std::optional<RefValue> read_loose(std::string_view name) const;
  [[nodiscard]] PackedRefs load_packed() const;
  [[nodiscard]] std::optional<RefValue> lookup(std::string_view name) const;
  void write_value(std::string_view name, const std::string &content,
                   const std::optional<ObjectId> &expected_old, bool must_not_exist);
  void rewrite_packed_without(std::string_view name);
  void prune_empty_dirs(std::filesystem::path dir) const;

  std::filesystem::path git_dir_;
  HashAlgo algo_;
};

} // namespace gitstore
