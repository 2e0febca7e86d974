#pragma once
#include "gitstore/config.hpp"
#include "gitstore/consts.hpp"
#include "gitstore/hash.hpp"
#include "gitstore/object_store.hpp"
#include "gitstore/refs.hpp"
#include "gitstore/time.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gitstore {

struct InitOptions {
  Identity identity{.name = "Your Name", .email = "you@example.com"};
  HashAlgo object_format = HashAlgo::Sha1;
  std::string initial_branch{consts::kDefaultBranch};
};

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Open an existing repository; IoError if root has no .gitstore.
  static Repository open(std::filesystem::path root);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto git_dir() const -> std::filesystem::path { return root_ / consts::kGitDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return git_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto pack_dir() const -> std::filesystem::path {
    return objects_dir() / consts::kPackDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return git_dir() / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return git_dir() / consts::kHeadFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return git_dir() / consts::kConfigFile;
  }

  // Initialize a new repo structure under root_.
  // Fails if .gitstore already exists (to avoid clobber).
  void init(const InitOptions &options = {});

  // Convenience: does .gitstore exist?
  [[nodiscard]] auto is_initialized() const -> bool;

  // Loaded on first use; the store's algorithm and compression come from config.
  [[nodiscard]] const Config &config();
  ObjectStore &objects();
  RefStore &refs();

  /**
   * Store a commit of `tree` whose parent is the current HEAD commit (none on
   * an unborn branch) and move HEAD's branch to it. The branch update is a
   * compare-and-swap against the HEAD commit that was read, so a concurrent
   * writer makes this throw RefRaceError instead of losing its commit.
   */
  ObjectId commit(const ObjectId &tree, const Signature &author, const Signature &committer,
                  std::string_view message);

  // Commit id HEAD resolves to, or nullopt on an unborn branch.
  [[nodiscard]] std::optional<ObjectId> head_commit();

private:
  std::filesystem::path root_;
  std::unique_ptr<Config> config_;
  std::unique_ptr<ObjectStore> objects_;
  std::unique_ptr<RefStore> refs_;
};

} // namespace gitstore
