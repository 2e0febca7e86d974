#include "gitstore/repo.hpp"

#include "gitstore/errors.hpp"
#include "gitstore/log.hpp"
#include "gitstore/object.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

void make_dirs(const stdfs::path &dir, std::string_view what) {
  std::error_code ec;
  stdfs::create_directories(dir, ec);
  if (ec) {
    throw gitstore::IoError(dir, "create " + std::string(what) + " dir failed: " + ec.message());
  }
}

} // namespace

namespace gitstore {

Repository::Repository(stdfs::path root) : root_(std::move(root)) {}

Repository Repository::open(stdfs::path root) {
  Repository repo(std::move(root));
  if (!repo.is_initialized()) {
    throw IoError(repo.git_dir(), "not a gitstore repository");
  }
  (void)repo.config();
  return repo;
}

auto Repository::is_initialized() const -> bool {
  std::error_code ec;
  return stdfs::is_directory(git_dir(), ec);
}

void Repository::init(const InitOptions &options) {
  if (is_initialized()) {
    throw Error("A gitstore repository already exists at: " + git_dir().string());
  }
  const std::string head_target = heads_ref(options.initial_branch);
  if (!is_valid_ref_name(head_target)) {
    throw InvalidRefName(head_target);
  }

  make_dirs(pack_dir(), "objects/pack");
  make_dirs(heads_dir(), "refs/heads");
  make_dirs(tags_dir(), "refs/tags");

  Config cfg;
  cfg.identity = options.identity;
  cfg.object_format = options.object_format;
  save_config(git_dir(), cfg);
  config_ = std::make_unique<Config>(std::move(cfg));

  refs().set_symbolic(consts::kHeadFile, head_target);
  log::trace("repo", "initialized " + git_dir().string());
}

const Config &Repository::config() {
  if (!config_) {
    config_ = std::make_unique<Config>(load_config(git_dir()));
  }
  return *config_;
}

ObjectStore &Repository::objects() {
  if (!objects_) {
    const Config &cfg = config();
    objects_ = std::make_unique<ObjectStore>(
        objects_dir(), StoreOptions{.algo = cfg.object_format, .compression = cfg.compression});
  }
  return *objects_;
}

RefStore &Repository::refs() {
  if (!refs_) {
    refs_ = std::make_unique<RefStore>(git_dir(), config().object_format);
  }
  return *refs_;
}

std::optional<ObjectId> Repository::head_commit() {
  try {
    return refs().resolve(consts::kHeadFile);
  } catch (const DanglingRef &) {
    return std::nullopt; // unborn branch
  } catch (const RefNotFound &) {
    return std::nullopt;
  }
}

ObjectId Repository::commit(const ObjectId &tree, const Signature &author,
                            const Signature &committer, std::string_view message) {
  const auto parent = head_commit();

  Commit c;
  c.tree = tree;
  if (parent) {
    c.parents.push_back(*parent);
  }
  c.author = author;
  c.committer = committer;
  c.message = std::string(message);
  const ObjectId id = objects().add(c);

  if (parent) {
    refs().set_direct(consts::kHeadFile, id, parent);
  } else {
    refs().create_direct(consts::kHeadFile, id);
  }
  log::trace("repo", "HEAD -> " + id.hex());
  return id;
}

} // namespace gitstore
