#include "gitstore/codec.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/fs.hpp"
#include "gitstore/object_store.hpp"
#include "gitstore/time.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
namespace consts = gitstore::consts;

static std::size_t count_loose_files(const fs::path &objects) {
  std::size_t n = 0;
  for (const auto &e : fs::recursive_directory_iterator(objects)) {
    if (e.is_regular_file()) {
      ++n;
    }
  }
  return n;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitstore_objects_" + std::to_string(std::random_device{}()));
  const fs::path objects = root / "objects";
  fs::create_directories(objects);

  try {
    using gitstore::Blob;
    using gitstore::HashAlgo;
    using gitstore::ObjectStore;

    const ObjectStore store{objects};

    // Add and read back
    const Blob blob = Blob::from_string("My file content\n");
    const auto id = store.add(blob);
    if (id.hex() != "c55063a4d5d37aa1af2b2dad3a70aa34dae54dc6") {
      std::cerr << "unexpected blob id " << id.hex() << "\n";
      return 1;
    }
    if (!store.has(id) || store.read_blob(id) != blob) {
      std::cerr << "blob not readable after add\n";
      return 1;
    }
    if (!fs::exists(objects / "c5" / "5063a4d5d37aa1af2b2dad3a70aa34dae54dc6")) {
      std::cerr << "loose file not in fan-out directory\n";
      return 1;
    }

    // Idempotent
    const auto again = store.add(Blob::from_string("My file content\n"));
    if (again != id || count_loose_files(objects) != 1) {
      std::cerr << "second add was not a no-op\n";
      return 1;
    }

    // Tree + commit
    const gitstore::Tree tree(
        {gitstore::TreeEntry{.mode = consts::kModeFile, .name = "spam", .id = id}});
    const auto tree_id = store.add(tree);
    gitstore::Commit commit;
    commit.tree = tree_id;
    commit.author = gitstore::timeutil::parse_signature(
        "A U Thor <author@example.com> 1112911993 -0700", "author");
    commit.committer = commit.author;
    commit.message = "msg\n";
    const auto commit_id = store.add(commit);
    if (store.read_commit(commit_id).tree != tree_id || store.read_tree(tree_id) != tree) {
      std::cerr << "tree/commit round trip failed\n";
      return 1;
    }

    // Wrong kind
    bool threw = false;
    try {
      (void)store.read_tree(id);
    } catch (const gitstore::DecodeError &e) {
      threw = e.field() == "kind";
    }
    if (!threw) {
      std::cerr << "read_tree on a blob did not throw DecodeError(kind)\n";
      return 1;
    }

    // Missing
    const auto missing = gitstore::digest(Blob::from_string("never stored"), HashAlgo::Sha1);
    if (store.has(missing)) {
      std::cerr << "has() true for a missing object\n";
      return 1;
    }
    threw = false;
    try {
      (void)store.get(missing);
    } catch (const gitstore::ObjectNotFound &e) {
      threw = e.id() == missing;
    }
    if (!threw) {
      std::cerr << "get() on a missing id did not throw ObjectNotFound\n";
      return 1;
    }

    // iter_all: every id once, and each call starts over
    const std::set<gitstore::ObjectId> expected{id, tree_id, commit_id};
    for (int pass = 0; pass < 2; ++pass) {
      std::set<gitstore::ObjectId> seen;
      std::size_t n = 0;
      for (const auto &oid : store.iter_all()) {
        seen.insert(oid);
        ++n;
      }
      if (seen != expected || n != expected.size()) {
        std::cerr << "iter_all pass " << pass << " yielded " << n << " ids\n";
        return 1;
      }
    }
    auto range = store.iter_all();
    std::size_t pulled = 0;
    while (range.next()) {
      ++pulled;
    }
    if (pulled != 3) {
      std::cerr << "pull-style iteration yielded " << pulled << "\n";
      return 1;
    }

    // A range keeps working after the store that made it is gone
    std::optional<gitstore::ObjectIdRange> detached;
    {
      const ObjectStore scoped{objects};
      detached.emplace(scoped.iter_all());
    }
    std::size_t detached_n = 0;
    while (detached->next()) {
      ++detached_n;
    }
    if (detached_n != 3) {
      std::cerr << "range outliving its store yielded " << detached_n << "\n";
      return 1;
    }

    // Stray temp files are not objects
    gitstore::fs::write_file_atomic(objects / "c5" / "tmp_obj_garbage",
                                    gitstore::fs::as_bytes("x"));
    std::size_t n = 0;
    for (const auto &oid : store.iter_all()) {
      (void)oid;
      ++n;
    }
    if (n != 3) {
      std::cerr << "iter_all picked up a stray file\n";
      return 1;
    }

    // Concurrent writers of the same and different content
    {
      std::vector<std::thread> threads;
      for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t] {
          (void)store.add(Blob::from_string("shared content\n"));
          (void)store.add(Blob::from_string("thread " + std::to_string(t) + "\n"));
        });
      }
      for (auto &th : threads) {
        th.join();
      }
      const auto shared_id = gitstore::digest(Blob::from_string("shared content\n"), HashAlgo::Sha1);
      if (store.read_blob(shared_id).text() != "shared content\n") {
        std::cerr << "shared blob unreadable after concurrent add\n";
        return 1;
      }
      std::size_t shared_files = 0;
      for (const auto &e : fs::directory_iterator(objects / shared_id.hex().substr(0, 2))) {
        if (e.path().filename().string().starts_with(shared_id.hex().substr(2))) {
          ++shared_files;
        }
      }
      if (shared_files != 1) {
        std::cerr << "expected one file for the shared blob, found " << shared_files << "\n";
        return 1;
      }
      std::size_t total = 0;
      for (const auto &oid : store.iter_all()) {
        (void)oid;
        ++total;
      }
      if (total != 3 + 1 + 8) {
        std::cerr << "unexpected object count after concurrent add: " << total << "\n";
        return 1;
      }
    }

    // verify() catches a file whose content does not match its name
    store.verify(id);
    const auto other = Blob::from_string("tampered\n");
    const auto victim = objects / "c5" / "5063a4d5d37aa1af2b2dad3a70aa34dae54dc6";
    gitstore::fs::write_file_atomic(
        victim, gitstore::fs::z_compress(gitstore::frame(gitstore::ObjectKind::Blob, other.data)));
    threw = false;
    try {
      store.verify(id);
    } catch (const gitstore::DecodeError &e) {
      threw = e.field() == "digest";
    }
    if (!threw) {
      std::cerr << "verify() accepted a tampered object\n";
      return 1;
    }

    // A loose file that is not zlib data is a decode error
    gitstore::fs::write_file_atomic(victim, gitstore::fs::as_bytes("not zlib"));
    threw = false;
    try {
      (void)store.get(id);
    } catch (const gitstore::DecodeError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "corrupt loose file did not throw DecodeError\n";
      return 1;
    }

    // SHA-256 store
    const fs::path objects256 = root / "objects256";
    const ObjectStore store256{objects256, gitstore::StoreOptions{.algo = HashAlgo::Sha256}};
    const auto id256 = store256.add(blob);
    if (id256.hex().size() != 64 || store256.read_blob(id256) != blob || store256.has(id)) {
      std::cerr << "sha256 store failed\n";
      return 1;
    }

    std::cout << "object store test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
