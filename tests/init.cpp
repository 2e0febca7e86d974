#include "gitstore/config.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/repo.hpp"
#include "gitstore/time.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  // Make a unique temp repo root
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path repo_root = base / ("gitstore_init_test_" + suffix);

  try {
    fs::create_directories(repo_root);

    gitstore::Repository repo{repo_root};
    if (repo.is_initialized()) {
      std::cerr << "repo unexpectedly initialized before init()\n";
      return 1;
    }

    bool threw = false;
    try {
      (void)gitstore::Repository::open(repo_root);
    } catch (const gitstore::IoError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "open() succeeded on an empty directory\n";
      return 1;
    }

    const gitstore::Identity id{.name = "Test User", .email = "test@example.com"};
    repo.init(gitstore::InitOptions{.identity = id});

    // Check directory layout
    const fs::path gitdir = repo_root / ".gitstore";
    const fs::path head = gitdir / "HEAD";
    const fs::path config = gitdir / "config";
    const fs::path objects = gitdir / "objects";
    const fs::path packs = objects / "pack";
    const fs::path refs = gitdir / "refs";
    const fs::path heads = refs / "heads";
    const fs::path tags = refs / "tags";

    for (const auto &dir : {gitdir, objects, packs, refs, heads, tags}) {
      if (!fs::is_directory(dir)) {
        std::cerr << dir << " missing\n";
        return 1;
      }
    }

    // Check HEAD contents
    const std::string head_txt = slurp(head);
    if (head_txt != "ref: refs/heads/master\n") {
      std::cerr << "HEAD content mismatch: [" << head_txt << "]\n";
      return 1;
    }
    if (repo.head_commit()) {
      std::cerr << "new repository has a HEAD commit\n";
      return 1;
    }

    // Check config contents + loader
    if (!fs::exists(config)) {
      std::cerr << "config missing\n";
      return 1;
    }
    const auto loaded = gitstore::load_config(gitdir);
    if (loaded.identity.name != id.name || loaded.identity.email != id.email ||
        loaded.object_format != gitstore::HashAlgo::Sha1) {
      std::cerr << "config load mismatch: got {" << loaded.identity.name << ","
                << loaded.identity.email << "}\n";
      return 1;
    }

    // Signatures stamped with the configured identity and the current time
    const std::time_t before = std::time(nullptr);
    const auto stamp = gitstore::timeutil::now(repo.config().identity);
    if (stamp.name != id.name || stamp.email != id.email || stamp.when < before ||
        stamp.when > std::time(nullptr) ||
        stamp.tz_minutes != gitstore::timeutil::local_utc_offset_minutes(stamp.when)) {
      std::cerr << "now() signature wrong: " << gitstore::timeutil::format_signature(stamp) << "\n";
      return 1;
    }

    // Calling init again should throw
    threw = false;
    try {
      repo.init(gitstore::InitOptions{.identity = id});
    } catch (const gitstore::Error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "init did not throw on already-initialized repo\n";
      return 1;
    }

    // SHA-256 repository on another branch name
    const fs::path root256 = base / ("gitstore_init_test256_" + suffix);
    gitstore::Repository repo256{root256};
    repo256.init(gitstore::InitOptions{.identity = id,
                                       .object_format = gitstore::HashAlgo::Sha256,
                                       .initial_branch = "main"});
    auto reopened = gitstore::Repository::open(root256);
    if (slurp(root256 / ".gitstore" / "HEAD") != "ref: refs/heads/main\n" ||
        reopened.config().object_format != gitstore::HashAlgo::Sha256 ||
        reopened.objects().algo() != gitstore::HashAlgo::Sha256) {
      std::cerr << "sha256 repository not set up\n";
      fs::remove_all(root256);
      return 1;
    }
    fs::remove_all(root256);

    // Success
    std::cout << "init test OK: " << repo_root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(repo_root);
    return 1;
  }

  // Clean up
  std::error_code ec;
  fs::remove_all(repo_root, ec);
  return 0;
}
