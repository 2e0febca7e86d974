#include "gitstore/config.hpp"
#include "gitstore/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static bool rejects(const fs::path &git_dir, std::string_view text) {
  write_file(git_dir / "config", text);
  try {
    (void)gitstore::load_config(git_dir);
  } catch (const gitstore::DecodeError &e) {
    return e.field() == "config";
  }
  return false;
}

int main() {
  const fs::path git_dir =
      fs::temp_directory_path() / ("gitstore_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(git_dir);

  try {
    // Missing file -> defaults
    const auto defaults = gitstore::load_config(git_dir);
    if (defaults.object_format != gitstore::HashAlgo::Sha1 || defaults.compression != 1 ||
        !defaults.extra.empty()) {
      std::cerr << "defaults wrong\n";
      return 1;
    }

    // Comments, blank lines, whitespace and unknown keys
    write_file(git_dir / "config", "# identity\n"
                                   "author:  Jane Doe \n"
                                   "\n"
                                   "email: jane@example.com\r\n"
                                   "objectformat: sha256\n"
                                   "compression: 9\n"
                                   "editor: vi\n");
    auto cfg = gitstore::load_config(git_dir);
    if (cfg.identity.name != "Jane Doe" || cfg.identity.email != "jane@example.com" ||
        cfg.object_format != gitstore::HashAlgo::Sha256 || cfg.compression != 9 ||
        cfg.extra.size() != 1 || cfg.extra[0].first != "editor" || cfg.extra[0].second != "vi") {
      std::cerr << "parsed config wrong\n";
      return 1;
    }

    // Save keeps unknown keys
    cfg.compression = 0;
    gitstore::save_config(git_dir, cfg);
    const auto back = gitstore::load_config(git_dir);
    if (back.identity.name != "Jane Doe" || back.compression != 0 || back.extra != cfg.extra) {
      std::cerr << "save/load lost data\n";
      return 1;
    }

    // Invalid values
    if (!rejects(git_dir, "objectformat: md5\n") || !rejects(git_dir, "compression: 10\n") ||
        !rejects(git_dir, "compression: fast\n") || !rejects(git_dir, "no colon here\n")) {
      std::cerr << "invalid config accepted\n";
      return 1;
    }

    std::cout << "config test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(git_dir);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(git_dir, ec);
  return 0;
}
