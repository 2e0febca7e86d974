#pragma once
#include "gitstore/hash.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace gitstore {

struct Identity {
  std::string name;
  std::string email;
};

struct Config {
  Identity identity;
  HashAlgo object_format = HashAlgo::Sha1;
  int compression = 1; // zlib level, 0..9
  // Keys this library does not interpret, kept so save_config round-trips them.
  std::vector<std::pair<std::string, std::string>> extra;
};

// Read <gitdir>/config. Missing file -> defaults; bad values throw DecodeError("config").
Config load_config(const std::filesystem::path &git_dir);

// Overwrite <gitdir>/config atomically.
void save_config(const std::filesystem::path &git_dir, const Config &cfg);

} // namespace gitstore
