#include "gitstore/config.hpp"

#include "gitstore/consts.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/fs.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

constexpr std::string_view kAuthor = "author";
constexpr std::string_view kEmail = "email";
constexpr std::string_view kObjectFormat = "objectformat";
constexpr std::string_view kCompression = "compression";

std::filesystem::path cfg_path(const std::filesystem::path &git_dir) {
  return git_dir / gitstore::consts::kConfigFile;
}

} // namespace

namespace gitstore {

auto load_config(const std::filesystem::path &git_dir) -> Config {
  Config out{};
  const auto path = cfg_path(git_dir);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (trim(sv).empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos) {
      throw DecodeError("config", "expected 'key: value', got '" + line + "'");
    }
    const std::string key = trim(sv.substr(0, colon));
    const std::string value = trim(sv.substr(colon + 1));

    if (key == kAuthor) {
      out.identity.name = value;
    } else if (key == kEmail) {
      out.identity.email = value;
    } else if (key == kObjectFormat) {
      const auto algo = parse_algo(value);
      if (!algo) {
        throw DecodeError("config", "unknown objectformat '" + value + "'");
      }
      out.object_format = *algo;
    } else if (key == kCompression) {
      int level = -1;
      const auto r = std::from_chars(value.data(), value.data() + value.size(), level);
      if (r.ec != std::errc{} || r.ptr != value.data() + value.size() || level < 0 || level > 9) {
        throw DecodeError("config", "compression must be 0..9, got '" + value + "'");
      }
      out.compression = level;
    } else {
      out.extra.emplace_back(key, value);
    }
  }
  return out;
}

void save_config(const std::filesystem::path &git_dir, const Config &cfg) {
  std::ostringstream os;
  os << kAuthor << ": " << cfg.identity.name << '\n'
     << kEmail << ": " << cfg.identity.email << '\n'
     << kObjectFormat << ": " << algo_name(cfg.object_format) << '\n'
     << kCompression << ": " << cfg.compression << '\n';
  for (const auto &[key, value] : cfg.extra) {
    os << key << ": " << value << '\n';
  }

  const std::string s = os.str();
  fs::write_file_atomic(cfg_path(git_dir), fs::as_bytes(s));
}

} // namespace gitstore
