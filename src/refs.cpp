#include "gitstore/refs.hpp"

#include "gitstore/consts.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/fs.hpp"
#include "gitstore/log.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>

namespace stdfs = std::filesystem;

namespace gitstore {

namespace {

bool is_upper_name(std::string_view s) {
  return !s.empty() && std::ranges::all_of(s, [](char c) { return (c >= 'A' && c <= 'Z') || c == '_'; });
}

bool bad_ref_char(char c) {
  const auto u = static_cast<unsigned char>(c);
  return u < 0x20 || u == 0x7f || c == ' ' || c == '~' || c == '^' || c == ':' || c == '?' ||
         c == '*' || c == '[' || c == '\\';
}

void strip_trailing_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
}

std::string describe(const std::optional<RefValue> &v) {
  if (!v) {
    return "missing";
  }
  if (const auto *id = std::get_if<ObjectId>(&*v)) {
    return id->hex();
  }
  return "ref: " + std::get<SymbolicTarget>(*v).name;
}

void require_valid(std::string_view name) {
  if (!is_valid_ref_name(name)) {
    throw InvalidRefName(std::string(name));
  }
}

} // namespace

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kRefsDir) + "/" + std::string(consts::kHeadsDir) + "/" +
         std::string(branch);
}

std::string tags_ref(std::string_view tag) {
  return std::string(consts::kRefsDir) + "/" + std::string(consts::kTagsDir) + "/" +
         std::string(tag);
}

bool is_valid_ref_name(std::string_view name) {
  if (name.empty() || name == "@") {
    return false;
  }
  if (name.find('/') == std::string_view::npos) {
    return is_upper_name(name);
  }
  if (!name.starts_with("refs/")) {
    return false;
  }
  if (name.back() == '/' || name.back() == '.') {
    return false;
  }
  if (name.find("..") != std::string_view::npos || name.find("@{") != std::string_view::npos ||
      std::ranges::any_of(name, bad_ref_char)) {
    return false;
  }
  std::size_t start = 0;
  while (start <= name.size()) {
    const auto slash = name.find('/', start);
    const auto comp =
        name.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
    if (comp.empty() || comp.front() == '.' || comp.ends_with(consts::kLockSuffix)) {
      return false;
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return true;
}

RefStore::RefStore(stdfs::path git_dir, HashAlgo algo) : git_dir_(std::move(git_dir)), algo_(algo) {}

stdfs::path RefStore::ref_path(std::string_view name) const { return git_dir_ / std::string(name); }

std::optional<RefValue> RefStore::read_loose(std::string_view name) const {
  const auto p = ref_path(name);
  std::error_code ec;
  if (!stdfs::is_regular_file(p, ec)) {
    return std::nullopt; // absent, or a directory of deeper refs
  }
  std::string s;
  try {
    const auto bytes = fs::read_file(p);
    s.assign(bytes.begin(), bytes.end());
  } catch (const IoError &) {
    if (!fs::exists(p)) {
      return std::nullopt; // deleted between the check and the read
    }
    throw;
  }
  strip_trailing_newlines(s);
  if (s.starts_with(consts::kRefPrefix)) {
    std::string target = s.substr(consts::kRefPrefix.size());
    if (!is_valid_ref_name(target)) {
      throw DecodeError("ref", std::string(name) + ": bad symbolic target '" + target + "'");
    }
    return SymbolicTarget{std::move(target)};
  }
  const auto id = ObjectId::from_hex(s);
  if (!id || id->algo() != algo_) {
    throw DecodeError("ref", std::string(name) + ": bad content '" + s + "'");
  }
  return *id;
}

RefStore::PackedRefs RefStore::load_packed() const {
  PackedRefs out;
  const auto p = git_dir_ / consts::kPackedRefs;
  if (!fs::exists(p)) {
    return out;
  }
  const auto bytes = fs::read_file(p);
  std::istringstream iss(std::string(bytes.begin(), bytes.end()));
  std::string line;
  std::string last;
  while (std::getline(iss, line)) {
    strip_trailing_newlines(line);
    if (line.empty()) {
      continue;
    }
    if (line.front() == '#') {
      if (out.header.empty()) {
        out.header = line;
      }
      continue;
    }
    if (line.front() == '^') {
      const auto id = ObjectId::from_hex(std::string_view(line).substr(1));
      if (last.empty() || !id || id->algo() != algo_) {
        throw DecodeError("packed-refs", "bad peeled line '" + line + "'");
      }
      out.peeled.insert_or_assign(last, *id);
      continue;
    }
    const auto sp = line.find(' ');
    std::optional<ObjectId> id;
    if (sp != std::string::npos) {
      id = ObjectId::from_hex(std::string_view(line).substr(0, sp));
    }
    if (!id || id->algo() != algo_) {
      throw DecodeError("packed-refs", "bad line '" + line + "'");
    }
    last = line.substr(sp + 1);
    if (!is_valid_ref_name(last)) {
      throw DecodeError("packed-refs", "bad ref name '" + last + "'");
    }
    out.refs.insert_or_assign(last, *id);
  }
  return out;
}

std::optional<RefValue> RefStore::lookup(std::string_view name) const {
  if (auto v = read_loose(name)) {
    return v;
  }
  const auto packed = load_packed();
  const auto it = packed.refs.find(std::string(name));
  if (it == packed.refs.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<RefValue> RefStore::try_read_ref(std::string_view name) const {
  require_valid(name);
  return lookup(name);
}

RefValue RefStore::read_ref(std::string_view name) const {
  auto v = try_read_ref(name);
  if (!v) {
    throw RefNotFound(std::string(name));
  }
  return std::move(*v);
}

ObjectId RefStore::resolve(std::string_view name) const {
  require_valid(name);
  std::string cur(name);
  std::set<std::string> seen;
  for (std::size_t depth = 0; depth <= consts::kMaxSymrefDepth; ++depth) {
    const auto v = lookup(cur);
    if (!v) {
      if (depth == 0) {
        throw RefNotFound(cur);
      }
      throw DanglingRef(std::string(name), cur);
    }
    if (const auto *id = std::get_if<ObjectId>(&*v)) {
      return *id;
    }
    seen.insert(cur);
    cur = std::get<SymbolicTarget>(*v).name;
    if (seen.contains(cur)) {
      throw RefCycle(std::string(name));
    }
  }
  throw RefCycle(std::string(name));
}

std::string RefStore::resolve_final_name(std::string_view name) const {
  require_valid(name);
  std::string cur(name);
  std::set<std::string> seen;
  for (std::size_t depth = 0; depth <= consts::kMaxSymrefDepth; ++depth) {
    const auto v = lookup(cur);
    if (!v || std::holds_alternative<ObjectId>(*v)) {
      return cur;
    }
    seen.insert(cur);
    cur = std::get<SymbolicTarget>(*v).name;
    if (seen.contains(cur)) {
      throw RefCycle(std::string(name));
    }
  }
  throw RefCycle(std::string(name));
}

void RefStore::write_value(std::string_view name, const std::string &content,
                           const std::optional<ObjectId> &expected_old, bool must_not_exist) {
  fs::LockFile lock(ref_path(name));
  if (!lock.try_acquire()) {
    throw RefRaceError(std::string(name),
                       lock.lock_path().string() + " is held by another writer");
  }
  // Checked under the lock: nobody can move the ref between check and write.
  if (expected_old || must_not_exist) {
    const auto current = lookup(name);
    if (must_not_exist && current) {
      throw RefRaceError(std::string(name), "already exists: " + describe(current));
    }
    if (expected_old) {
      const auto *cur_id = current ? std::get_if<ObjectId>(&*current) : nullptr;
      if (cur_id == nullptr || *cur_id != *expected_old) {
        throw RefRaceError(std::string(name),
                           "expected " + expected_old->hex() + ", found " + describe(current));
      }
    }
  }
  lock.write(fs::as_bytes(content));
  lock.commit();
}

void RefStore::set_direct(std::string_view name, const ObjectId &id,
                          const std::optional<ObjectId> &expected_old) {
  if (id.algo() != algo_) {
    throw std::invalid_argument("set_direct: id uses the wrong hash algorithm");
  }
  const std::string target = resolve_final_name(name);
  write_value(target, id.hex() + "\n", expected_old, false);
  log::trace("refs", target + " -> " + id.hex());
}

void RefStore::create_direct(std::string_view name, const ObjectId &id) {
  if (id.algo() != algo_) {
    throw std::invalid_argument("create_direct: id uses the wrong hash algorithm");
  }
  const std::string target = resolve_final_name(name);
  write_value(target, id.hex() + "\n", std::nullopt, true);
  log::trace("refs", "created " + target + " -> " + id.hex());
}

void RefStore::set_symbolic(std::string_view name, std::string_view target) {
  require_valid(name);
  require_valid(target);
  write_value(name, std::string(consts::kRefPrefix) + std::string(target) + "\n", std::nullopt,
              false);
  log::trace("refs", std::string(name) + " -> ref: " + std::string(target));
}

void RefStore::delete_ref(std::string_view name, const std::optional<ObjectId> &expected_old) {
  require_valid(name);
  fs::LockFile lock(ref_path(name));
  if (!lock.try_acquire()) {
    throw RefRaceError(std::string(name),
                       lock.lock_path().string() + " is held by another writer");
  }
  const auto loose = read_loose(name);
  const auto packed = load_packed();
  const bool in_packed = packed.refs.contains(std::string(name));
  std::optional<RefValue> current = loose;
  if (!current && in_packed) {
    current = packed.refs.at(std::string(name));
  }
  if (!current) {
    throw RefNotFound(std::string(name));
  }
  if (expected_old) {
    const auto *cur_id = std::get_if<ObjectId>(&*current);
    if (cur_id == nullptr || *cur_id != *expected_old) {
      throw RefRaceError(std::string(name),
                         "expected " + expected_old->hex() + ", found " + describe(current));
    }
  }
  if (in_packed) {
    rewrite_packed_without(name);
  }
  lock.commit_delete();
  prune_empty_dirs(ref_path(name).parent_path());
  log::trace("refs", "deleted " + std::string(name));
}

void RefStore::rewrite_packed_without(std::string_view name) {
  fs::LockFile lock(git_dir_ / consts::kPackedRefs);
  if (!lock.try_acquire()) {
    throw RefRaceError(std::string(consts::kPackedRefs),
                       lock.lock_path().string() + " is held by another writer");
  }
  auto packed = load_packed();
  packed.refs.erase(std::string(name));
  packed.peeled.erase(std::string(name));

  std::string out;
  out += packed.header.empty() ? std::string(consts::kPackedRefsHeader) : packed.header;
  out += '\n';
  for (const auto &[ref, id] : packed.refs) {
    out += id.hex() + " " + ref + "\n";
    if (const auto it = packed.peeled.find(ref); it != packed.peeled.end()) {
      out += "^" + it->second.hex() + "\n";
    }
  }
  lock.write(fs::as_bytes(out));
  lock.commit();
}

void RefStore::prune_empty_dirs(stdfs::path dir) const {
  const auto stop = git_dir_ / consts::kRefsDir;
  std::error_code ec;
  while (dir != stop && dir.native().starts_with(stop.native())) {
    if (!stdfs::is_empty(dir, ec) || ec) {
      return;
    }
    stdfs::remove(dir, ec);
    if (ec) {
      return; // another writer just created something here
    }
    dir = dir.parent_path();
  }
}

std::vector<std::pair<std::string, RefValue>> RefStore::iter_refs(std::string_view prefix) const {
  std::map<std::string, RefValue> all;
  const auto packed = load_packed();
  for (const auto &[name, id] : packed.refs) {
    if (name.starts_with(prefix)) {
      all.insert_or_assign(name, id);
    }
  }

  std::error_code ec;
  // top-level refs such as HEAD
  for (stdfs::directory_iterator it(git_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (!is_upper_name(name) || !name.starts_with(prefix) || !it->is_regular_file(ec)) {
      continue;
    }
    try {
      if (auto v = read_loose(name)) {
        all.insert_or_assign(name, std::move(*v));
      }
    } catch (const DecodeError &e) {
      log::trace("refs", "ignoring non-ref file " + name + ": " + e.what());
    }
  }

  const auto refs_root = git_dir_ / consts::kRefsDir;
  for (stdfs::recursive_directory_iterator it(refs_root, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const std::string name = it->path().lexically_relative(git_dir_).generic_string();
    if (!is_valid_ref_name(name) || !name.starts_with(prefix)) {
      continue; // lock files and strays
    }
    if (auto v = read_loose(name)) {
      all.insert_or_assign(name, std::move(*v));
    }
  }

  return {all.begin(), all.end()};
}

std::optional<ObjectId> RefStore::peeled(std::string_view name) const {
  require_valid(name);
  const auto packed = load_packed();
  const auto it = packed.peeled.find(std::string(name));
  if (it == packed.peeled.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace gitstore
