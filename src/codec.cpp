#include "gitstore/codec.hpp"

#include "gitstore/consts.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/fs.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace gitstore {

namespace {

// Modes

std::string mode_to_ascii_octal(std::uint32_t mode) {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

std::uint32_t ascii_octal_to_mode(std::string_view s) {
  if (s.empty() || s.size() > 6 || s.front() == '0') {
    throw DecodeError("mode", "malformed mode '" + std::string(s) + "'");
  }
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw DecodeError("mode", "non-octal mode '" + std::string(s) + "'");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  if (!is_valid_mode(v)) {
    throw DecodeError("mode", "mode out of range '" + std::string(s) + "'");
  }
  return v;
}

ObjectId parse_id_field(std::string_view hex, HashAlgo algo, std::string_view field) {
  auto id = ObjectId::from_hex(hex);
  if (!id || id->algo() != algo) {
    throw DecodeError(field, "bad object id '" + std::string(hex) + "'");
  }
  return *id;
}

void append(std::vector<std::uint8_t> &out, std::string_view s) {
  out.insert(out.end(), s.begin(), s.end());
}

// Header values may span lines; continuation lines start with one space.
void append_header(std::vector<std::uint8_t> &out, std::string_view key, std::string_view value) {
  append(out, key);
  out.push_back(static_cast<std::uint8_t>(consts::kSpace));
  for (const char c : value) {
    out.push_back(static_cast<std::uint8_t>(c));
    if (c == consts::kLF) {
      out.push_back(static_cast<std::uint8_t>(consts::kSpace));
    }
  }
  out.push_back(static_cast<std::uint8_t>(consts::kLF));
}

// Keys with a fixed place in a commit; anywhere else they would not read back.
bool is_reserved_commit_header(std::string_view key) {
  return key == consts::kTreeHeader || key == consts::kParentHeader ||
         key == consts::kAuthorHeader || key == consts::kCommitterHeader ||
         key == consts::kEncodingHeader;
}

// Encoders

std::vector<std::uint8_t> encode_commit(const Commit &c) {
  std::vector<std::uint8_t> out;
  append_header(out, consts::kTreeHeader, c.tree.hex());
  for (const auto &p : c.parents) {
    append_header(out, consts::kParentHeader, p.hex());
  }
  append_header(out, consts::kAuthorHeader, timeutil::format_signature(c.author));
  append_header(out, consts::kCommitterHeader, timeutil::format_signature(c.committer));
  if (c.encoding) {
    append_header(out, consts::kEncodingHeader, *c.encoding);
  }
  for (const auto &[key, value] : c.extra_headers) {
    if (is_reserved_commit_header(key) || key.empty() ||
        key.find_first_of(" \n") != std::string::npos) {
      throw std::invalid_argument("commit: extra header key '" + key + "' is not allowed");
    }
    append_header(out, key, value);
  }
  out.push_back(static_cast<std::uint8_t>(consts::kLF));
  append(out, c.message);
  return out;
}

std::vector<std::uint8_t> encode_tag(const Tag &t) {
  std::vector<std::uint8_t> out;
  append_header(out, consts::kObjectHeader, t.object.hex());
  append_header(out, consts::kTypeHeader, kind_name(t.target_kind));
  append_header(out, consts::kTagHeader, t.name);
  if (t.tagger) {
    append_header(out, consts::kTaggerHeader, timeutil::format_signature(*t.tagger));
  }
  out.push_back(static_cast<std::uint8_t>(consts::kLF));
  append(out, t.message);
  return out;
}

// Decoders

Tree decode_tree(std::span<const std::uint8_t> data, HashAlgo algo) {
  const std::size_t id_len = raw_size(algo);
  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw DecodeError("mode", "tree entry: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw DecodeError("name", "tree entry: expected NUL");
    }
    std::string name(p, q_nul);
    if (!is_valid_entry_name(name)) {
      throw DecodeError("name", "tree entry: invalid name '" + name + "'");
    }
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < id_len) {
      throw DecodeError("id", "tree entry: truncated id for '" + name + "'");
    }
    ObjectId id(algo, std::span<const std::uint8_t>(&*p, id_len));
    p += static_cast<std::ptrdiff_t>(id_len);

    TreeEntry e{.mode = mode, .name = std::move(name), .id = id};
    if (!out.empty() && compare_tree_entries(out.back(), e) >= 0) {
      throw DecodeError("order", "tree entries not in canonical order at '" + e.name + "'");
    }
    out.push_back(std::move(e));
  }
  return Tree(std::move(out));
}

struct Header {
  std::string key;
  std::string value;
};

// Split a commit/tag body into headers and message. Continuation lines are
// folded back into the previous header's value.
std::pair<std::vector<Header>, std::string> split_headers(std::string_view text) {
  std::vector<Header> headers;
  std::size_t pos = 0;
  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    if (nl == std::string_view::npos) {
      throw DecodeError("header", "missing blank line before message");
    }
    const std::string_view line = text.substr(pos, nl - pos);
    pos = nl + 1;
    if (line.empty()) {
      break;
    }
    if (line.front() == consts::kSpace) {
      if (headers.empty()) {
        throw DecodeError("header", "continuation line without header");
      }
      headers.back().value += consts::kLF;
      headers.back().value += line.substr(1);
      continue;
    }
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string_view::npos || sp == 0) {
      throw DecodeError("header", "malformed header line '" + std::string(line) + "'");
    }
    headers.push_back(Header{std::string(line.substr(0, sp)), std::string(line.substr(sp + 1))});
  }
  return {std::move(headers), std::string(text.substr(pos))};
}

Commit decode_commit(std::span<const std::uint8_t> data, HashAlgo algo) {
  auto [headers, message] = split_headers(fs::as_text(data));
  Commit c;
  c.message = std::move(message);

  std::size_t i = 0;
  if (i >= headers.size() || headers[i].key != consts::kTreeHeader) {
    throw DecodeError("tree", "commit must start with a tree header");
  }
  c.tree = parse_id_field(headers[i++].value, algo, "tree");
  while (i < headers.size() && headers[i].key == consts::kParentHeader) {
    c.parents.push_back(parse_id_field(headers[i++].value, algo, "parent"));
  }
  if (i >= headers.size() || headers[i].key != consts::kAuthorHeader) {
    throw DecodeError("author", "missing author header");
  }
  c.author = timeutil::parse_signature(headers[i++].value, "author");
  if (i >= headers.size() || headers[i].key != consts::kCommitterHeader) {
    throw DecodeError("committer", "missing committer header");
  }
  c.committer = timeutil::parse_signature(headers[i++].value, "committer");
  if (i < headers.size() && headers[i].key == consts::kEncodingHeader) {
    c.encoding = std::move(headers[i++].value);
  }
  for (; i < headers.size(); ++i) {
    if (is_reserved_commit_header(headers[i].key)) {
      throw DecodeError(headers[i].key, "header out of order");
    }
    c.extra_headers.emplace_back(std::move(headers[i].key), std::move(headers[i].value));
  }
  return c;
}

Tag decode_tag(std::span<const std::uint8_t> data, HashAlgo algo) {
  auto [headers, message] = split_headers(fs::as_text(data));
  Tag t;
  t.message = std::move(message);

  std::size_t i = 0;
  if (i >= headers.size() || headers[i].key != consts::kObjectHeader) {
    throw DecodeError("object", "tag must start with an object header");
  }
  t.object = parse_id_field(headers[i++].value, algo, "object");
  if (i >= headers.size() || headers[i].key != consts::kTypeHeader) {
    throw DecodeError("type", "missing type header");
  }
  const auto kind = parse_kind(headers[i].value);
  if (!kind) {
    throw DecodeError("type", "unknown target kind '" + headers[i].value + "'");
  }
  t.target_kind = *kind;
  ++i;
  if (i >= headers.size() || headers[i].key != consts::kTagHeader) {
    throw DecodeError("tag", "missing tag header");
  }
  t.name = std::move(headers[i++].value);
  if (i < headers.size() && headers[i].key == consts::kTaggerHeader) {
    t.tagger = timeutil::parse_signature(headers[i++].value, "tagger");
  }
  if (i != headers.size()) {
    throw DecodeError("header", "unexpected tag header '" + headers[i].key + "'");
  }
  return t;
}

} // namespace

int compare_entry_names(std::string_view a, bool a_is_tree, std::string_view b, bool b_is_tree) {
  const std::size_t len = std::min(a.size(), b.size());
  if (len > 0) {
    const int cmp = std::memcmp(a.data(), b.data(), len);
    if (cmp != 0) {
      return cmp;
    }
  }
  const auto next = [len](std::string_view s, bool is_tree) -> unsigned {
    if (s.size() > len) {
      return static_cast<unsigned char>(s[len]);
    }
    return is_tree ? static_cast<unsigned>('/') : 0U;
  };
  const unsigned c1 = next(a, a_is_tree);
  const unsigned c2 = next(b, b_is_tree);
  return c1 < c2 ? -1 : (c1 > c2 ? 1 : 0);
}

bool is_valid_entry_name(std::string_view name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string_view::npos &&
         name.find(consts::kNul) == std::string_view::npos;
}

std::string object_header(ObjectKind kind, std::size_t size) {
  const std::string_view type = kind_name(kind);
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1);
  s.append(type);
  s.push_back(consts::kSpace);
  s.append(std::to_string(size));
  s.push_back(consts::kNul);
  return s;
}

std::vector<std::uint8_t> encode_tree(std::vector<TreeEntry> entries) {
  const Tree tree(std::move(entries)); // sorts + validates
  std::vector<std::uint8_t> data;
  for (const auto &e : tree.entries()) {
    append(data, mode_to_ascii_octal(e.mode));
    data.push_back(static_cast<std::uint8_t>(consts::kSpace));
    append(data, e.name);
    data.push_back(static_cast<std::uint8_t>(consts::kNul));
    const auto raw = e.id.bytes();
    data.insert(data.end(), raw.begin(), raw.end());
  }
  return data;
}

std::vector<std::uint8_t> serialize(const Object &obj) {
  return std::visit(
      [](const auto &o) -> std::vector<std::uint8_t> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blob>) {
          return o.data;
        } else if constexpr (std::is_same_v<T, Tree>) {
          return encode_tree(o.entries());
        } else if constexpr (std::is_same_v<T, Commit>) {
          return encode_commit(o);
        } else {
          return encode_tag(o);
        }
      },
      obj);
}

ObjectId digest(ObjectKind kind, std::span<const std::uint8_t> body, HashAlgo algo) {
  Hasher h{algo};
  h.update(object_header(kind, body.size()));
  h.update(body);
  return h.finish();
}

ObjectId digest(const Object &obj, HashAlgo algo) {
  const auto body = serialize(obj);
  return digest(kind_of(obj), body, algo);
}

Object deserialize(ObjectKind kind, std::span<const std::uint8_t> body, HashAlgo algo) {
  switch (kind) {
  case ObjectKind::Blob:
    return Blob{.data = {body.begin(), body.end()}};
  case ObjectKind::Tree:
    return decode_tree(body, algo);
  case ObjectKind::Commit:
    return decode_commit(body, algo);
  case ObjectKind::Tag:
    return decode_tag(body, algo);
  }
  throw DecodeError("kind", "unknown object kind");
}

std::vector<std::uint8_t> frame(ObjectKind kind, std::span<const std::uint8_t> body) {
  const std::string hdr = object_header(kind, body.size());
  std::vector<std::uint8_t> out;
  out.reserve(hdr.size() + body.size());
  append(out, hdr);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

RawObject parse_framed(std::span<const std::uint8_t> bytes) {
  const auto it_space = std::ranges::find(bytes, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == bytes.end()) {
    throw DecodeError("header", "missing space after kind");
  }
  const auto it_nul = std::find(it_space + 1, bytes.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == bytes.end()) {
    throw DecodeError("header", "truncated header (no NUL)");
  }
  const std::string type(bytes.begin(), it_space);
  const auto kind = parse_kind(type);
  if (!kind) {
    throw DecodeError("kind", "unknown kind tag '" + type + "'");
  }
  const std::string size_str(it_space + 1, it_nul);
  std::size_t size = 0;
  const auto r = std::from_chars(size_str.data(), size_str.data() + size_str.size(), size);
  if (size_str.empty() || r.ec != std::errc{} || r.ptr != size_str.data() + size_str.size()) {
    throw DecodeError("size", "bad size '" + size_str + "'");
  }
  const auto body_off = static_cast<std::size_t>(it_nul - bytes.begin()) + 1;
  if (bytes.size() - body_off != size) {
    throw DecodeError("size", "header says " + size_str + " bytes, body has " +
                                  std::to_string(bytes.size() - body_off));
  }
  return RawObject{.kind = *kind, .body = {bytes.begin() + static_cast<std::ptrdiff_t>(body_off), bytes.end()}};
}

} // namespace gitstore
