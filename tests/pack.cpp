#include "gitstore/codec.hpp"
#include "gitstore/errors.hpp"
#include "gitstore/fs.hpp"
#include "gitstore/log.hpp"
#include "gitstore/object_store.hpp"
#include "gitstore/pack.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

using gitstore::HashAlgo;
using gitstore::ObjectId;
using gitstore::ObjectKind;

using Bytes = std::vector<std::uint8_t>;

static Bytes to_bytes(std::string_view s) { return {s.begin(), s.end()}; }

static void put_u32(Bytes &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

static void put_u64(Bytes &out, std::uint64_t v) {
  put_u32(out, static_cast<std::uint32_t>(v >> 32));
  put_u32(out, static_cast<std::uint32_t>(v));
}

// Minimal pack v2 + idx v2 writer, enough to exercise the reader.
class TestPack {
public:
  ObjectId add_whole(ObjectKind kind, std::string_view body) {
    return add_whole(kind, body, body.size());
  }

  // Entry whose header claims `declared_size` bytes whatever the body holds.
  ObjectId add_whole(ObjectKind kind, std::string_view body, std::uint64_t declared_size) {
    const auto data = to_bytes(body);
    const ObjectId id = gitstore::digest(kind, data, HashAlgo::Sha1);
    Bytes entry;
    put_type_size(entry, type_code(kind), declared_size);
    append_zlib(entry, data);
    finish_entry(id, entry);
    return id;
  }

  ObjectId add_ofs_delta(const ObjectId &base, const Bytes &delta, const ObjectId &result) {
    const std::uint64_t here = next_offset();
    std::uint64_t rel = here - offset_of(base);
    Bytes entry;
    put_type_size(entry, 6, delta.size());
    // big-endian, each continuation byte biased by one
    Bytes ofs{static_cast<std::uint8_t>(rel & 0x7fU)};
    while ((rel >>= 7) != 0) {
      --rel;
      ofs.insert(ofs.begin(), static_cast<std::uint8_t>(0x80U | (rel & 0x7fU)));
    }
    entry.insert(entry.end(), ofs.begin(), ofs.end());
    append_zlib(entry, delta);
    finish_entry(result, entry);
    return result;
  }

  ObjectId add_ref_delta(const ObjectId &base, const Bytes &delta, const ObjectId &result) {
    Bytes entry;
    put_type_size(entry, 7, delta.size());
    const auto raw = base.bytes();
    entry.insert(entry.end(), raw.begin(), raw.end());
    append_zlib(entry, delta);
    finish_entry(result, entry);
    return result;
  }

  // Writes pack-<name>.pack and pack-<name>.idx under `pack_dir`.
  void write(const fs::path &pack_dir, const std::string &name, bool large_offsets = false) const {
    Bytes pack;
    pack.insert(pack.end(), {'P', 'A', 'C', 'K'});
    put_u32(pack, 2);
    put_u32(pack, static_cast<std::uint32_t>(entries_.size()));
    pack.insert(pack.end(), body_.begin(), body_.end());
    const ObjectId pack_sum = gitstore::hash_bytes(HashAlgo::Sha1, pack);
    const auto pack_sum_raw = pack_sum.bytes();
    pack.insert(pack.end(), pack_sum_raw.begin(), pack_sum_raw.end());

    auto sorted = entries_;
    std::ranges::sort(sorted, {}, &Entry::id);

    Bytes idx{0xff, 't', 'O', 'c'};
    put_u32(idx, 2);
    for (unsigned b = 0; b < 256; ++b) {
      const auto n = std::ranges::count_if(sorted, [b](const Entry &e) { return e.id.bytes()[0] <= b; });
      put_u32(idx, static_cast<std::uint32_t>(n));
    }
    for (const auto &e : sorted) {
      const auto raw = e.id.bytes();
      idx.insert(idx.end(), raw.begin(), raw.end());
    }
    for (const auto &e : sorted) {
      put_u32(idx, e.crc);
    }
    for (std::size_t i = 0; i < sorted.size(); ++i) {
      put_u32(idx, large_offsets ? static_cast<std::uint32_t>(0x80000000U | i)
                                 : static_cast<std::uint32_t>(sorted[i].offset));
    }
    if (large_offsets) {
      for (const auto &e : sorted) {
        put_u64(idx, e.offset);
      }
    }
    idx.insert(idx.end(), pack_sum_raw.begin(), pack_sum_raw.end());
    const ObjectId idx_sum = gitstore::hash_bytes(HashAlgo::Sha1, idx);
    const auto idx_sum_raw = idx_sum.bytes();
    idx.insert(idx.end(), idx_sum_raw.begin(), idx_sum_raw.end());

    fs::create_directories(pack_dir);
    gitstore::fs::write_file_atomic(pack_dir / ("pack-" + name + ".pack"), pack);
    gitstore::fs::write_file_atomic(pack_dir / ("pack-" + name + ".idx"), idx);
  }

private:
  struct Entry {
    ObjectId id;
    std::uint64_t offset;
    std::uint32_t crc;
  };

  static unsigned type_code(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Commit:
      return 1;
    case ObjectKind::Tree:
      return 2;
    case ObjectKind::Blob:
      return 3;
    case ObjectKind::Tag:
      return 4;
    }
    return 0;
  }

  static void put_type_size(Bytes &out, unsigned type, std::uint64_t size) {
    std::uint8_t c = static_cast<std::uint8_t>((type << 4) | (size & 0x0fU));
    size >>= 4;
    while (size != 0) {
      out.push_back(static_cast<std::uint8_t>(c | 0x80U));
      c = static_cast<std::uint8_t>(size & 0x7fU);
      size >>= 7;
    }
    out.push_back(c);
  }

  static void append_zlib(Bytes &out, const Bytes &data) {
    const auto z = gitstore::fs::z_compress(data);
    out.insert(out.end(), z.begin(), z.end());
  }

  [[nodiscard]] std::uint64_t next_offset() const { return 12 + body_.size(); }

  [[nodiscard]] std::uint64_t offset_of(const ObjectId &id) const {
    return std::ranges::find(entries_, id, &Entry::id)->offset;
  }

  void finish_entry(const ObjectId &id, const Bytes &entry) {
    const auto crc = static_cast<std::uint32_t>(
        ::crc32(0L, entry.data(), static_cast<uInt>(entry.size())));
    entries_.push_back(Entry{.id = id, .offset = next_offset(), .crc = crc});
    body_.insert(body_.end(), entry.begin(), entry.end());
  }

  std::vector<Entry> entries_;
  Bytes body_;
};

static ObjectId blob_id(std::string_view text) {
  return gitstore::digest(ObjectKind::Blob, gitstore::fs::as_bytes(text), HashAlgo::Sha1);
}

// Field of the DecodeError apply_delta throws, or "" if it succeeds.
static std::string delta_error(std::string_view base, const Bytes &delta) {
  try {
    (void)gitstore::apply_delta(gitstore::fs::as_bytes(base), delta);
  } catch (const gitstore::DecodeError &e) {
    return e.field();
  }
  return {};
}

static std::size_t count_ids(const gitstore::ObjectStore &store) {
  std::size_t n = 0;
  for (const auto &id : store.iter_all()) {
    (void)id;
    ++n;
  }
  return n;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitstore_pack_" + std::to_string(std::random_device{}()));
  const fs::path objects = root / "objects";
  const fs::path pack_dir = objects / "pack";
  fs::create_directories(pack_dir);

  try {
    const std::string base_text = "hello world\n";
    const std::string d1_text = "hello world\nand more\n";
    const std::string d2_text = "hello world\nand more\nplus\n";

    // d1 = copy base[0..12) + insert "and more\n"
    Bytes d1_delta{0x0c, 0x15, 0x90, 0x0c, 0x09};
    d1_delta.insert(d1_delta.end(), d1_text.begin() + 12, d1_text.end());
    // d2 = copy d1[0..21) + insert "plus\n"
    Bytes d2_delta{0x15, 0x1a, 0x90, 0x15, 0x05};
    d2_delta.insert(d2_delta.end(), d2_text.begin() + 21, d2_text.end());

    if (gitstore::apply_delta(gitstore::fs::as_bytes(base_text), d1_delta) != to_bytes(d1_text)) {
      std::cerr << "apply_delta produced the wrong result\n";
      return 1;
    }

    TestPack tp;
    const ObjectId base = tp.add_whole(ObjectKind::Blob, base_text);
    const ObjectId d1 = tp.add_ofs_delta(base, d1_delta, blob_id(d1_text));
    const ObjectId d2 = tp.add_ref_delta(d1, d2_delta, blob_id(d2_text));
    tp.write(pack_dir, "a");

    gitstore::ObjectStore store{objects};
    if (store.pack_count() != 1) {
      std::cerr << "pack not loaded\n";
      return 1;
    }
    if (!store.has(base) || !store.has(d1) || !store.has(d2)) {
      std::cerr << "has() false for packed objects\n";
      return 1;
    }
    if (store.read_blob(base).text() != base_text || store.read_blob(d1).text() != d1_text ||
        store.read_blob(d2).text() != d2_text) {
      std::cerr << "packed/delta content mismatch\n";
      return 1;
    }
    store.verify(d2);
    if (count_ids(store) != 3) {
      std::cerr << "iter_all over pack yielded the wrong count\n";
      return 1;
    }

    // A loose copy of a packed object is yielded once
    (void)store.add(gitstore::Blob::from_string(base_text));
    if (count_ids(store) != 3) {
      std::cerr << "loose+packed duplicate yielded twice\n";
      return 1;
    }

    // Loose storage is consulted first
    const auto loose_path = objects / base.hex().substr(0, 2) / base.hex().substr(2);
    gitstore::fs::write_file_atomic(
        loose_path, gitstore::fs::z_compress(gitstore::frame(
                        ObjectKind::Blob, gitstore::fs::as_bytes("shadowed\n"))));
    if (store.read_blob(base).text() != "shadowed\n") {
      std::cerr << "loose object did not shadow the packed one\n";
      return 1;
    }
    fs::remove(loose_path);
    if (store.read_blob(base).text() != base_text) {
      std::cerr << "packed object not visible after removing the loose copy\n";
      return 1;
    }

    // A second pack (large offsets, overlapping content) appears only after reload
    TestPack tp2;
    (void)tp2.add_whole(ObjectKind::Blob, base_text);
    const ObjectId extra = tp2.add_whole(ObjectKind::Blob, "only in pack b\n");
    tp2.write(pack_dir, "b", true);
    if (store.has(extra)) {
      std::cerr << "new pack visible before reload_packs()\n";
      return 1;
    }
    store.reload_packs();
    if (store.pack_count() != 2 || store.read_blob(extra).text() != "only in pack b\n") {
      std::cerr << "reload_packs() did not pick up the new pack\n";
      return 1;
    }
    std::set<ObjectId> seen;
    std::size_t n = 0;
    for (const auto &id : store.iter_all()) {
      seen.insert(id);
      ++n;
    }
    if (n != 4 || seen != std::set<ObjectId>{base, d1, d2, extra}) {
      std::cerr << "iter_all across packs yielded " << n << " ids\n";
      return 1;
    }

    // An unreadable pack is skipped with a warning
    gitstore::log::set_level(gitstore::log::Level::Trace);
    if (!gitstore::log::tracing()) {
      std::cerr << "trace level not reported as tracing\n";
      return 1;
    }
    gitstore::log::set_level(gitstore::log::Level::Off);
    if (gitstore::log::tracing()) {
      std::cerr << "tracing still on after set_level(Off)\n";
      return 1;
    }
    gitstore::fs::write_file_atomic(pack_dir / "pack-c.idx", gitstore::fs::as_bytes("garbage"));
    gitstore::fs::write_file_atomic(pack_dir / "pack-c.pack", gitstore::fs::as_bytes("garbage"));
    store.reload_packs();
    if (store.pack_count() != 2 || store.read_blob(d2).text() != d2_text) {
      std::cerr << "broken pack not skipped\n";
      return 1;
    }

    // REF_DELTA against a base outside the pack is rejected on read
    TestPack tp3;
    const ObjectId orphan = tp3.add_ref_delta(blob_id("elsewhere\n"), d1_delta, blob_id("x\n"));
    const fs::path lone_dir = root / "lone" / "pack";
    tp3.write(lone_dir, "d");
    const gitstore::PackBackend lone(lone_dir / "pack-d.idx", HashAlgo::Sha1);
    bool threw = false;
    try {
      (void)lone.read(orphan);
    } catch (const gitstore::DecodeError &e) {
      threw = e.field() == "delta";
    }
    if (!threw) {
      std::cerr << "missing REF_DELTA base not reported\n";
      return 1;
    }

    // Malformed deltas
    if (delta_error("short", d1_delta) != "delta") {
      std::cerr << "base size mismatch not reported\n";
      return 1;
    }
    if (delta_error(base_text, Bytes{0x0c, 0x20, 0x90, 0x20}) != "delta") {
      std::cerr << "out-of-bounds copy not reported\n";
      return 1;
    }
    if (delta_error(base_text, Bytes{0x0c, 0x01, 0x00}) != "delta") {
      std::cerr << "reserved opcode not reported\n";
      return 1;
    }
    if (delta_error(base_text, Bytes{0x0c, 0x05, 0x90, 0x0c}) != "delta") {
      std::cerr << "result size mismatch not reported\n";
      return 1;
    }

    // Sizes declared by corrupt headers are never trusted for allocation
    if (delta_error("", Bytes{0x00, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f}) !=
        "delta") {
      std::cerr << "huge delta result size not reported\n";
      return 1;
    }
    threw = false;
    try {
      (void)gitstore::fs::z_inflate_exact(
          gitstore::fs::z_compress(to_bytes(base_text)), std::size_t{1} << 62U);
    } catch (const gitstore::DecodeError &e) {
      threw = e.field() == "size";
    }
    if (!threw) {
      std::cerr << "huge inflate size not reported\n";
      return 1;
    }
    threw = false;
    try {
      (void)gitstore::fs::z_inflate_exact(gitstore::fs::z_compress(to_bytes(base_text)), 4);
    } catch (const gitstore::DecodeError &e) {
      threw = e.field() == "size";
    }
    if (!threw) {
      std::cerr << "oversized stream not reported\n";
      return 1;
    }
    TestPack tp4;
    const ObjectId bloated =
        tp4.add_whole(ObjectKind::Blob, base_text, std::uint64_t{1} << 40U);
    const fs::path bloated_dir = root / "bloated" / "pack";
    tp4.write(bloated_dir, "e");
    const gitstore::PackBackend bloated_pack(bloated_dir / "pack-e.idx", HashAlgo::Sha1);
    threw = false;
    try {
      (void)bloated_pack.read(bloated);
    } catch (const gitstore::DecodeError &e) {
      threw = e.field() == "size";
    }
    if (!threw) {
      std::cerr << "pack entry with a huge declared size not reported\n";
      return 1;
    }

    std::cout << "pack test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
