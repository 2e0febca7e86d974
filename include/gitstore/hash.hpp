#pragma once

#include "gitstore/consts.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gitstore {

// Digest scheme of a repository: legacy SHA-1 (20 bytes) or SHA-256 (32 bytes).
enum class HashAlgo : std::uint8_t { Sha1, Sha256 };

[[nodiscard]] constexpr std::size_t raw_size(HashAlgo algo) {
  return algo == HashAlgo::Sha1 ? consts::kSha1RawLen : consts::kSha256RawLen;
}
[[nodiscard]] constexpr std::size_t hex_size(HashAlgo algo) { return 2 * raw_size(algo); }

std::string_view algo_name(HashAlgo algo);
std::optional<HashAlgo> parse_algo(std::string_view name);

/**
 * Binary object identifier. Holds up to 32 raw bytes; the algorithm decides
 * how many are significant. Unused trailing bytes are always zero, so the
 * defaulted comparisons order ids byte-wise.
 */
class ObjectId {
public:
  ObjectId() = default;
  ObjectId(HashAlgo algo, std::span<const std::uint8_t> raw);

  // Parse 40- or 64-char hex; the length picks the algorithm.
  static std::optional<ObjectId> from_hex(std::string_view hex);
  // Like from_hex, but requires the given algorithm and throws DecodeError("id").
  static ObjectId parse(std::string_view hex, HashAlgo algo);

  [[nodiscard]] HashAlgo algo() const { return algo_; }
  [[nodiscard]] std::size_t size() const { return raw_size(algo_); }
  [[nodiscard]] std::span<const std::uint8_t> bytes() const { return {raw_.data(), size()}; }
  [[nodiscard]] std::string hex() const;
  [[nodiscard]] std::string short_hex(std::size_t n = 7) const { return hex().substr(0, n); }

  auto operator<=>(const ObjectId &) const = default;
  bool operator==(const ObjectId &) const = default;

private:
  std::array<std::uint8_t, consts::kMaxRawLen> raw_{};
  HashAlgo algo_ = HashAlgo::Sha1;
};

struct ObjectIdHash {
  std::size_t operator()(const ObjectId &id) const noexcept {
    // ids are uniformly distributed; the leading bytes are a fine hash
    std::size_t h = 0;
    const auto b = id.bytes();
    for (std::size_t i = 0; i < sizeof(std::size_t) && i < b.size(); ++i) {
      h = (h << 8U) | b[i];
    }
    return h;
  }
};

/**
 * Incremental digest over an OpenSSL EVP context. Lets callers hash the
 * "<kind> <size>\0" header and the body without concatenating them.
 */
class Hasher {
public:
  explicit Hasher(HashAlgo algo);
  ~Hasher();
  Hasher(const Hasher &) = delete;
  Hasher &operator=(const Hasher &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }
  ObjectId finish();

private:
  struct Ctx;
  std::unique_ptr<Ctx> ctx_;
  HashAlgo algo_;
};

// One-shot digest of arbitrary bytes.
ObjectId hash_bytes(HashAlgo algo, std::span<const std::uint8_t> data);

inline ObjectId sha1(std::string_view s) {
  return hash_bytes(HashAlgo::Sha1,
                    std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                                  s.size()));
}

/** Lowercase hex of arbitrary bytes. */
std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * Parse hex into `out` (which must already have hex.size()/2 bytes).
 * Returns false on odd length or non-hex characters.
 */
bool from_hex(std::string_view hex, std::span<std::uint8_t> out);

} // namespace gitstore

template <> struct std::hash<gitstore::ObjectId> : gitstore::ObjectIdHash {};
