#include "gitstore/hash.hpp"

#include "gitstore/errors.hpp"

#include <algorithm>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>
#include <string>

namespace gitstore {

std::string_view algo_name(HashAlgo algo) {
  return algo == HashAlgo::Sha1 ? "sha1" : "sha256";
}

std::optional<HashAlgo> parse_algo(std::string_view name) {
  if (name == "sha1") {
    return HashAlgo::Sha1;
  }
  if (name == "sha256") {
    return HashAlgo::Sha256;
  }
  return std::nullopt;
}

// ObjectId

ObjectId::ObjectId(HashAlgo algo, std::span<const std::uint8_t> raw) : algo_(algo) {
  if (raw.size() != raw_size(algo)) {
    throw std::invalid_argument("object id: expected " + std::to_string(raw_size(algo)) +
                                " bytes, got " + std::to_string(raw.size()));
  }
  std::ranges::copy(raw, raw_.begin());
}

std::optional<ObjectId> ObjectId::from_hex(std::string_view hex) {
  HashAlgo algo{};
  if (hex.size() == hex_size(HashAlgo::Sha1)) {
    algo = HashAlgo::Sha1;
  } else if (hex.size() == hex_size(HashAlgo::Sha256)) {
    algo = HashAlgo::Sha256;
  } else {
    return std::nullopt;
  }
  std::array<std::uint8_t, consts::kMaxRawLen> raw{};
  if (!gitstore::from_hex(hex, std::span(raw.data(), raw_size(algo)))) {
    return std::nullopt;
  }
  return ObjectId(algo, std::span<const std::uint8_t>(raw.data(), raw_size(algo)));
}

ObjectId ObjectId::parse(std::string_view hex, HashAlgo algo) {
  auto id = from_hex(hex);
  if (!id || id->algo() != algo) {
    throw DecodeError("id", "not a " + std::string(algo_name(algo)) + " hex id: '" +
                                std::string(hex) + "'");
  }
  return *id;
}

std::string ObjectId::hex() const { return to_hex(bytes()); }

// Hasher

struct Hasher::Ctx {
  EVP_MD_CTX *md = nullptr;
  ~Ctx() { EVP_MD_CTX_free(md); }
};

Hasher::Hasher(HashAlgo algo) : ctx_(std::make_unique<Ctx>()), algo_(algo) {
  ctx_->md = EVP_MD_CTX_new();
  if (!ctx_->md) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  const EVP_MD *md = algo == HashAlgo::Sha1 ? EVP_sha1() : EVP_sha256();
  if (EVP_DigestInit_ex(ctx_->md, md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Hasher::~Hasher() = default;

void Hasher::update(std::span<const std::uint8_t> data) {
  if (!data.empty() && EVP_DigestUpdate(ctx_->md, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

ObjectId Hasher::finish() {
  std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_->md, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != raw_size(algo_)) {
    throw std::runtime_error("digest produced unexpected length");
  }
  return ObjectId(algo_, std::span<const std::uint8_t>(out.data(), len));
}

ObjectId hash_bytes(HashAlgo algo, std::span<const std::uint8_t> data) {
  Hasher h{algo};
  h.update(data);
  return h.finish();
}

// Hex

std::string to_hex(std::span<const std::uint8_t> bytes) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const unsigned b = bytes[i];
    s[(2 * i) + 0] = kHex[(b >> 4U) & 0xFU];
    s[(2 * i) + 1] = kHex[b & 0xFU];
  }
  return s;
}

bool from_hex(std::string_view hex, std::span<std::uint8_t> out) {
  if (hex.size() != out.size() * 2) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace gitstore
