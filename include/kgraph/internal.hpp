#pragma once
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include <kgraph/status.hpp>

namespace kgraph::internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock timestamp for created_at/updated_at/recorded_at (microseconds
// since epoch).
inline uint64_t WallClockMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

// SHA-256 wrapper using OpenSSL's EVP API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  static std::array<uint8_t, kDigestBytes> Digest(std::string_view data) {
    std::array<uint8_t, kDigestBytes> out{};
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx) {
      if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
          EVP_DigestUpdate(ctx, data.data(), data.size()) &&
          EVP_DigestFinal_ex(ctx, out.data(), &len)) {
        // Success
      }
      EVP_MD_CTX_free(ctx);
    }

    return out;
  }

  // Lowercase hex digest, as stored in node records.
  static std::string Hex(std::string_view data) {
    static constexpr char kHex[] = "0123456789abcdef";
    auto digest = Digest(data);
    std::string out;
    out.reserve(kDigestBytes * 2);
    for (uint8_t b : digest) {
      out.push_back(kHex[(b >> 4) & 0x0f]);
      out.push_back(kHex[b & 0x0f]);
    }
    return out;
  }
};

// ---------------------------------------------------------------------------
// Sequence key helpers
// ---------------------------------------------------------------------------

// Big-endian so that iteration order matches numeric order.
inline std::string EncodeU64BE(uint64_t v) {
  std::string key;
  key.reserve(8);
  for (int i = 7; i >= 0; --i) {
    key.push_back(static_cast<char>((v >> (i * 8)) & 0xff));
  }
  return key;
}

inline bool DecodeU64BE(std::string_view s, uint64_t* out) {
  if (s.size() != 8 || !out) return false;
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

// ---------------------------------------------------------------------------
// Edge key helpers
// ---------------------------------------------------------------------------
//
// kgraph_edges_out: [src]\0[dst]\0[edge_type] -> edge record
// kgraph_edges_in:  [dst]\0[src]\0[edge_type] -> empty
//
// Slugs and type tags never contain control characters, so NUL is a safe
// separator and a "[slug]\0" prefix scan returns exactly one node's edges.

constexpr char kKeySep = '\0';

inline std::string MakeEdgeKey(std::string_view first, std::string_view second,
                               std::string_view edge_type) {
  std::string key;
  key.reserve(first.size() + second.size() + edge_type.size() + 2);
  key.append(first);
  key.push_back(kKeySep);
  key.append(second);
  key.push_back(kKeySep);
  key.append(edge_type);
  return key;
}

inline std::string EdgeKeyPrefix(std::string_view slug) {
  std::string prefix(slug);
  prefix.push_back(kKeySep);
  return prefix;
}

inline bool ParseEdgeKey(std::string_view key, std::string* first,
                         std::string* second, std::string* edge_type) {
  size_t a = key.find(kKeySep);
  if (a == std::string_view::npos) return false;
  size_t b = key.find(kKeySep, a + 1);
  if (b == std::string_view::npos) return false;
  *first = std::string(key.substr(0, a));
  *second = std::string(key.substr(a + 1, b - a - 1));
  *edge_type = std::string(key.substr(b + 1));
  return true;
}

// ---------------------------------------------------------------------------
// Identifier validation
// ---------------------------------------------------------------------------

constexpr size_t kMaxSlugBytes = 256;

// Length of the well-formed UTF-8 sequence starting at text[i], or 0. No
// overlong forms, surrogates, or code points past U+10FFFF.
inline size_t Utf8SequenceLength(std::string_view text, size_t i) {
  unsigned char c = static_cast<unsigned char>(text[i]);
  if (c < 0x80) return 1;
  size_t len;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (c >= 0xC2 && c <= 0xDF) {
    len = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    len = 3;
    if (c == 0xE0) lo = 0xA0;
    if (c == 0xED) hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    len = 4;
    if (c == 0xF0) lo = 0x90;
    if (c == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }
  if (text.size() - i < len) return 0;
  unsigned char c1 = static_cast<unsigned char>(text[i + 1]);
  if (c1 < lo || c1 > hi) return 0;
  for (size_t k = 2; k < len; ++k) {
    if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) return 0;
  }
  return len;
}

// jsoncpp rewrites strings that fail this on write.
inline bool IsValidUtf8(std::string_view text) {
  for (size_t i = 0; i < text.size();) {
    size_t len = Utf8SequenceLength(text, i);
    if (len == 0) return false;
    i += len;
  }
  return true;
}

// Copy of `text` with every byte outside a well-formed sequence written as
// \xNN, for log targets built from rejected input.
inline std::string EscapeInvalidUtf8(std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size();) {
    size_t len = Utf8SequenceLength(text, i);
    if (len == 0) {
      unsigned char c = static_cast<unsigned char>(text[i]);
      out += "\\x";
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
      ++i;
    } else {
      out.append(text.data() + i, len);
      i += len;
    }
  }
  return out;
}

// 1-256 bytes of UTF-8, no whitespace or control characters.
inline Status ValidateSlug(std::string_view slug) {
  if (slug.empty()) return Status::Validation("slug is empty");
  if (slug.size() > kMaxSlugBytes) {
    return Status::Validation("slug exceeds " + std::to_string(kMaxSlugBytes) + " bytes");
  }
  for (char c : slug) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u <= 0x20 || u == 0x7f) {
      return Status::Validation("slug contains whitespace or control characters: " +
                                std::string(slug));
    }
  }
  if (!IsValidUtf8(slug)) return Status::Validation("slug is not valid UTF-8");
  return Status::OK();
}

inline Status ValidateText(std::string_view field, std::string_view text) {
  if (!IsValidUtf8(text)) {
    return Status::Validation(std::string(field) + " is not valid UTF-8");
  }
  return Status::OK();
}

// [a-z][a-z0-9_]*
inline bool IsValidTypeTag(std::string_view tag) {
  if (tag.empty() || tag.size() > 64) return false;
  if (tag[0] < 'a' || tag[0] > 'z') return false;
  for (char c : tag) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Embedding utilities
// ---------------------------------------------------------------------------

// Serialize embedding vector to bytes (host-order floats)
inline std::string SerializeEmbedding(const std::vector<float>& embedding) {
  std::string out;
  out.resize(embedding.size() * sizeof(float));
  std::memcpy(out.data(), embedding.data(), out.size());
  return out;
}

// Deserialize bytes to embedding vector
inline bool DeserializeEmbedding(std::string_view bytes, std::vector<float>* out) {
  if (bytes.size() % sizeof(float) != 0) return false;
  size_t count = bytes.size() / sizeof(float);
  out->resize(count);
  std::memcpy(out->data(), bytes.data(), bytes.size());
  return true;
}

inline float L2Norm(const std::vector<float>& v) {
  double sum = 0.0;
  for (float x : v) sum += static_cast<double>(x) * static_cast<double>(x);
  return static_cast<float>(std::sqrt(sum));
}

// Copy of v scaled to unit length; v unchanged when its norm is ~0.
inline std::vector<float> Normalized(const std::vector<float>& v) {
  std::vector<float> out(v);
  float norm = L2Norm(v);
  if (norm > 1e-12f) {
    for (float& x : out) x /= norm;
  }
  return out;
}

inline float Dot(const std::vector<float>& a, const std::vector<float>& b) {
  float dot = 0.0f;
  size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) dot += a[i] * b[i];
  return dot;
}

// Compute cosine similarity between two embeddings
// Returns value in [-1.0, 1.0]; 1.0 means identical directions
inline float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0f;

  float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }

  float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom < 1e-12f) return 0.0f;
  return dot / denom;
}

// Checks a caller-supplied vector: exact dimension, finite, non-zero.
inline Status ValidateEmbedding(const std::vector<float>& v, size_t dimension) {
  if (v.size() != dimension) {
    return Status::DimensionMismatch("expected " + std::to_string(dimension) +
                                     " dimensions, got " + std::to_string(v.size()));
  }
  for (float x : v) {
    if (!std::isfinite(x)) return Status::Validation("embedding has non-finite components");
  }
  if (L2Norm(v) < 1e-12f) return Status::Validation("embedding is a zero vector");
  return Status::OK();
}

}  // namespace kgraph::internal
