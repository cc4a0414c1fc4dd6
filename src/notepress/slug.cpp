#include "notepress/slug.hpp"

#include <cstdio>
#include <vector>

#include <unicode/unorm2.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>

#include "notepress/logging.hpp"
#include "xxhash.h"

namespace notepress {
namespace {

using logging::LogDebug;

constexpr UChar32 kReplacementCharacter = 0xFFFD;

// Converts |seed| to UTF-16, decomposes it with NFKD and keeps the ASCII
// code units. Malformed UTF-8 becomes U+FFFD and is dropped with the rest.
std::string DecomposeToAscii(const std::string& seed) {
  if (seed.empty()) {
    return {};
  }
  UErrorCode status = U_ZERO_ERROR;
  int32_t utf16_length = 0;
  u_strFromUTF8WithSub(nullptr, 0, &utf16_length, seed.data(),
                       static_cast<int32_t>(seed.size()), kReplacementCharacter, nullptr,
                       &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    LogDebug(std::string{"Slug seed is not convertible: "} + u_errorName(status));
    return {};
  }
  status = U_ZERO_ERROR;
  std::vector<UChar> utf16(static_cast<std::size_t>(utf16_length) + 1);
  u_strFromUTF8WithSub(utf16.data(), static_cast<int32_t>(utf16.size()), &utf16_length,
                       seed.data(), static_cast<int32_t>(seed.size()), kReplacementCharacter,
                       nullptr, &status);
  if (U_FAILURE(status)) {
    LogDebug(std::string{"Slug seed conversion failed: "} + u_errorName(status));
    return {};
  }

  const UNormalizer2* nfkd = unorm2_getNFKDInstance(&status);
  if (U_FAILURE(status)) {
    LogDebug(std::string{"NFKD normalizer unavailable: "} + u_errorName(status));
    return {};
  }

  std::vector<UChar> decomposed(static_cast<std::size_t>(utf16_length) * 2 + 16);
  int32_t decomposed_length =
      unorm2_normalize(nfkd, utf16.data(), utf16_length, decomposed.data(),
                       static_cast<int32_t>(decomposed.size()), &status);
  if (status == U_BUFFER_OVERFLOW_ERROR) {
    status = U_ZERO_ERROR;
    decomposed.resize(static_cast<std::size_t>(decomposed_length) + 1);
    decomposed_length = unorm2_normalize(nfkd, utf16.data(), utf16_length, decomposed.data(),
                                         static_cast<int32_t>(decomposed.size()), &status);
  }
  if (U_FAILURE(status)) {
    LogDebug(std::string{"NFKD normalization failed: "} + u_errorName(status));
    return {};
  }

  std::string ascii;
  ascii.reserve(static_cast<std::size_t>(decomposed_length));
  for (int32_t i = 0; i < decomposed_length; ++i) {
    const UChar unit = decomposed[static_cast<std::size_t>(i)];
    if (unit < 0x80) {
      ascii.push_back(static_cast<char>(unit));
    }
  }
  return ascii;
}

bool IsSlugChar(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-';
}

std::string HexPrefix(const std::string& bytes, std::size_t hex_digits) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  for (const unsigned char byte : bytes) {
    if (hex.size() >= hex_digits) {
      break;
    }
    hex.push_back(kHex[(byte >> 4) & 0x0F]);
    hex.push_back(kHex[byte & 0x0F]);
  }
  if (hex.size() > hex_digits) {
    hex.resize(hex_digits);
  }
  return hex;
}

}  // namespace

std::string NormalizeSlug(const std::string& seed) {
  std::string slug;
  for (const char raw : DecomposeToAscii(seed)) {
    char ch = raw;
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
    if (!IsSlugChar(ch)) {
      ch = '-';
    }
    if (ch == '-' && (slug.empty() || slug.back() == '-')) {
      continue;
    }
    slug.push_back(ch);
  }
  while (!slug.empty() && slug.back() == '-') {
    slug.pop_back();
  }
  return slug;
}

std::string Slugify(const std::string& primary_seed, const std::string& fallback_seed,
                    int sequence) {
  if (auto primary = NormalizeSlug(primary_seed); !primary.empty()) {
    return primary;
  }
  if (auto fallback = NormalizeSlug(fallback_seed); !fallback.empty()) {
    LogDebug("Slug for '" + primary_seed + "' taken from fallback seed '" + fallback_seed + "'");
    return fallback;
  }
  if (const auto hex = HexPrefix(fallback_seed, 8); !hex.empty()) {
    LogDebug("Slug for '" + fallback_seed + "' taken from its byte encoding");
    return "note-" + hex;
  }
  const auto magnitude = static_cast<unsigned long long>(
      sequence < 0 ? -static_cast<long long>(sequence) : static_cast<long long>(sequence));
  char numbered[32];
  std::snprintf(numbered, sizeof(numbered), "note-%03llu", magnitude);
  LogDebug(std::string{"Slug falls back to sequence number: "} + numbered);
  return numbered;
}

std::string SourceDigest(const std::string& source) {
  const XXH32_hash_t hash = XXH32(source.data(), source.size(), 0);
  char digest[9];
  std::snprintf(digest, sizeof(digest), "%08x", static_cast<unsigned int>(hash));
  return digest;
}

std::string SlugRegistry::Claim(const std::string& slug, const std::string& source) {
  const auto it = owners_.find(slug);
  if (it == owners_.end()) {
    owners_.emplace(slug, source);
    return slug;
  }
  if (it->second == source) {
    return slug;
  }

  const std::string digested = slug + "-" + SourceDigest(source);
  std::string candidate = digested;
  int suffix = 2;
  for (auto found = owners_.find(candidate); found != owners_.end() && found->second != source;
       found = owners_.find(candidate)) {
    candidate = digested + "-" + std::to_string(suffix++);
  }
  owners_.emplace(candidate, source);
  logging::LogWarn("Slug '" + slug + "' already used by '" + it->second + "', '" + source +
                   "' published as '" + candidate + "'");
  return candidate;
}

bool SlugRegistry::Contains(const std::string& slug) const { return owners_.count(slug) != 0; }

}  // namespace notepress
