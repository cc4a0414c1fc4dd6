#pragma once

#include <map>
#include <string>

namespace notepress {

// Reduces |seed| to [a-z0-9-]: NFKD decomposition, non-ASCII code points
// dropped, lower-cased, other characters turned into single hyphens, hyphens
// trimmed. May return an empty string.
std::string NormalizeSlug(const std::string& seed);

// First non-empty of: normalized |primary_seed|, normalized |fallback_seed|,
// "note-" + leading hex of |fallback_seed|'s bytes, "note-NNN" from
// |sequence|. Never empty.
std::string Slugify(const std::string& primary_seed, const std::string& fallback_seed,
                    int sequence);

// Hands out slugs that are unique within one build run.
class SlugRegistry {
 public:
  // Returns |slug| when it is free or already owned by |source|. A slug owned
  // by another source gets "-" and the XXH32 digest of |source| appended, and
  // then a numeric suffix if that is taken too.
  std::string Claim(const std::string& slug, const std::string& source);

  bool Contains(const std::string& slug) const;
  std::size_t size() const { return owners_.size(); }

 private:
  std::map<std::string, std::string> owners_;
};

std::string SourceDigest(const std::string& source);

}  // namespace notepress
