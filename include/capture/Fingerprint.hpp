#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "capture/Models.hpp"

namespace capture {

// Characters of leading content that identify a message.
constexpr size_t kFingerprintPrefix = 100;

// hash = hash * 31 + byte, wrapped to 32-bit signed
int32_t rolling_hash_value(const std::string& s);

// rolling_hash_value rendered as signed lower-case hex ("-1f", "61", "0")
std::string rolling_hash(const std::string& s);

// Approximate identity of a message: lower-cased, trimmed first 100 characters.
// Collisions are possible and accepted.
std::string fingerprint(const std::string& content);

// Whole-snapshot digest over raw fragment texts joined by "|||".
std::string snapshot_digest(const std::vector<Fragment>& fragments);

}  // namespace capture
