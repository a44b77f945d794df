// Repository: MediaForge
// Component: Identifier and timestamp helpers
// Purpose: Opaque token generation (upload ids, asset ids, job ids) and
//          UTC formatting shared by every pipeline component.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_UTIL_IDS_HPP_
#define MEDIAFORGE_UTIL_IDS_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace mediaforge::util {

// Random RFC 4122 version-4 UUID, lowercase hex.
std::string GenerateUuidV4();

// "<prefix>_<uuid-without-dashes>". Used as the opaque key for every entity.
std::string GenerateId(const std::string& prefix);

// Uppercase hex of `num_bytes` random bytes (2 * num_bytes characters).
std::string RandomHexUpper(std::size_t num_bytes);

// Current epoch milliseconds (UTC).
int64_t NowUtcMs();

// "YYYY-MM-DDTHH:MM:SS.mmmZ" for the given epoch milliseconds; empty on error.
std::string FormatUtcIso8601(int64_t utc_ms);

}  // namespace mediaforge::util

#endif  // MEDIAFORGE_UTIL_IDS_HPP_
