// Repository: MediaForge
// Component: POSIX file helpers
// Purpose: mkdir -p, recursive removal, atomic writes and streaming copies
//          used by the local object store, publisher and encoder scratch.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_UTIL_FILE_UTIL_HPP_
#define MEDIAFORGE_UTIL_FILE_UTIL_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mediaforge::util {

// mkdir -p. Throws std::runtime_error if any component cannot be created.
void MakeDirs(const std::string& path);

// Parent directory of `path` ("" if none).
std::string ParentDir(const std::string& path);

// rm -rf. Missing paths are not an error; other failures throw.
void RemoveTree(const std::string& path);

bool PathExists(const std::string& path);

// Size in bytes, or -1 if the file does not exist.
int64_t FileSize(const std::string& path);

// Writes `bytes` to `path` via a sibling temp file + rename. Throws on error.
void WriteFileAtomic(const std::string& path, const std::string& bytes);

// Streams `path` in blocks of `block_size`. Throws if the file cannot be read.
void ReadFileBlocks(const std::string& path,
                    const std::function<void(const char*, std::size_t)>& sink,
                    std::size_t block_size = 1 << 20);

// Copies src to dst (parents created), via temp file + rename. Throws on error.
void CopyFile(const std::string& src, const std::string& dst);

// Joins with exactly one '/' between parts.
std::string JoinPath(const std::string& a, const std::string& b);

}  // namespace mediaforge::util

#endif  // MEDIAFORGE_UTIL_FILE_UTIL_HPP_
