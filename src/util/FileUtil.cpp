// Repository: MediaForge
// Component: POSIX file helpers implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/util/FileUtil.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mediaforge::util {

namespace {

std::string ErrnoText() {
  return std::strerror(errno);
}

}  // namespace

void MakeDirs(const std::string& path) {
  if (path.empty()) return;
  std::string partial;
  partial.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    partial += path[i];
    const bool at_sep = (path[i] == '/' && i != 0);
    const bool at_end = (i + 1 == path.size());
    if (!at_sep && !at_end) continue;
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      throw std::runtime_error("cannot create directory " + partial + ": " + ErrnoText());
    }
  }
}

std::string ParentDir(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) return "";
  if (slash == 0) return "/";
  return path.substr(0, slash);
}

void RemoveTree(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) return;
    throw std::runtime_error("cannot stat " + path + ": " + ErrnoText());
  }
  if (S_ISDIR(st.st_mode)) {
    DIR* dir = opendir(path.c_str());
    if (dir == nullptr) {
      if (errno == ENOENT) return;
      throw std::runtime_error("cannot open directory " + path + ": " + ErrnoText());
    }
    std::vector<std::string> children;
    while (struct dirent* entry = readdir(dir)) {
      const std::string name = entry->d_name;
      if (name == "." || name == "..") continue;
      children.push_back(JoinPath(path, name));
    }
    closedir(dir);
    for (const auto& child : children) RemoveTree(child);
    if (rmdir(path.c_str()) != 0 && errno != ENOENT) {
      throw std::runtime_error("cannot remove directory " + path + ": " + ErrnoText());
    }
    return;
  }
  if (unlink(path.c_str()) != 0 && errno != ENOENT) {
    throw std::runtime_error("cannot remove " + path + ": " + ErrnoText());
  }
}

bool PathExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

int64_t FileSize(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return -1;
  return static_cast<int64_t>(st.st_size);
}

void WriteFileAtomic(const std::string& path, const std::string& bytes) {
  const std::string tmp = path + ".tmp." + std::to_string(getpid()) + "." +
                          std::to_string(reinterpret_cast<uintptr_t>(&bytes));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp + " for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      out.close();
      unlink(tmp.c_str());
      throw std::runtime_error("write failed: " + tmp);
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    const std::string err = ErrnoText();
    unlink(tmp.c_str());
    throw std::runtime_error("cannot rename " + tmp + " -> " + path + ": " + err);
  }
}

void ReadFileBlocks(const std::string& path,
                    const std::function<void(const char*, std::size_t)>& sink,
                    std::size_t block_size) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path + " for reading");
  }
  std::vector<char> buffer(block_size);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = in.gcount();
    if (got > 0) sink(buffer.data(), static_cast<std::size_t>(got));
  }
  if (in.bad()) {
    throw std::runtime_error("read failed: " + path);
  }
}

void CopyFile(const std::string& src, const std::string& dst) {
  MakeDirs(ParentDir(dst));
  const std::string tmp = dst + ".tmp." + std::to_string(getpid());
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp + " for writing");
    }
    ReadFileBlocks(src, [&out](const char* data, std::size_t len) {
      out.write(data, static_cast<std::streamsize>(len));
    });
    out.flush();
    if (!out) {
      out.close();
      unlink(tmp.c_str());
      throw std::runtime_error("write failed: " + tmp);
    }
  }
  if (std::rename(tmp.c_str(), dst.c_str()) != 0) {
    const std::string err = ErrnoText();
    unlink(tmp.c_str());
    throw std::runtime_error("cannot rename " + tmp + " -> " + dst + ": " + err);
  }
}

std::string JoinPath(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  const bool a_slash = a.back() == '/';
  const bool b_slash = b.front() == '/';
  if (a_slash && b_slash) return a + b.substr(1);
  if (a_slash || b_slash) return a + b;
  return a + "/" + b;
}

}  // namespace mediaforge::util
