#pragma once

#include "util/result.hpp"

#include <string>

namespace vfsup {

class ArchivePathPolicy {
  public:
    // Turns an entry name into a clean relative path ("./a//b" -> "a/b").
    // Absolute paths, backslashes and ".." segments are rejected.
    static Result Normalize(const char* raw_path, std::string& out_relative);

  private:
    static bool IsSafeRelativePath(const std::string& p);
};

// Unpacks a downloaded release asset (tar, optionally compressed).
class ArchiveUnpacker {
  public:
    Result UnpackToDir(const std::string& archive_path, const std::string& dst_dir) const;
};

} // namespace vfsup
