#pragma once

#include <filesystem>
#include <string_view>

namespace serve::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "serve-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Writes (or overwrites) a file at 'relPath' inside the directory, creating intermediate directories.
  // Returns its absolute path. Throws std::runtime_error on failure.
  std::filesystem::path writeFile(std::string_view relPath, std::string_view content) const;

  // Creates a sub directory (and its parents). Returns its absolute path.
  std::filesystem::path createDir(std::string_view relPath) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

}  // namespace serve::test
