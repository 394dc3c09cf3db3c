#pragma once
#include <filesystem>
#include <string>

namespace certgen {

// Private directory created with mkdtemp and removed, with everything in
// it, when the owner goes out of scope on any path.
class ScopedTempDir {
public:
  // Throws std::system_error if the directory cannot be created.
  explicit ScopedTempDir(const std::string& prefix = "certgen-");
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace certgen
