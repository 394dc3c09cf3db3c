#include "ScopedTempDir.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace certgen {

ScopedTempDir::ScopedTempDir(const std::string& prefix) {
  namespace fs = std::filesystem;
  const std::string pattern = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
  }
  path_ = buf.data();
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) spdlog::warn("could not remove {}: {}", path_.string(), ec.message());
}

} // namespace certgen
