#include "LocalFSBackend.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <fstream>
#include <functional>
#include <iterator>
#include <system_error>
#include <thread>

namespace certgen {

static std::string content_type_for(const std::filesystem::path& p) {
  const std::string ext = p.extension().string();
  if (ext == ".docx") return kDocxContentType;
  if (ext == ".pdf")  return kPdfContentType;
  if (ext == ".png")  return kPngContentType;
  if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
  return "application/octet-stream";
}

std::filesystem::path LocalFSBackend::resolve(const std::string& key) const {
  namespace fs = std::filesystem;
  fs::path rel(key);
  if (key.empty() || rel.is_absolute()) return {};
  for (const auto& part : rel) {
    if (part == "..") return {};
  }
  return fs::path(root_) / rel;
}

Result<AssetBlob> LocalFSBackend::get(const std::string& key) {
  namespace fs = std::filesystem;
  const fs::path file = resolve(key);
  if (file.empty()) {
    return Result<AssetBlob>::fail(ErrorCode::AssetNotFound, "invalid object key: " + key);
  }

  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return Result<AssetBlob>::fail(ErrorCode::AssetNotFound, "no such object: " + key);
  }

  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return Result<AssetBlob>::fail(ErrorCode::AssetStoreUnavailable, "cannot open " + file.string());
  }
  AssetBlob blob;
  blob.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return Result<AssetBlob>::fail(ErrorCode::AssetStoreUnavailable, "read failed: " + file.string());
  }
  blob.content_type = content_type_for(file);
  return blob;
}

Status LocalFSBackend::put(const std::string& key,
                           const Bytes& data,
                           const std::string& contentType) {
  namespace fs = std::filesystem;
  static std::atomic<unsigned long> seq{0};

  const fs::path file = resolve(key);
  if (file.empty()) {
    return Status::fail(ErrorCode::AssetStoreUnavailable, "invalid object key: " + key);
  }

  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  if (ec) {
    return Status::fail(ErrorCode::AssetStoreUnavailable,
                        "cannot create " + file.parent_path().string() + ": " + ec.message());
  }

  const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  fs::path tmp = file;
  tmp += ".tmp-" + std::to_string(tid) + "-" + std::to_string(seq++);
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    os.flush();
    if (!os) {
      fs::remove(tmp, ec);
      return Status::fail(ErrorCode::AssetStoreUnavailable, "write failed: " + file.string());
    }
  }
  fs::rename(tmp, file, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return Status::fail(ErrorCode::AssetStoreUnavailable,
                        "rename failed for " + file.string() + ": " + ec.message());
  }

  spdlog::debug("local put {} ({} bytes, {})", key, data.size(), contentType);
  return {};
}

} // namespace certgen
