#include "AppConfig.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace certgen {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static int env_int_or(const char* key, int defval, int minVal, int maxVal) {
  const char* val = std::getenv(key);
  if (!val || !*val) return defval;
  try {
    std::size_t used = 0;
    const int v = std::stoi(val, &used);
    if (used != std::string(val).size()) throw std::invalid_argument(val);
    return std::clamp(v, minVal, maxVal);
  } catch (const std::exception&) {
    spdlog::warn("Invalid integer for {} '{}', using default {}", key, val, defval);
    return defval;
  }
}

static bool env_bool_or(const char* key, bool defval) {
  std::string v = get_env_or(key, "");
  if (v.empty()) return defval;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  spdlog::warn("Invalid boolean for {} '{}', using default {}", key, v, defval);
  return defval;
}

int load_env_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) return 0;

  int applied = 0;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key.empty()) continue;

    if (value.size() >= 2 &&
        (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    } else if (const auto hash = value.find(" #"); hash != std::string::npos) {
      value = trim(value.substr(0, hash));
    }

    if (std::getenv(key.c_str())) continue;
    if (::setenv(key.c_str(), value.c_str(), 0) == 0) ++applied;
  }
  return applied;
}

std::vector<std::string> split_list(const std::string& csv) {
  std::vector<std::string> out;
  std::stringstream ss(csv);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

void init_logging(const std::string& level) {
  spdlog::level::level_enum lvl = spdlog::level::from_str(level);
  // from_str maps anything unknown to "off"
  if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
  spdlog::set_level(lvl);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  spdlog::flush_on(spdlog::level::warn);
}

AppConfig AppConfig::fromEnvironment() {
  AppConfig c;

  c.host = get_env_or("HOST", c.host);
  c.port = env_int_or("PORT", c.port, 1, 65535);

  c.storageBackend   = get_env_or("STORAGE_BACKEND", c.storageBackend);
  c.localStorageRoot = get_env_or("LOCAL_STORAGE_ROOT", c.localStorageRoot);

  const std::string account = get_env_or("R2_ACCOUNT_ID", "");
  c.s3.endpoint = get_env_or("S3_ENDPOINT",
                             account.empty() ? std::string()
                                             : "https://" + account + ".r2.cloudflarestorage.com");
  c.s3.region          = get_env_or("S3_REGION", c.s3.region);
  c.s3.accessKeyId     = get_env_or("R2_ACCESS_KEY_ID", "");
  c.s3.secretAccessKey = get_env_or("R2_SECRET_ACCESS_KEY", "");
  c.s3.bucket          = get_env_or("R2_BUCKET_NAME", "");

  c.verifyBaseUrl   = get_env_or("VERIFY_BASE_URL", "");
  c.libreofficePath = get_env_or("LIBREOFFICE_PATH", c.libreofficePath);
  c.conversionTimeoutSeconds = env_int_or("CONVERSION_TIMEOUT_SECONDS", c.conversionTimeoutSeconds, 1, 3600);
  c.convertToPdf    = env_bool_or("CONVERT_TO_PDF", c.convertToPdf);

  c.signatureMaxWidth  = env_int_or("SIGNATURE_MAX_WIDTH", c.signatureMaxWidth, 1, 10000);
  c.signatureMaxHeight = env_int_or("SIGNATURE_MAX_HEIGHT", c.signatureMaxHeight, 1, 10000);

  c.corsOrigins    = split_list(get_env_or("CORS_ORIGINS", ""));
  c.internalApiKey = get_env_or("INTERNAL_API_KEY", "");
  c.logLevel       = get_env_or("LOG_LEVEL", c.logLevel);
  return c;
}

void AppConfig::validate() const {
  if (storageBackend == "local") {
    if (localStorageRoot.empty()) throw std::runtime_error("LOCAL_STORAGE_ROOT is empty");
    return;
  }
  if (storageBackend != "s3") {
    throw std::runtime_error("STORAGE_BACKEND must be 's3' or 'local', got '" + storageBackend + "'");
  }
  if (s3.endpoint.empty()) throw std::runtime_error("S3_ENDPOINT or R2_ACCOUNT_ID must be set");
  if (s3.bucket.empty()) throw std::runtime_error("R2_BUCKET_NAME not set");
  if (s3.accessKeyId.empty() || s3.secretAccessKey.empty()) {
    throw std::runtime_error("R2_ACCESS_KEY_ID and R2_SECRET_ACCESS_KEY must be set");
  }
}

PipelineSettings AppConfig::pipelineSettings() const {
  PipelineSettings s;
  s.verifyBaseUrl      = verifyBaseUrl;
  s.signatureMaxWidth  = signatureMaxWidth;
  s.signatureMaxHeight = signatureMaxHeight;
  s.convertToPdf       = convertToPdf;
  return s;
}

ConverterOptions AppConfig::converterOptions() const {
  ConverterOptions o;
  o.executable = libreofficePath;
  o.timeout    = std::chrono::seconds(conversionTimeoutSeconds);
  return o;
}

void AppConfig::logSummary() const {
  spdlog::info("listen: {}:{}", host, port);
  if (storageBackend == "local") {
    spdlog::info("storage: local ({})", localStorageRoot);
  } else {
    spdlog::info("storage: s3 {} bucket={} region={}", s3.endpoint, s3.bucket, s3.region);
  }
  spdlog::info("converter: {} (timeout {}s), default format {}",
               libreofficePath, conversionTimeoutSeconds, convertToPdf ? "pdf" : "docx");
  spdlog::info("signature bounds: {}x{}", signatureMaxWidth, signatureMaxHeight);
  spdlog::info("verify base url: {}", verifyBaseUrl.empty() ? "(none)" : verifyBaseUrl);
  spdlog::info("cors origins: {}", corsOrigins.size());
  spdlog::info("internal api key: {}", internalApiKey.empty() ? "disabled" : "set");
}

} // namespace certgen
