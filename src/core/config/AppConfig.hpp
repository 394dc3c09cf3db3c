#pragma once
#include <string>
#include <vector>

#include "core/pipeline/CertificatePipeline.hpp"
#include "core/storage/S3Backend.hpp"

namespace certgen {

std::string get_env_or(const char* key, const std::string& defval);

// Loads KEY=VALUE lines from `path` into the environment. Variables that are
// already set are left alone. Returns the number of variables applied; a
// missing file is not an error.
int load_env_file(const std::string& path);

// Splits a comma-separated list, trimming blanks and dropping empties.
std::vector<std::string> split_list(const std::string& csv);

// Sets the default spdlog logger's level and console pattern.
void init_logging(const std::string& level);

struct AppConfig {
  std::string host = "0.0.0.0";
  int         port = 8080;

  std::string storageBackend = "s3";   // "s3" | "local"
  std::string localStorageRoot = "data/objects";
  S3Options   s3;

  std::string verifyBaseUrl;
  std::string libreofficePath = "libreoffice";
  int         conversionTimeoutSeconds = 120;
  bool        convertToPdf = false;
  int         signatureMaxWidth  = kSignatureMaxWidth;
  int         signatureMaxHeight = kSignatureMaxHeight;

  std::vector<std::string> corsOrigins;
  std::string internalApiKey;  // empty = auth disabled
  std::string logLevel = "info";

  static AppConfig fromEnvironment();

  // Throws std::runtime_error when the selected backend lacks settings.
  void validate() const;

  PipelineSettings pipelineSettings() const;
  ConverterOptions converterOptions() const;

  // One line per setting; secrets are masked.
  void logSummary() const;
};

} // namespace certgen
