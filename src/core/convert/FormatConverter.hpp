#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "core/common/Result.hpp"
#include "core/common/Types.hpp"

namespace certgen {

struct ConverterOptions {
  std::string          executable = "libreoffice";
  std::chrono::seconds timeout{120};
  std::string          targetExtension = "pdf";
};

// Transcodes a rendered .docx through headless LibreOffice. Every call runs
// in its own temporary directory with its own user profile, so concurrent
// conversions never share lock files.
class FormatConverter {
public:
  explicit FormatConverter(ConverterOptions opts) : opts_(std::move(opts)) {}

  // ConversionProcessError: launch failure, non-zero exit, timeout.
  // ConversionOutputMissing: clean exit without an output file.
  Result<Bytes> convert(const Bytes& document) const;

  std::vector<std::string> commandLine(const std::filesystem::path& workDir,
                                       const std::filesystem::path& input) const;

  const ConverterOptions& options() const { return opts_; }

private:
  ConverterOptions opts_;
};

} // namespace certgen
