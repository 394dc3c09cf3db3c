#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace certgen {

using Bytes = std::vector<unsigned char>;

inline constexpr const char* kDocxContentType =
  "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
inline constexpr const char* kPdfContentType = "application/pdf";
inline constexpr const char* kPngContentType = "image/png";

// Raw object as read from the store; never mutated after fetch.
struct AssetBlob {
  Bytes       data;
  std::string content_type;
};

// PNG-encoded raster together with its pixel dimensions.
struct ImageBytes {
  Bytes png;
  int   width  = 0;
  int   height = 0;
};

enum class OutputFormat { Docx, Pdf };

struct GenerationRequest {
  std::string templateKey;
  std::string signatureKey;
  std::string outputKey;  // advisory; the derived key wins
  std::map<std::string, std::string> fields;
  std::optional<OutputFormat> outputFormat;

  // Missing fields read as empty string.
  std::string field(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? std::string() : it->second;
  }
};

struct OutputArtifact {
  std::string key;
  Bytes       data;
  std::string content_type;
};

} // namespace certgen
