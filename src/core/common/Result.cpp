#include "Result.hpp"

namespace certgen {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation:              return "ValidationError";
    case ErrorCode::Unauthorized:            return "Unauthorized";
    case ErrorCode::AssetNotFound:           return "AssetNotFound";
    case ErrorCode::AssetStoreUnavailable:   return "AssetStoreUnavailable";
    case ErrorCode::EncodingError:           return "EncodingError";
    case ErrorCode::UnsupportedImageFormat:  return "UnsupportedImageFormat";
    case ErrorCode::TemplateRenderError:     return "TemplateRenderError";
    case ErrorCode::InvalidIdentity:         return "InvalidIdentity";
    case ErrorCode::ConversionProcessError:  return "ConversionProcessError";
    case ErrorCode::ConversionOutputMissing: return "ConversionOutputMissing";
    case ErrorCode::PublishError:            return "PublishError";
  }
  return "UnknownError";
}

bool is_client_error(ErrorCode code) {
  return code == ErrorCode::Validation ||
         code == ErrorCode::InvalidIdentity ||
         code == ErrorCode::Unauthorized;
}

} // namespace certgen
