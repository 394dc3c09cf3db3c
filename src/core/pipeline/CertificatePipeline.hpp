#pragma once
#include <string>

#include "core/common/Result.hpp"
#include "core/common/Types.hpp"
#include "core/convert/FormatConverter.hpp"
#include "core/image/ImageNormalizer.hpp"
#include "core/naming/FilenameDeriver.hpp"
#include "core/render/QrEncoder.hpp"
#include "core/render/TemplateRenderer.hpp"
#include "core/storage/AssetFetcher.hpp"
#include "core/storage/ObjectStore.hpp"

namespace certgen {

struct PipelineSettings {
  std::string verifyBaseUrl;       // empty: QR carries the bare certificate number
  int         signatureMaxWidth  = kSignatureMaxWidth;
  int         signatureMaxHeight = kSignatureMaxHeight;
  double      imageWidthMm       = 30.0;
  bool        convertToPdf       = false;  // when the request does not say
};

// Fetch -> QR + signature -> render -> name -> [convert] -> publish.
// Stateless between calls; safe to share across request threads as long as
// the ObjectStore is.
class CertificatePipeline {
public:
  CertificatePipeline(ObjectStore& store, PipelineSettings settings, FormatConverter converter);

  // Published key on success.
  Result<std::string> run(const GenerationRequest& request) const;

  // Request-level checks done before any store access.
  static Status validate(const GenerationRequest& request);

  const PipelineSettings& settings() const { return settings_; }

private:
  Result<RenderContext> buildContext(const GenerationRequest& request) const;

  AssetFetcher      fetcher_;
  ArtifactPublisher publisher_;
  QrEncoder         qr_;
  ImageNormalizer   images_;
  TemplateRenderer  renderer_;
  FilenameDeriver   names_;
  FormatConverter   converter_;
  PipelineSettings  settings_;
};

} // namespace certgen
