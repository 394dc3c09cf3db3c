#include "CertificatePipeline.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <utility>

#include "core/render/DateFormat.hpp"

namespace certgen {

static const char* const kTextFields[] = {
  "first_name", "middle_name", "last_name", "certificate_number", "instructor_name"
};
static const char* const kDateFields[] = {"training_date", "issue_date"};

static bool blank(const std::string& s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

CertificatePipeline::CertificatePipeline(ObjectStore& store,
                                         PipelineSettings settings,
                                         FormatConverter converter)
  : fetcher_(store),
    publisher_(store),
    converter_(std::move(converter)),
    settings_(std::move(settings)) {}

Status CertificatePipeline::validate(const GenerationRequest& request) {
  if (blank(request.field("certificate_number"))) {
    return Status::fail(ErrorCode::Validation, "certificate_number missing");
  }
  if (blank(request.field("first_name")) || blank(request.field("last_name"))) {
    return Status::fail(ErrorCode::Validation,
                        "certificate_number, first_name and last_name are required");
  }
  if (request.templateKey.empty()) {
    return Status::fail(ErrorCode::Validation, "templateKey missing");
  }
  if (request.signatureKey.empty()) {
    return Status::fail(ErrorCode::Validation, "signatureKey missing");
  }
  return {};
}

Result<RenderContext> CertificatePipeline::buildContext(const GenerationRequest& request) const {
  const std::string certNo = request.field("certificate_number");

  auto qr = qr_.encode(verification_payload(settings_.verifyBaseUrl, certNo));
  if (!qr) return qr.error();

  auto signatureRaw = fetcher_.fetch(request.signatureKey);
  if (!signatureRaw) return signatureRaw.error();

  auto signature = images_.normalize(signatureRaw.value().data,
                                     settings_.signatureMaxWidth,
                                     settings_.signatureMaxHeight);
  if (!signature) return signature.error();

  RenderContext ctx;
  for (const char* name : kTextFields) ctx[name] = request.field(name);
  for (const char* name : kDateFields) ctx[name] = format_mmddyyyy(request.field(name));
  ctx["qr_code"] = InlineImage{std::move(qr).value().png, settings_.imageWidthMm};
  ctx["instructor_signature"] = InlineImage{std::move(signature).value().png, settings_.imageWidthMm};
  return ctx;
}

Result<std::string> CertificatePipeline::run(const GenerationRequest& request) const {
  if (auto st = validate(request); !st) return st.error();

  const std::string certNo = request.field("certificate_number");
  spdlog::info("generating certificate {} from template {}", certNo, request.templateKey);

  auto templ = fetcher_.fetch(request.templateKey);
  if (!templ) return templ.error();

  auto ctx = buildContext(request);
  if (!ctx) return ctx.error();

  auto docx = renderer_.render(templ.value().data, ctx.value());
  if (!docx) {
    spdlog::warn("render failed for {}: {}", certNo, docx.error().message);
    return docx.error();
  }

  auto key = names_.derive(certNo,
                           request.field("first_name"),
                           request.field("middle_name"),
                           request.field("last_name"));
  if (!key) return key.error();
  if (!request.outputKey.empty() && request.outputKey != key.value()) {
    spdlog::debug("ignoring caller output key {} in favour of {}", request.outputKey, key.value());
  }

  const bool toPdf = request.outputFormat
                       ? *request.outputFormat == OutputFormat::Pdf
                       : settings_.convertToPdf;

  OutputArtifact artifact;
  if (toPdf) {
    auto pdf = converter_.convert(docx.value());
    if (!pdf) {
      spdlog::error("conversion failed for {} [{}]: {}",
                    certNo, to_string(pdf.error().code), pdf.error().message);
      return pdf.error();
    }
    artifact.key = replace_extension(key.value(), converter_.options().targetExtension);
    artifact.data = std::move(pdf).value();
    artifact.content_type = kPdfContentType;
  } else {
    artifact.key = key.value();
    artifact.data = std::move(docx).value();
    artifact.content_type = kDocxContentType;
  }

  if (auto st = publisher_.publish(artifact.key, artifact.data, artifact.content_type); !st) {
    return st.error();
  }
  return artifact.key;
}

} // namespace certgen
