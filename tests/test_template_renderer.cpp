#include <gtest/gtest.h>

#include "core/render/DocxArchive.hpp"
#include "core/render/TemplateRenderer.hpp"
#include "test_helpers.hpp"

using namespace certgen;
using namespace test_helpers;

namespace {

std::string rendered_body(const Result<Bytes>& out) {
  EXPECT_TRUE(out.ok()) << (out.ok() ? "" : out.error().message);
  if (!out.ok()) return {};
  return DocxArchive::load(out.value()).read("word/document.xml");
}

} // namespace

TEST(TemplateRenderer, BindsTextPlaceholders) {
  TemplateRenderer r;
  RenderContext ctx{{"first_name", std::string("Jane")}, {"last_name", std::string("Doe")}};
  auto out = r.render(make_docx(paragraph("Awarded to {{ first_name }} {{last_name}}.")), ctx);
  const std::string body = rendered_body(out);
  EXPECT_NE(body.find("Awarded to Jane Doe."), std::string::npos);
  EXPECT_EQ(body.find("{{"), std::string::npos);
}

TEST(TemplateRenderer, EscapesXmlInValues) {
  TemplateRenderer r;
  RenderContext ctx{{"instructor_name", std::string("Smith & <Sons>")}};
  const std::string body = rendered_body(r.render(make_docx(paragraph("{{instructor_name}}")), ctx));
  EXPECT_NE(body.find("Smith &amp; &lt;Sons&gt;"), std::string::npos);
}

TEST(TemplateRenderer, UnboundPlaceholderRendersEmpty) {
  TemplateRenderer r;
  const std::string body = rendered_body(r.render(make_docx(paragraph("[{{ middle_name }}]")), {}));
  EXPECT_NE(body.find("[]"), std::string::npos);
}

TEST(TemplateRenderer, MergesPlaceholderSplitAcrossRuns) {
  TemplateRenderer r;
  const std::string split =
    "<w:p>"
    "<w:r><w:t>No. {</w:t></w:r>"
    "<w:r><w:rPr><w:b/></w:rPr><w:t>{ certificate_</w:t></w:r>"
    "<w:r><w:t>number }</w:t></w:r>"
    "<w:r><w:t>}</w:t></w:r>"
    "</w:p>";
  RenderContext ctx{{"certificate_number", std::string("CERT-001")}};
  const std::string body = rendered_body(r.render(make_docx(split), ctx));
  EXPECT_NE(body.find("CERT-001"), std::string::npos);
  EXPECT_EQ(body.find("{"), std::string::npos);
}

TEST(TemplateRenderer, EmbedsInlineImage) {
  TemplateRenderer r;
  RenderContext ctx{{"qr_code", InlineImage{make_png(40, 40), 30.0}}};
  auto out = r.render(make_docx(paragraph("Scan: {{ qr_code }}")), ctx);
  ASSERT_TRUE(out.ok()) << out.error().message;

  DocxArchive pkg = DocxArchive::load(out.value());
  const std::string body = pkg.read("word/document.xml");
  EXPECT_NE(body.find("<w:drawing>"), std::string::npos);
  EXPECT_NE(body.find("r:embed=\"rId1\""), std::string::npos);
  // 30 mm at 36000 EMU per mm, square image
  EXPECT_NE(body.find("cx=\"1080000\" cy=\"1080000\""), std::string::npos);

  ASSERT_TRUE(pkg.contains("word/media/certgen_qr_code.png"));
  EXPECT_EQ(to_bytes(pkg.read("word/media/certgen_qr_code.png")), make_png(40, 40));

  ASSERT_TRUE(pkg.contains("word/_rels/document.xml.rels"));
  const std::string rels = pkg.read("word/_rels/document.xml.rels");
  EXPECT_NE(rels.find("Target=\"media/certgen_qr_code.png\""), std::string::npos);

  EXPECT_NE(pkg.read("[Content_Types].xml").find("Extension=\"png\""), std::string::npos);
}

TEST(TemplateRenderer, ImageUsedTwiceSharesOneMediaPart) {
  TemplateRenderer r;
  RenderContext ctx{{"instructor_signature", InlineImage{make_png(60, 20), 30.0}}};
  auto out = r.render(make_docx(paragraph("{{instructor_signature}}") + paragraph("{{instructor_signature}}")), ctx);
  ASSERT_TRUE(out.ok()) << out.error().message;
  DocxArchive pkg = DocxArchive::load(out.value());
  const std::string rels = pkg.read("word/_rels/document.xml.rels");
  EXPECT_EQ(rels.find("certgen_instructor_signature.png"), rels.rfind("certgen_instructor_signature.png"));
}

TEST(TemplateRenderer, RendersHeaderParts) {
  DocxArchive pkg = minimal_docx(paragraph("body"));
  pkg.write("word/header1.xml",
            "<w:hdr xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">" +
            paragraph("Cert {{certificate_number}}") + "</w:hdr>");
  TemplateRenderer r;
  auto out = r.render(pkg.save(), {{"certificate_number", std::string("C-9")}});
  ASSERT_TRUE(out.ok()) << out.error().message;
  EXPECT_NE(DocxArchive::load(out.value()).read("word/header1.xml").find("Cert C-9"), std::string::npos);
}

TEST(TemplateRenderer, RejectsControlBlocks) {
  TemplateRenderer r;
  auto out = r.render(make_docx(paragraph("{% if first_name %}x{% endif %}")), {});
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::TemplateRenderError);
}

TEST(TemplateRenderer, RejectsUnterminatedPlaceholder) {
  TemplateRenderer r;
  auto out = r.render(make_docx(paragraph("{{ first_name")), {});
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::TemplateRenderError);
}

TEST(TemplateRenderer, RejectsExpressions) {
  TemplateRenderer r;
  auto out = r.render(make_docx(paragraph("{{ first_name|upper }}")), {});
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::TemplateRenderError);
}

TEST(TemplateRenderer, RejectsNonPngImage) {
  TemplateRenderer r;
  RenderContext ctx{{"qr_code", InlineImage{to_bytes("GIF89a...."), 30.0}}};
  auto out = r.render(make_docx(paragraph("{{qr_code}}")), ctx);
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::TemplateRenderError);
}

TEST(TemplateRenderer, RejectsImageOutsideTextRun) {
  TemplateRenderer r;
  RenderContext ctx{{"qr_code", InlineImage{make_png(10, 10), 30.0}}};
  auto out = r.render(make_docx("<w:p><w:pPr><w:pStyle w:val=\"{{qr_code}}\"/></w:pPr></w:p>"), ctx);
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::TemplateRenderError);
}

TEST(TemplateRenderer, RejectsNonDocx) {
  TemplateRenderer r;
  auto out = r.render(to_bytes("plain text"), {});
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::TemplateRenderError);
}

TEST(TemplateRenderer, LeavesTemplateWithoutPlaceholdersIntact) {
  TemplateRenderer r;
  auto out = r.render(make_docx(paragraph("static text")), {{"first_name", std::string("Jane")}});
  const std::string body = rendered_body(out);
  EXPECT_EQ(body, wrap_body(paragraph("static text")));
}
