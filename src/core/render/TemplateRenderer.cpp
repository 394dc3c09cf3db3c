#include "TemplateRenderer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>
#include <stdexcept>

#include "DocxArchive.hpp"
#include "core/image/Raster.hpp"

namespace certgen {

namespace {

constexpr const char* kMainPart = "word/document.xml";
constexpr const char* kContentTypesPart = "[Content_Types].xml";
constexpr const char* kImageRelType =
  "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";
constexpr long long kEmuPerMm = 36000;

const std::regex& renderable_part() {
  static const std::regex re(R"(^word/(document|header[0-9]*|footer[0-9]*)\.xml$)");
  return re;
}

bool is_identifier(const std::string& s) {
  if (s.empty()) return false;
  if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
  for (char c : s) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
  }
  return true;
}

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string strip_tags(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool inTag = false;
  for (char c : s) {
    if (c == '<') inTag = true;
    else if (c == '>' && inTag) inTag = false;
    else if (!inTag) out.push_back(c);
  }
  return out;
}

// Largest integer following `prefix` anywhere in `xml`.
int max_numbered(const std::string& xml, const std::string& prefix) {
  int best = 0;
  std::size_t pos = 0;
  while ((pos = xml.find(prefix, pos)) != std::string::npos) {
    pos += prefix.size();
    int v = 0;
    bool any = false;
    while (pos < xml.size() && std::isdigit(static_cast<unsigned char>(xml[pos]))) {
      v = v * 10 + (xml[pos] - '0');
      ++pos;
      any = true;
    }
    if (any) best = std::max(best, v);
  }
  return best;
}

// True when `pos` falls between a <w:t> opening tag and its </w:t>.
bool inside_text_run(const std::string& xml, std::size_t pos) {
  const std::string head = xml.substr(0, pos);
  std::size_t open = head.rfind("<w:t>");
  const std::size_t openAttr = head.rfind("<w:t ");
  if (open == std::string::npos || (openAttr != std::string::npos && openAttr > open)) open = openAttr;
  const std::size_t close = head.rfind("</w:t>");
  return open != std::string::npos && (close == std::string::npos || open > close);
}

std::string rels_path_for(const std::string& part) {
  const auto slash = part.rfind('/');
  return part.substr(0, slash) + "/_rels/" + part.substr(slash + 1) + ".rels";
}

// Adds media parts and relationships while placeholders are bound.
class ImageEmbedder {
public:
  explicit ImageEmbedder(DocxArchive& pkg) : pkg_(pkg) {
    for (const auto& name : pkg_.names()) {
      if (std::regex_match(name, renderable_part())) {
        nextDocPr_ = std::max(nextDocPr_, max_numbered(pkg_.read(name), "<wp:docPr id=\"") + 1);
      }
    }
  }

  std::string drawing(const std::string& part, const std::string& placeholder, const InlineImage& img) {
    int w = 0, h = 0;
    if (!read_png_size(img.png, w, h)) {
      throw std::runtime_error("placeholder '" + placeholder + "' requires PNG image data");
    }

    const std::string rid = relate(part, media_for(placeholder, img));
    const long long cx = std::llround(img.widthMm * kEmuPerMm);
    const long long cy = std::llround(static_cast<double>(cx) * h / w);
    const int id = nextDocPr_++;
    const std::string ext = "cx=\"" + std::to_string(cx) + "\" cy=\"" + std::to_string(cy) + "\"";

    return
      "<w:drawing>"
      "<wp:inline distT=\"0\" distB=\"0\" distL=\"0\" distR=\"0\" "
        "xmlns:wp=\"http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing\">"
      "<wp:extent " + ext + "/>"
      "<wp:docPr id=\"" + std::to_string(id) + "\" name=\"Picture " + std::to_string(id) + "\"/>"
      "<wp:cNvGraphicFramePr>"
        "<a:graphicFrameLocks xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" noChangeAspect=\"1\"/>"
      "</wp:cNvGraphicFramePr>"
      "<a:graphic xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\">"
      "<a:graphicData uri=\"http://schemas.openxmlformats.org/drawingml/2006/picture\">"
      "<pic:pic xmlns:pic=\"http://schemas.openxmlformats.org/drawingml/2006/picture\">"
        "<pic:nvPicPr><pic:cNvPr id=\"0\" name=\"" + placeholder + ".png\"/><pic:cNvPicPr/></pic:nvPicPr>"
        "<pic:blipFill>"
          "<a:blip r:embed=\"" + rid + "\" "
            "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"/>"
          "<a:stretch><a:fillRect/></a:stretch>"
        "</pic:blipFill>"
        "<pic:spPr>"
          "<a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext " + ext + "/></a:xfrm>"
          "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom>"
        "</pic:spPr>"
      "</pic:pic>"
      "</a:graphicData>"
      "</a:graphic>"
      "</wp:inline>"
      "</w:drawing>";
  }

  // Writes relationship parts and registers the png content type.
  void finish() {
    if (rels_.empty()) return;
    for (auto& [path, r] : rels_) pkg_.write(path, r.xml);

    std::string types = pkg_.read(kContentTypesPart);
    std::string lower = types;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower.find("extension=\"png\"") == std::string::npos) {
      const auto typesTag = types.find("<Types");
      const auto tagEnd = typesTag == std::string::npos ? typesTag : types.find('>', typesTag);
      if (tagEnd == std::string::npos) throw std::runtime_error("malformed [Content_Types].xml");
      types.insert(tagEnd + 1, "<Default Extension=\"png\" ContentType=\"image/png\"/>");
      pkg_.write(kContentTypesPart, types);
    }
  }

private:
  struct PartRels {
    std::string xml;
    int nextId = 1;
    std::map<std::string, std::string> ridByTarget;
  };

  // Package path of the media part for a placeholder, created once.
  std::string media_for(const std::string& placeholder, const InlineImage& img) {
    auto it = mediaByPlaceholder_.find(placeholder);
    if (it != mediaByPlaceholder_.end()) return it->second;

    std::string path = "word/media/certgen_" + placeholder + ".png";
    for (int n = 2; pkg_.contains(path); ++n) {
      path = "word/media/certgen_" + placeholder + "_" + std::to_string(n) + ".png";
    }
    pkg_.write(path, std::string(img.png.begin(), img.png.end()));
    mediaByPlaceholder_.emplace(placeholder, path);
    return path;
  }

  std::string relate(const std::string& part, const std::string& mediaPath) {
    const std::string relsPath = rels_path_for(part);
    auto it = rels_.find(relsPath);
    if (it == rels_.end()) {
      PartRels r;
      if (pkg_.contains(relsPath)) {
        r.xml = pkg_.read(relsPath);
      } else {
        r.xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
                "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
                "</Relationships>";
      }
      r.nextId = max_numbered(r.xml, "Id=\"rId") + 1;
      it = rels_.emplace(relsPath, std::move(r)).first;
    }
    PartRels& r = it->second;

    // media lives under word/, next to every renderable part
    const std::string target = mediaPath.substr(std::string("word/").size());
    if (auto found = r.ridByTarget.find(target); found != r.ridByTarget.end()) return found->second;

    const std::string rid = "rId" + std::to_string(r.nextId++);
    const auto close = r.xml.rfind("</Relationships>");
    if (close == std::string::npos) throw std::runtime_error("malformed relationships part " + relsPath);
    r.xml.insert(close, "<Relationship Id=\"" + rid + "\" Type=\"" + kImageRelType +
                        "\" Target=\"" + target + "\"/>");
    r.ridByTarget.emplace(target, rid);
    return rid;
  }

  DocxArchive& pkg_;
  std::map<std::string, PartRels> rels_;
  std::map<std::string, std::string> mediaByPlaceholder_;
  int nextDocPr_ = 1;
};

std::string render_part(const std::string& part,
                        const std::string& xml,
                        const RenderContext& context,
                        ImageEmbedder& images) {
  std::string out;
  out.reserve(xml.size());
  std::size_t pos = 0;
  while (true) {
    const std::size_t open = xml.find("{{", pos);
    if (open == std::string::npos) break;
    const std::size_t close = xml.find("}}", open + 2);
    if (close == std::string::npos) throw std::runtime_error("unterminated placeholder in " + part);

    out.append(xml, pos, open - pos);
    const std::string name = trim(xml.substr(open + 2, close - open - 2));
    if (!is_identifier(name)) {
      throw std::runtime_error("invalid placeholder expression '{{" + name + "}}' in " + part);
    }

    auto it = context.find(name);
    if (it == context.end()) {
      // unbound placeholder renders empty
    } else if (const auto* text = std::get_if<std::string>(&it->second)) {
      out += xml_escape(*text);
    } else {
      if (!inside_text_run(xml, open)) {
        throw std::runtime_error("image placeholder '" + name + "' is not inside a text run");
      }
      const auto& img = std::get<InlineImage>(it->second);
      out += "</w:t></w:r><w:r>" + images.drawing(part, name, img) +
             "</w:r><w:r><w:t xml:space=\"preserve\">";
    }
    pos = close + 2;
  }
  out.append(xml, pos, std::string::npos);
  return out;
}

} // namespace

std::string xml_escape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default:   out.push_back(c);
    }
  }
  return out;
}

std::string merge_split_placeholders(const std::string& xml) {
  const std::size_t n = xml.size();
  auto skip_tags = [&](std::size_t j) {
    while (j < n && xml[j] == '<') {
      const std::size_t e = xml.find('>', j);
      if (e == std::string::npos) return std::string::npos;
      j = e + 1;
    }
    return j;
  };

  // pass 1: drop markup between the two braces of "{{" and "}}"
  std::string joined;
  joined.reserve(n);
  for (std::size_t i = 0; i < n;) {
    const char c = xml[i];
    joined.push_back(c);
    if (c == '{' || c == '}' || c == '%' || c == '#') {
      const std::size_t j = skip_tags(i + 1);
      if (j != std::string::npos && j > i + 1 && j < n) {
        const char d = xml[j];
        const bool opener = c == '{' && (d == '{' || d == '%' || d == '#');
        const bool closer = c != '{' && d == '}';
        if (opener || closer) {
          i = j;
          continue;
        }
      }
    }
    ++i;
  }

  // pass 2: strip markup inside each placeholder
  std::string out;
  out.reserve(joined.size());
  std::size_t pos = 0;
  while (true) {
    const std::size_t open = joined.find('{', pos);
    if (open == std::string::npos || open + 1 >= joined.size()) break;
    const char kind = joined[open + 1];
    if (kind == '%' || kind == '#') {
      throw std::runtime_error("unsupported template block '{" + std::string(1, kind) + "'");
    }
    if (kind != '{') {
      out.append(joined, pos, open + 1 - pos);
      pos = open + 1;
      continue;
    }
    const std::size_t close = joined.find("}}", open + 2);
    if (close == std::string::npos) throw std::runtime_error("unterminated placeholder");
    out.append(joined, pos, open - pos);
    out += "{{" + strip_tags(joined.substr(open + 2, close - open - 2)) + "}}";
    pos = close + 2;
  }
  out.append(joined, pos, std::string::npos);
  return out;
}

Result<Bytes> TemplateRenderer::render(const Bytes& templateDocx, const RenderContext& context) const {
  DocxArchive pkg;
  try {
    pkg = DocxArchive::load(templateDocx);
  } catch (const std::exception& e) {
    return Result<Bytes>::fail(ErrorCode::TemplateRenderError,
                               std::string("template is not a valid .docx: ") + e.what());
  }
  if (!pkg.contains(kMainPart) || !pkg.contains(kContentTypesPart)) {
    return Result<Bytes>::fail(ErrorCode::TemplateRenderError,
                               "template is missing word/document.xml or [Content_Types].xml");
  }

  try {
    ImageEmbedder images(pkg);
    int rendered = 0;
    for (const auto& name : pkg.names()) {
      if (!std::regex_match(name, renderable_part())) continue;
      const std::string merged = merge_split_placeholders(pkg.read(name));
      pkg.write(name, render_part(name, merged, context, images));
      ++rendered;
    }
    images.finish();
    spdlog::debug("rendered {} template part(s)", rendered);
    return pkg.save();
  } catch (const std::exception& e) {
    return Result<Bytes>::fail(ErrorCode::TemplateRenderError, e.what());
  }
}

} // namespace certgen
