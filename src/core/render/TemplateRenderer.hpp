#pragma once
#include <map>
#include <string>
#include <variant>

#include "core/common/Result.hpp"
#include "core/common/Types.hpp"

namespace certgen {

// Image bound to a placeholder; `png` must be PNG data.
struct InlineImage {
  Bytes  png;
  double widthMm = 30.0;
};

using RenderValue   = std::variant<std::string, InlineImage>;
using RenderContext = std::map<std::string, RenderValue>;

// Rejoins "{{ name }}" placeholders that Word split across runs.
// Throws std::runtime_error on an unterminated placeholder.
std::string merge_split_placeholders(const std::string& xml);

std::string xml_escape(const std::string& text);

// Binds {{ name }} placeholders in the body, headers and footers of a .docx.
// Unknown names render as empty text; absent placeholders are ignored.
class TemplateRenderer {
public:
  Result<Bytes> render(const Bytes& templateDocx, const RenderContext& context) const;
};

} // namespace certgen
