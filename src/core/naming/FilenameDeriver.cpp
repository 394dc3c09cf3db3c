#include "FilenameDeriver.hpp"

#include <cctype>

namespace certgen {

std::string sanitize_part(const std::string& value) {
  auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

  std::size_t b = 0, e = value.size();
  while (b < e && is_space(value[b])) ++b;
  while (e > b && is_space(value[e - 1])) --e;

  std::string out;
  out.reserve(e - b);
  bool inSpace = false;
  for (std::size_t i = b; i < e; ++i) {
    const unsigned char c = static_cast<unsigned char>(value[i]);
    if (is_space(value[i])) {
      if (!inSpace) out.push_back('_');
      inSpace = true;
      continue;
    }
    inSpace = false;
    if ((c < 0x80 && std::isalnum(c)) || c == '_') out.push_back(static_cast<char>(c));
  }
  return out;
}

std::string replace_extension(const std::string& key, const std::string& ext) {
  const auto slash = key.rfind('/');
  const auto dot = key.rfind('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return key + "." + ext;
  }
  return key.substr(0, dot + 1) + ext;
}

Result<std::string> FilenameDeriver::derive(const std::string& certNo,
                                            const std::string& first,
                                            const std::string& middle,
                                            const std::string& last) const {
  const std::string c = sanitize_part(certNo);
  const std::string f = sanitize_part(first);
  const std::string m = sanitize_part(middle);
  const std::string l = sanitize_part(last);

  if (c.empty() || f.empty() || l.empty()) {
    return Result<std::string>::fail(ErrorCode::InvalidIdentity,
      "certificate_number, first_name and last_name are required");
  }

  std::string name = c + "_" + f;
  if (!m.empty()) name += "_" + m;
  name += "_" + l;
  return std::string(kPrefix) + name + ".docx";
}

} // namespace certgen
