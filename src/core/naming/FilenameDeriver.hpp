#pragma once
#include <string>

#include "core/common/Result.hpp"

namespace certgen {

// Trim, collapse whitespace runs to '_', keep only [A-Za-z0-9_].
std::string sanitize_part(const std::string& value);

// ".../name.docx" -> ".../name.<ext>"; appends when there is no extension.
std::string replace_extension(const std::string& key, const std::string& ext);

class FilenameDeriver {
public:
  static constexpr const char* kPrefix = "certificates/";

  // certificates/{certNo}_{first}[_{middle}]_{last}.docx
  // Fails with InvalidIdentity if certNo, first or last sanitize to empty.
  Result<std::string> derive(const std::string& certNo,
                             const std::string& first,
                             const std::string& middle,
                             const std::string& last) const;
};

} // namespace certgen
