#pragma once
#include <string>
#include <utility>
#include <vector>

#include "core/common/Types.hpp"

namespace certgen {

// In-memory OOXML package (a zip). Entry order is preserved on save so
// [Content_Types].xml stays first. Methods throw std::runtime_error.
class DocxArchive {
public:
  static DocxArchive load(const Bytes& data);
  Bytes save() const;

  bool contains(const std::string& name) const;
  const std::string& read(const std::string& name) const;
  // Replaces an existing entry in place or appends a new one.
  void write(const std::string& name, std::string data);

  std::vector<std::string> names() const;

private:
  std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace certgen
