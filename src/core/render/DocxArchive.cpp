#include "DocxArchive.hpp"

#include <zip.h>

#include <stdexcept>

namespace certgen {

static std::string zip_error_message(zip_error_t* err) {
  std::string msg = zip_error_strerror(err);
  zip_error_fini(err);
  return msg;
}

DocxArchive DocxArchive::load(const Bytes& data) {
  zip_error_t err;
  zip_error_init(&err);

  zip_source_t* src = zip_source_buffer_create(data.data(), data.size(), 0, &err);
  if (!src) throw std::runtime_error("zip source: " + zip_error_message(&err));

  zip_t* za = zip_open_from_source(src, ZIP_RDONLY | ZIP_CHECKCONS, &err);
  if (!za) {
    zip_source_free(src);
    throw std::runtime_error("not a zip archive: " + zip_error_message(&err));
  }
  zip_error_fini(&err);

  DocxArchive out;
  const zip_int64_t n = zip_get_num_entries(za, 0);
  for (zip_int64_t i = 0; i < n; ++i) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(za, static_cast<zip_uint64_t>(i), 0, &st) != 0 ||
        !(st.valid & ZIP_STAT_NAME) || !(st.valid & ZIP_STAT_SIZE)) {
      zip_discard(za);
      throw std::runtime_error("cannot stat zip entry " + std::to_string(i));
    }

    std::string body(static_cast<std::size_t>(st.size), '\0');
    if (st.size > 0) {
      zip_file_t* zf = zip_fopen_index(za, static_cast<zip_uint64_t>(i), 0);
      if (!zf) {
        zip_discard(za);
        throw std::runtime_error(std::string("cannot open zip entry ") + st.name);
      }
      const zip_int64_t got = zip_fread(zf, body.data(), st.size);
      zip_fclose(zf);
      if (got < 0 || static_cast<zip_uint64_t>(got) != st.size) {
        const std::string name = st.name;
        zip_discard(za);
        throw std::runtime_error("short read on zip entry " + name);
      }
    }
    out.entries_.emplace_back(st.name, std::move(body));
  }

  // read-only archive: discard also frees the source
  zip_discard(za);
  return out;
}

Bytes DocxArchive::save() const {
  zip_error_t err;
  zip_error_init(&err);

  zip_source_t* src = zip_source_buffer_create(nullptr, 0, 0, &err);
  if (!src) throw std::runtime_error("zip source: " + zip_error_message(&err));

  zip_t* za = zip_open_from_source(src, ZIP_TRUNCATE, &err);
  if (!za) {
    zip_source_free(src);
    throw std::runtime_error("cannot create zip archive: " + zip_error_message(&err));
  }
  zip_error_fini(&err);
  // keep the buffer alive past zip_close so it can be read back
  zip_source_keep(src);

  for (const auto& [name, body] : entries_) {
    if (!name.empty() && name.back() == '/') {
      if (zip_dir_add(za, name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
        zip_discard(za);
        zip_source_free(src);
        throw std::runtime_error("cannot add directory " + name);
      }
      continue;
    }
    zip_source_t* fileSrc = zip_source_buffer(za, body.data(), body.size(), 0);
    if (!fileSrc) {
      zip_discard(za);
      zip_source_free(src);
      throw std::runtime_error("cannot create source for " + name);
    }
    const zip_int64_t idx = zip_file_add(za, name.c_str(), fileSrc, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
    if (idx < 0) {
      zip_source_free(fileSrc);
      zip_discard(za);
      zip_source_free(src);
      throw std::runtime_error("cannot add " + name + " to zip");
    }
    zip_set_file_compression(za, static_cast<zip_uint64_t>(idx), ZIP_CM_DEFLATE, 0);
  }

  if (zip_close(za) != 0) {
    const std::string msg = zip_strerror(za);
    zip_discard(za);
    zip_source_free(src);
    throw std::runtime_error("cannot finalize zip: " + msg);
  }

  zip_stat_t st;
  zip_stat_init(&st);
  if (zip_source_stat(src, &st) != 0) {
    zip_source_free(src);
    throw std::runtime_error("cannot stat zip buffer");
  }
  if (zip_source_open(src) != 0) {
    zip_source_free(src);
    throw std::runtime_error("cannot open zip buffer for reading");
  }
  Bytes out(static_cast<std::size_t>(st.size));
  const zip_int64_t got = zip_source_read(src, out.data(), st.size);
  zip_source_close(src);
  zip_source_free(src);
  if (got < 0 || static_cast<zip_uint64_t>(got) != st.size) {
    throw std::runtime_error("short read of zip buffer");
  }
  return out;
}

bool DocxArchive::contains(const std::string& name) const {
  for (const auto& e : entries_) {
    if (e.first == name) return true;
  }
  return false;
}

const std::string& DocxArchive::read(const std::string& name) const {
  for (const auto& e : entries_) {
    if (e.first == name) return e.second;
  }
  throw std::runtime_error("missing package part: " + name);
}

void DocxArchive::write(const std::string& name, std::string data) {
  for (auto& e : entries_) {
    if (e.first == name) {
      e.second = std::move(data);
      return;
    }
  }
  entries_.emplace_back(name, std::move(data));
}

std::vector<std::string> DocxArchive::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.first);
  return out;
}

} // namespace certgen
