#pragma once

#include <zip.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qrdrop::test {

struct ZipEntryInfo {
  std::string name;
  std::uint16_t method = 0;
  std::uint32_t crc = 0;
  std::uint64_t compressed_size = 0;
  std::uint64_t uncompressed_size = 0;
  std::vector<char> data;
};

struct ZipArchiveInfo {
  std::uint64_t entry_count = 0;
  bool zip64_end = false;
  std::vector<ZipEntryInfo> entries;
};

// Opens an in-memory archive with libzip's consistency checks. With
// `extract` every entry is read back to its end, where libzip verifies the
// CRC.
class ZipInspector {
public:
  explicit ZipInspector(const std::vector<char>& archive) : buf_(archive) {}

  bool inspect(ZipArchiveInfo& out, std::string& error, bool extract = true) const {
    out = ZipArchiveInfo{};
    zip_error_t zerr;
    zip_error_init(&zerr);
    zip_source_t* source = zip_source_buffer_create(buf_.empty() ? nullptr : buf_.data(), buf_.size(), 0, &zerr);
    if(!source) return fail(error, zerr);
    zip_t* archive = zip_open_from_source(source, ZIP_RDONLY | ZIP_CHECKCONS, &zerr);
    if(!archive) {
      zip_source_free(source);
      return fail(error, zerr);
    }
    zip_error_fini(&zerr);

    const zip_int64_t count = zip_get_num_entries(archive, 0);
    out.entry_count = count < 0 ? 0 : static_cast<std::uint64_t>(count);
    out.zip64_end = has_zip64_locator();

    bool ok = true;
    for(zip_int64_t i = 0; ok && i < count; ++i) {
      const auto index = static_cast<zip_uint64_t>(i);
      zip_stat_t st;
      zip_stat_init(&st);
      if(zip_stat_index(archive, index, 0, &st) < 0) {
        ok = fail(error, "stat entry " + std::to_string(i) + ": " + zip_strerror(archive));
        break;
      }
      ZipEntryInfo entry;
      entry.name = st.name ? st.name : "";
      entry.method = st.comp_method;
      entry.crc = st.crc;
      entry.compressed_size = st.comp_size;
      entry.uncompressed_size = st.size;
      if(extract) ok = read_entry(archive, index, entry, error);
      out.entries.push_back(std::move(entry));
    }
    zip_discard(archive);
    return ok;
  }

private:
  static bool read_entry(zip_t* archive, zip_uint64_t index, ZipEntryInfo& entry, std::string& error) {
    zip_file_t* file = zip_fopen_index(archive, index, 0);
    if(!file) return fail(error, entry.name + ": " + zip_strerror(archive));
    entry.data.resize(static_cast<std::size_t>(entry.uncompressed_size));
    std::size_t got = 0;
    bool ok = true;
    while(ok) {
      // One read past the declared size so libzip reaches the end and checks the CRC.
      char overflow_byte = 0;
      char* dest = got < entry.data.size() ? entry.data.data() + got : &overflow_byte;
      const zip_uint64_t want = got < entry.data.size() ? entry.data.size() - got : 1;
      const zip_int64_t n = zip_fread(file, dest, want);
      if(n < 0) {
        ok = fail(error, entry.name + ": " + zip_file_strerror(file));
      } else if(n == 0) {
        break;
      } else if(got >= entry.data.size()) {
        ok = fail(error, entry.name + ": more data than the directory declares");
      } else {
        got += static_cast<std::size_t>(n);
      }
    }
    if(ok && got != entry.data.size()) {
      ok = fail(error, entry.name + ": entry shorter than the directory declares");
    }
    if(zip_fclose(file) != 0 && ok) {
      ok = fail(error, entry.name + ": close failed");
    }
    return ok;
  }

  // libzip writes no archive comment, so a ZIP64 locator sits right before
  // the 22-byte end record.
  bool has_zip64_locator() const {
    if(buf_.size() < 22 + 20) return false;
    const std::size_t at = buf_.size() - 22 - 20;
    std::uint32_t sig = 0;
    for(int i = 3; i >= 0; --i) {
      sig = (sig << 8) | static_cast<unsigned char>(buf_[at + static_cast<std::size_t>(i)]);
    }
    return sig == 0x07064b50;
  }

  static bool fail(std::string& error, zip_error_t& zerr) {
    error = zip_error_strerror(&zerr);
    zip_error_fini(&zerr);
    return false;
  }

  static bool fail(std::string& error, const std::string& message) {
    error = message;
    return false;
  }

  const std::vector<char>& buf_;
};

} // namespace qrdrop::test
