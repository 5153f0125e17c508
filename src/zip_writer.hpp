#pragma once

#include <zip.h>

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class ZipError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Builds a ZIP archive in memory with libzip. Entries are served to libzip
// from caller-owned buffers, which must stay alive until `finish` returns.
// libzip picks ZIP64 records by itself once sizes, offsets or the entry count
// outgrow the classic format.
class ZipWriter {
public:
  // Called with the number of entry bytes libzip pulled for compression.
  using ReadObserver = std::function<void(std::size_t bytes)>;

  struct Options {
    int level = 8; // 0 stores, 1-9 deflate
  };

  explicit ZipWriter(Options options);
  ~ZipWriter();

  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  void add_entry(const std::string& name,
                 const char* data,
                 std::size_t size,
                 std::time_t modified = std::time(nullptr));

  // Compresses every entry and returns the archive bytes. The writer accepts
  // nothing afterwards.
  std::vector<char> finish();

  void set_read_observer(ReadObserver observer) { observer_ = std::move(observer); }
  std::size_t entry_count() const { return entries_; }

private:
  struct EntrySource;

  static zip_int64_t serve_entry(void* state, void* data, zip_uint64_t len, zip_source_cmd_t cmd);
  void consumed(std::size_t bytes);

  Options options_;
  zip_source_t* buffer_ = nullptr;
  zip_t* archive_ = nullptr;
  std::size_t entries_ = 0;
  ReadObserver observer_;
};
