#include "zip_writer.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

std::string take_message(zip_error_t& error) {
  std::string message = zip_error_strerror(&error);
  zip_error_fini(&error);
  return message;
}

} // namespace

// State behind one entry's zip_source_function; freed by ZIP_SOURCE_FREE.
struct ZipWriter::EntrySource {
  ZipWriter* writer = nullptr;
  const char* data = nullptr;
  zip_uint64_t size = 0;
  zip_uint64_t offset = 0;
  std::time_t modified = 0;
  zip_error_t error;
};

ZipWriter::ZipWriter(Options options)
  : options_(options) {
  if(options_.level < 0 || options_.level > 9) {
    throw ZipError("compression level must be between 0 and 9");
  }

  zip_error_t error;
  zip_error_init(&error);
  buffer_ = zip_source_buffer_create(nullptr, 0, 0, &error);
  if(!buffer_) {
    throw ZipError("could not create archive buffer: " + take_message(error));
  }
  archive_ = zip_open_from_source(buffer_, ZIP_TRUNCATE, &error);
  if(!archive_) {
    zip_source_free(buffer_);
    buffer_ = nullptr;
    throw ZipError("could not open archive buffer: " + take_message(error));
  }
  zip_error_fini(&error);
  // The archive owns one reference; this one lets finish() read the result.
  zip_source_keep(buffer_);
  zip_set_archive_flag(archive_, ZIP_AFL_CREATE_OR_KEEP_FILE_FOR_EMPTY_ARCHIVE, 1);
}

ZipWriter::~ZipWriter() {
  if(archive_) zip_discard(archive_);
  if(buffer_) zip_source_free(buffer_);
}

zip_int64_t ZipWriter::serve_entry(void* state, void* data, zip_uint64_t len, zip_source_cmd_t cmd) {
  auto* source = static_cast<EntrySource*>(state);
  switch(cmd) {
    case ZIP_SOURCE_OPEN:
      source->offset = 0;
      return 0;
    case ZIP_SOURCE_READ: {
      const zip_uint64_t n = std::min(len, source->size - source->offset);
      if(n > 0) {
        std::memcpy(data, source->data + source->offset, static_cast<std::size_t>(n));
        source->offset += n;
        source->writer->consumed(static_cast<std::size_t>(n));
      }
      return static_cast<zip_int64_t>(n);
    }
    case ZIP_SOURCE_CLOSE:
      return 0;
    case ZIP_SOURCE_STAT: {
      auto* st = ZIP_SOURCE_GET_ARGS(zip_stat_t, data, len, &source->error);
      if(!st) return -1;
      zip_stat_init(st);
      st->size = source->size;
      st->mtime = source->modified;
      st->valid |= ZIP_STAT_SIZE | ZIP_STAT_MTIME;
      return sizeof(*st);
    }
    case ZIP_SOURCE_ERROR:
      return zip_error_to_data(&source->error, data, len);
    case ZIP_SOURCE_FREE:
      zip_error_fini(&source->error);
      delete source;
      return 0;
    case ZIP_SOURCE_SUPPORTS:
      return zip_source_make_command_bitmap(ZIP_SOURCE_OPEN, ZIP_SOURCE_READ, ZIP_SOURCE_CLOSE,
                                            ZIP_SOURCE_STAT, ZIP_SOURCE_ERROR, ZIP_SOURCE_FREE, -1);
    default:
      zip_error_set(&source->error, ZIP_ER_OPNOTSUPP, 0);
      return -1;
  }
}

void ZipWriter::consumed(std::size_t bytes) {
  if(observer_) observer_(bytes);
}

void ZipWriter::add_entry(const std::string& name, const char* data, std::size_t size, std::time_t modified) {
  if(!archive_) throw ZipError("archive already finished");
  if(name.empty()) throw ZipError("entry name is empty");

  auto* state = new EntrySource;
  state->writer = this;
  state->data = data;
  state->size = size;
  state->modified = modified;
  zip_error_init(&state->error);

  zip_source_t* source = zip_source_function(archive_, &ZipWriter::serve_entry, state);
  if(!source) {
    zip_error_fini(&state->error);
    delete state;
    throw ZipError(std::string("could not create entry source: ") + zip_strerror(archive_));
  }
  const zip_int64_t index = zip_file_add(archive_, name.c_str(), source, ZIP_FL_ENC_UTF_8);
  if(index < 0) {
    zip_source_free(source);
    throw ZipError("could not add '" + name + "': " + zip_strerror(archive_));
  }

  const zip_int32_t method = options_.level == 0 ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
  if(zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index), method,
                              static_cast<zip_uint32_t>(options_.level)) < 0) {
    throw ZipError("could not set compression for '" + name + "': " + zip_strerror(archive_));
  }
  ++entries_;
}

std::vector<char> ZipWriter::finish() {
  if(!archive_) throw ZipError("archive already finished");

  zip_t* archive = std::exchange(archive_, nullptr);
  if(zip_close(archive) < 0) {
    const std::string message = zip_strerror(archive);
    zip_discard(archive);
    throw ZipError("could not write archive: " + message);
  }

  if(zip_source_open(buffer_) < 0) {
    throw ZipError(std::string("could not read archive buffer: ") +
                   zip_error_strerror(zip_source_error(buffer_)));
  }
  std::vector<char> out;
  std::vector<char> chunk(kReadChunk);
  for(;;) {
    const zip_int64_t n = zip_source_read(buffer_, chunk.data(), chunk.size());
    if(n < 0) {
      const std::string message = zip_error_strerror(zip_source_error(buffer_));
      zip_source_close(buffer_);
      throw ZipError("could not read archive buffer: " + message);
    }
    if(n == 0) break;
    out.insert(out.end(), chunk.begin(), chunk.begin() + n);
  }
  zip_source_close(buffer_);
  zip_source_free(std::exchange(buffer_, nullptr));
  return out;
}
