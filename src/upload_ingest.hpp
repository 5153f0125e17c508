#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "multipart_parser.hpp"
#include "utils.hpp"

class BroadcastHub;
class TransferRegistry;

class IngestError : public std::runtime_error {
public:
  enum class Kind {
    InvalidSize,
    AllocationFailure,
    SizeLimitExceeded,
    OrderingError,
    MissingSize,
    MissingFile,
    MissingFilename,
    UnexpectedPart,
    SizeMismatch,
    MalformedBody,
    MissingRegistryEntry
  };

  enum class Category { ClientProtocolError, ResourceExhaustion, MissingRegistryEntry };

  IngestError(Kind kind, const std::string& message);

  Kind kind() const { return kind_; }
  Category category() const;
  int http_status() const { return 400; }

private:
  Kind kind_;
};

const char* to_string(IngestError::Kind kind);
const char* to_string(IngestError::Category category);

enum class MissingTransferPolicy { Lenient, Strict };

// Accepts "lenient" or "strict".
bool parse_missing_transfer_policy(const std::string& text, MissingTransferPolicy& policy);

struct IngestOptions {
  std::uint64_t size_limit = kGiB;
  MissingTransferPolicy missing_policy = MissingTransferPolicy::Lenient;
};

struct UploadedFile {
  std::string name;
  std::string display_name;
  std::uint64_t size = 0;
  std::vector<char> bytes;
};

// Consumes one upload body: a `size` field holding the decimal byte count,
// then a `file` field. Progress is published to the registry record named
// after the file on every 5% boundary, and the aggregate stream that reports
// the record's device is woken. One instance per request, not thread-safe.
class UploadIngest {
public:
  UploadIngest(const std::string& boundary,
               std::shared_ptr<TransferRegistry> registry,
               std::shared_ptr<BroadcastHub> hub,
               IngestOptions options,
               std::shared_ptr<Logger> logger = nullptr);

  // Throws IngestError; the instance is unusable afterwards.
  void feed(const char* data, std::size_t size);

  // Validates the complete body and hands over the file bytes.
  UploadedFile finish();

  const std::string& filename() const { return file_.name; }
  std::uint64_t declared_size() const { return declared_size_; }
  std::uint64_t bytes_received() const { return received_; }
  bool size_known() const { return size_parsed_; }

private:
  enum class Part { None, Size, File, Other };

  void on_part_begin(const PartInfo& info);
  void on_part_data(const char* data, std::size_t size);
  void on_part_end();

  void parse_size();
  void publish_progress();

  std::shared_ptr<TransferRegistry> registry_;
  std::shared_ptr<BroadcastHub> hub_;
  IngestOptions options_;
  std::shared_ptr<Logger> logger_;

  Part part_ = Part::None;
  std::size_t parts_seen_ = 0;
  std::string size_text_;
  bool size_parsed_ = false;
  bool file_complete_ = false;
  bool missing_logged_ = false;
  std::uint64_t declared_size_ = 0;
  std::uint64_t received_ = 0;
  ProgressBuckets buckets_;
  UploadedFile file_;

  MultipartParser parser_;
};
