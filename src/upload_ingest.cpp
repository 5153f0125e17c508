#include "upload_ingest.hpp"

#include <charconv>
#include <new>
#include <utility>

#include "broadcast_hub.hpp"
#include "transfer_registry.hpp"

namespace {

constexpr std::size_t kMaxSizeFieldBytes = 32;

const std::string& checked_boundary(const std::string& boundary) {
  if(boundary.empty() || boundary.size() > 70) {
    throw IngestError(IngestError::Kind::MalformedBody, "missing or invalid multipart boundary");
  }
  return boundary;
}

} // namespace

IngestError::IngestError(Kind kind, const std::string& message)
  : std::runtime_error(message), kind_(kind) {}

IngestError::Category IngestError::category() const {
  switch(kind_) {
    case Kind::AllocationFailure:
    case Kind::SizeLimitExceeded:
      return Category::ResourceExhaustion;
    case Kind::MissingRegistryEntry:
      return Category::MissingRegistryEntry;
    default:
      return Category::ClientProtocolError;
  }
}

const char* to_string(IngestError::Kind kind) {
  switch(kind) {
    case IngestError::Kind::InvalidSize: return "InvalidSize";
    case IngestError::Kind::AllocationFailure: return "AllocationFailure";
    case IngestError::Kind::SizeLimitExceeded: return "SizeLimitExceeded";
    case IngestError::Kind::OrderingError: return "OrderingError";
    case IngestError::Kind::MissingSize: return "MissingSize";
    case IngestError::Kind::MissingFile: return "MissingFile";
    case IngestError::Kind::MissingFilename: return "MissingFilename";
    case IngestError::Kind::UnexpectedPart: return "UnexpectedPart";
    case IngestError::Kind::SizeMismatch: return "SizeMismatch";
    case IngestError::Kind::MalformedBody: return "MalformedBody";
    case IngestError::Kind::MissingRegistryEntry: return "MissingRegistryEntry";
  }
  return "Unknown";
}

const char* to_string(IngestError::Category category) {
  switch(category) {
    case IngestError::Category::ClientProtocolError: return "ClientProtocolError";
    case IngestError::Category::ResourceExhaustion: return "ResourceExhaustion";
    case IngestError::Category::MissingRegistryEntry: return "MissingRegistryEntry";
  }
  return "Unknown";
}

bool parse_missing_transfer_policy(const std::string& text, MissingTransferPolicy& policy) {
  if(text == "lenient") {
    policy = MissingTransferPolicy::Lenient;
    return true;
  }
  if(text == "strict") {
    policy = MissingTransferPolicy::Strict;
    return true;
  }
  return false;
}

UploadIngest::UploadIngest(const std::string& boundary,
                           std::shared_ptr<TransferRegistry> registry,
                           std::shared_ptr<BroadcastHub> hub,
                           IngestOptions options,
                           std::shared_ptr<Logger> logger)
  : registry_(std::move(registry)),
    hub_(std::move(hub)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("ingest")),
    parser_(checked_boundary(boundary), MultipartParser::Callbacks{
      [this](const PartInfo& info){ on_part_begin(info); },
      [this](const char* data, std::size_t size){ on_part_data(data, size); },
      [this](){ on_part_end(); },
      nullptr
    }) {}

void UploadIngest::feed(const char* data, std::size_t size) {
  try {
    parser_.feed(data, size);
  } catch(const MultipartError& e) {
    throw IngestError(IngestError::Kind::MalformedBody, e.what());
  }
}

UploadedFile UploadIngest::finish() {
  try {
    parser_.finish();
  } catch(const MultipartError& e) {
    throw IngestError(IngestError::Kind::MalformedBody, e.what());
  }
  if(!size_parsed_) {
    throw IngestError(IngestError::Kind::MissingSize, "upload has no size field");
  }
  if(!file_complete_) {
    throw IngestError(IngestError::Kind::MissingFile, "upload has no file field");
  }
  logger_->info("[{}] received {} bytes", file_.display_name, received_);
  file_.size = received_;
  return std::move(file_);
}

void UploadIngest::on_part_begin(const PartInfo& info) {
  ++parts_seen_;
  if(parts_seen_ > 2) {
    throw IngestError(IngestError::Kind::UnexpectedPart,
                      "unexpected extra field '" + info.name + "'");
  }

  if(info.name == "size") {
    if(size_parsed_ || part_ != Part::None) {
      throw IngestError(IngestError::Kind::UnexpectedPart, "duplicate size field");
    }
    part_ = Part::Size;
    return;
  }

  if(info.name == "file") {
    if(!size_parsed_) {
      throw IngestError(IngestError::Kind::OrderingError, "file field arrived before size field");
    }
    if(!info.has_filename || info.filename.empty()) {
      throw IngestError(IngestError::Kind::MissingFilename, "file field has no filename");
    }
    part_ = Part::File;
    file_.name = info.filename;
    file_.display_name = display_name(info.filename);
    logger_->info("[{}] receiving {} bytes", file_.display_name, declared_size_);

    if(registry_ && !registry_->lookup(file_.name)) {
      if(options_.missing_policy == MissingTransferPolicy::Strict) {
        throw IngestError(IngestError::Kind::MissingRegistryEntry,
                          "no progress subscription for '" + file_.name + "'");
      }
      logger_->warn("[{}] nobody is tracking this transfer, continuing", file_.display_name);
      missing_logged_ = true;
    }
    return;
  }

  throw IngestError(IngestError::Kind::UnexpectedPart, "unexpected field '" + info.name + "'");
}

void UploadIngest::on_part_data(const char* data, std::size_t size) {
  switch(part_) {
    case Part::Size:
      if(size_text_.size() + size > kMaxSizeFieldBytes) {
        throw IngestError(IngestError::Kind::InvalidSize, "size field is too long");
      }
      size_text_.append(data, size);
      return;

    case Part::File:
      if(size > declared_size_ - received_) {
        throw IngestError(IngestError::Kind::SizeMismatch,
                          "file is larger than the declared " + std::to_string(declared_size_) + " bytes");
      }
      file_.bytes.insert(file_.bytes.end(), data, data + size);
      received_ += size;
      publish_progress();
      return;

    default:
      return;
  }
}

void UploadIngest::on_part_end() {
  if(part_ == Part::Size) {
    parse_size();
  } else if(part_ == Part::File) {
    if(received_ != declared_size_) {
      throw IngestError(IngestError::Kind::SizeMismatch,
                        "file ended after " + std::to_string(received_) + " of " +
                        std::to_string(declared_size_) + " declared bytes");
    }
    file_complete_ = true;
    // covers empty files, which never produce a data chunk
    publish_progress();
  }
  part_ = Part::None;
}

void UploadIngest::parse_size() {
  std::uint64_t value = 0;
  const char* begin = size_text_.data();
  const char* end = begin + size_text_.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if(size_text_.empty() || ec != std::errc() || ptr != end) {
    throw IngestError(IngestError::Kind::InvalidSize, "could not parse size '" + size_text_ + "'");
  }
  if(value > options_.size_limit) {
    throw IngestError(IngestError::Kind::SizeLimitExceeded,
                      "declared size " + std::to_string(value) + " exceeds the limit of " +
                      std::to_string(options_.size_limit) + " bytes");
  }
  try {
    file_.bytes.reserve(static_cast<std::size_t>(value));
  } catch(const std::bad_alloc&) {
    throw IngestError(IngestError::Kind::AllocationFailure,
                      "could not allocate " + std::to_string(value) + " bytes");
  } catch(const std::length_error&) {
    throw IngestError(IngestError::Kind::AllocationFailure,
                      "could not allocate " + std::to_string(value) + " bytes");
  }
  declared_size_ = value;
  size_parsed_ = true;
}

void UploadIngest::publish_progress() {
  const auto crossed = buckets_.advance(progress_percent(received_, declared_size_));
  if(!crossed || !registry_) return;

  auto stored = registry_->update(file_.name, received_, declared_size_);
  if(!stored) {
    if(options_.missing_policy == MissingTransferPolicy::Strict) {
      throw IngestError(IngestError::Kind::MissingRegistryEntry,
                        "progress subscription for '" + file_.name + "' went away");
    }
    if(!missing_logged_) {
      logger_->warn("[{}] no progress record, continuing", file_.display_name);
      missing_logged_ = true;
    }
    return;
  }
  logger_->debug("[{}] {}%", file_.display_name, *crossed);

  if(!hub_) return;
  if(auto record = registry_->lookup(file_.name)) {
    hub_->ping(reporting_class(record->device));
  }
}
