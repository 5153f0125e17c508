#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// A fully uploaded file waiting to be packaged. Immutable once staged.
struct StagedFile {
  std::string name;          // original name, used for the archive entry
  std::string display_name;  // shortened for logs and screens
  std::uint64_t size = 0;
  std::vector<char> content;
};

using StagedFilePtr = std::shared_ptr<const StagedFile>;

struct StagingSnapshot {
  std::vector<StagedFilePtr> files;
  std::uint64_t total_size = 0;
};

class StagingStore {
public:
  StagedFilePtr add(StagedFile file);

  // Copies the current list under the lock; the files themselves are shared.
  StagingSnapshot snapshot() const;

  // Removes exactly the given files; files staged later are kept.
  std::size_t remove(const std::vector<StagedFilePtr>& files);

  std::size_t size() const;
  std::uint64_t total_size() const;
  void clear();

private:
  mutable std::mutex m_;
  std::vector<StagedFilePtr> files_; // insertion order
  std::uint64_t total_size_ = 0;
};
