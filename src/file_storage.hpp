#pragma once
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Destination of direct-to-storage uploads. Blocking; run on the worker pool.
class FileStorage {
public:
    explicit FileStorage(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);

    // Writes `bytes` to root/<final component of name>, replacing an existing
    // file. Returns the written path; throws StorageError.
    std::filesystem::path store(const std::string& name, const std::vector<char>& bytes);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::shared_ptr<Logger> logger_;
};
