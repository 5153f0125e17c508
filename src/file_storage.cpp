#include "file_storage.hpp"

#include <fstream>
#include <system_error>

#include "utils.hpp"

FileStorage::FileStorage(std::filesystem::path root, std::shared_ptr<Logger> logger)
: root_(std::move(root)),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("storage"))
{
    if(root_.empty()) root_ = ".";
}

std::filesystem::path FileStorage::store(const std::string& name, const std::vector<char>& bytes){
    const std::string base = storage_name(name);
    if(base.empty()){
        throw StorageError("unusable file name '" + name + "'");
    }

    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if(ec){
        throw StorageError("could not create " + root_.string() + ": " + ec.message());
    }

    // Written as <name>.part and renamed once complete.
    const auto target = root_ / base;
    auto partial = target;
    partial += ".part";

    logger_->info("[{}] copying bytes to {}", display_name(name), target.string());
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if(!out){
            throw StorageError("could not create file " + partial.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if(!out){
            out.close();
            std::filesystem::remove(partial, ec);
            throw StorageError("could not copy bytes to " + target.string());
        }
    }
    std::filesystem::rename(partial, target, ec);
    if(ec){
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        throw StorageError("could not move " + partial.string() + " into place: " + ec.message());
    }
    logger_->info("[{}] stored", display_name(name));
    return target;
}
