#include "staging_store.hpp"

#include <algorithm>
#include <unordered_set>

StagedFilePtr StagingStore::add(StagedFile file){
    auto staged = std::make_shared<const StagedFile>(std::move(file));
    std::lock_guard lg(m_);
    files_.push_back(staged);
    total_size_ += staged->size;
    return staged;
}

StagingSnapshot StagingStore::snapshot() const {
    std::lock_guard lg(m_);
    return StagingSnapshot{files_, total_size_};
}

std::size_t StagingStore::remove(const std::vector<StagedFilePtr>& files){
    std::unordered_set<const StagedFile*> doomed;
    for(const auto& f: files) doomed.insert(f.get());

    std::vector<StagedFilePtr> removed; // released after the lock
    std::lock_guard lg(m_);
    auto it = std::stable_partition(files_.begin(), files_.end(),
        [&](const StagedFilePtr& f){ return doomed.count(f.get()) == 0; });
    for(auto r = it; r != files_.end(); ++r){
        total_size_ -= (*r)->size;
        removed.push_back(std::move(*r));
    }
    files_.erase(it, files_.end());
    return removed.size();
}

std::size_t StagingStore::size() const {
    std::lock_guard lg(m_);
    return files_.size();
}

std::uint64_t StagingStore::total_size() const {
    std::lock_guard lg(m_);
    return total_size_;
}

void StagingStore::clear(){
    std::lock_guard lg(m_);
    files_.clear();
    total_size_ = 0;
}
