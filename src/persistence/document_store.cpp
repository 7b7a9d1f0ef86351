#include "persistence/document_store.hpp"

namespace desk {

std::optional<StoreDocument> MemoryDocumentStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return document_;
}

void MemoryDocumentStore::save(const StoreDocument& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    document_ = document;
    save_count_++;
}

int MemoryDocumentStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

} // namespace desk
