#include "pastebin/storage/memorystore.hpp"

namespace pastebin {
namespace storage {

Result<Paste> MemoryStore::Get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = storage_.find(id);
    if (it == storage_.end()) {
        return Error::NotFound("Paste not found: " + id);
    }
    return it->second;
}

Error MemoryStore::Put(const Paste& paste) {
    if (!IsValidPasteID(paste.id)) {
        return Error::Invalid("Invalid paste id: " + paste.id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    storage_[paste.id] = paste;
    return Error();
}

Result<std::vector<Paste>> MemoryStore::List() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Paste> pastes;
    pastes.reserve(storage_.size());
    for (const auto& pair : storage_) {
        pastes.push_back(pair.second);
    }
    return pastes;
}

std::string MemoryStore::Location() const {
    return "memory";
}

} // namespace storage
} // namespace pastebin
