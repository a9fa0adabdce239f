#pragma once

#include <map>
#include <mutex>
#include "pastebin/storage/store.hpp"

namespace pastebin {
namespace storage {

// 内存存储实现, 进程退出即丢失
class MemoryStore : public PasteStore {
public:
    MemoryStore() = default;

    Result<Paste> Get(const std::string& id) override;
    Error Put(const Paste& paste) override;
    Result<std::vector<Paste>> List() override;
    std::string Location() const override;

private:
    std::map<std::string, Paste> storage_;
    std::mutex mutex_;
};

} // namespace storage
} // namespace pastebin
