#pragma once

#include <string>
#include <vector>
#include "pastebin/storage/store.hpp"
#include "pastebin/types.hpp"

namespace pastebin {
namespace storage {

// 文件系统存储: 每条记录一个 {baseDir}/{id}.json
// 不加锁, 同一ID的并发写入由文件系统决定先后
class FileStore : public PasteStore {
public:
    explicit FileStore(const std::string& baseDir);

    Result<Paste> Get(const std::string& id) override;
    Error Put(const Paste& paste) override;
    Result<std::vector<Paste>> List() override;
    std::string Location() const override;

private:
    std::string baseDir_;

    std::string buildPastePath(const std::string& id) const;
    Result<std::string> readFile(const std::string& path) const;
};

// 辅助函数
bool dirExists(const std::string& path);
bool createDirRecursive(const std::string& path);

} // namespace storage
} // namespace pastebin
