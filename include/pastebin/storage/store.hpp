#pragma once

#include <string>
#include <vector>
#include "pastebin/types.hpp"

namespace pastebin {
namespace storage {

// 粘贴存储后端接口
class PasteStore {
public:
    virtual ~PasteStore() = default;

    // 读取记录; 不存在返回 NotFound, 无法解析返回 Corrupt
    virtual Result<Paste> Get(const std::string& id) = 0;

    // 写入记录, 同ID直接覆盖
    virtual Error Put(const Paste& paste) = 0;

    // 列出所有可解析的记录, 顺序不定
    virtual Result<std::vector<Paste>> List() = 0;

    // 获取存储位置描述
    virtual std::string Location() const = 0;
};

// ID只允许 [A-Za-z0-9_-], 保证不会拼出目录之外的路径
bool IsValidPasteID(const std::string& id);

} // namespace storage
} // namespace pastebin
