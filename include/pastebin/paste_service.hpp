#pragma once

#include <string>
#include <vector>
#include "pastebin/storage/store.hpp"
#include "pastebin/types.hpp"

namespace pastebin {

using storage::PasteStore;

// 粘贴服务: 负责ID生成、默认值填充和排序, 存储细节交给 PasteStore
class PasteService {
public:
    explicit PasteService(PasteStore& store);

    // 生成新ID并保存
    Result<Paste> Create(const std::string& content,
                         const std::string& title = "",
                         const std::string& description = "");

    // 以指定ID保存, 同ID覆盖; 空标题取 "Paste {id}", 空描述保持为空
    Result<Paste> Save(const std::string& id,
                       const std::string& content,
                       const std::string& title = "",
                       const std::string& description = "");

    Result<Paste> Load(const std::string& id);

    // 按 created_at 降序
    Result<std::vector<Paste>> List();

private:
    PasteStore& store_;
};

} // namespace pastebin
