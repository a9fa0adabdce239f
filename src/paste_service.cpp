#include "pastebin/paste_service.hpp"
#include <algorithm>
#include "pastebin/utils/logger.hpp"
#include "pastebin/utils/tools.hpp"

namespace pastebin {

PasteService::PasteService(PasteStore& store) : store_(store) {}

Result<Paste> PasteService::Create(const std::string& content,
                                   const std::string& title,
                                   const std::string& description) {
    return Save(utils::GeneratePasteID(), content, title, description);
}

Result<Paste> PasteService::Save(const std::string& id,
                                 const std::string& content,
                                 const std::string& title,
                                 const std::string& description) {
    Paste paste;
    paste.id = id;
    paste.content = content;
    paste.title = title.empty() ? DefaultTitle(id) : title;
    paste.description = description;
    paste.createdAt = utils::CurrentTimeISO8601();

    Error err = store_.Put(paste);
    if (err.hasError()) {
        utils::GetLogger().Error("保存粘贴失败",
            utils::LogContext()
                .With("id", id)
                .With("store", store_.Location())
                .With("error", err.what()));
        return err;
    }

    utils::GetLogger().Info("创建粘贴",
        utils::LogContext()
            .With("id", id)
            .With("title", paste.title)
            .With("size", std::to_string(content.size())));
    return paste;
}

Result<Paste> PasteService::Load(const std::string& id) {
    return store_.Get(id);
}

Result<std::vector<Paste>> PasteService::List() {
    auto result = store_.List();
    if (!result.ok()) {
        return result;
    }

    std::vector<Paste> pastes = std::move(result).value();
    // ISO-8601 字符串的字典序即时间序
    std::stable_sort(pastes.begin(), pastes.end(),
        [](const Paste& a, const Paste& b) { return a.createdAt > b.createdAt; });
    return pastes;
}

} // namespace pastebin
