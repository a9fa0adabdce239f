#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "pastebin/paste_service.hpp"
#include "pastebin/storage/memorystore.hpp"
#include "pastebin/utils/logger.hpp"

using namespace pastebin;
using namespace pastebin::storage;

namespace {

// 写入失败的存储, 用于验证错误向上传递
class FailingStore : public PasteStore {
public:
    Result<Paste> Get(const std::string& id) override {
        return Error("disk unavailable");
    }
    Error Put(const Paste& paste) override {
        return Error("disk full");
    }
    Result<std::vector<Paste>> List() override {
        return Error("disk unavailable");
    }
    std::string Location() const override {
        return "failing";
    }
};

} // namespace

TEST_CASE("PasteService创建粘贴", "[paste_service]") {
    utils::GetLogger().SetLevel(utils::LogLevel::Panic);
    MemoryStore store;
    PasteService service(store);

    SECTION("未提供标题和描述时使用默认值") {
        auto result = service.Create("hello world");
        REQUIRE(result.ok());

        const Paste& paste = result.value();
        REQUIRE(paste.id.size() == PASTE_ID_LENGTH);
        REQUIRE(paste.content == "hello world");
        REQUIRE(paste.title == "Paste " + paste.id);
        REQUIRE(paste.description.empty());
        REQUIRE_FALSE(paste.createdAt.empty());

        auto loaded = service.Load(paste.id);
        REQUIRE(loaded.ok());
        REQUIRE(loaded.value().content == "hello world");
        REQUIRE(loaded.value().createdAt == paste.createdAt);
    }

    SECTION("保留提供的标题和描述") {
        auto result = service.Create("body", "My title", "My description");
        REQUIRE(result.ok());
        REQUIRE(result.value().title == "My title");
        REQUIRE(result.value().description == "My description");
    }

    SECTION("以指定ID保存") {
        auto result = service.Save("fixed001", "body");
        REQUIRE(result.ok());
        REQUIRE(result.value().id == "fixed001");
        REQUIRE(result.value().title == "Paste fixed001");
        REQUIRE(store.Get("fixed001").ok());
    }

    SECTION("存储失败时返回错误") {
        FailingStore failing;
        PasteService failingService(failing);
        auto result = failingService.Create("body");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().what() == "disk full");
    }
}

TEST_CASE("PasteService按时间倒序列出", "[paste_service]") {
    utils::GetLogger().SetLevel(utils::LogLevel::Panic);
    MemoryStore store;
    PasteService service(store);

    auto put = [&store](const std::string& id, const std::string& createdAt) {
        Paste paste;
        paste.id = id;
        paste.content = id;
        paste.title = DefaultTitle(id);
        paste.createdAt = createdAt;
        REQUIRE(store.Put(paste).ok());
    };

    put("aaaaaaaa", "2026-03-01T09:00:00.000000");
    put("bbbbbbbb", "2026-03-02T09:00:00.000000");
    put("cccccccc", "2026-02-28T23:59:59.999999");
    put("dddddddd", "2026-03-01T09:00:00.000001");

    auto result = service.List();
    REQUIRE(result.ok());

    std::vector<std::string> ids;
    for (const auto& paste : result.value()) {
        ids.push_back(paste.id);
    }
    REQUIRE(ids == std::vector<std::string>{"bbbbbbbb", "dddddddd", "aaaaaaaa", "cccccccc"});
}
