#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "pastebin/storage/filestore.hpp"
#include "pastebin/storage/memorystore.hpp"
#include "pastebin/utils/logger.hpp"

using namespace pastebin;
using namespace pastebin::storage;

namespace fs = std::filesystem;

namespace {

std::string makeTempDir(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("pastebin_" + name + "_" + std::to_string(stamp));
    fs::remove_all(dir);
    return dir.string();
}

void writeRaw(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary);
    file << data;
}

Paste samplePaste(const std::string& id, const std::string& createdAt) {
    Paste paste;
    paste.id = id;
    paste.content = "content of " + id;
    paste.title = DefaultTitle(id);
    paste.description = "";
    paste.createdAt = createdAt;
    return paste;
}

} // namespace

TEST_CASE("FileStore读写", "[storage][filestore]") {
    utils::GetLogger().SetLevel(utils::LogLevel::Panic);
    std::string dir = makeTempDir("filestore");

    SECTION("构造时创建多级目录") {
        std::string nested = dir + "/a/b";
        FileStore store(nested);
        REQUIRE(dirExists(nested));
        REQUIRE(store.Location() == nested);
    }

    SECTION("写入后读取, 文件名为 id.json") {
        FileStore store(dir);
        Paste paste = samplePaste("abc12345", "2026-01-01T10:00:00.000000");
        paste.content = "line1\nline2\t\"quoted\" \xE4\xBD\xA0\xE5\xA5\xBD";

        REQUIRE(store.Put(paste).ok());
        REQUIRE(fs::exists(fs::path(dir) / "abc12345.json"));

        auto result = store.Get("abc12345");
        REQUIRE(result.ok());
        REQUIRE(result.value().id == "abc12345");
        REQUIRE(result.value().content == paste.content);
        REQUIRE(result.value().title == "Paste abc12345");
        REQUIRE(result.value().createdAt == paste.createdAt);
    }

    SECTION("持久化格式包含全部五个字段") {
        FileStore store(dir);
        REQUIRE(store.Put(samplePaste("fmt00001", "2026-01-01T10:00:00.000000")).ok());

        std::ifstream file(fs::path(dir) / "fmt00001.json");
        nlohmann::json j = nlohmann::json::parse(file);
        REQUIRE(j.size() == 5);
        REQUIRE(j["id"] == "fmt00001");
        REQUIRE(j["content"] == "content of fmt00001");
        REQUIRE(j["title"] == "Paste fmt00001");
        REQUIRE(j["description"] == "");
        REQUIRE(j["created_at"] == "2026-01-01T10:00:00.000000");
    }

    SECTION("同ID写入覆盖旧记录") {
        FileStore store(dir);
        Paste first = samplePaste("dup00001", "2026-01-01T10:00:00.000000");
        Paste second = first;
        second.content = "replaced";
        REQUIRE(store.Put(first).ok());
        REQUIRE(store.Put(second).ok());
        REQUIRE(store.Get("dup00001").value().content == "replaced");
    }

    SECTION("不存在的记录返回NotFound") {
        FileStore store(dir);
        auto result = store.Get("missing1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind() == ErrorKind::NotFound);
        REQUIRE(result.error().IsNotFound());
    }

    SECTION("损坏的记录返回Corrupt") {
        FileStore store(dir);
        writeRaw(dir + "/broken01.json", "{not json");
        writeRaw(dir + "/partial1.json", "{\"id\": \"partial1\", \"content\": \"x\"}");
        writeRaw(dir + "/wrongtyp.json",
                 "{\"id\": \"wrongtyp\", \"content\": 5, \"title\": \"t\", "
                 "\"description\": \"\", \"created_at\": \"2026\"}");

        for (const std::string id : {"broken01", "partial1", "wrongtyp"}) {
            auto result = store.Get(id);
            REQUIRE_FALSE(result.ok());
            REQUIRE(result.error().kind() == ErrorKind::Corrupt);
            REQUIRE(result.error().IsNotFound());
        }
    }

    SECTION("记录内的ID与文件名不一致视为损坏") {
        FileStore store(dir);
        writeRaw(dir + "/abc.json",
                 "{\"id\": \"../x\", \"content\": \"c\", \"title\": \"t\", "
                 "\"description\": \"\", \"created_at\": \"2026\"}");
        REQUIRE(store.Put(samplePaste("good0001", "2026-01-01T10:00:00.000000")).ok());

        auto result = store.Get("abc");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind() == ErrorKind::Corrupt);

        auto listed = store.List();
        REQUIRE(listed.ok());
        REQUIRE(listed.value().size() == 1);
        REQUIRE(listed.value()[0].id == "good0001");
    }

    SECTION("非法ID不会访问目录之外的文件") {
        FileStore store(dir + "/inner");
        writeRaw(dir + "/outside.json",
                 "{\"id\": \"outside\", \"content\": \"secret\", \"title\": \"t\", "
                 "\"description\": \"\", \"created_at\": \"2026\"}");

        auto result = store.Get("../outside");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind() == ErrorKind::NotFound);

        Paste bad = samplePaste("../evil", "2026");
        Error err = store.Put(bad);
        REQUIRE(err.hasError());
        REQUIRE(err.kind() == ErrorKind::Invalid);
        REQUIRE_FALSE(fs::exists(fs::path(dir) / "evil.json"));
    }

    SECTION("列表跳过损坏记录和非json文件") {
        FileStore store(dir);
        REQUIRE(store.Put(samplePaste("good0001", "2026-01-01T10:00:00.000000")).ok());
        REQUIRE(store.Put(samplePaste("good0002", "2026-01-02T10:00:00.000000")).ok());
        writeRaw(dir + "/broken01.json", "garbage");
        writeRaw(dir + "/notes.txt", "not a paste");
        fs::create_directories(fs::path(dir) / "subdir.json");

        auto result = store.List();
        REQUIRE(result.ok());
        REQUIRE(result.value().size() == 2);
        for (const auto& paste : result.value()) {
            REQUIRE(paste.id.rfind("good", 0) == 0);
        }
    }

    SECTION("目录不存在时列表为空") {
        FileStore store(dir);
        fs::remove_all(dir);
        auto result = store.List();
        REQUIRE(result.ok());
        REQUIRE(result.value().empty());
    }

    SECTION("目录被删除后写入返回IO错误") {
        FileStore store(dir);
        fs::remove_all(dir);
        Error err = store.Put(samplePaste("lost0001", "2026"));
        REQUIRE(err.hasError());
        REQUIRE(err.kind() == ErrorKind::IO);
    }

    fs::remove_all(dir);
}

TEST_CASE("MemoryStore读写", "[storage][memorystore]") {
    MemoryStore store;
    REQUIRE(store.Location() == "memory");

    SECTION("写入后读取") {
        REQUIRE(store.Put(samplePaste("mem00001", "2026-01-01T00:00:00.000000")).ok());
        auto result = store.Get("mem00001");
        REQUIRE(result.ok());
        REQUIRE(result.value().content == "content of mem00001");
    }

    SECTION("不存在返回NotFound") {
        auto result = store.Get("nothing1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind() == ErrorKind::NotFound);
    }

    SECTION("拒绝非法ID") {
        REQUIRE(store.Put(samplePaste("a/b", "2026")).kind() == ErrorKind::Invalid);
    }

    SECTION("列出全部记录") {
        REQUIRE(store.Put(samplePaste("mem00001", "2026-01-01T00:00:00.000000")).ok());
        REQUIRE(store.Put(samplePaste("mem00002", "2026-01-02T00:00:00.000000")).ok());
        auto result = store.List();
        REQUIRE(result.ok());
        REQUIRE(result.value().size() == 2);
    }
}

TEST_CASE("粘贴ID校验", "[storage]") {
    REQUIRE(IsValidPasteID("abc12345"));
    REQUIRE(IsValidPasteID("A-b_9"));
    REQUIRE_FALSE(IsValidPasteID(""));
    REQUIRE_FALSE(IsValidPasteID("../x"));
    REQUIRE_FALSE(IsValidPasteID("a.b"));
    REQUIRE_FALSE(IsValidPasteID("a b"));
}
