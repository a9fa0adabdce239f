#include "pastebin/storage/filestore.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "pastebin/utils/logger.hpp"

namespace fs = std::filesystem;

namespace pastebin {
namespace storage {

const std::string PASTE_FILE_EXT = ".json";

bool dirExists(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool createDirRecursive(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    if (dirExists(path)) {
        return true;
    }
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && dirExists(path);
}

FileStore::FileStore(const std::string& baseDir) : baseDir_(baseDir) {
    if (!createDirRecursive(baseDir_)) {
        // 目录建不出来时后续的 Put 会返回 IO 错误
        utils::GetLogger().Error("无法创建存储目录",
            utils::LogContext().With("baseDir", baseDir_));
        return;
    }
    utils::GetLogger().Info("初始化文件存储",
        utils::LogContext().With("baseDir", baseDir_));
}

Result<Paste> FileStore::Get(const std::string& id) {
    if (!IsValidPasteID(id)) {
        return Error::NotFound("Invalid paste id: " + id);
    }

    std::string path = buildPastePath(id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Error("Cannot stat file: " + path + ", error: " + ec.message());
        }
        return Error::NotFound("Paste not found: " + id);
    }

    auto dataResult = readFile(path);
    if (!dataResult.ok()) {
        return dataResult.error();
    }

    auto pasteResult = ParsePaste(dataResult.value());
    // 记录内的 id 必须与文件名一致
    if (pasteResult.ok() && pasteResult.value().id != id) {
        pasteResult = Error::Corrupt("Paste id mismatch: file " + id +
                                     ", record " + pasteResult.value().id);
    }
    if (!pasteResult.ok()) {
        utils::GetLogger().Warn("粘贴记录无法解析",
            utils::LogContext()
                .With("path", path)
                .With("error", pasteResult.error().what()));
    }
    return pasteResult;
}

Error FileStore::Put(const Paste& paste) {
    if (!IsValidPasteID(paste.id)) {
        return Error::Invalid("Invalid paste id: " + paste.id);
    }

    std::string path = buildPastePath(paste.id);
    std::string data = nlohmann::json(paste).dump(-1, ' ', false,
                                                  nlohmann::json::error_handler_t::replace);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        utils::GetLogger().Error("无法创建粘贴文件",
            utils::LogContext().With("path", path));
        return Error("Failed to create file: " + path);
    }

    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        utils::GetLogger().Error("写入粘贴文件失败",
            utils::LogContext().With("path", path));
        return Error("Failed to write file: " + path);
    }

    utils::GetLogger().Debug("粘贴已写入",
        utils::LogContext()
            .With("id", paste.id)
            .With("path", path)
            .With("bytes", std::to_string(data.size())));
    return Error();
}

Result<std::vector<Paste>> FileStore::List() {
    std::vector<Paste> pastes;

    if (!dirExists(baseDir_)) {
        return pastes;
    }

    std::error_code ec;
    fs::directory_iterator it(baseDir_, ec);
    if (ec) {
        return Error("Failed to list directory: " + baseDir_ + ", error: " + ec.message());
    }

    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) continue;
        if (entry.path().extension().string() != PASTE_FILE_EXT) continue;

        std::string id = entry.path().stem().string();
        auto result = Get(id);
        if (!result.ok()) {
            utils::GetLogger().Warn("跳过无法读取的粘贴记录",
                utils::LogContext()
                    .With("file", entry.path().filename().string())
                    .With("error", result.error().what()));
            continue;
        }
        pastes.push_back(std::move(result).value());
    }

    return pastes;
}

std::string FileStore::Location() const {
    return baseDir_;
}

std::string FileStore::buildPastePath(const std::string& id) const {
    return (fs::path(baseDir_) / (id + PASTE_FILE_EXT)).string();
}

Result<std::string> FileStore::readFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error("Cannot open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error("Failed to read file: " + path);
    }

    return buffer.str();
}

} // namespace storage
} // namespace pastebin
