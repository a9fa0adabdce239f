#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include "pastebin/server/server.hpp"
#include "pastebin/storage/filestore.hpp"
#include "pastebin/storage/memorystore.hpp"
#include "pastebin/utils/logger.hpp"

int main(int argc, char* argv[]) {
    CLI::App app{"pastebin服务器 - 文本粘贴与分享"};

    std::string addr = "0.0.0.0:5000";
    std::string storeDir = "pastes";
    std::string storeType = "file";
    std::string baseUrl;

    pastebin::utils::LoggingConfig logging;

    app.add_option("--addr", addr, "服务器监听地址, 格式: host:port");
    app.add_option("--store-dir", storeDir, "粘贴文件存放目录");
    app.add_option("--store", storeType, "存储类型: file, memory")
        ->check(CLI::IsMember({"file", "memory"}));
    app.add_option("--base-url", baseUrl, "对外访问地址, 为空时使用请求的Host头");

    app.add_option("--log-level", logging.level, "日志级别: debug, info, warn, error, fatal, panic");
    app.add_option("--log-format", logging.format, "日志格式: json, text")
        ->check(CLI::IsMember({"json", "text"}));
    app.add_option("--log-output", logging.output, "日志输出: console, file")
        ->check(CLI::IsMember({"console", "file"}));
    app.add_option("--log-file", logging.file, "日志文件路径(当log-output为file时使用)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    pastebin::utils::GetLogger().Initialize(logging);

    pastebin::utils::GetLogger().Info("pastebin服务器配置",
        pastebin::utils::LogContext()
            .With("addr", addr)
            .With("store", storeType)
            .With("storeDir", storeDir)
            .With("baseUrl", baseUrl)
            .With("logLevel", logging.level)
            .With("logFormat", logging.format)
            .With("logOutput", logging.output));

    std::unique_ptr<pastebin::storage::PasteStore> store;
    if (storeType == "memory") {
        store = std::make_unique<pastebin::storage::MemoryStore>();
    } else {
        store = std::make_unique<pastebin::storage::FileStore>(storeDir);
    }

    pastebin::server::Config config;
    config.addr = addr;
    config.baseUrl = baseUrl;
    config.logging = logging;
    config.store = store.get();

    pastebin::server::Server server(config);
    auto err = server.Run();
    if (err.Code() != 0) { // 0 = NoError
        pastebin::utils::GetLogger().Fatal("服务器启动失败",
            pastebin::utils::LogContext().With("error", err.Detail()));
        return 1;
    }

    return 0;
}
