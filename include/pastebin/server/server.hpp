#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <map>
#include <regex>
#include "pastebin/paste_service.hpp"
#include "pastebin/server/errors.hpp"
#include "pastebin/storage/store.hpp"
#include "pastebin/utils/logger.hpp"
#include <nlohmann/json.hpp>

// 前向声明
namespace httplib {
    class Server;
    class Request;
    class Response;
}

namespace pastebin {
namespace server {

using json = nlohmann::json;

// 请求结构, 与 httplib 解耦, 便于直接测试处理函数
struct Request {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query;   // URL查询参数
    std::map<std::string, std::string> form;    // urlencoded 表单字段
    std::string body;
    std::map<std::string, std::string> params;  // 路径参数

    // 按名称查找请求头, 不区分大小写; 不存在返回空串
    std::string Header(const std::string& name) const;
};

struct Response {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;
};

// 上下文
struct Context {
    Request request;
    PasteService* pasteService = nullptr;
    std::string baseUrl;  // 已去掉末尾 '/'
};

// 处理器函数类型
using Handler = std::function<Error(const Context&, Response&)>;

// 路由器, 路由按添加顺序匹配
// 路径模板形如 /api/paste/{pasteId:[A-Za-z0-9_-]+}
class Router {
public:
    void AddRoute(const std::string& method, const std::string& path, Handler handler);
    Error HandleRequest(const Context& ctx, Response& response) const;

private:
    struct Route {
        std::string method;
        std::string path;
        std::regex pattern;
        std::vector<std::string> paramNames;
        Handler handler;
    };
    std::vector<Route> routes_;

    static bool matchRoute(const Route& route, const std::string& path,
                           std::map<std::string, std::string>& params);
};

// 服务器配置
struct Config {
    std::string addr = "0.0.0.0:5000";
    std::string baseUrl;                 // 为空时由 Host 头推导
    utils::LoggingConfig logging;
    storage::PasteStore* store = nullptr; // 不持有所有权
};

// 服务器
class Server {
public:
    explicit Server(const Config& config);

    // 阻塞监听, 无法绑定地址时返回错误
    Error Run();

    // 在 httplib 服务器上注册默认头、异常处理、访问日志和全部路由
    void Mount(httplib::Server& http) const;

    // 不经过网络处理一个请求
    Response Dispatch(const Request& request) const;

private:
    void setupRoutes();
    void setupLogger();
    std::string resolveBaseUrl(const Request& request) const;
    void handleHttpRequest(const std::string& method, const httplib::Request& req, httplib::Response& res) const;

    Config config_;
    Router router_;
    std::unique_ptr<PasteService> pasteService_;
};

// 处理函数声明
namespace handlers {
    Error HomeHandler(const Context& ctx, Response& resp);
    Error CreatePasteHandler(const Context& ctx, Response& resp);
    Error GetPasteHandler(const Context& ctx, Response& resp);
    Error ListPastesHandler(const Context& ctx, Response& resp);
    Error ViewPasteHandler(const Context& ctx, Response& resp);
    Error RawPasteHandler(const Context& ctx, Response& resp);
    Error NotFoundHandler(const Context& ctx, Response& resp);
}

} // namespace server
} // namespace pastebin
