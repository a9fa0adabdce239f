#include "pastebin/server/server.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "pastebin/utils/logger.hpp"
#include "pastebin/utils/tools.hpp"

namespace pastebin {
namespace server {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::string SERVER_HEADER = "pastebin/1.0";

// 重复的键保留第一个值
std::map<std::string, std::string> firstValues(const httplib::Params& params) {
    std::map<std::string, std::string> result;
    for (const auto& param : params) {
        result.emplace(param.first, param.second);
    }
    return result;
}

} // namespace

std::string Request::Header(const std::string& name) const {
    std::string wanted = toLower(name);
    for (const auto& header : headers) {
        if (toLower(header.first) == wanted) {
            return header.second;
        }
    }
    return "";
}

void Router::AddRoute(const std::string& method, const std::string& path, Handler handler) {
    // 将 {name:regex} 替换为捕获组, 其余部分按字面匹配
    static const std::regex paramRegex("\\{([a-zA-Z0-9]+):(.*?)\\}");

    Route route;
    route.method = method;
    route.path = path;
    route.handler = std::move(handler);

    std::string regexPattern;
    std::smatch matches;
    std::string::const_iterator searchStart(path.cbegin());

    while (std::regex_search(searchStart, path.cend(), matches, paramRegex)) {
        regexPattern += std::string(searchStart, searchStart + matches.position());
        regexPattern += "(" + std::string(matches[2]) + ")";
        route.paramNames.push_back(matches[1]);
        searchStart += matches.position() + matches.length();
    }
    regexPattern += std::string(searchStart, path.cend());

    route.pattern = std::regex("^" + regexPattern + "$");
    routes_.push_back(std::move(route));
}

bool Router::matchRoute(const Route& route, const std::string& path,
                        std::map<std::string, std::string>& params) {
    std::smatch pathMatches;
    if (!std::regex_match(path, pathMatches, route.pattern)) {
        return false;
    }
    // pathMatches[0] 是整个匹配, 捕获组从1开始
    for (size_t i = 0; i < route.paramNames.size(); ++i) {
        params[route.paramNames[i]] = pathMatches[i + 1].str();
    }
    return true;
}

Error Router::HandleRequest(const Context& ctx, Response& response) const {
    for (const auto& route : routes_) {
        if (route.method != ctx.request.method) {
            continue;
        }
        std::map<std::string, std::string> params;
        if (matchRoute(route, ctx.request.path, params)) {
            Context newCtx = ctx;
            newCtx.request.params = params;

            utils::GetLogger().Debug("匹配到路由",
                utils::LogContext()
                    .With("method", route.method)
                    .With("route", route.path)
                    .With("path", ctx.request.path));

            return route.handler(newCtx, response);
        }
    }

    utils::GetLogger().Debug("未找到匹配的路由",
        utils::LogContext()
            .With("method", ctx.request.method)
            .With("path", ctx.request.path));

    return handlers::NotFoundHandler(ctx, response);
}

Server::Server(const Config& config) : config_(config) {
    setupLogger();
    if (config_.store) {
        pasteService_ = std::make_unique<PasteService>(*config_.store);
    } else {
        utils::GetLogger().Warn("未配置存储, 所有粘贴请求将返回500");
    }
    setupRoutes();
}

void Server::setupLogger() {
    utils::GetLogger().Initialize(config_.logging);

    utils::GetLogger().Info("初始化pastebin服务器",
        utils::LogContext()
            .With("address", config_.addr)
            .With("baseUrl", config_.baseUrl)
            .With("logLevel", config_.logging.level)
            .With("logFormat", config_.logging.format));
}

void Server::setupRoutes() {
    router_.AddRoute("GET", "/", handlers::HomeHandler);

    // /api/* 必须排在 /{pasteId} 之前
    router_.AddRoute("GET", "/api/paste", handlers::CreatePasteHandler);
    router_.AddRoute("POST", "/api/paste", handlers::CreatePasteHandler);
    router_.AddRoute("GET", "/api/paste_list", handlers::ListPastesHandler);
    router_.AddRoute("GET", "/api/paste/{pasteId:[A-Za-z0-9_-]+}", handlers::GetPasteHandler);

    router_.AddRoute("GET", "/{pasteId:[A-Za-z0-9_-]+}/raw", handlers::RawPasteHandler);
    router_.AddRoute("GET", "/{pasteId:[A-Za-z0-9_-]+}", handlers::ViewPasteHandler);

    utils::GetLogger().Debug("路由设置完成");
}

std::string Server::resolveBaseUrl(const Request& request) const {
    if (!config_.baseUrl.empty()) {
        return utils::TrimTrailingSlash(config_.baseUrl);
    }
    std::string host = request.Header("Host");
    if (host.empty()) {
        host = config_.addr;
    }
    return utils::TrimTrailingSlash("http://" + host);
}

Response Server::Dispatch(const Request& request) const {
    Context ctx;
    ctx.request = request;
    ctx.pasteService = pasteService_.get();
    ctx.baseUrl = resolveBaseUrl(request);

    Response response;
    Error err = router_.HandleRequest(ctx, response);

    if (err.Code() != 0) { // 0 = NoError
        response.status = err.HTTPStatusCode();

        utils::GetLogger().Debug("请求处理出错",
            utils::LogContext()
                .With("code", std::to_string(err.Code()))
                .With("message", err.Detail())
                .With("statusCode", std::to_string(response.status))
                .With("method", request.method)
                .With("path", request.path));

        // 处理函数没有写响应体时补一个JSON错误
        if (response.body.empty()) {
            json errorJson = {{"error", err.Detail()}};
            response.body = errorJson.dump();
            response.headers["Content-Type"] = "application/json";
        }
    }

    return response;
}

Error Server::Run() {
    std::string host;
    int port;

    try {
        size_t colonPos = config_.addr.rfind(':');
        if (colonPos != std::string::npos) {
            host = config_.addr.substr(0, colonPos);
            port = std::stoi(config_.addr.substr(colonPos + 1));
        } else {
            host = "0.0.0.0";
            port = std::stoi(config_.addr);
        }
    } catch (const std::exception& e) {
        utils::GetLogger().Fatal("无法解析监听地址",
            utils::LogContext()
                .With("addr", config_.addr)
                .With("error", e.what()));
        return Error::ErrUnknown.WithDetail("invalid listen address: " + config_.addr);
    }

    httplib::Server server;
    Mount(server);

    utils::GetLogger().Info("服务器开始监听",
        utils::LogContext()
            .With("host", host)
            .With("port", std::to_string(port))
            .With("store", config_.store ? config_.store->Location() : "none"));

    if (!server.listen(host.c_str(), port)) {
        utils::GetLogger().Fatal("无法启动服务器",
            utils::LogContext()
                .With("host", host)
                .With("port", std::to_string(port)));
        return Error::ErrUnknown.WithDetail("failed to listen on " + config_.addr);
    }

    return Error();
}

void Server::Mount(httplib::Server& http) const {
    http.set_default_headers({{"Server", SERVER_HEADER}});

    http.set_exception_handler([](const auto& req, auto& res, std::exception_ptr ep) {
        std::string message = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            // 非 std::exception 的异常只记录为未知错误
        }

        utils::GetLogger().Error("服务器异常",
            utils::LogContext()
                .With("exception", message)
                .With("path", req.path)
                .With("method", req.method));

        json errorJson = {{"error", message}};
        res.status = 500;
        res.set_content(errorJson.dump(-1, ' ', false, json::error_handler_t::replace),
                        "application/json");
    });

    http.set_logger([](const auto& req, const auto& res) {
        utils::LogContext ctx;
        ctx.WithField("method", req.method);
        ctx.WithField("path", req.path);
        ctx.WithField("status", std::to_string(res.status));
        ctx.WithField("remoteAddr", req.remote_addr);

        if (res.status >= 500) {
            utils::GetLogger().Error("HTTP请求完成", ctx);
        } else if (res.status >= 400) {
            utils::GetLogger().Warn("HTTP请求完成", ctx);
        } else {
            utils::GetLogger().Info("HTTP请求完成", ctx);
        }
    });

    http.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest("GET", req, res);
    });

    http.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest("POST", req, res);
    });
}

void Server::handleHttpRequest(const std::string& method, const httplib::Request& req, httplib::Response& res) const {
    Request request;
    request.method = method;
    request.path = req.path;
    request.body = req.body;

    for (const auto& header : req.headers) {
        request.headers[header.first] = header.second;
    }

    // httplib 会把表单体合并进 req.params, 查询参数和表单分开解析
    size_t queryPos = req.target.find('?');
    if (queryPos != std::string::npos) {
        httplib::Params queryParams;
        httplib::detail::parse_query_text(req.target.substr(queryPos + 1), queryParams);
        request.query = firstValues(queryParams);
    }

    if (toLower(req.get_header_value("Content-Type")).rfind("application/x-www-form-urlencoded", 0) == 0) {
        httplib::Params formParams;
        httplib::detail::parse_query_text(req.body, formParams);
        request.form = firstValues(formParams);
    }

    Response response = Dispatch(request);

    std::string contentType = "application/json";
    for (const auto& header : response.headers) {
        if (toLower(header.first) == "content-type") {
            contentType = header.second;
            continue;
        }
        res.set_header(header.first.c_str(), header.second.c_str());
    }

    res.status = response.status;
    res.set_content(response.body, contentType.c_str());
}

} // namespace server
} // namespace pastebin
