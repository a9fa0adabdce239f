#include "pastebin/server/server.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include "pastebin/server/handlers/pages.hpp"
#include "pastebin/utils/logger.hpp"
#include "pastebin/utils/tools.hpp"

namespace pastebin {
namespace server {
namespace handlers {

namespace {

const std::string CONTENT_TYPE_JSON = "application/json";
const std::string CONTENT_TYPE_HTML = "text/html; charset=utf-8";
const std::string CONTENT_TYPE_TEXT = "text/plain; charset=utf-8";

const std::string NOT_FOUND_TEXT = "Paste not found";

// 创建请求中提取出的字段
struct PasteFields {
    std::string content;
    std::string title;
    std::string description;
};

void writeJSON(Response& resp, const json& body) {
    resp.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    resp.headers["Content-Type"] = CONTENT_TYPE_JSON;
}

void writeJSONError(Response& resp, const std::string& message) {
    writeJSON(resp, json{{"error", message}});
}

void writeText(Response& resp, const std::string& contentType, const std::string& body) {
    resp.body = body;
    resp.headers["Content-Type"] = contentType;
}

std::string lookup(const std::map<std::string, std::string>& values, const std::string& key) {
    auto it = values.find(key);
    return it == values.end() ? "" : it->second;
}

std::string lookupJSON(const json& body, const std::string& key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// 返回第一个非空值
std::string firstNonEmpty(std::initializer_list<std::string> values) {
    for (const auto& value : values) {
        if (!value.empty()) {
            return value;
        }
    }
    return "";
}

// application/json 或 application/*+json
bool isJSONRequest(const Request& request) {
    std::string contentType = request.Header("Content-Type");
    contentType = contentType.substr(0, contentType.find(';'));
    std::transform(contentType.begin(), contentType.end(), contentType.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t first = contentType.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    contentType = contentType.substr(first, contentType.find_last_not_of(" \t") - first + 1);

    if (contentType == "application/json") {
        return true;
    }
    const std::string prefix = "application/";
    const std::string suffix = "+json";
    return contentType.size() > prefix.size() + suffix.size() &&
           contentType.compare(0, prefix.size(), prefix) == 0 &&
           contentType.compare(contentType.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// 按请求方式提取字段; "prompt" 是 "content" 的别名
Error extractPasteFields(const Request& request, PasteFields& fields) {
    const auto& query = request.query;

    if (request.method == "GET") {
        fields.content = firstNonEmpty({lookup(query, "content"), lookup(query, "prompt")});
        fields.title = lookup(query, "title");
        fields.description = lookup(query, "description");
        return Error();
    }

    if (isJSONRequest(request)) {
        json body = json::object();
        if (!request.body.empty()) {
            try {
                body = json::parse(request.body);
            } catch (const json::parse_error& e) {
                utils::GetLogger().Warn("JSON请求体无法解析",
                    utils::LogContext().With("error", e.what()));
                return Error::ErrMalformedJSON;
            }
        }
        if (!body.is_object()) {
            return Error::ErrMalformedJSON;
        }
        fields.content = firstNonEmpty({lookup(query, "prompt"),
                                        lookupJSON(body, "content"),
                                        lookupJSON(body, "prompt")});
        fields.title = lookupJSON(body, "title");
        fields.description = lookupJSON(body, "description");
        return Error();
    }

    const auto& form = request.form;
    fields.content = firstNonEmpty({lookup(query, "prompt"),
                                    lookup(form, "content"),
                                    lookup(form, "prompt")});
    fields.title = lookup(form, "title");
    fields.description = lookup(form, "description");
    return Error();
}

std::string pasteUrl(const Context& ctx, const std::string& id) {
    return ctx.baseUrl + "/" + id;
}

std::string rawUrl(const Context& ctx, const std::string& id) {
    return ctx.baseUrl + "/" + id + "/raw";
}

// 读取路径参数中的粘贴; 不存在或损坏返回 ErrPasteNotFound, 其他存储错误返回 ErrStorage
Error loadPaste(const Context& ctx, Paste& paste) {
    if (!ctx.pasteService) {
        utils::GetLogger().Error("存储服务不可用");
        return Error::ErrNoStorage;
    }

    auto idIt = ctx.request.params.find("pasteId");
    if (idIt == ctx.request.params.end()) {
        return Error::ErrPasteNotFound;
    }

    auto result = ctx.pasteService->Load(idIt->second);
    if (!result.ok()) {
        if (result.error().IsNotFound()) {
            utils::GetLogger().Debug("粘贴不存在",
                utils::LogContext()
                    .With("id", idIt->second)
                    .With("reason", result.error().what()));
            return Error::ErrPasteNotFound;
        }
        utils::GetLogger().Error("读取粘贴失败",
            utils::LogContext()
                .With("id", idIt->second)
                .With("error", result.error().what()));
        return Error::ErrStorage.WithDetail(result.error().what());
    }

    paste = std::move(result).value();
    return Error();
}

} // namespace

Error HomeHandler(const Context& ctx, Response& resp) {
    writeText(resp, CONTENT_TYPE_HTML, RenderHomePage());
    return Error();
}

Error CreatePasteHandler(const Context& ctx, Response& resp) {
    if (!ctx.pasteService) {
        utils::GetLogger().Error("存储服务不可用");
        return Error::ErrNoStorage;
    }

    PasteFields fields;
    Error err = extractPasteFields(ctx.request, fields);
    if (err.Code() != 0) {
        writeJSONError(resp, err.Detail());
        return err;
    }

    if (fields.content.empty()) {
        utils::GetLogger().Debug("创建请求缺少内容",
            utils::LogContext().With("method", ctx.request.method));
        writeJSONError(resp, Error::ErrNoContent.Detail());
        return Error::ErrNoContent;
    }

    auto result = ctx.pasteService->Create(fields.content, fields.title, fields.description);
    if (!result.ok()) {
        return Error::ErrStorage.WithDetail(result.error().what());
    }
    const Paste& paste = result.value();

    std::string url = pasteUrl(ctx, paste.id);

    // 表单提交直接跳转到粘贴页面
    if (ctx.request.method == "POST" && !isJSONRequest(ctx.request)) {
        resp.status = 302;
        resp.headers["Location"] = url;
        return Error();
    }

    writeJSON(resp, json{
        {"success", true},
        {"paste_id", paste.id},
        {"url", url},
        {"raw_url", rawUrl(ctx, paste.id)},
        {"title", paste.title},
        {"description", paste.description},
        {"created_at", paste.createdAt}
    });
    return Error();
}

Error GetPasteHandler(const Context& ctx, Response& resp) {
    Paste paste;
    Error err = loadPaste(ctx, paste);
    if (err.Code() != 0) {
        if (err.Code() == Error::ErrPasteNotFound.Code()) {
            writeJSONError(resp, NOT_FOUND_TEXT);
        }
        return err;
    }

    writeJSON(resp, json{
        {"success", true},
        {"paste_id", paste.id},
        {"title", paste.title},
        {"description", paste.description},
        {"content", paste.content},
        {"created_at", paste.createdAt},
        {"url", pasteUrl(ctx, paste.id)},
        {"raw_url", rawUrl(ctx, paste.id)}
    });
    return Error();
}

Error ListPastesHandler(const Context& ctx, Response& resp) {
    if (!ctx.pasteService) {
        utils::GetLogger().Error("存储服务不可用");
        return Error::ErrNoStorage;
    }

    auto result = ctx.pasteService->List();
    if (!result.ok()) {
        utils::GetLogger().Error("列出粘贴失败",
            utils::LogContext().With("error", result.error().what()));
        return Error::ErrStorage.WithDetail(result.error().what());
    }

    json pastes = json::array();
    for (const auto& paste : result.value()) {
        pastes.push_back({
            {"id", paste.id},
            {"title", paste.title},
            {"created_at", paste.createdAt},
            {"url", pasteUrl(ctx, paste.id)}
        });
    }

    writeJSON(resp, json{{"pastes", pastes}});
    return Error();
}

Error ViewPasteHandler(const Context& ctx, Response& resp) {
    Paste paste;
    Error err = loadPaste(ctx, paste);
    if (err.Code() != 0) {
        if (err.Code() == Error::ErrPasteNotFound.Code()) {
            writeText(resp, CONTENT_TYPE_TEXT, NOT_FOUND_TEXT);
        }
        return err;
    }

    writeText(resp, CONTENT_TYPE_HTML, RenderPastePage(paste, pasteUrl(ctx, paste.id)));
    return Error();
}

Error RawPasteHandler(const Context& ctx, Response& resp) {
    Paste paste;
    Error err = loadPaste(ctx, paste);
    if (err.Code() != 0) {
        if (err.Code() == Error::ErrPasteNotFound.Code()) {
            writeText(resp, CONTENT_TYPE_TEXT, NOT_FOUND_TEXT);
        }
        return err;
    }

    writeText(resp, CONTENT_TYPE_TEXT, paste.content);
    return Error();
}

Error NotFoundHandler(const Context& ctx, Response& resp) {
    writeJSONError(resp, Error::ErrRouteNotFound.Detail());
    return Error::ErrRouteNotFound;
}

} // namespace handlers
} // namespace server
} // namespace pastebin
