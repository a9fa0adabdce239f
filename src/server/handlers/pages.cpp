#include "pastebin/server/handlers/pages.hpp"
#include "pastebin/utils/tools.hpp"

namespace pastebin {
namespace server {
namespace handlers {

namespace {

const char* PASTE_PAGE_TEMPLATE = R"HTML(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <title>{{ title }}</title>

    <!-- Open Graph -->
    <meta property="og:title" content="{{ title }}" />
    <meta property="og:description" content="{{ description }}" />
    <meta property="og:url" content="{{ paste_url }}" />
    <meta property="og:type" content="article" />
    <meta property="og:site_name" content="{{ site_name }}" />

    <!-- Twitter Card -->
    <meta name="twitter:card" content="summary" />
    <meta name="twitter:title" content="{{ title }}" />
    <meta name="twitter:description" content="{{ description }}" />

    <meta name="description" content="{{ description }}" />
    <meta name="author" content="Paste Link" />

    <style>
        body { font-family: Arial, sans-serif; margin: 40px; }
        .paste-container { max-width: 800px; margin: 0 auto; }
        .paste-content {
            background: #f5f5f5;
            padding: 20px;
            border-radius: 5px;
            white-space: pre-wrap;
            font-family: monospace;
        }
    </style>
</head>
<body>
    <div class="paste-container">
        <h1>{{ title }}</h1>
        <div class="paste-meta">
            Created: {{ created_at }}<br>
            Paste ID: {{ paste_id }}
        </div>
        <div class="paste-content">{{ content }}</div>
    </div>
</body>
</html>
)HTML";

const char* HOME_PAGE = R"HTML(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <title>Simple Pastebin</title>
    <style>
        body { font-family: Arial, sans-serif; margin: 40px; }
        .container { max-width: 600px; margin: 0 auto; }
        textarea { width: 100%; height: 200px; margin: 10px 0; }
        input[type="text"] { width: 100%; margin: 10px 0; padding: 5px; }
        button { background: #007bff; color: white; padding: 10px 20px; border: none; border-radius: 3px; cursor: pointer; }
    </style>
</head>
<body>
    <div class="container">
        <h1>Simple Pastebin</h1>
        <form action="/api/paste" method="post" enctype="application/x-www-form-urlencoded">
            <input type="text" name="title" placeholder="Paste title (optional)">
            <input type="text" name="description" placeholder="Paste description (optional)">
            <textarea name="content" placeholder="Enter your content here..." required></textarea>
            <button type="submit">Create Paste</button>
        </form>
    </div>
</body>
</html>
)HTML";

} // namespace

std::string RenderTemplate(const std::string& tpl, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(tpl.size());

    size_t pos = 0;
    while (pos < tpl.size()) {
        size_t open = tpl.find("{{", pos);
        if (open == std::string::npos) {
            out.append(tpl, pos, std::string::npos);
            break;
        }
        size_t close = tpl.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(tpl, pos, std::string::npos);
            break;
        }

        out.append(tpl, pos, open - pos);

        std::string key = tpl.substr(open + 2, close - open - 2);
        size_t first = key.find_first_not_of(' ');
        size_t last = key.find_last_not_of(' ');
        key = first == std::string::npos ? "" : key.substr(first, last - first + 1);

        auto it = values.find(key);
        if (it != values.end()) {
            out += utils::EscapeHTML(it->second);
        }
        pos = close + 2;
    }

    return out;
}

std::string PageDescription(const Paste& paste) {
    if (!paste.description.empty()) {
        return paste.description;
    }
    return utils::Excerpt(paste.content);
}

std::string RenderPastePage(const Paste& paste, const std::string& pasteUrl) {
    return RenderTemplate(PASTE_PAGE_TEMPLATE, {
        {"title", paste.title},
        {"description", PageDescription(paste)},
        {"paste_url", pasteUrl},
        {"site_name", SITE_NAME},
        {"created_at", paste.createdAt},
        {"paste_id", paste.id},
        {"content", paste.content}
    });
}

std::string RenderHomePage() {
    return HOME_PAGE;
}

} // namespace handlers
} // namespace server
} // namespace pastebin
