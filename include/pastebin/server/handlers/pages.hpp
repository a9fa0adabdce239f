#pragma once

#include <map>
#include <string>
#include "pastebin/types.hpp"

namespace pastebin {
namespace server {
namespace handlers {

// 站点名, 用于 og:site_name
const std::string SITE_NAME = "Simple Paste";

// 把模板中的 {{ key }} 替换为转义后的值, 未知键替换为空
std::string RenderTemplate(const std::string& tpl, const std::map<std::string, std::string>& values);

// 粘贴的HTML页面, description 为空时由内容摘要代替
std::string RenderPastePage(const Paste& paste, const std::string& pasteUrl);

// 首页创建表单
std::string RenderHomePage();

// HTML页面使用的描述: 存储的描述, 或内容摘要
std::string PageDescription(const Paste& paste);

} // namespace handlers
} // namespace server
} // namespace pastebin
