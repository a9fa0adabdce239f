#pragma once

#include <string>

namespace pastebin {
namespace utils {

// 生成8位十六进制粘贴ID (随机UUID的前8个字符)
// 不检查是否与已有记录冲突
std::string GeneratePasteID();

// 当前本地时间的ISO-8601表示, 精确到微秒, 如 2026-10-17T21:16:03.123456
std::string CurrentTimeISO8601();

// HTML转义 & < > " '
std::string EscapeHTML(const std::string& text);

// 按UTF-8码点计算长度
size_t Utf8Length(const std::string& text);

// 内容摘要: 超过 maxChars 个字符时截断并追加 "...", 同时把 \n \r 换成空格;
// 否则原样返回
std::string Excerpt(const std::string& content, size_t maxChars = 150);

// 去掉末尾的 '/'
std::string TrimTrailingSlash(const std::string& url);

} // namespace utils
} // namespace pastebin
