#include "pastebin/utils/tools.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <uuid/uuid.h>
#include "pastebin/types.hpp"

namespace pastebin {
namespace utils {

std::string GeneratePasteID() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr, PASTE_ID_LENGTH);
}

std::string CurrentTimeISO8601() {
    auto now = std::chrono::system_clock::now();
    auto nowTime = std::chrono::system_clock::to_time_t(now);
    auto nowUs = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;

    std::tm nowTm;
    localtime_r(&nowTime, &nowTm);

    std::stringstream ss;
    ss << std::put_time(&nowTm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(6) << nowUs.count();
    return ss.str();
}

std::string EscapeHTML(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&#34;"; break;
            case '\'': result += "&#39;"; break;
            default:   result += c; break;
        }
    }

    return result;
}

size_t Utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        // 续字节 10xxxxxx 不计数
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string Excerpt(const std::string& content, size_t maxChars) {
    if (Utf8Length(content) <= maxChars) {
        return content;
    }

    // 找到第 maxChars 个码点的起始字节
    size_t chars = 0;
    size_t cut = 0;
    for (; cut < content.size(); ++cut) {
        unsigned char c = static_cast<unsigned char>(content[cut]);
        if ((c & 0xC0) != 0x80) {
            if (chars == maxChars) {
                break;
            }
            ++chars;
        }
    }

    std::string excerpt = content.substr(0, cut) + "...";
    for (char& c : excerpt) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return excerpt;
}

std::string TrimTrailingSlash(const std::string& url) {
    std::string result = url;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

} // namespace utils
} // namespace pastebin
