#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>
#include "pastebin/utils/tools.hpp"

using namespace pastebin::utils;

TEST_CASE("粘贴ID生成", "[tools]") {
    SECTION("ID为8位小写十六进制") {
        std::string id = GeneratePasteID();
        REQUIRE(id.size() == 8);
        for (char c : id) {
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            REQUIRE(hex);
        }
    }

    SECTION("连续生成的ID互不相同") {
        std::set<std::string> ids;
        for (int i = 0; i < 200; ++i) {
            ids.insert(GeneratePasteID());
        }
        REQUIRE(ids.size() == 200);
    }
}

TEST_CASE("ISO-8601时间格式", "[tools]") {
    std::string ts = CurrentTimeISO8601();
    // YYYY-MM-DDTHH:MM:SS.ffffff
    REQUIRE(ts.size() == 26);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[7] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts[13] == ':');
    REQUIRE(ts[16] == ':');
    REQUIRE(ts[19] == '.');
}

TEST_CASE("内容摘要", "[tools]") {
    SECTION("短内容原样返回, 包括换行") {
        REQUIRE(Excerpt("hello\nworld") == "hello\nworld");
    }

    SECTION("恰好150个字符不截断") {
        std::string content(150, 'a');
        REQUIRE(Excerpt(content) == content);
    }

    SECTION("超过150个字符截断并去掉换行") {
        std::string content = std::string(100, 'a') + "\r\n" + std::string(100, 'b');
        std::string excerpt = Excerpt(content);

        std::string expected = std::string(100, 'a') + "  " + std::string(48, 'b') + "...";
        REQUIRE(excerpt == expected);
        REQUIRE(excerpt.find('\n') == std::string::npos);
        REQUIRE(excerpt.find('\r') == std::string::npos);
    }

    SECTION("按UTF-8字符计数, 不截断多字节字符") {
        std::string content;
        for (int i = 0; i < 151; ++i) {
            content += "\xE4\xBD\xA0"; // 你
        }
        std::string excerpt = Excerpt(content);
        REQUIRE(Utf8Length(excerpt) == 153);
        REQUIRE(excerpt.size() == 150 * 3 + 3);
    }
}

TEST_CASE("HTML转义", "[tools]") {
    REQUIRE(EscapeHTML("<a href=\"x\">'&'</a>") ==
            "&lt;a href=&#34;x&#34;&gt;&#39;&amp;&#39;&lt;/a&gt;");
    REQUIRE(EscapeHTML("plain") == "plain");
}

TEST_CASE("去掉末尾斜杠", "[tools]") {
    REQUIRE(TrimTrailingSlash("http://localhost:5000/") == "http://localhost:5000");
    REQUIRE(TrimTrailingSlash("http://x//") == "http://x");
    REQUIRE(TrimTrailingSlash("http://x") == "http://x");
}
