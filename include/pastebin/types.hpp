#pragma once

#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace pastebin {

// 错误类别
enum class ErrorKind {
    None,
    NotFound,   // 记录不存在
    Corrupt,    // 记录存在但无法解析
    IO,         // 文件系统读写失败
    Invalid     // 参数非法
};

// 错误类型
class Error {
public:
    explicit Error(const std::string& message, ErrorKind kind = ErrorKind::IO)
        : message_(message), kind_(kind), isError_(true) {}
    Error() : kind_(ErrorKind::None), isError_(false) {}

    static Error NotFound(const std::string& message) { return Error(message, ErrorKind::NotFound); }
    static Error Corrupt(const std::string& message) { return Error(message, ErrorKind::Corrupt); }
    static Error Invalid(const std::string& message) { return Error(message, ErrorKind::Invalid); }

    const std::string& what() const { return message_; }
    bool ok() const { return !isError_; }
    bool hasError() const { return isError_; }
    ErrorKind kind() const { return kind_; }

    // 不存在与损坏的记录对外都视为未找到
    bool IsNotFound() const {
        return kind_ == ErrorKind::NotFound || kind_ == ErrorKind::Corrupt;
    }

private:
    std::string message_;
    ErrorKind kind_;
    bool isError_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

// 粘贴记录
struct Paste {
    std::string id;
    std::string content;
    std::string title;
    std::string description;
    std::string createdAt;  // ISO-8601 本地时间, 创建后不再变化
};

// 持久化字段名
const std::string PASTE_FIELD_ID          = "id";
const std::string PASTE_FIELD_CONTENT     = "content";
const std::string PASTE_FIELD_TITLE       = "title";
const std::string PASTE_FIELD_DESCRIPTION = "description";
const std::string PASTE_FIELD_CREATED_AT  = "created_at";

// 粘贴ID长度
const size_t PASTE_ID_LENGTH = 8;

// 默认标题 "Paste {id}"
std::string DefaultTitle(const std::string& id);

// nlohmann::json 的 ADL 转换
void to_json(nlohmann::json& j, const Paste& paste);
void from_json(const nlohmann::json& j, Paste& paste);

// 从JSON文本解析粘贴记录, 缺字段或类型不符时返回 Corrupt
Result<Paste> ParsePaste(const std::string& text);

} // namespace pastebin
