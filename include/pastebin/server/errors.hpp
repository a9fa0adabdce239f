#pragma once

#include <string>
#include <utility>

namespace pastebin {
namespace server {

class Error {
public:
    Error() : code_(0), detail_("") {}
    Error(int code, std::string detail) : code_(code), detail_(std::move(detail)) {}

    int Code() const { return code_; }
    const std::string& Detail() const { return detail_; }

    Error WithDetail(const std::string& detail) const {
        return Error(code_, detail);
    }

    int HTTPStatusCode() const {
        switch (code_) {
            case 0: // NoError
                return 200;
            case 1: // ErrPasteNotFound
            case 6: // ErrRouteNotFound
                return 404;
            case 2: // ErrNoContent
            case 3: // ErrMalformedJSON
                return 400;
            case 4: // ErrNoStorage
            case 5: // ErrStorage
            case 7: // ErrUnknown
            default:
                return 500;
        }
    }

    static const Error Success;
    static const Error ErrPasteNotFound;
    static const Error ErrNoContent;
    static const Error ErrMalformedJSON;
    static const Error ErrNoStorage;
    static const Error ErrStorage;
    static const Error ErrRouteNotFound;
    static const Error ErrUnknown;

private:
    int code_;
    std::string detail_;
};

} // namespace server
} // namespace pastebin
