#include "pastebin/storage/store.hpp"

namespace pastebin {
namespace storage {

bool IsValidPasteID(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace storage
} // namespace pastebin
