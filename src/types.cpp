#include "pastebin/types.hpp"

namespace pastebin {

std::string DefaultTitle(const std::string& id) {
    return "Paste " + id;
}

void to_json(nlohmann::json& j, const Paste& paste) {
    j = nlohmann::json{
        {PASTE_FIELD_ID, paste.id},
        {PASTE_FIELD_CONTENT, paste.content},
        {PASTE_FIELD_TITLE, paste.title},
        {PASTE_FIELD_DESCRIPTION, paste.description},
        {PASTE_FIELD_CREATED_AT, paste.createdAt}
    };
}

void from_json(const nlohmann::json& j, Paste& paste) {
    // at() 在缺字段时抛出 out_of_range, get_to 在类型不符时抛出 type_error
    j.at(PASTE_FIELD_ID).get_to(paste.id);
    j.at(PASTE_FIELD_CONTENT).get_to(paste.content);
    j.at(PASTE_FIELD_TITLE).get_to(paste.title);
    j.at(PASTE_FIELD_DESCRIPTION).get_to(paste.description);
    j.at(PASTE_FIELD_CREATED_AT).get_to(paste.createdAt);
}

Result<Paste> ParsePaste(const std::string& text) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Error::Corrupt("paste document is not a JSON object");
        }
        return j.get<Paste>();
    } catch (const nlohmann::json::exception& e) {
        return Error::Corrupt(std::string("malformed paste document: ") + e.what());
    }
}

} // namespace pastebin
