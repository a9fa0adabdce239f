#include "pastebin/server/errors.hpp"

namespace pastebin {
namespace server {

const Error Error::Success(0, "");
const Error Error::ErrPasteNotFound(1, "Paste not found");
const Error Error::ErrNoContent(2, "No content provided");
const Error Error::ErrMalformedJSON(3, "Malformed JSON body");
const Error Error::ErrNoStorage(4, "Storage not configured");
const Error Error::ErrStorage(5, "Storage failure");
const Error Error::ErrRouteNotFound(6, "Not found");
const Error Error::ErrUnknown(7, "Unknown error");

} // namespace server
} // namespace pastebin
