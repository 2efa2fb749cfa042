#pragma once

#include <string>
#include <string_view>

namespace archivefile {

enum class DecodePolicy {
    STRICT,           // throw TextDecodeError
    IGNORE,           // drop undecodable bytes
    REPLACE,          // emit U+FFFD
    BACKSLASH_REPLACE // emit \xNN
};

// Throws TextDecodeError for unknown names
DecodePolicy parse_decode_policy(const std::string& name, const std::string& encoding);

// Decodes bytes in the given encoding to UTF-8. Encoding names follow the usual
// aliases ("utf-8", "utf-8-sig", "latin-1", "ascii", "cp1252", ...); anything else is
// handed to iconv as-is. errors is one of "strict", "ignore", "replace", "backslashreplace".
std::string decode_text(std::string_view data, const std::string& encoding = "utf-8", const std::string& errors = "strict");

} // namespace archivefile
