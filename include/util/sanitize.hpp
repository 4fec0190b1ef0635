#pragma once

#include <string>
#include <string_view>

namespace sf::util {

// Strips path separators, parent refs, control chars; collapses whitespace; caps length keeping the extension.
std::string sanitizeFilename(std::string_view filename, size_t maxLength = 255);

// javascript:, data:, vbscript:, file:
bool hasForbiddenScheme(std::string_view url);

// http(s)://, ftp://, magnet: and no forbidden scheme anywhere in the string
bool isAllowedUrl(std::string_view url);

// "https://www.YouTube.com:443/watch?v=x" -> "youtube.com"
std::string hostOf(std::string_view url);

}
