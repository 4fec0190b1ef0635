#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sf::util {

enum class CookieFormat { Netscape, Header };

struct CookieFile {
    CookieFormat format = CookieFormat::Header;
    std::vector<std::string> lines;    // non-blank, non-comment

    // "a=1; b=2" form usable as a Cookie header regardless of the on-disk format
    [[nodiscard]] std::string toHeader() const;
};

// nullopt when the file is missing, unreadable or carries no usable line
std::optional<CookieFile> readCookieFile(const std::filesystem::path& path);

}
