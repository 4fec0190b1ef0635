#include "util/sanitize.hpp"

#include <boost/algorithm/string.hpp>

#include <array>
#include <cctype>
#include <filesystem>

namespace sf::util {

static constexpr std::array<std::string_view, 4> kForbiddenSchemes{
    "javascript:", "data:", "vbscript:", "file:"
};

static constexpr std::array<std::string_view, 4> kAllowedSchemes{
    "http://", "https://", "ftp://", "magnet:"
};

static bool isControl(const unsigned char c) {
    return c < 0x20 || (c >= 0x7f && c <= 0x9f);
}

std::string sanitizeFilename(const std::string_view filename, const size_t maxLength) {
    std::string out(filename);

    boost::algorithm::replace_all(out, "/", "_");
    boost::algorithm::replace_all(out, "\\", "_");
    boost::algorithm::erase_all(out, "..");

    std::string cleaned;
    cleaned.reserve(out.size());
    bool lastSpace = false;
    for (const char ch : out) {
        const auto c = static_cast<unsigned char>(ch);
        if (isControl(c)) continue;
        if (std::isspace(c)) {
            if (!lastSpace) cleaned.push_back(' ');
            lastSpace = true;
            continue;
        }
        lastSpace = false;
        cleaned.push_back(ch);
    }

    boost::algorithm::trim_if(cleaned, boost::is_any_of(". "));

    if (cleaned.size() > maxLength) {
        const std::filesystem::path p(cleaned);
        const auto ext = p.extension().string();
        if (!ext.empty() && ext.size() < maxLength)
            cleaned = cleaned.substr(0, maxLength - ext.size()) + ext;
        else cleaned.resize(maxLength);
    }

    if (cleaned.empty()) return "unnamed_file";
    return cleaned;
}

bool hasForbiddenScheme(const std::string_view url) {
    auto lower = boost::algorithm::to_lower_copy(std::string(url));
    boost::algorithm::trim(lower);
    for (const auto scheme : kForbiddenSchemes)
        if (boost::algorithm::starts_with(lower, scheme)) return true;
    return false;
}

bool isAllowedUrl(const std::string_view url) {
    if (url.empty()) return false;
    const auto lower = boost::algorithm::to_lower_copy(std::string(url));

    bool allowed = false;
    for (const auto scheme : kAllowedSchemes)
        if (boost::algorithm::starts_with(lower, scheme)) allowed = true;
    if (!allowed) return false;

    for (const auto pattern : {"file://", "javascript:", "data:", "vbscript:"})
        if (lower.find(pattern) != std::string::npos) return false;

    return true;
}

std::string hostOf(const std::string_view url) {
    auto lower = boost::algorithm::to_lower_copy(std::string(url));

    const auto schemeEnd = lower.find("://");
    if (schemeEnd == std::string::npos) return {};
    auto host = lower.substr(schemeEnd + 3);

    if (const auto end = host.find_first_of("/?#"); end != std::string::npos) host.resize(end);
    if (const auto at = host.rfind('@'); at != std::string::npos) host.erase(0, at + 1);
    if (const auto colon = host.find(':'); colon != std::string::npos) host.resize(colon);
    if (boost::algorithm::starts_with(host, "www.")) host.erase(0, 4);
    if (boost::algorithm::starts_with(host, "m.")) host.erase(0, 2);

    return host;
}

}
