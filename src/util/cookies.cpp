#include "util/cookies.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>

namespace sf::util {

std::string CookieFile::toHeader() const {
    if (format == CookieFormat::Header) return boost::algorithm::join(lines, " ");

    // domain, include-subdomains, path, secure, expiry, name, value
    std::vector<std::string> pairs;
    for (const auto& line : lines) {
        std::vector<std::string> fields;
        boost::algorithm::split(fields, line, boost::is_any_of("\t"));
        if (fields.size() < 7) continue;
        pairs.push_back(fields[5] + "=" + fields[6]);
    }
    return boost::algorithm::join(pairs, "; ");
}

std::optional<CookieFile> readCookieFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream in(path);
    if (!in) return std::nullopt;

    CookieFile cf;
    bool tabbed = false;

    for (std::string line; std::getline(in, line);) {
        boost::algorithm::trim(line);
        // "#HttpOnly_" prefixes are real Netscape entries, not comments
        if (boost::algorithm::starts_with(line, "#HttpOnly_")) line.erase(0, 10);
        else if (line.empty() || line.front() == '#') continue;
        if (line.find('\t') != std::string::npos) tabbed = true;
        cf.lines.push_back(std::move(line));
    }

    if (cf.lines.empty()) return std::nullopt;
    cf.format = tabbed ? CookieFormat::Netscape : CookieFormat::Header;
    return cf;
}

}
