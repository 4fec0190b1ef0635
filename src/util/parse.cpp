#include "util/parse.hpp"

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sf::util {

std::string url_decode(const std::string& value) {
    std::ostringstream result;
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%' && i + 2 < value.length()) {
            if (int hex = 0; std::istringstream(value.substr(i + 1, 2)) >> std::hex >> hex) {
                result << static_cast<char>(hex);
                i += 2;
            } else throw std::runtime_error("Invalid percent-encoding in URL");
        }
        else if (value[i] == '+') result << ' ';
        else result << value[i];
    }
    return result.str();
}

std::optional<double> parseLeadingDouble(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    if (s.empty()) return std::nullopt;

    const std::string buf(s);
    char* end = nullptr;
    const double v = std::strtod(buf.c_str(), &end);
    if (end == buf.c_str()) return std::nullopt;
    return v;
}

std::optional<uint64_t> parseSize(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    if (!s.empty() && s.front() == '~') s.remove_prefix(1);

    size_t i = 0;
    while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) ++i;
    if (i == 0) return std::nullopt;

    const auto num = parseLeadingDouble(s.substr(0, i));
    if (!num || *num < 0) return std::nullopt;

    const auto unit = boost::algorithm::to_lower_copy(std::string(s.substr(i)));

    double mult = 1;
    if (unit.empty() || unit == "b" || unit == "bytes") mult = 1;
    else if (unit == "kib" || unit == "kb" || unit == "k") mult = 1024.0;
    else if (unit == "mib" || unit == "mb" || unit == "m") mult = 1024.0 * 1024;
    else if (unit == "gib" || unit == "gb" || unit == "g") mult = 1024.0 * 1024 * 1024;
    else if (unit == "tib" || unit == "tb" || unit == "t") mult = 1024.0 * 1024 * 1024 * 1024;
    else return std::nullopt;

    return static_cast<uint64_t>(*num * mult);
}

std::optional<std::chrono::seconds> parseUnitDuration(std::string_view s) {
    if (s.empty()) return std::nullopt;

    long total = 0;
    long cur = 0;
    bool haveDigits = false;
    bool haveUnit = false;

    for (const char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            cur = cur * 10 + (c - '0');
            haveDigits = true;
            continue;
        }
        if (!haveDigits) return std::nullopt;
        switch (c) {
            case 'd': total += cur * 86400; break;
            case 'h': total += cur * 3600; break;
            case 'm': total += cur * 60; break;
            case 's': total += cur; break;
            default: return std::nullopt;
        }
        cur = 0;
        haveDigits = false;
        haveUnit = true;
    }

    if (haveDigits) return std::nullopt;
    if (!haveUnit) return std::nullopt;
    return std::chrono::seconds(total);
}

std::optional<std::chrono::seconds> parseClockDuration(std::string_view s) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, s, boost::is_any_of(":"));
    if (parts.empty() || parts.size() > 3) return std::nullopt;

    long total = 0;
    for (const auto& p : parts) {
        if (p.empty()) return std::nullopt;
        long v = 0;
        const auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), v);
        if (ec != std::errc() || ptr != p.data() + p.size()) return std::nullopt;
        total = total * 60 + v;
    }
    return std::chrono::seconds(total);
}

}
