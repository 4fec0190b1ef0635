#include "util/humanize.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <utility>

namespace sf::util {

std::string readableSize(const uint64_t bytes) {
    static constexpr std::array<const char*, 6> units{"B", "KB", "MB", "GB", "TB", "PB"};
    if (bytes == 0) return "0B";

    auto size = static_cast<double>(bytes);
    size_t idx = 0;
    while (size >= 1024 && idx < units.size() - 1) {
        size /= 1024;
        ++idx;
    }
    return fmt::format("{:.2f}{}", size, units[idx]);
}

std::string readableTime(const std::chrono::seconds s) {
    static constexpr std::array<std::pair<char, long>, 4> periods{{
        {'d', 86400}, {'h', 3600}, {'m', 60}, {'s', 1}
    }};

    long remaining = s.count();
    if (remaining <= 0) return "0s";

    std::string out;
    for (const auto& [name, secs] : periods) {
        if (remaining < secs) continue;
        out += fmt::format("{}{}", remaining / secs, name);
        remaining %= secs;
    }
    return out;
}

std::string readableRate(const double bytesPerSecond) {
    if (bytesPerSecond <= 0) return "0B/s";
    return readableSize(static_cast<uint64_t>(bytesPerSecond)) + "/s";
}

std::string progressBar(const double percent, const size_t width) {
    const auto p = std::clamp(percent, 0.0, 100.0);
    const auto full = static_cast<size_t>(p / 100.0 * static_cast<double>(width));

    std::string bar = "[";
    bar.append(full, '#');
    if (full < width) {
        bar.push_back(p > 0 ? '>' : '-');
        bar.append(width - full - 1, '-');
    }
    bar.push_back(']');
    return bar;
}

}
