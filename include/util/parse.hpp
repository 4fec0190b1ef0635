#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sf::util {

std::string url_decode(const std::string& value);

// "33.2MiB", "400.0KiB", "1.5GB", "512B" -> bytes
std::optional<uint64_t> parseSize(std::string_view s);

// "4m51s", "1h2m", "35s" -> seconds
std::optional<std::chrono::seconds> parseUnitDuration(std::string_view s);

// "00:35", "1:02:03" -> seconds
std::optional<std::chrono::seconds> parseClockDuration(std::string_view s);

// Reads a numeric prefix like "12.3" out of "12.3%"
std::optional<double> parseLeadingDouble(std::string_view s);

}
