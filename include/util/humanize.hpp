#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sf::util {

// 0 -> "0B", 1536 -> "1.50KB"
std::string readableSize(uint64_t bytes);

// 3725s -> "1h2m5s", 0 -> "0s"
std::string readableTime(std::chrono::seconds s);

std::string readableRate(double bytesPerSecond);

// 42.0, 10 -> "[####>-----]"
std::string progressBar(double percent, size_t width = 20);

}
