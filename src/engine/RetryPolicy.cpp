#include "engine/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

using namespace sf::engine;

std::chrono::milliseconds RetryPolicy::backoff(const unsigned int attempt) const {
    if (attempt == 0) return std::chrono::milliseconds(0);

    const double factor = std::pow(std::max(multiplier, 1.0), static_cast<double>(attempt - 1));
    const double ms = static_cast<double>(base.count()) * factor;
    if (!std::isfinite(ms) || ms >= static_cast<double>(max.count())) return max;
    return std::chrono::milliseconds(static_cast<long>(ms));
}
