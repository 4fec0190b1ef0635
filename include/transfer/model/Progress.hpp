#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace sf::transfer::model {

struct Progress {
    uint64_t transferred = 0;
    std::optional<uint64_t> total;
    double rate = 0;                        // bytes/s
    std::optional<std::chrono::seconds> eta;

    // transferred never exceeds a known total
    void clamp() {
        if (total && transferred > *total) transferred = *total;
    }

    [[nodiscard]] std::optional<double> percent() const {
        if (!total || *total == 0) return std::nullopt;
        return 100.0 * static_cast<double>(transferred) / static_cast<double>(*total);
    }
};

void to_json(nlohmann::json& j, const Progress& p);

}
