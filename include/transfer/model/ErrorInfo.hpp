#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sf::transfer::model {

enum class ErrorKind { Transient, Auth, QuotaExceeded, Fatal, Unsupported, CancelledByUser };

struct ErrorInfo {
    ErrorKind kind{ErrorKind::Fatal};
    std::string message;
    std::string account;    // service account that hit its quota, if any
    std::chrono::seconds retryAfter{0};    // server-requested minimum wait before a retry
};

std::string to_string(ErrorKind k);

void to_json(nlohmann::json& j, const ErrorInfo& e);

}
