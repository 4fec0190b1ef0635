#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace sf::auth {

class ServiceAccountPool;

class QuotaResetService final : public concurrency::AsyncService {
public:
    QuotaResetService(std::shared_ptr<ServiceAccountPool> pool, std::chrono::hours interval);
    ~QuotaResetService() override;

protected:
    void runLoop() override;

private:
    std::shared_ptr<ServiceAccountPool> pool_;
    std::chrono::hours interval_;
};

}
