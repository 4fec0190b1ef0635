#pragma once

namespace sf::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
