#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sf::runtime {

struct JobLine {
    std::string owner;
    std::string reference;
    std::string destination;    // empty = configured default
};

// "owner<TAB>reference[<TAB>destination]". Blank lines and '#' comments yield nullopt.
// Throws std::invalid_argument on a malformed line.
std::optional<JobLine> parseJobLine(std::string_view line);

// Reads job lines from a file descriptor until EOF or until stop is set
class JobFeed {
public:
    using SubmitFn = std::function<void(const JobLine& job)>;

    JobFeed(int fd, SubmitFn onJob);

    // Returns once the input is exhausted or stop becomes true. Malformed lines are reported and skipped.
    void run(const std::atomic<bool>& stop);

    [[nodiscard]] bool exhausted() const { return exhausted_.load(); }

private:
    void dispatch(std::string_view line) const;

    int fd_;
    SubmitFn onJob_;
    std::atomic<bool> exhausted_{false};
};

}
