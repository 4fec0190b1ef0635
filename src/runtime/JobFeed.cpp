#include "runtime/JobFeed.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string.hpp>

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

using namespace sf::runtime;

std::optional<JobLine> sf::runtime::parseJobLine(std::string_view line) {
    std::string trimmed(line);
    boost::algorithm::trim(trimmed);
    if (trimmed.empty() || trimmed.front() == '#') return std::nullopt;

    std::vector<std::string> fields;
    boost::algorithm::split(fields, trimmed, boost::is_any_of("\t"));
    for (auto& f : fields) boost::algorithm::trim(f);

    if (fields.size() < 2 || fields.size() > 3)
        throw std::invalid_argument("Expected owner<TAB>reference[<TAB>destination], got " +
                                    std::to_string(fields.size()) + " fields");
    if (fields[0].empty()) throw std::invalid_argument("Missing owner");

    JobLine job{fields[0], fields[1], fields.size() == 3 ? fields[2] : std::string{}};
    return job;
}

JobFeed::JobFeed(const int fd, SubmitFn onJob)
    : fd_(fd), onJob_(std::move(onJob)) {
    if (!onJob_) throw std::invalid_argument("JobFeed requires a submit callback");
}

void JobFeed::dispatch(const std::string_view line) const {
    try {
        if (const auto job = parseJobLine(line)) onJob_(*job);
    } catch (const std::invalid_argument& e) {
        log::Registry::skyferry()->warn("[JobFeed] Skipping line: {}", e.what());
    }
}

void JobFeed::run(const std::atomic<bool>& stop) {
    std::string buffer;
    char chunk[4096];

    while (!stop.load()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            log::Registry::skyferry()->error("[JobFeed] poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) continue;

        const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            log::Registry::skyferry()->error("[JobFeed] read failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) break;

        buffer.append(chunk, static_cast<size_t>(n));
        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            dispatch(std::string_view(buffer).substr(0, pos));
            buffer.erase(0, pos + 1);
        }
    }

    if (!stop.load() && !buffer.empty()) dispatch(buffer);
    exhausted_.store(true);
}
