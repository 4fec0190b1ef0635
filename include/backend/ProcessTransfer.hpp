#pragma once

#include "backend/ThreadedTransfer.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <string>
#include <sys/types.h>
#include <vector>

namespace sf::backend {

// Drives one external tool. stdout and stderr are merged and fed line by line to onLine().
// Cancel sends SIGTERM to the process group, then SIGKILL after the grace period; the child is always reaped.
// Pause maps to SIGSTOP/SIGCONT when the tool tolerates it.
class ProcessTransfer : public ThreadedTransfer {
public:
    static constexpr size_t TAIL_LINES = 30;

    ProcessTransfer(std::string name, std::vector<std::string> argv, bool pausable,
                    std::filesystem::path output,
                    std::chrono::milliseconds killGrace = std::chrono::seconds(5));

    [[nodiscard]] const std::vector<std::string>& argv() const { return argv_; }

protected:
    std::filesystem::path run() override;

    virtual void onLine(const std::string& line) { (void)line; }

    // Called for a non-zero exit that was not caused by cancel(). Throws the classified TransferError.
    virtual void classifyExit(int exitCode, const std::deque<std::string>& tail);

    // Joined tail, for error messages
    static std::string lastLines(const std::deque<std::string>& tail, size_t n = 3);

private:
    void feed(const char* data, size_t len);
    void emitLine();

    std::vector<std::string> argv_;
    std::filesystem::path output_;
    std::chrono::milliseconds killGrace_;

    std::string partial_;
    std::deque<std::string> tail_;
};

}
