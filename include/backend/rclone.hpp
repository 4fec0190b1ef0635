#pragma once

#include "auth/model/Credential.hpp"
#include "backend/ProcessTransfer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sf::backend {

struct RcloneOptions {
    std::string binary = "rclone";
    std::filesystem::path config;       // empty = rclone's default lookup
    std::string remote = "gdrive:";     // configured drive remote
};

// "... NOTICE:    1.234 MiB / 10.5 MiB, 12%, 1.2 MiB/s, ETA 8s"
std::optional<transfer::model::Progress> parseRcloneStats(const std::string& line);

// "rclone [--config X] --stats=1s --stats-one-line ..."
std::vector<std::string> rcloneBaseArgs(const RcloneOptions& opts);

// Drive remote for a folder root: ":drive,root_folder_id=ID:" with a service account,
// otherwise "<remote>,root_folder_id=ID:" on the configured remote
std::string driveRemote(const RcloneOptions& opts, const std::string& folderId,
                        const std::optional<auth::model::Credential>& credential);

// Directories keep their own name under the target; single files land directly in it
std::string copyTarget(const std::filesystem::path& input, std::string target);

void appendCredentialArgs(std::vector<std::string>& argv, const std::optional<auth::model::Credential>& credential);

// Extracts the file or folder id from a drive link; nullopt when the link carries none
struct DriveLink {
    std::string id;
    bool folder = false;
};
std::optional<DriveLink> parseDriveLink(const std::string& url);

class RcloneTransfer final : public ProcessTransfer {
public:
    RcloneTransfer(std::string name, std::vector<std::string> argv, std::filesystem::path output, std::string account);
    ~RcloneTransfer() override;

protected:
    void onLine(const std::string& line) override;
    void classifyExit(int exitCode, const std::deque<std::string>& tail) override;

private:
    std::string account_;
};

}
