#include "backend/download/CloudCloneDownloader.hpp"
#include "transfer/errors.hpp"

using namespace sf::backend;
using namespace sf::transfer;

CloudCloneDownloader::CloudCloneDownloader(RcloneOptions opts, const bool useServiceAccounts)
    : opts_(std::move(opts)), useServiceAccounts_(useServiceAccounts) {}

std::optional<sf::auth::model::CredentialKind> CloudCloneDownloader::credentialKind() const {
    if (!useServiceAccounts_) return std::nullopt;
    return auth::model::CredentialKind::ServiceAccount;
}

std::vector<std::string> CloudCloneDownloader::buildArgv(const DownloadJob& job) const {
    const auto link = parseDriveLink(job.reference);
    if (!link) throw FatalTransferError("No file or folder id in drive link: " + job.reference);

    auto argv = rcloneBaseArgs(opts_);
    if (link->folder) {
        argv.emplace_back("copy");
        argv.push_back(driveRemote(opts_, link->id, job.credential));
        argv.push_back(job.workDir.string());
    } else {
        argv.emplace_back("backend");
        argv.emplace_back("copyid");
        argv.push_back(driveRemote(opts_, {}, job.credential));
        argv.push_back(link->id);
        argv.push_back(job.workDir.string() + "/");
    }
    appendCredentialArgs(argv, job.credential);
    return argv;
}

std::shared_ptr<Transfer> CloudCloneDownloader::start(const DownloadJob& job) {
    const auto account = job.credential ? job.credential->account : std::string{};
    auto t = std::make_shared<RcloneTransfer>("CloudClone:" + job.taskId, buildArgv(job), job.workDir, account);
    t->launch();
    return t;
}
