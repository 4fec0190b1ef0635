#include "backend/upload/CloudUploader.hpp"
#include "transfer/errors.hpp"

using namespace sf::backend;
using namespace sf::transfer;

CloudUploader::CloudUploader(RcloneOptions opts, std::string defaultFolder, const bool useServiceAccounts)
    : opts_(std::move(opts)), defaultFolder_(std::move(defaultFolder)), useServiceAccounts_(useServiceAccounts) {}

std::optional<sf::auth::model::CredentialKind> CloudUploader::credentialKind() const {
    if (!useServiceAccounts_) return std::nullopt;
    return auth::model::CredentialKind::ServiceAccount;
}

std::vector<std::string> CloudUploader::buildArgv(const UploadJob& job) const {
    const auto folder = job.destination.target.empty() ? defaultFolder_ : job.destination.target;

    auto argv = rcloneBaseArgs(opts_);
    argv.emplace_back("copy");
    argv.push_back(job.input.string());
    argv.push_back(copyTarget(job.input, driveRemote(opts_, folder, job.credential)));
    appendCredentialArgs(argv, job.credential);
    return argv;
}

std::shared_ptr<Transfer> CloudUploader::start(const UploadJob& job) {
    const auto account = job.credential ? job.credential->account : std::string{};
    auto t = std::make_shared<RcloneTransfer>("CloudUpload:" + job.taskId, buildArgv(job), job.input, account);
    t->launch();
    return t;
}
