#include "backend/upload/RemoteSyncUploader.hpp"
#include "transfer/errors.hpp"

using namespace sf::backend;
using namespace sf::transfer;

RemoteSyncUploader::RemoteSyncUploader(RcloneOptions opts)
    : opts_(std::move(opts)) {}

std::vector<std::string> RemoteSyncUploader::buildArgv(const UploadJob& job) const {
    if (job.destination.target.find(':') == std::string::npos)
        throw FatalTransferError("Remote target must be <remote>:<path>: " + job.destination.target);

    auto argv = rcloneBaseArgs(opts_);
    argv.emplace_back("copy");
    argv.push_back(job.input.string());
    argv.push_back(copyTarget(job.input, job.destination.target));
    return argv;
}

std::shared_ptr<Transfer> RemoteSyncUploader::start(const UploadJob& job) {
    auto t = std::make_shared<RcloneTransfer>("RemoteSync:" + job.taskId, buildArgv(job), job.input, std::string{});
    t->launch();
    return t;
}
