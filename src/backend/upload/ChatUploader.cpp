#include "backend/upload/ChatUploader.hpp"
#include "transfer/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::transfer::model;

namespace fs = std::filesystem;

std::vector<fs::path> sf::backend::splitFile(const fs::path& file, const uintmax_t maxPartBytes, const fs::path& outDir) {
    if (maxPartBytes == 0) throw std::invalid_argument("maxPartBytes must be > 0");

    const auto size = fs::file_size(file);
    if (size <= maxPartBytes) return {file};

    fs::create_directories(outDir);

    std::ifstream in(file, std::ios::binary);
    if (!in) throw FatalTransferError("Cannot open " + file.string() + " for splitting");

    std::vector<fs::path> parts;
    std::vector<char> buf(std::min<uintmax_t>(maxPartBytes, 1024 * 1024));
    uintmax_t remaining = size;

    for (unsigned int index = 1; remaining > 0; ++index) {
        const auto partPath = outDir / fmt::format("{}.{:03}", file.filename().string(), index);
        std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
        if (!out) throw FatalTransferError("Cannot create part " + partPath.string());

        uintmax_t partLeft = std::min(maxPartBytes, remaining);
        while (partLeft > 0) {
            const auto chunk = static_cast<std::streamsize>(std::min<uintmax_t>(partLeft, buf.size()));
            in.read(buf.data(), chunk);
            if (in.gcount() != chunk) throw FatalTransferError("Short read while splitting " + file.string());
            out.write(buf.data(), chunk);
            partLeft -= static_cast<uintmax_t>(chunk);
            remaining -= static_cast<uintmax_t>(chunk);
        }

        if (!out.flush()) throw FatalTransferError("Write failed for part " + partPath.string());
        parts.push_back(partPath);
    }

    return parts;
}

std::vector<fs::path> sf::backend::collectFiles(const fs::path& input) {
    std::vector<fs::path> files;
    if (fs::is_regular_file(input)) return {input};
    if (!fs::is_directory(input)) return files;

    for (const auto& entry : fs::recursive_directory_iterator(input))
        if (entry.is_regular_file()) files.push_back(entry.path());

    std::ranges::sort(files);
    return files;
}

ChatTransfer::ChatTransfer(UploadJob job, std::shared_ptr<ChatTransport> transport, const uintmax_t maxPartBytes)
    : ThreadedTransfer("ChatTransfer:" + job.taskId, false),
      job_(std::move(job)), transport_(std::move(transport)), maxPartBytes_(maxPartBytes) {}

ChatTransfer::~ChatTransfer() {
    cancel();
    wait();
}

fs::path ChatTransfer::run() {
    // parts go next to the input so the task's workspace cleanup removes them
    const auto partsDir = (fs::is_directory(job_.input) ? job_.input : job_.input.parent_path()) / ".parts";

    auto files = collectFiles(job_.input);
    const auto partsPrefix = partsDir.string() + "/";
    std::erase_if(files, [&](const fs::path& f) { return f.string().starts_with(partsPrefix); });
    if (files.empty()) throw FatalTransferError("Nothing to upload in " + job_.input.string());

    uint64_t total = 0;
    for (const auto& f : files) total += fs::file_size(f);

    uint64_t base = 0;
    Progress p;
    p.total = total;
    const auto started = std::chrono::steady_clock::now();

    for (const auto& file : files) {
        const auto parts = splitFile(file, maxPartBytes_, partsDir);

        for (size_t i = 0; i < parts.size(); ++i) {
            if (cancelRequested()) return {};

            const auto caption = parts.size() > 1
                ? fmt::format("{} (part {}/{})", file.filename().string(), i + 1, parts.size())
                : file.filename().string();

            transport_->sendDocument(job_.destination.target, parts[i], caption,
                [&](const uint64_t sent, uint64_t) {
                    if (cancelRequested()) return false;
                    p.transferred = base + sent;
                    const auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
                    if (secs > 0) p.rate = static_cast<double>(p.transferred) / secs;
                    if (p.rate > 0) p.eta = std::chrono::seconds(static_cast<long>(static_cast<double>(total - std::min(total, p.transferred)) / p.rate));
                    publish(p);
                    return true;
                });

            base += fs::file_size(parts[i]);
            if (parts[i] != file) {
                std::error_code ec;
                fs::remove(parts[i], ec);
            }
            p.transferred = base;
            publish(p);
        }
    }

    std::error_code ec;
    fs::remove_all(partsDir, ec);
    log::Registry::upload()->debug("[ChatTransfer] Delivered {} file(s) to chat {}", files.size(), job_.destination.target);
    return job_.input;
}

ChatUploader::ChatUploader(std::shared_ptr<ChatTransport> transport, const uintmax_t maxPartBytes)
    : transport_(std::move(transport)), maxPartBytes_(maxPartBytes) {}

std::shared_ptr<Transfer> ChatUploader::start(const UploadJob& job) {
    auto t = std::make_shared<ChatTransfer>(job, transport_, maxPartBytes_);
    t->launch();
    return t;
}
