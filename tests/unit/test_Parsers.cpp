#include <gtest/gtest.h>
#include "backend/download/ExtractorDownloader.hpp"
#include "backend/download/TorrentDownloader.hpp"
#include "backend/rclone.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace sf::backend;
using namespace std::chrono_literals;

TEST(Aria2ReadoutTest, FullReadout) {
    const auto p = parseAria2Readout("[#2089b0 400.0KiB/33.2MiB(1%) CN:1 DL:115.7KiB ETA:4m51s]");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->transferred, 409600u);
    ASSERT_TRUE(p->total.has_value());
    EXPECT_EQ(*p->total, 34812723u);
    EXPECT_DOUBLE_EQ(p->rate, 118476.0);
    ASSERT_TRUE(p->eta.has_value());
    EXPECT_EQ(*p->eta, 291s);
}

TEST(Aria2ReadoutTest, UnknownTotalAndMissingFields) {
    const auto p = parseAria2Readout("[#abc123 0B/0B CN:0]");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->transferred, 0u);
    EXPECT_FALSE(p->total.has_value());
    EXPECT_FALSE(p->eta.has_value());
}

TEST(Aria2ReadoutTest, IgnoresOtherOutput) {
    EXPECT_FALSE(parseAria2Readout("Download Results:").has_value());
    EXPECT_FALSE(parseAria2Readout("gid   |stat|avg speed  |path/URI").has_value());
    EXPECT_FALSE(parseAria2Readout("[#abc]").has_value());
}

TEST(Aria2ReadoutTest, BareInfoHashBecomesMagnet) {
    const TorrentDownloader d("aria2c");
    DownloadJob job;
    job.workDir = "/tmp/t1";
    job.reference = "0123456789abcdef0123456789abcdef01234567";

    const auto argv = d.buildArgv(job);
    EXPECT_EQ(argv.front(), "aria2c");
    EXPECT_EQ(argv.back(), "magnet:?xt=urn:btih:0123456789abcdef0123456789abcdef01234567");
    EXPECT_NE(std::ranges::find(argv, "--dir=/tmp/t1"), argv.end());
    EXPECT_NE(std::ranges::find(argv, "--seed-time=0"), argv.end());
}

TEST(YtDlpProgressTest, EstimatedTotal) {
    const auto p = parseYtDlpProgress("[download]  12.3% of ~50.00MiB at  1.20MiB/s ETA 00:35");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p->total, 52428800u);
    EXPECT_EQ(p->transferred, 6448742u);
    EXPECT_DOUBLE_EQ(p->rate, 1258291.0);
    EXPECT_EQ(*p->eta, 35s);
}

TEST(YtDlpProgressTest, PaddedEstimateAndCompletion) {
    const auto padded = parseYtDlpProgress("[download]   5.0% of ~  10.00MiB at 100.00KiB/s ETA 01:02:03");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(*padded->total, 10485760u);
    EXPECT_EQ(*padded->eta, 3723s);

    const auto done = parseYtDlpProgress("[download] 100% of 10.00MiB in 00:05");
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->transferred, 10485760u);
}

TEST(YtDlpProgressTest, IgnoresOtherOutput) {
    EXPECT_FALSE(parseYtDlpProgress("[download] Destination: clip [abc].mp4").has_value());
    EXPECT_FALSE(parseYtDlpProgress("[youtube] abc: Downloading webpage").has_value());
    EXPECT_FALSE(parseYtDlpProgress("").has_value());
}

TEST(YtDlpProgressTest, CookieArguments) {
    const auto dir = std::filesystem::temp_directory_path() / "skyferry-ytdlp-args";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "netscape.txt") << ".example.com\tTRUE\t/\tTRUE\t0\tSID\tabc\n";
    std::ofstream(dir / "header.txt") << "SID=abc; HSID=def\n";

    const ExtractorDownloader d("yt-dlp");
    DownloadJob job;
    job.workDir = dir;
    job.reference = "https://youtu.be/abc";

    job.credential = sf::auth::model::Credential{sf::auth::model::CredentialKind::Cookie,
                                                 sf::auth::model::CredentialScope::User, dir / "netscape.txt", "alice"};
    auto argv = d.buildArgv(job);
    auto it = std::ranges::find(argv, "--cookies");
    ASSERT_NE(it, argv.end());
    EXPECT_EQ(*(it + 1), (dir / "netscape.txt").string());
    EXPECT_EQ(argv.back(), "https://youtu.be/abc");
    EXPECT_EQ(*(argv.end() - 2), "--");

    job.credential->path = dir / "header.txt";
    argv = d.buildArgv(job);
    it = std::ranges::find(argv, "--add-header");
    ASSERT_NE(it, argv.end());
    EXPECT_EQ(*(it + 1), "Cookie:SID=abc; HSID=def");

    std::filesystem::remove_all(dir);
}

TEST(RcloneStatsTest, NoticeLine) {
    const auto p = parseRcloneStats("2024/01/01 12:00:00 NOTICE:    1.234 MiB / 10.5 MiB, 12%, 1.2 MiB/s, ETA 8s");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->transferred, 1293942u);
    EXPECT_EQ(*p->total, 11010048u);
    EXPECT_DOUBLE_EQ(p->rate, 1258291.0);
    EXPECT_EQ(*p->eta, 8s);
}

TEST(RcloneStatsTest, UnknownEta) {
    const auto p = parseRcloneStats("NOTICE: 0 B / 1 GiB, 0%, 0 B/s, ETA -");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->transferred, 0u);
    EXPECT_FALSE(p->eta.has_value());
}

TEST(RcloneStatsTest, IgnoresFileCountsAndNoise) {
    EXPECT_FALSE(parseRcloneStats("Transferred:            3 / 10, 30%").has_value());
    EXPECT_FALSE(parseRcloneStats("2024/01/01 ERROR : file.bin: Failed to copy").has_value());
}

TEST(RcloneHelpersTest, DriveLinks) {
    const auto file = parseDriveLink("https://drive.google.com/file/d/1AbC/view?usp=sharing");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->id, "1AbC");
    EXPECT_FALSE(file->folder);

    const auto folder = parseDriveLink("https://drive.google.com/drive/folders/1XyZ?usp=drive_link");
    ASSERT_TRUE(folder.has_value());
    EXPECT_EQ(folder->id, "1XyZ");
    EXPECT_TRUE(folder->folder);

    EXPECT_EQ(parseDriveLink("https://drive.google.com/open?id=1Q")->id, "1Q");
    EXPECT_FALSE(parseDriveLink("https://example.com/").has_value());
}

TEST(RcloneHelpersTest, DriveRemote) {
    const RcloneOptions opts;
    EXPECT_EQ(driveRemote(opts, "F1", std::nullopt), "gdrive,root_folder_id=F1:");
    EXPECT_EQ(driveRemote(opts, "", std::nullopt), "gdrive:");

    const sf::auth::model::Credential sa{sf::auth::model::CredentialKind::ServiceAccount,
                                         sf::auth::model::CredentialScope::Pool, "/etc/sa/1.json", "one@x"};
    EXPECT_EQ(driveRemote(opts, "F1", sa), ":drive,root_folder_id=F1:");

    std::vector<std::string> argv;
    appendCredentialArgs(argv, sa);
    ASSERT_EQ(argv.size(), 1u);
    EXPECT_EQ(argv[0], "--drive-service-account-file=/etc/sa/1.json");
}

TEST(RcloneHelpersTest, CopyTarget) {
    const auto dir = std::filesystem::temp_directory_path() / "skyferry-rclone-Album";
    std::filesystem::create_directories(dir);

    EXPECT_EQ(copyTarget(dir, "backup:media"), "backup:media/skyferry-rclone-Album");
    EXPECT_EQ(copyTarget(dir, "backup:"), "backup:skyferry-rclone-Album");
    EXPECT_EQ(copyTarget(dir / "missing.bin", "backup:media"), "backup:media");

    std::filesystem::remove_all(dir);
}

TEST(RcloneHelpersTest, BaseArgs) {
    RcloneOptions opts;
    opts.binary = "/usr/bin/rclone";
    opts.config = "/etc/rclone.conf";

    const auto argv = rcloneBaseArgs(opts);
    EXPECT_EQ(argv[0], "/usr/bin/rclone");
    EXPECT_EQ(argv[1], "--config=/etc/rclone.conf");
    EXPECT_NE(std::ranges::find(argv, "--stats-one-line"), argv.end());
}
