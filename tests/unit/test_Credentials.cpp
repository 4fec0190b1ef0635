#include <gtest/gtest.h>
#include "auth/CredentialResolver.hpp"
#include "auth/ServiceAccountPool.hpp"
#include "transfer/errors.hpp"

#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace sf::auth;
using namespace sf::auth::model;

namespace {
void writeFile(const fs::path& p, const std::string& body) {
    fs::create_directories(p.parent_path());
    std::ofstream(p) << body;
}

fs::path scratchDir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("skyferry-cred-" + std::to_string(::getpid()) + "-" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}
}

class CredentialResolverTest : public ::testing::Test {
protected:
    fs::path root;
    sf::config::CredentialsConfig cfg;

    void SetUp() override {
        root = scratchDir(::testing::UnitTest::GetInstance()->current_test_info()->name());
        cfg.cookies_dir = root / "cookies";
        cfg.service_accounts.dir = root / "accounts";
        cfg.validity_ttl = std::chrono::seconds(30);
    }

    void TearDown() override { fs::remove_all(root); }

    CredentialResolver make() {
        return CredentialResolver(cfg, std::make_shared<ServiceAccountPool>(cfg.service_accounts.dir));
    }
};

TEST_F(CredentialResolverTest, UserCookie_Preferred) {
    writeFile(cfg.cookies_dir / "alice.txt", "SID=user\n");
    writeFile(cfg.cookies_dir / "cookies.txt", "SID=global\n");
    auto r = make();

    const auto c = r.resolve("alice", CredentialKind::Cookie);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->scope, CredentialScope::User);
    EXPECT_EQ(c->path, cfg.cookies_dir / "alice.txt");
    EXPECT_EQ(c->account, "alice");
}

TEST_F(CredentialResolverTest, MissingUserCookie_FallsBackToGlobal) {
    writeFile(cfg.cookies_dir / "cookies.txt", "SID=global\n");
    auto r = make();

    const auto c = r.resolve("bob", CredentialKind::Cookie);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->scope, CredentialScope::Global);
}

TEST_F(CredentialResolverTest, NoCookies_ProceedsUnauthenticated) {
    auto r = make();
    EXPECT_FALSE(r.resolve("bob", CredentialKind::Cookie).has_value());
}

TEST_F(CredentialResolverTest, EmptyCookieFile_IsInvalid) {
    writeFile(cfg.cookies_dir / "alice.txt", "# Netscape HTTP Cookie File\n\n");
    auto r = make();
    EXPECT_FALSE(r.isValidCookieFile(cfg.cookies_dir / "alice.txt"));
    EXPECT_FALSE(r.resolve("alice", CredentialKind::Cookie).has_value());
}

TEST_F(CredentialResolverTest, Invalidate_SkipsUserCookieForOneWindow) {
    writeFile(cfg.cookies_dir / "alice.txt", "SID=user\n");
    writeFile(cfg.cookies_dir / "cookies.txt", "SID=global\n");
    auto r = make();

    r.invalidate(r.userCookiePath("alice"));
    const auto c = r.resolve("alice", CredentialKind::Cookie);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->scope, CredentialScope::Global);
}

TEST_F(CredentialResolverTest, ValidityIsCachedForTtl) {
    auto r = make();
    const auto path = r.userCookiePath("alice");
    EXPECT_FALSE(r.isValidCookieFile(path));

    writeFile(path, "SID=user\n");
    EXPECT_FALSE(r.isValidCookieFile(path));

    cfg.validity_ttl = std::chrono::seconds(0);
    auto fresh = make();
    EXPECT_TRUE(fresh.isValidCookieFile(path));
}

TEST_F(CredentialResolverTest, ExpiredValidityEntriesAreDropped) {
    cfg.validity_ttl = std::chrono::seconds(1);
    auto r = make();
    for (const auto* owner : {"alice", "bob", "carol"}) r.isValidCookieFile(r.userCookiePath(owner));
    r.invalidate(r.globalCookiePath());
    EXPECT_EQ(r.cachedEntries(), 4u);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_FALSE(r.isValidCookieFile(r.userCookiePath("dave")));
    EXPECT_EQ(r.cachedEntries(), 1u);
}

TEST_F(CredentialResolverTest, Fallback_OnlyGlobalCookie) {
    writeFile(cfg.cookies_dir / "alice.txt", "SID=user\n");
    auto r = make();
    EXPECT_FALSE(r.resolveFallback("alice", CredentialKind::Cookie).has_value());
    EXPECT_FALSE(r.resolveFallback("alice", CredentialKind::ServiceAccount).has_value());

    writeFile(cfg.cookies_dir / "cookies.txt", "SID=global\n");
    cfg.validity_ttl = std::chrono::seconds(0);
    auto fresh = make();
    EXPECT_EQ(fresh.resolveFallback("alice", CredentialKind::Cookie)->scope, CredentialScope::Global);
}

TEST_F(CredentialResolverTest, OwnerNameIsSanitisedIntoPath) {
    auto r = make();
    EXPECT_EQ(r.userCookiePath("../../etc/passwd").parent_path(), cfg.cookies_dir);
}

TEST_F(CredentialResolverTest, ServiceAccounts_DisabledPool) {
    writeFile(cfg.service_accounts.dir / "a.json", R"({"client_email":"a@x"})");
    cfg.service_accounts.enabled = false;
    auto r = make();
    EXPECT_FALSE(r.resolve("alice", CredentialKind::ServiceAccount).has_value());
}

TEST_F(CredentialResolverTest, ServiceAccounts_FromPool) {
    writeFile(cfg.service_accounts.dir / "a.json", R"({"client_email":"a@x"})");
    cfg.service_accounts.enabled = true;
    auto r = make();

    const auto c = r.resolve("alice", CredentialKind::ServiceAccount);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->scope, CredentialScope::Pool);
    EXPECT_EQ(c->account, "a@x");
}

class ServiceAccountPoolTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = scratchDir(::testing::UnitTest::GetInstance()->current_test_info()->name());
        writeFile(dir / "01.json", R"({"type":"service_account","client_email":"one@x"})");
        writeFile(dir / "02.json", R"({"type":"service_account","client_email":"two@x"})");
        writeFile(dir / "03.json", R"({"type":"service_account"})");
    }

    void TearDown() override { fs::remove_all(dir); }
};

TEST_F(ServiceAccountPoolTest, Acquire_RotatesLeastRecentlyUsed) {
    ServiceAccountPool pool(dir);
    EXPECT_EQ(pool.acquire()->account, "one@x");
    EXPECT_EQ(pool.acquire()->account, "two@x");
    EXPECT_EQ(pool.acquire()->account, "03");
    EXPECT_EQ(pool.acquire()->account, "one@x");
}

TEST_F(ServiceAccountPoolTest, QuotaExceeded_DisablesUntilReset) {
    ServiceAccountPool pool(dir);
    pool.reportQuotaExceeded("one@x");
    pool.reportQuotaExceeded("03");
    EXPECT_EQ(pool.enabledCount(), 1u);

    for (int i = 0; i < 3; ++i) EXPECT_EQ(pool.acquire()->account, "two@x");

    pool.reportQuotaExceeded("two@x");
    EXPECT_THROW(pool.acquire(), sf::transfer::QuotaExceededError);

    pool.resetQuotaWindow();
    EXPECT_EQ(pool.enabledCount(), 3u);
    EXPECT_NO_THROW(pool.acquire());
}

TEST_F(ServiceAccountPoolTest, UnknownAccountReport_IsIgnored) {
    ServiceAccountPool pool(dir);
    pool.reportQuotaExceeded("ghost@x");
    EXPECT_EQ(pool.enabledCount(), 3u);
}

TEST_F(ServiceAccountPoolTest, MalformedFilesAreSkipped) {
    writeFile(dir / "04.json", "{ not json");
    writeFile(dir / "notes.txt", "ignored");
    ServiceAccountPool pool(dir);
    EXPECT_EQ(pool.size(), 3u);
}

TEST_F(ServiceAccountPoolTest, EmptyOrMissingDirectory) {
    ServiceAccountPool missing(dir / "nope");
    EXPECT_FALSE(missing.acquire().has_value());
    EXPECT_EQ(missing.size(), 0u);
}

TEST_F(ServiceAccountPoolTest, UsageCountsPerWindow) {
    ServiceAccountPool pool(dir);
    pool.acquire();
    pool.acquire();
    pool.acquire();
    pool.acquire();
    const auto accounts = pool.accounts();
    EXPECT_EQ(accounts[0].quota_used_today, 2u);
    EXPECT_EQ(accounts[1].quota_used_today, 1u);

    pool.resetQuotaWindow();
    EXPECT_EQ(pool.accounts()[0].quota_used_today, 0u);
}
