#include <gtest/gtest.h>
#include "backend/download/TeraboxResolver.hpp"
#include "transfer/errors.hpp"
#include "fakes/LocalHttpServer.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace sf::backend;
using namespace sf::transfer;
using sf::test::LocalHttpServer;

TEST(TeraboxParseTest, RecognisesShareHosts) {
    EXPECT_TRUE(TeraboxResolver::isTeraboxUrl("https://www.terabox.com/s/1AbC"));
    EXPECT_TRUE(TeraboxResolver::isTeraboxUrl("https://1024terabox.com/s/1AbC"));
    EXPECT_TRUE(TeraboxResolver::isTeraboxUrl("https://dm.terabox.app/sharing/link?surl=AbC"));
    EXPECT_FALSE(TeraboxResolver::isTeraboxUrl("https://notterabox.com/s/1AbC"));
    EXPECT_FALSE(TeraboxResolver::isTeraboxUrl("https://example.com/terabox.com"));
}

TEST(TeraboxParseTest, ShortUrl) {
    EXPECT_EQ(TeraboxResolver::shortUrlOf("https://www.terabox.com/s/1AbC-d_e"), "AbC-d_e");
    EXPECT_EQ(TeraboxResolver::shortUrlOf("https://www.terabox.com/s/1AbC?from=x"), "AbC");
    EXPECT_EQ(TeraboxResolver::shortUrlOf("https://www.terabox.app/sharing/link?surl=XyZ&path=%2F"), "XyZ");
    EXPECT_FALSE(TeraboxResolver::shortUrlOf("https://www.terabox.com/main").has_value());
}

TEST(TeraboxParseTest, JsToken) {
    EXPECT_EQ(TeraboxResolver::jsTokenOf(R"(<script>var templateData = decodeURIComponent("fn%28%22AB12CD%22%29");</script>)"),
              "AB12CD");
    EXPECT_FALSE(TeraboxResolver::jsTokenOf("<html>login</html>").has_value());
    EXPECT_FALSE(TeraboxResolver::jsTokenOf("fn%28%22%22%29").has_value());
}

TEST(TeraboxParseTest, ShareListPicksFirstFile) {
    const auto f = TeraboxResolver::parseShareList(
        R"({"errno":0,"list":[{"server_filename":"movie.mkv","size":"1048576","isdir":"0","dlink":"https://d.terabox.app/file/abc"}]})");
    EXPECT_EQ(f.directUrl, "https://d.terabox.app/file/abc");
    EXPECT_EQ(f.name, "movie.mkv");
    ASSERT_TRUE(f.size.has_value());
    EXPECT_EQ(*f.size, 1048576u);
}

TEST(TeraboxParseTest, ShareListErrors) {
    EXPECT_THROW(TeraboxResolver::parseShareList(R"({"errno":-6})"), AuthError);
    EXPECT_THROW(TeraboxResolver::parseShareList(R"({"errno":105})"), FatalTransferError);
    EXPECT_THROW(TeraboxResolver::parseShareList(R"({"errno":0,"list":[]})"), FatalTransferError);
    EXPECT_THROW(TeraboxResolver::parseShareList(R"({"errno":0,"list":[{"isdir":1,"dlink":"x"}]})"), FatalTransferError);
    EXPECT_THROW(TeraboxResolver::parseShareList(R"({"errno":0,"list":[{"server_filename":"a"}]})"), FatalTransferError);
    EXPECT_THROW(TeraboxResolver::parseShareList("<html>"), FatalTransferError);
}

class TeraboxResolverTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("skyferry-terabox-" + std::to_string(::getpid()) + "-" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override { fs::remove_all(root); }

    fs::path writeCookie(const std::string& name, const std::string& content) const {
        const auto p = root / name;
        std::ofstream(p) << content;
        return p;
    }
};

TEST_F(TeraboxResolverTest, ResolvesShareToDirectLink) {
    std::unique_ptr<LocalHttpServer> server;
    server = std::make_unique<LocalHttpServer>([&server](const LocalHttpServer::Request& req) {
        if (req.target == "/s/1AbC")
            return LocalHttpServer::Response{200, R"(<script>x = decodeURIComponent("fn%28%22TOKEN9%22%29")</script>)", {}};
        if (req.target.rfind("/share/list?", 0) == 0)
            return LocalHttpServer::Response{200, R"({"errno":0,"list":[{"server_filename":"clip.mp4","size":42,"isdir":"0","dlink":")" +
                                                      server->url("/file/clip") + R"("}]})", {}};
        return LocalHttpServer::Response{404, "", {}};
    });

    const auto cookie = writeCookie("terabox.txt", "lang=en; ndus=Y2abc");
    TeraboxResolver resolver({server->url(""), cookie});
    const auto file = resolver.resolve(server->url("/s/1AbC"), std::nullopt);

    EXPECT_EQ(file.directUrl, server->url("/file/clip"));
    EXPECT_EQ(file.name, "clip.mp4");
    ASSERT_TRUE(file.size.has_value());
    EXPECT_EQ(*file.size, 42u);
    EXPECT_EQ(file.cookieHeader, "lang=en; ndus=Y2abc");

    const auto requests = server->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[0].headers.find("ndus=Y2abc"), std::string::npos);
    EXPECT_NE(requests[1].target.find("jsToken=TOKEN9"), std::string::npos);
    EXPECT_NE(requests[1].target.find("shorturl=AbC"), std::string::npos);
}

TEST_F(TeraboxResolverTest, OwnerCookiePreferredWhenItIsATeraboxSession) {
    LocalHttpServer server([](const LocalHttpServer::Request& req) {
        if (req.target == "/s/1AbC") return LocalHttpServer::Response{200, "fn%28%22T%22%29", {}};
        return LocalHttpServer::Response{200, R"({"errno":0,"list":[{"server_filename":"a.bin","dlink":"http://x/a"}]})", {}};
    });

    const auto global = writeCookie("terabox.txt", "ndus=global");
    const auto owner = writeCookie("alice.txt", "ndus=alice");
    TeraboxResolver resolver({server.url(""), global});

    const sf::auth::model::Credential cred{sf::auth::model::CredentialKind::Cookie, sf::auth::model::CredentialScope::User, owner, {}};
    EXPECT_EQ(resolver.resolve(server.url("/s/1AbC"), cred).cookieHeader, "ndus=alice");

    const auto unrelated = writeCookie("bob.txt", "SID=google");
    const sf::auth::model::Credential other{sf::auth::model::CredentialKind::Cookie, sf::auth::model::CredentialScope::User, unrelated, {}};
    EXPECT_EQ(resolver.resolve(server.url("/s/1AbC"), other).cookieHeader, "ndus=global");
}

TEST_F(TeraboxResolverTest, MissingCookieIsAuthError) {
    TeraboxResolver resolver({"http://127.0.0.1:1", root / "absent.txt"});
    EXPECT_THROW(resolver.resolve("https://www.terabox.com/s/1AbC", std::nullopt), AuthError);
}

TEST_F(TeraboxResolverTest, ExpiredSessionIsAuthError) {
    LocalHttpServer server([](const LocalHttpServer::Request&) {
        return LocalHttpServer::Response{200, "<html>please log in</html>", {}};
    });
    TeraboxResolver resolver({server.url(""), writeCookie("terabox.txt", "ndus=stale")});
    EXPECT_THROW(resolver.resolve(server.url("/s/1AbC"), std::nullopt), AuthError);
}

TEST_F(TeraboxResolverTest, ThrottledIsTransient) {
    LocalHttpServer server([](const LocalHttpServer::Request&) {
        return LocalHttpServer::Response{429, "", {}};
    });
    TeraboxResolver resolver({server.url(""), writeCookie("terabox.txt", "ndus=x")});
    EXPECT_THROW(resolver.resolve(server.url("/s/1AbC"), std::nullopt), TransientTransferError);
}
