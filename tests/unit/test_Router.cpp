#include <gtest/gtest.h>
#include "archive/ArchiveStore.hpp"
#include "protocols/http/Router.hpp"
#include "sync/PresenceBitmap.hpp"
#include "util/ScratchDir.hpp"
#include "ArchiveFixtures.hpp"
#include "CapturingResponder.hpp"

using namespace ts::archive;
using namespace ts::protocols::http;
using namespace ts::sync;
using namespace ts::test;

class RouterTest : public ::testing::Test {
protected:
    ts::util::ScratchDir root;
    std::unique_ptr<Router> router;

    void SetUp() override {
        writeTgz(root.path() / "a.tgz", {dir("a/"), file("a/x", "AAAA"), file("a/y", "BBBB")});
        router = std::make_unique<Router>(Router::Options{root.path(), 6, 1024, false});
    }

    CapturingResponder get(const std::string& target) const {
        CapturingResponder res;
        router->route(request{verb::get, target, 11}, res);
        return res;
    }

    CapturingResponder post(const std::string& target, const std::string& body, const std::string& fingerprint = {}) const {
        request req{verb::post, target, 11};
        if (!fingerprint.empty()) req.set(protocol::FINGERPRINT_HEADER, fingerprint);
        req.body() = body;
        req.prepare_payload();
        CapturingResponder res;
        router->route(req, res);
        return res;
    }
};

TEST_F(RouterTest, GetServesIndexWithHeaders) {
    const auto res = get("/a.tgz");
    ASSERT_EQ(res.code, status::ok);
    EXPECT_TRUE(res.finished);
    EXPECT_EQ(res.header(protocol::REGULAR_FILES_HEADER), "2");
    EXPECT_EQ(res.header(protocol::FINGERPRINT_HEADER), ArchiveStore::inspect(root.path() / "a.tgz").fingerprint);

    const auto index = readTgzBytes(res.body.str());
    ASSERT_EQ(index.size(), 3u);
    EXPECT_EQ(index[1].first.size, 20);
}

TEST_F(RouterTest, PostServesRequestedEntries) {
    const auto res = post("/a.tgz", gzipCompress(std::string(1, '\x40')));
    ASSERT_EQ(res.code, status::ok);

    const auto diff = readTgzBytes(res.body.str());
    ASSERT_EQ(diff.size(), 1u);
    EXPECT_EQ(diff[0].first.name, "a/y");
    EXPECT_EQ(diff[0].second, "BBBB");
}

TEST_F(RouterTest, UnsupportedMethod) {
    CapturingResponder res;
    router->route(request{verb::put, "/a.tgz", 11}, res);
    EXPECT_EQ(res.code, status::method_not_allowed);
}

TEST_F(RouterTest, UnknownArchive) {
    const auto res = get("/missing.tgz");
    EXPECT_EQ(res.code, status::not_found);
    EXPECT_EQ(res.body.str(), "404 - File not found!");
}

TEST_F(RouterTest, UnreadableArchive) {
    writeFile(root.path() / "broken.tgz", "garbage");
    const auto res = get("/broken.tgz");
    EXPECT_EQ(res.code, status::internal_server_error);
    EXPECT_EQ(res.body.str(), "500 - cannot read tgz file!");
    EXPECT_FALSE(res.chunked);
}

TEST_F(RouterTest, UndecodableBitmap) {
    const auto res = post("/a.tgz", "not gzip");
    EXPECT_EQ(res.code, status::internal_server_error);
    EXPECT_EQ(res.body.str(), "500 - Cannot read request bitmap!");
}

TEST_F(RouterTest, OversizedBitmap) {
    const auto res = post("/a.tgz", gzipCompress(std::string(4096, '\0')));
    EXPECT_EQ(res.code, status::internal_server_error);
    EXPECT_EQ(res.body.str(), "500 - Cannot read request bitmap!");
}

TEST_F(RouterTest, ShortBitmapRejectedBeforeStreaming) {
    std::vector<Member> many;
    for (int i = 0; i < 9; ++i) many.push_back(file("f" + std::to_string(i), "x"));
    writeTgz(root.path() / "many.tgz", many);

    const auto res = post("/many.tgz", gzipCompress(std::string(1, '\xff')));
    EXPECT_EQ(res.code, status::internal_server_error);
    EXPECT_FALSE(res.chunked);
    EXPECT_NE(res.body.str().find("bitmap too short"), std::string::npos);
}

TEST_F(RouterTest, StaleFingerprintRejected) {
    const auto res = post("/a.tgz", gzipCompress(std::string(1, '\x40')), std::string(40, '0'));
    EXPECT_EQ(res.code, status::precondition_failed);
}

TEST_F(RouterTest, MatchingFingerprintAccepted) {
    const auto fingerprint = get("/a.tgz").header(protocol::FINGERPRINT_HEADER);
    const auto res = post("/a.tgz", gzipCompress(std::string(1, '\x40')), fingerprint);
    EXPECT_EQ(res.code, status::ok);
}

TEST_F(RouterTest, LongerBitmapAccepted) {
    const auto res = post("/a.tgz", gzipCompress(std::string("\xc0\xff\xff", 3)));
    ASSERT_EQ(res.code, status::ok);
    EXPECT_EQ(names(readTgzBytes(res.body.str())), (std::vector<std::string>{"a/x", "a/y"}));
}
