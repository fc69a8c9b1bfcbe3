#include <gtest/gtest.h>
#include "client/Destination.hpp"
#include "client/SyncClient.hpp"
#include "protocols/http/Router.hpp"
#include "util/ScratchDir.hpp"
#include "ArchiveFixtures.hpp"
#include "CapturingResponder.hpp"

#include <chrono>

using namespace ts::client;
using namespace ts::protocols::http;
using namespace ts::test;

namespace fs = std::filesystem;

class SyncClientTest : public ::testing::Test {
protected:
    ts::util::ScratchDir serverRoot;
    ts::util::ScratchDir ref;
    ts::util::ScratchDir out;
    ts::util::ScratchDir tmp;

    std::shared_ptr<Router> router;

    void SetUp() override {
        router = std::make_shared<Router>(Router::Options{serverRoot.path(), 6, 1024 * 1024, false});
    }

    SyncClient client(const std::shared_ptr<LoopbackTransport>& transport, const bool preserveOrder = true) const {
        return {transport, SyncClient::Options{
            .referenceRoot = ref.path(),
            .destination = out.path() / "a.tgz",
            .tempDir = tmp.path(),
            .preserveOrder = preserveOrder,
        }};
    }
};

TEST_F(SyncClientTest, RebuildsArchiveFromLocalAndFetchedFiles) {
    const std::vector<Member> source = {dir("a/"), file("a/x", "AAAA"), file("a/y", "BBBB")};
    writeTgz(serverRoot.path() / "a.tgz", source);
    writeFile(ref.path() / "a/x", "AAAA");

    const auto transport = std::make_shared<LoopbackTransport>(router, "/a.tgz");
    auto c = client(transport);
    const auto report = c.run();

    EXPECT_EQ(c.phase(), Phase::Done);
    EXPECT_EQ(report.entries, 3u);
    EXPECT_EQ(report.regularFiles, 2u);
    EXPECT_EQ(report.satisfied, 1u);
    EXPECT_EQ(report.fetched, 1u);
    EXPECT_TRUE(report.diffRequested);
    EXPECT_EQ(transport->diffRequests, 1);
    EXPECT_EQ(ts::archive::gzipDecompress(transport->lastBitmap, 16), std::string(1, '\x40'));

    const auto rebuilt = readTgz(out.path() / "a.tgz");
    ASSERT_EQ(rebuilt.size(), 3u);
    EXPECT_EQ(names(rebuilt), names(source));
    EXPECT_EQ(rebuilt[1].second, "AAAA");
    EXPECT_EQ(rebuilt[2].second, "BBBB");

    EXPECT_FALSE(fs::exists(out.path() / "a.tgz.part"));
    EXPECT_TRUE(fs::is_empty(tmp.path()));
}

TEST_F(SyncClientTest, SecondRunNeedsNoDiffOnceReferenceIsComplete) {
    writeTgz(serverRoot.path() / "a.tgz", {dir("a/"), file("a/x", "AAAA"), file("a/y", "BBBB")});
    writeFile(ref.path() / "a/x", "AAAA");
    writeFile(ref.path() / "a/y", "BBBB");

    const auto transport = std::make_shared<LoopbackTransport>(router, "/a.tgz");
    const auto first = client(transport).run();
    const auto second = client(transport).run();

    EXPECT_FALSE(first.diffRequested);
    EXPECT_FALSE(second.diffRequested);
    EXPECT_EQ(transport->diffRequests, 0);
    EXPECT_EQ(second.satisfied, 2u);
    EXPECT_EQ(readTgz(out.path() / "a.tgz").size(), 3u);
}

TEST_F(SyncClientTest, EmptyArchive) {
    writeTgz(serverRoot.path() / "a.tgz", {});

    const auto transport = std::make_shared<LoopbackTransport>(router, "/a.tgz");
    const auto report = client(transport).run();

    EXPECT_EQ(report.entries, 0u);
    EXPECT_FALSE(report.diffRequested);
    EXPECT_EQ(transport->diffRequests, 0);
    EXPECT_TRUE(readTgz(out.path() / "a.tgz").empty());
}

TEST_F(SyncClientTest, AppendModeMovesFetchedFilesToTheEnd) {
    writeTgz(serverRoot.path() / "a.tgz", {file("1", "one"), file("2", "two"), dir("d/")});
    writeFile(ref.path() / "2", "two");

    const auto transport = std::make_shared<LoopbackTransport>(router, "/a.tgz");
    client(transport, false).run();

    EXPECT_EQ(names(readTgz(out.path() / "a.tgz")), (std::vector<std::string>{"2", "d/", "1"}));
}

TEST_F(SyncClientTest, ServerErrorFailsTheSync) {
    const auto transport = std::make_shared<LoopbackTransport>(router, "/missing.tgz");
    auto c = client(transport);

    try {
        c.run();
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status(), 404);
    }
    EXPECT_EQ(c.phase(), Phase::Failed);
    EXPECT_FALSE(fs::exists(out.path() / "a.tgz"));
}

TEST_F(SyncClientTest, ArchiveChangedBetweenRequests) {
    writeTgz(serverRoot.path() / "a.tgz", {file("a/x", "AAAA")});

    // Rewrites the archive after the index has been served.
    class MutatingTransport final : public Transport {
    public:
        MutatingTransport(std::shared_ptr<LoopbackTransport> inner, fs::path archive)
            : inner_(std::move(inner)), archive_(std::move(archive)) {}

        IndexResponse fetchIndex(std::ostream& dest) override {
            auto res = inner_->fetchIndex(dest);
            const auto mtime = fs::last_write_time(archive_);
            writeTgz(archive_, {file("a/x", "CCCC")});
            // same length rewrite; make sure it lands on a later mtime tick
            fs::last_write_time(archive_, mtime + std::chrono::seconds(1));
            return res;
        }

        void fetchDiff(const std::string& gzBitmap, const std::string& fingerprint, std::ostream& dest) override {
            inner_->fetchDiff(gzBitmap, fingerprint, dest);
        }

    private:
        std::shared_ptr<LoopbackTransport> inner_;
        fs::path archive_;
    };

    const auto transport = std::make_shared<MutatingTransport>(
        std::make_shared<LoopbackTransport>(router, "/a.tgz"), serverRoot.path() / "a.tgz");
    SyncClient c(transport, {.referenceRoot = ref.path(), .destination = out.path() / "a.tgz", .tempDir = tmp.path()});

    try {
        c.run();
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status(), 412);
    }
}

TEST(DestinationTest, ResolvesAgainstUrlBasename) {
    const std::string url = "http://host:8090/dir/a.tgz";
    EXPECT_EQ(resolveDestination(url, "", ".tgz"), fs::path("a.tgz"));
    EXPECT_EQ(resolveDestination(url, "./", ".tgz"), fs::path("./a.tgz"));
    EXPECT_EQ(resolveDestination(url, "out/", ".tgz"), fs::path("out/a.tgz"));
    EXPECT_EQ(resolveDestination(url, "out", ".tgz"), fs::path("out/a.tgz"));
    EXPECT_EQ(resolveDestination(url, "copy.tgz", ".tgz"), fs::path("copy.tgz"));
}

TEST(DestinationTest, RequiresArchiveSuffix) {
    EXPECT_THROW(resolveDestination("http://host/a.tar", "", ".tgz"), std::invalid_argument);
    EXPECT_THROW(resolveDestination("http://host/.tgz", "", ".tgz"), std::invalid_argument);
}
