#include <gtest/gtest.h>
#include "archive/ArchiveStore.hpp"
#include "util/ScratchDir.hpp"
#include "ArchiveFixtures.hpp"

#include <chrono>

using namespace ts::archive;
using namespace ts::test;

class ArchiveStoreTest : public ::testing::Test {
protected:
    ts::util::ScratchDir root;

    void SetUp() override {
        writeTgz(root.path() / "a.tgz", {dir("a/"), file("a/x", "AAAA"), file("a/empty", ""), file("a/y", "BBBB")});
        writeTgz(root.path() / "with space.tgz", {});
        std::filesystem::create_directory(root.path() / "sub.tgz");
    }
};

TEST_F(ArchiveStoreTest, ResolvesLastSegment) {
    const ArchiveStore store(root.path());
    EXPECT_EQ(store.resolve("/a.tgz"), root.path() / "a.tgz");
    EXPECT_EQ(store.resolve("/some/prefix/a.tgz"), root.path() / "a.tgz");
    EXPECT_EQ(store.resolve("/a.tgz?x=1"), root.path() / "a.tgz");
    EXPECT_EQ(store.resolve("/with%20space.tgz"), root.path() / "with space.tgz");
}

TEST_F(ArchiveStoreTest, RejectsMissingAndNonFiles) {
    const ArchiveStore store(root.path());
    EXPECT_FALSE(store.resolve("/nope.tgz"));
    EXPECT_FALSE(store.resolve("/sub.tgz"));
    EXPECT_FALSE(store.resolve("/"));
    EXPECT_FALSE(store.resolve("/.."));
    EXPECT_FALSE(store.resolve("/a.tgz/.."));
}

TEST_F(ArchiveStoreTest, EmptyRootRejected) {
    EXPECT_THROW(ArchiveStore(""), std::invalid_argument);
}

TEST_F(ArchiveStoreTest, InspectCountsRegularFiles) {
    const auto info = ArchiveStore::inspect(root.path() / "a.tgz");
    EXPECT_EQ(info.entries, 4u);
    EXPECT_EQ(info.regularFiles, 2u);
    EXPECT_EQ(info.fingerprint.size(), 40u);

    EXPECT_EQ(ArchiveStore::inspect(root.path() / "a.tgz").fingerprint, info.fingerprint);
}

TEST_F(ArchiveStoreTest, FingerprintTracksContent) {
    const auto before = ArchiveStore::inspect(root.path() / "a.tgz").fingerprint;
    writeTgz(root.path() / "a.tgz", {dir("a/"), file("a/x", "AAAA"), file("a/empty", ""), file("a/y", "CCCC")});
    EXPECT_NE(ArchiveStore::inspect(root.path() / "a.tgz").fingerprint, before);
}

TEST_F(ArchiveStoreTest, InspectRejectsCorruptArchive) {
    writeFile(root.path() / "bad.tgz", "definitely not gzip");
    EXPECT_ANY_THROW(ArchiveStore::inspect(root.path() / "bad.tgz"));
}

TEST_F(ArchiveStoreTest, InfoMatchesInspect) {
    const ArchiveStore store(root.path());
    const auto path = root.path() / "a.tgz";
    const auto cached = store.info(path);
    const auto direct = ArchiveStore::inspect(path);
    EXPECT_EQ(cached.entries, direct.entries);
    EXPECT_EQ(cached.regularFiles, direct.regularFiles);
    EXPECT_EQ(cached.fingerprint, direct.fingerprint);
}

TEST_F(ArchiveStoreTest, InfoIsReusedWhileSizeAndMtimeHold) {
    const ArchiveStore store(root.path());
    const auto path = root.path() / "a.tgz";
    const auto first = store.info(path);

    // same size, same mtime, unreadable content: only a cache hit can succeed
    const auto mtime = std::filesystem::last_write_time(path);
    writeFile(path, std::string(readFile(path).size(), 'z'));
    std::filesystem::last_write_time(path, mtime);
    EXPECT_EQ(store.info(path).fingerprint, first.fingerprint);

    std::filesystem::last_write_time(path, mtime + std::chrono::seconds(5));
    EXPECT_ANY_THROW((void)store.info(path));
}

TEST_F(ArchiveStoreTest, InfoNoticesRewrittenArchive) {
    const ArchiveStore store(root.path());
    const auto path = root.path() / "a.tgz";
    const auto before = store.info(path);
    const auto mtime = std::filesystem::last_write_time(path);

    writeTgz(path, {dir("a/"), file("a/x", "AAAA"), file("a/y", "BBBB"), file("a/z", "CCCC")});
    std::filesystem::last_write_time(path, mtime + std::chrono::seconds(5));

    const auto after = store.info(path);
    EXPECT_EQ(after.regularFiles, 3u);
    EXPECT_NE(after.fingerprint, before.fingerprint);
}

TEST_F(ArchiveStoreTest, InfoOnMissingArchiveThrows) {
    const ArchiveStore store(root.path());
    EXPECT_THROW((void)store.info(root.path() / "gone.tgz"), std::filesystem::filesystem_error);
}
