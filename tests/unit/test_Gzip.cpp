#include <gtest/gtest.h>
#include "archive/Gzip.hpp"
#include "util/ScratchDir.hpp"
#include "ArchiveFixtures.hpp"

#include <sstream>
#include <iterator>

using namespace ts::archive;

TEST(GzipTest, CompressDecompress) {
    const std::string text(5000, 'g');
    const auto packed = gzipCompress(text, 9);
    ASSERT_GE(packed.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(packed[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(packed[1]), 0x8b);
    EXPECT_LT(packed.size(), text.size());
    EXPECT_EQ(gzipDecompress(packed, text.size()), text);
}

TEST(GzipTest, DecompressRejectsGarbage) {
    EXPECT_THROW((void)gzipDecompress("this is not gzip", 1024), std::runtime_error);
}

TEST(GzipTest, DecompressEnforcesLimit) {
    const auto packed = gzipCompress(std::string(4096, '\0'));
    EXPECT_THROW((void)gzipDecompress(packed, 100), std::runtime_error);
}

TEST(GzipTest, InvalidLevelRejected) {
    EXPECT_THROW((void)gzipCompress("x", 10), std::invalid_argument);
}

TEST(GzipTest, StreamedTarThroughFile) {
    const ts::util::ScratchDir tmp;
    const auto path = tmp.path() / "a.tgz";
    ts::test::writeTgz(path, {ts::test::dir("d/"), ts::test::file("d/f", "payload")});

    const auto back = ts::test::readTgz(path);
    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back[1].first.name, "d/f");
    EXPECT_EQ(back[1].second, "payload");
}

TEST(GzipTest, StreamWriterToMemory) {
    std::ostringstream sink;
    {
        GzipWriter gz(sink, 1);
        gz.stream() << "hello";
        gz.finish();
    }
    EXPECT_EQ(gzipDecompress(sink.str(), 100), "hello");
}

TEST(GzipTest, MissingFileThrows) {
    EXPECT_THROW(GzipReader("/nonexistent/tarsync.tgz"), std::runtime_error);
}

TEST(GzipTest, StreamsAreUsableRightAfterConstruction) {
    std::ostringstream sink;
    GzipWriter writer(sink);
    EXPECT_TRUE(writer.stream().good());
    writer.stream() << "over the wire";
    writer.finish();

    std::istringstream source(sink.str());
    GzipReader reader(source);
    EXPECT_TRUE(reader.stream().good());
    const std::string back((std::istreambuf_iterator<char>(reader.stream())), std::istreambuf_iterator<char>());
    EXPECT_EQ(back, "over the wire");
}
