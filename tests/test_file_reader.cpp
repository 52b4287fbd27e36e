#include <gtest/gtest.h>

#include "io/file_reader.hpp"
#include "testing.hpp"

#include <cerrno>
#include <string>
#include <vector>

namespace {

class FileReaderTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(FileReaderTest, ReportsSizeOfRegularFile) {
    const std::string path = tmp.Join("bundle.js");
    testutil::WriteFile(path, std::string(12345, 'z'));

    codepush::FileReader r;
    auto res = codepush::FileReader::Open(path, r);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(r.Path(), path);
    ASSERT_TRUE(r.TotalSize().has_value());
    EXPECT_EQ(*r.TotalSize(), 12345u);
}

TEST_F(FileReaderTest, MissingFileFails) {
    codepush::FileReader r;
    auto res = codepush::FileReader::Open(tmp.Join("nope.bin"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(FileReaderTest, DirectoryIsRejected) {
    codepush::FileReader r;
    auto res = codepush::FileReader::Open(tmp.Path(), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, EISDIR);
}

TEST_F(FileReaderTest, ReadAfterCloseFails) {
    const std::string path = tmp.Join("a.txt");
    testutil::WriteFile(path, "abc");

    codepush::FileReader r;
    ASSERT_TRUE(codepush::FileReader::Open(path, r).ok);
    r.Close();

    std::uint8_t buf[4];
    errno = 0;
    EXPECT_EQ(r.Read(buf), -1);
    EXPECT_EQ(errno, EBADF);
}

TEST_F(FileReaderTest, ForEachChunkVisitsWholeFile) {
    const std::string path = tmp.Join("big.bin");
    std::string data(2 * codepush::kIoChunkSize + 7, '\0');
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<char>((i * 13) & 0xFF);
    testutil::WriteFile(path, data);

    codepush::FileReader r;
    ASSERT_TRUE(codepush::FileReader::Open(path, r).ok);

    std::string seen;
    int chunks = 0;
    std::uint64_t total = 0;
    auto res = codepush::ForEachChunk(
        r,
        [&](std::span<const std::uint8_t> chunk) {
            ++chunks;
            seen.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
            return codepush::Result::Ok();
        },
        &total);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(seen, data);
    EXPECT_EQ(total, data.size());
    EXPECT_EQ(chunks, 3);
}

TEST(ForEachChunkTest, CallbackFailureStopsIteration) {
    testutil::MemoryReader reader(std::string(3 * codepush::kIoChunkSize, 'x'));
    int calls = 0;
    auto res = codepush::ForEachChunk(reader, [&](std::span<const std::uint8_t>) {
        ++calls;
        return codepush::Result::Fail(codepush::kErrIo, "sink full");
    });
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.msg, "sink full");
    EXPECT_EQ(calls, 1);
}

} // namespace
