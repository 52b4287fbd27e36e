#include <gtest/gtest.h>

#include "codepush/progress_sinks.hpp"
#include "util/format.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

class CapturedStream {
public:
    CapturedStream() : stream_(open_memstream(&buf_, &len_)) {}
    ~CapturedStream() {
        if (stream_) std::fclose(stream_);
        std::free(buf_);
    }

    std::FILE* Get() const { return stream_; }
    std::string Text() {
        std::fflush(stream_);
        return std::string(buf_, len_);
    }

private:
    char* buf_ = nullptr;
    size_t len_ = 0;
    std::FILE* stream_;
};

TEST(FormatBytesTest, UsesBinaryUnits) {
    EXPECT_EQ(codepush::FormatBytes(0), "0 B");
    EXPECT_EQ(codepush::FormatBytes(1023), "1023 B");
    EXPECT_EQ(codepush::FormatBytes(1536), "1.5 KB");
    EXPECT_EQ(codepush::FormatBytes(3 * 1024 * 1024), "3.0 MB");
}

TEST(ConsoleProgressSinkTest, RepaintsOnlyOnPercentChange) {
    CapturedStream out;
    codepush::ConsoleProgressSink sink(out.Get());

    sink.OnProgress({.label = "upload", .sent = 10, .total = 1000});
    sink.OnProgress({.label = "upload", .sent = 11, .total = 1000});
    EXPECT_TRUE(codepush::IsProgressLineActive());

    const std::string text = out.Text();
    EXPECT_EQ(text, "\r   upload   1% (10 B of 1000 B)");
    codepush::ClearProgressLine();
    EXPECT_FALSE(codepush::IsProgressLineActive());
    EXPECT_EQ(out.Text(), text + "\n");
}

TEST(ConsoleProgressSinkTest, CompletionEndsLine) {
    CapturedStream out;
    codepush::ConsoleProgressSink sink(out.Get());

    sink.OnProgress({.label = "upload", .sent = 2048, .total = 2048});
    EXPECT_FALSE(codepush::IsProgressLineActive());
    EXPECT_EQ(out.Text(), "\r   upload 100% (2.0 KB of 2.0 KB)\n");
}

TEST(ConsoleProgressSinkTest, UnknownTotalShowsBytesSent) {
    CapturedStream out;
    codepush::ConsoleProgressSink sink(out.Get());

    sink.OnProgress({.label = "upload", .sent = 512, .total = 0});
    EXPECT_EQ(out.Text(), "\r   upload 512 B");
    codepush::ClearProgressLine();
}

} // namespace
