#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <csignal>
#include <sys/resource.h>
#include <unistd.h>
#include "../../src/sink/file_output.h"
#include "../../src/sink/ordered_append_sink.h"
#include "../../src/sink/sink_errors.h"

using namespace ChunkSink;
namespace fs = std::filesystem;

class FileOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("chunksink_file_output_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
        path_ = (dir_ / "out.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string ReadAll() const {
        std::ifstream in(path_, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    fs::path dir_;
    std::string path_;
};

TEST_F(FileOutputTest, AppendsAndCloses) {
    FileOutput output(path_);
    EXPECT_EQ(output.Append("hello "), 6u);
    EXPECT_EQ(output.Append("world"), 5u);
    output.Close();
    EXPECT_EQ(ReadAll(), "hello world");
    EXPECT_EQ(output.Describe(), path_);
}

TEST_F(FileOutputTest, TruncatesExistingFile) {
    {
        std::ofstream stale(path_);
        stale << "stale content";
    }
    FileOutput output(path_, /*force_sync=*/true);
    output.Append("new");
    output.Close();
    EXPECT_EQ(ReadAll(), "new");
}

TEST_F(FileOutputTest, AppendAfterCloseThrows) {
    FileOutput output(path_);
    output.Close();
    EXPECT_THROW(output.Append("late"), std::runtime_error);
    // Closing twice is harmless
    EXPECT_NO_THROW(output.Close());
}

TEST_F(FileOutputTest, OpenFailureThrowsSystemError) {
    std::string missing = (dir_ / "no_such_dir" / "out.json").string();
    EXPECT_THROW(FileOutput output(missing), std::system_error);
}

TEST_F(FileOutputTest, FailedAppendLeavesNoPartialFragment) {
    FileOutput output(path_);
    output.Append("head;");

    // Cap the file at 8 bytes: the next write stores 3 bytes, then fails with EFBIG.
    struct rlimit saved;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &saved), 0);
    struct rlimit capped = saved;
    capped.rlim_cur = 8;
    auto old_handler = std::signal(SIGXFSZ, SIG_IGN);
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &capped), 0);

    EXPECT_THROW(output.Append("0123456789"), std::system_error);

    setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, old_handler);

    EXPECT_EQ(ReadAll(), "head;");
    // The output stays usable after the rollback
    output.Append("tail;");
    output.Close();
    EXPECT_EQ(ReadAll(), "head;tail;");
}

TEST_F(FileOutputTest, SinkReportsFailedFragmentWithoutWritingIt) {
    OrderedAppendSink sink(std::make_unique<FileOutput>(path_));
    sink.Submit(0, "a;");
    struct rlimit saved;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &saved), 0);
    struct rlimit capped = saved;
    capped.rlim_cur = 4;
    auto old_handler = std::signal(SIGXFSZ, SIG_IGN);
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &capped), 0);

    EXPECT_THROW(sink.Submit(1, "bbbbbb;"), SinkWriteError);

    setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, old_handler);

    EXPECT_EQ(sink.GetStats().bytes_written, 2u);
    EXPECT_THROW(sink.Close(), SinkPoisonedError);
    EXPECT_EQ(ReadAll(), "a;");
}

TEST_F(FileOutputTest, SinkWritesFileInSequenceOrder) {
    OrderedAppendSink sink(std::make_unique<FileOutput>(path_));
    sink.Enqueue(2, "c");
    sink.Enqueue(1, "b");
    sink.Enqueue(0, "a");
    sink.Close();
    EXPECT_EQ(ReadAll(), "abc");
}
