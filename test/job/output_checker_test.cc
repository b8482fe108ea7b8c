#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "../../src/job/output_checker.h"

using namespace ChunkSink;
using ::testing::Contains;
using ::testing::HasSubstr;

namespace {

std::string Rec(int code) {
    return "  {\"code\":" + std::to_string(code) + ",\"ref\":\"R\",\"type\":0,\"nature\":0,\"etat\":0,\"ref2\":\"\"}";
}

} // namespace

TEST(OutputCheckerTest, AcceptsWellFormedArray) {
    std::string text = "[\n" + Rec(1) + ",\n" + Rec(2) + ",\n" + Rec(3) + "\n]\n";
    CheckReport report = OutputChecker::CheckJsonArray(text);
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.has_open_bracket);
    EXPECT_TRUE(report.has_close_bracket);
    EXPECT_EQ(report.records, 3u);
    EXPECT_TRUE(report.codes_ascending);
}

TEST(OutputCheckerTest, AcceptsEmptyArray) {
    CheckReport report = OutputChecker::CheckJsonArray("[\n\n]\n");
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.records, 0u);
}

TEST(OutputCheckerTest, FlagsLoneSeparator) {
    std::string text = "[\n,\n" + Rec(2) + Rec(1) + "\n]\n";
    CheckReport report = OutputChecker::CheckJsonArray(text);
    EXPECT_FALSE(report.ok());
    EXPECT_THAT(report.issues, Contains(HasSubstr("line 2: separator alone on a line")));
    EXPECT_THAT(report.issues, Contains(HasSubstr("2 records on one line")));
    EXPECT_FALSE(report.codes_ascending);
}

TEST(OutputCheckerTest, FlagsMissingSeparatorBetweenLines) {
    std::string text = "[\n" + Rec(1) + "\n" + Rec(2) + "\n]\n";
    CheckReport report = OutputChecker::CheckJsonArray(text);
    EXPECT_FALSE(report.ok());
    EXPECT_THAT(report.issues, Contains(HasSubstr("without a separator")));
}

TEST(OutputCheckerTest, FlagsDanglingSeparatorAndMissingBrackets) {
    CheckReport report = OutputChecker::CheckJsonArray(Rec(1) + ",\n");
    EXPECT_FALSE(report.has_open_bracket);
    EXPECT_FALSE(report.has_close_bracket);
    EXPECT_THAT(report.issues, Contains(HasSubstr("dangling separator")));
}

TEST(OutputCheckerTest, FlagsEmptyFile) {
    CheckReport report = OutputChecker::CheckJsonArray("");
    EXPECT_FALSE(report.ok());
}

TEST(OutputCheckerTest, ChecksFileOnDisk) {
    auto path = std::filesystem::temp_directory_path() /
                ("chunksink_checker_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << "[\n" << Rec(5) << ",\n" << Rec(6) << "\n]\n";
    }
    CheckReport report = OutputChecker::CheckJsonArrayFile(path.string());
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.records, 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(OutputChecker::CheckJsonArrayFile(path.string()), std::runtime_error);
}
