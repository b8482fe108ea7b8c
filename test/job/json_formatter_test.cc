#include <gtest/gtest.h>
#include "../../src/job/json_formatter.h"
#include "../../src/job/output_checker.h"

using namespace ChunkSink;

namespace {

Record MakeRecord(int code, const std::string& ref, const std::string& ref2 = "") {
    Record record;
    record.code = code;
    record.ref = ref;
    record.type = 1;
    record.nature = 2;
    record.etat = 3;
    record.ref2 = ref2;
    return record;
}

} // namespace

TEST(JsonArrayFormatterTest, FormatsSingleRecord) {
    EXPECT_EQ(JsonArrayFormatter::FormatRecord(MakeRecord(10001, "REF1", "X")),
              "{\"code\":10001,\"ref\":\"REF1\",\"type\":1,\"nature\":2,\"etat\":3,\"ref2\":\"X\"}");
}

TEST(JsonArrayFormatterTest, EscapesStrings) {
    EXPECT_EQ(JsonArrayFormatter::Escape("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    EXPECT_EQ(JsonArrayFormatter::Escape(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(JsonArrayFormatter::Escape("plain"), "plain");
}

TEST(JsonArrayFormatterTest, FirstChunkHasNoLeadingSeparator) {
    JsonArrayFormatter formatter(1);
    Chunk first{1, {MakeRecord(1, "A"), MakeRecord(2, "B")}};
    Chunk later{2, {MakeRecord(3, "C")}};

    std::string first_text = formatter.Format(first);
    std::string later_text = formatter.Format(later);

    EXPECT_EQ(first_text.rfind("  {\"code\":1,", 0), 0u);
    EXPECT_NE(first_text.find("},\n  {\"code\":2,"), std::string::npos);
    EXPECT_EQ(later_text.rfind(",\n  {\"code\":3,", 0), 0u);
}

TEST(JsonArrayFormatterTest, FragmentsInSequenceOrderFormWellFormedArray) {
    JsonArrayFormatter formatter(1);
    std::string text = formatter.Header();
    for (uint64_t seq = 1; seq <= 4; ++seq) {
        Chunk chunk{seq, {MakeRecord(static_cast<int>(seq * 10), "R"),
                          MakeRecord(static_cast<int>(seq * 10 + 1), "S")}};
        text += formatter.Format(chunk);
    }
    text += formatter.Footer();

    CheckReport report = OutputChecker::CheckJsonArray(text);
    EXPECT_TRUE(report.ok()) << (report.issues.empty() ? "" : report.issues.front());
    EXPECT_EQ(report.records, 8u);
    EXPECT_TRUE(report.codes_ascending);
}

TEST(JsonArrayFormatterTest, SwappedFragmentsAreDetected) {
    JsonArrayFormatter formatter(1);
    Chunk first{1, {MakeRecord(1, "A")}};
    Chunk second{2, {MakeRecord(2, "B")}};
    Chunk third{3, {MakeRecord(3, "C")}};

    // Second chunk written before the first: separator alone, then two records on one line.
    std::string text = formatter.Header() + formatter.Format(second) + formatter.Format(first) +
                       formatter.Format(third) + formatter.Footer();

    CheckReport report = OutputChecker::CheckJsonArray(text);
    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.codes_ascending);
    EXPECT_EQ(report.records, 3u);
}
