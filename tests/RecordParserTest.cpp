#include "RecordParser.hpp"
#include "TestUtil.hpp"
#include <fstream>


namespace {

const char* kHead = R"({"timestamp":"2025-01-15T10:00:00Z","message":{"id":"msg_1","usage":{"input_tokens":5}},)";

// Valid usage record whose nesting depth (top-level object = 1) is `depth`.
std::string nested_record(int depth) {
    const std::string extra = std::string(depth - 1, '[') + std::string(depth - 1, ']');
    return std::string(kHead) + R"("extra":)" + extra + "}";
}

// Valid usage record of exactly `total` bytes.
std::string padded_record(size_t total) {
    const std::string open = std::string(kHead) + R"("pad":")";
    const std::string close = R"("})";
    return open + std::string(total - open.size() - close.size(), 'x') + close;
}

} // namespace


class RecordParserTest : public TempDirTest {
protected:
    ParseStatus parse(const std::string& line, UsageEntry& e, std::string& reason) {
        RecordParser p(cfg_, -1);
        return p.parse_line(line, "test.jsonl", 1, e, reason);
    }

    MonitorConfig cfg_;
};

TEST_F(RecordParserTest, ParsesFullRecord) {
    UsageEntry e;
    std::string reason;
    const std::string line = usage_line("2025-01-15T10:00:00.250Z", "msg_1", "req_1", 100, 20, 30, 40, "claude-opus-4");
    ASSERT_EQ(parse(line, e, reason), ParseStatus::Usage) << reason;

    EXPECT_EQ(e.timestamp_ns, kT0 + 250 * 1000000LL);
    EXPECT_EQ(e.model, "claude-opus-4");
    EXPECT_EQ(e.input_tokens, 100u);
    EXPECT_EQ(e.output_tokens, 20u);
    EXPECT_EQ(e.cache_creation_tokens, 30u);
    EXPECT_EQ(e.cache_read_tokens, 40u);
    EXPECT_EQ(e.total_tokens(), 190u);
    EXPECT_EQ(e.message_id, "msg_1");
    EXPECT_EQ(e.request_id, "req_1");
    EXPECT_EQ(e.source_file, "test.jsonl");
    EXPECT_EQ(e.line_no, 1u);
}

TEST_F(RecordParserTest, AcceptsTopLevelFallbacks) {
    UsageEntry e;
    std::string reason;
    const std::string line =
        R"({"timestamp":"2025-01-15T12:00:00+02:00","model":"m1","message_id":"id9","request_id":"r9",)"
        R"("usage":{"input_tokens":7,"output_tokens":3}})";
    ASSERT_EQ(parse(line, e, reason), ParseStatus::Usage) << reason;
    EXPECT_EQ(e.timestamp_ns, kT0);
    EXPECT_EQ(e.model, "m1");
    EXPECT_EQ(e.message_id, "id9");
    EXPECT_EQ(e.request_id, "r9");
    EXPECT_EQ(e.total_tokens(), 10u);
}

TEST_F(RecordParserTest, RecordsWithoutUsageAreSkippedNotErrors) {
    UsageEntry e;
    std::string reason;
    EXPECT_EQ(parse(R"({"type":"user","timestamp":"2025-01-15T10:00:00Z","message":{"role":"user"}})", e, reason),
              ParseStatus::NotUsage);
    EXPECT_EQ(parse(R"({"type":"summary","summary":"x","usage":{"input_tokens":1}})", e, reason),
              ParseStatus::NotUsage);
    // no timestamp needed when there is no usage at all
    EXPECT_EQ(parse(R"({"message":{"id":"x"}})", e, reason), ParseStatus::NotUsage);
}

TEST_F(RecordParserTest, MalformedInputs) {
    UsageEntry e;
    std::string reason;
    EXPECT_EQ(parse("{not json", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(parse("[1,2,3]", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(parse(R"({"message":{"usage":{"input_tokens":1}}})", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(parse(R"({"timestamp":"yesterday","message":{"usage":{"input_tokens":1}}})", e, reason),
              ParseStatus::Malformed);
    EXPECT_EQ(parse(R"({"timestamp":"2025-02-30T00:00:00Z","message":{"usage":{"input_tokens":1}}})", e, reason),
              ParseStatus::Malformed);
}

TEST_F(RecordParserTest, InvalidTokenCountsAreMalformed) {
    UsageEntry e;
    std::string reason;
    const std::string pre = R"({"timestamp":"2025-01-15T10:00:00Z","message":{"usage":{"input_tokens":)";
    EXPECT_EQ(parse(pre + "-1}}}", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(parse(pre + "1.5}}}", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(parse(pre + "\"12\"}}}", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(parse(pre + "4294967296}}}", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(parse(pre + "4294967295}}}", e, reason), ParseStatus::Usage);
    EXPECT_EQ(parse(pre + "null}}}", e, reason), ParseStatus::Usage);
    EXPECT_EQ(e.input_tokens, 0u);
}

TEST_F(RecordParserTest, DepthLimitEnforcedDuringParse) {
    UsageEntry e;
    std::string reason;
    EXPECT_EQ(parse(nested_record(31), e, reason), ParseStatus::Usage) << reason;
    EXPECT_EQ(parse(nested_record(32), e, reason), ParseStatus::Usage) << reason;
    EXPECT_EQ(parse(nested_record(33), e, reason), ParseStatus::Malformed);
    EXPECT_NE(reason.find("nesting"), std::string::npos);
}

TEST_F(RecordParserTest, DeepNestingDoesNotExhaustStack) {
    UsageEntry e;
    std::string reason;
    const std::string bomb = std::string(200000, '[') + std::string(200000, ']');
    EXPECT_EQ(parse(bomb, e, reason), ParseStatus::Malformed);
}

TEST_F(RecordParserTest, LineSizeCeiling) {
    UsageEntry e;
    std::string reason;
    const size_t max = 1024 * 1024;
    EXPECT_EQ(parse(padded_record(max), e, reason), ParseStatus::Usage) << reason;
    EXPECT_EQ(parse(padded_record(max + 1), e, reason), ParseStatus::Malformed);
    EXPECT_NE(reason.find("too large"), std::string::npos);
}

TEST_F(RecordParserTest, ReasonNeverQuotesRecordContent) {
    UsageEntry e;
    std::string reason;
    EXPECT_EQ(parse(R"({"secret":"hunter2", oops})", e, reason), ParseStatus::Malformed);
    EXPECT_EQ(reason.find("hunter2"), std::string::npos);
}

TEST_F(RecordParserTest, ParseFileCountsEveryOutcome) {
    const fs::path file = dir_ / "s.jsonl";
    write_lines(file, {
        usage_line("2025-01-15T10:00:00Z", "a", "r1", 10),
        "",
        "{broken",
        R"({"type":"summary","summary":"s"})",
        padded_record(1024 * 1024 + 1),
        usage_line("2025-01-15T10:01:00Z", "b", "r2", 20),
    });

    RecordParser p(cfg_, -1);
    std::vector<UsageEntry> out;
    DerivationReport report;
    ASSERT_EQ(p.parse_file(file.string(), out, report), IngestError::None);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].message_id, "a");
    EXPECT_EQ(out[0].line_no, 1u);
    EXPECT_EQ(out[1].message_id, "b");
    EXPECT_EQ(out[1].line_no, 6u);
    EXPECT_EQ(out[1].source_file, file.string());

    EXPECT_EQ(report.files_scanned, 1u);
    EXPECT_EQ(report.lines_read, 5u);
    EXPECT_EQ(report.usage_entries, 2u);
    EXPECT_EQ(report.non_usage_lines, 1u);
    EXPECT_EQ(report.malformed_lines, 2u);
}

TEST_F(RecordParserTest, HandlesCrlfAndUnterminatedLastLine) {
    const fs::path file = dir_ / "crlf.jsonl";
    {
        std::ofstream f(file, std::ios::binary);
        f << usage_line("2025-01-15T10:00:00Z", "a", "r1", 10) << "\r\n";
        f << usage_line("2025-01-15T10:01:00Z", "b", "r2", 20);   // complete, no newline
    }
    RecordParser p(cfg_, -1);
    std::vector<UsageEntry> out;
    DerivationReport report;
    ASSERT_EQ(p.parse_file(file.string(), out, report), IngestError::None);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(report.malformed_lines, 0u);
}

TEST_F(RecordParserTest, PartiallyWrittenLastLineIsNotCounted) {
    const fs::path file = dir_ / "partial.jsonl";
    {
        std::ofstream f(file, std::ios::binary);
        f << usage_line("2025-01-15T10:00:00Z", "a", "r1", 10) << "\n";
        f << R"({"timestamp":"2025-01-15T10:01:00Z","message":{"us)";
    }
    RecordParser p(cfg_, -1);
    std::vector<UsageEntry> out;
    DerivationReport report;
    ASSERT_EQ(p.parse_file(file.string(), out, report), IngestError::None);
    EXPECT_EQ(out.size(), 1u);
    EXPECT_EQ(report.lines_read, 1u);
    EXPECT_EQ(report.malformed_lines, 0u);
}

TEST_F(RecordParserTest, OversizedFileSkippedBeforeOpen) {
    const fs::path file = dir_ / "big.jsonl";
    { std::ofstream f(file); }
    fs::resize_file(file, 50ULL * 1024 * 1024 + 1);   // sparse

    RecordParser p(cfg_, -1);
    std::vector<UsageEntry> out;
    DerivationReport report;
    EXPECT_EQ(p.parse_file(file.string(), out, report), IngestError::FileTooLarge);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(report.files_too_large, 1u);
    EXPECT_EQ(report.files_scanned, 0u);
    EXPECT_EQ(report.lines_read, 0u);
}

TEST_F(RecordParserTest, FileCeilingIsInclusive) {
    cfg_.max_file_bytes = 1024;
    cfg_.max_line_bytes = 1024;
    const fs::path at = dir_ / "at.jsonl";
    const fs::path over = dir_ / "over.jsonl";
    {
        std::ofstream f(at, std::ios::binary);
        f << padded_record(1023) << "\n";
    }
    {
        std::ofstream f(over, std::ios::binary);
        f << padded_record(1024) << "\n";
    }
    RecordParser p(cfg_, -1);
    std::vector<UsageEntry> out;
    DerivationReport report;
    EXPECT_EQ(p.parse_file(at.string(), out, report), IngestError::None);
    EXPECT_EQ(out.size(), 1u);
    EXPECT_EQ(p.parse_file(over.string(), out, report), IngestError::FileTooLarge);
}

TEST_F(RecordParserTest, MissingFileIsReadFailed) {
    RecordParser p(cfg_, -1);
    std::vector<UsageEntry> out;
    DerivationReport report;
    EXPECT_EQ(p.parse_file((dir_ / "gone.jsonl").string(), out, report), IngestError::ReadFailed);
    EXPECT_EQ(report.files_unreadable, 1u);
}
