#include <gtest/gtest.h>

#include "TestFiles.hpp"
#include "report/JsonReport.hpp"
#include "report/RunLog.hpp"
#include "report/TextReport.hpp"

#include <fstream>
#include <sstream>

using namespace csvcheck;

namespace {

ValidationResult sample_result(size_t type_errors) {
    ValidationResult res;
    res.file_path = "users.csv";
    res.total_rows = type_errors + 1;
    res.rows_validated = 1;
    add_error(res, 2, "email", ErrorKind::Required, "Required field 'email' is empty or missing");
    for (size_t i = 0; i < type_errors; ++i) {
        add_error(res, 3 + i, "age", ErrorKind::Type, "Invalid type for 'age'. Expected integer, got 'x'", "x");
    }
    return res;
}

size_t count_occurrences(const std::string& hay, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) ++n;
    return n;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST(ValidationResult, AddErrorKeepsCountersInStep) {
    ValidationResult res;
    EXPECT_TRUE(res.valid);
    add_error(res, 0, "", ErrorKind::File, "File is empty");
    EXPECT_FALSE(res.valid);
    EXPECT_EQ(res.error_count, 1u);
    EXPECT_EQ(res.count(ErrorKind::File), 1u);
    EXPECT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(error_kind_name(ErrorKind::Structural), "structural");
}

TEST(TextReport, ValidResultHasNoSummary) {
    ValidationResult res;
    res.file_path = "ok.csv";
    res.total_rows = 3;
    res.rows_validated = 3;

    const std::string text = render_text_report(res, ReportOptions{true, 100});
    EXPECT_NE(text.find("CSV VALIDATION REPORT"), std::string::npos);
    EXPECT_NE(text.find("File: ok.csv\n"), std::string::npos);
    EXPECT_NE(text.find("Status: VALID\n"), std::string::npos);
    EXPECT_NE(text.find("Total Rows: 3\n"), std::string::npos);
    EXPECT_NE(text.find("Rows Validated: 3\n"), std::string::npos);
    EXPECT_NE(text.find("Total Errors: 0\n"), std::string::npos);
    EXPECT_EQ(text.find("ERROR SUMMARY"), std::string::npos);
}

TEST(TextReport, SummaryListsOnlyNonZeroKinds) {
    const std::string text = render_text_report(sample_result(2));
    EXPECT_NE(text.find("Status: INVALID\n"), std::string::npos);
    EXPECT_NE(text.find("Required Errors: 1\n"), std::string::npos);
    EXPECT_NE(text.find("Type Errors: 2\n"), std::string::npos);
    EXPECT_EQ(text.find("Custom Errors"), std::string::npos);
    EXPECT_EQ(text.find("DETAILED ERRORS"), std::string::npos);
}

TEST(TextReport, VerboseListsErrorsWithValues) {
    ReportOptions opts;
    opts.verbose = true;
    const std::string text = render_text_report(sample_result(1), opts);
    EXPECT_NE(text.find("DETAILED ERRORS"), std::string::npos);
    EXPECT_NE(text.find("1. Line 2, Column 'email'\n   Type: required\n"), std::string::npos);
    EXPECT_NE(text.find("2. Line 3, Column 'age'\n   Type: type\n"), std::string::npos);
    EXPECT_NE(text.find("   Value: x\n"), std::string::npos);
    EXPECT_EQ(count_occurrences(text, "   Value:"), 1u);
    EXPECT_EQ(text.find("more errors"), std::string::npos);
}

TEST(TextReport, VerboseTruncatesLongLists) {
    ReportOptions opts;
    opts.verbose = true;
    const ValidationResult res = sample_result(150);
    const std::string text = render_text_report(res, opts);
    EXPECT_EQ(count_occurrences(text, "   Message: "), 100u);
    EXPECT_NE(text.find("\n... and 51 more errors\n"), std::string::npos);
}

TEST(TextReport, PrintWritesToStream) {
    std::ostringstream out;
    const ValidationResult res = sample_result(0);
    print_text_report(out, res);
    EXPECT_EQ(out.str(), render_text_report(res));
}

TEST(JsonReport, SerializesAllFields) {
    const nlohmann::json j = result_to_json(sample_result(1));
    EXPECT_EQ(j["valid"], false);
    EXPECT_EQ(j["file_path"], "users.csv");
    EXPECT_EQ(j["total_rows"], 2);
    EXPECT_EQ(j["rows_validated"], 1);
    EXPECT_EQ(j["error_count"], 2);

    const nlohmann::json& summary = j["summary"];
    EXPECT_EQ(summary.size(), 5u);
    EXPECT_EQ(summary["file_errors"], 0);
    EXPECT_EQ(summary["structural_errors"], 0);
    EXPECT_EQ(summary["type_errors"], 1);
    EXPECT_EQ(summary["required_errors"], 1);
    EXPECT_EQ(summary["custom_errors"], 0);

    ASSERT_EQ(j["errors"].size(), 2u);
    EXPECT_EQ(j["errors"][0]["error_type"], "required");
    EXPECT_TRUE(j["errors"][0]["value"].is_null());
    EXPECT_EQ(j["errors"][1]["line"], 3);
    EXPECT_EQ(j["errors"][1]["column"], "age");
    EXPECT_EQ(j["errors"][1]["value"], "x");
}

TEST(JsonReport, WritesFileCreatingDirectories) {
    testfiles::TempDir dir;
    const std::string path = dir.join("out/nested/report.json");
    write_json_report(path, sample_result(1));

    const nlohmann::json j = nlohmann::json::parse(read_file(path));
    EXPECT_EQ(j["error_count"], 2);
}

TEST(RunLog, AppendsOneLinePerRun) {
    testfiles::TempDir dir;
    const std::string path = dir.join("logs/runs.jsonl");
    ValidationOptions opts;
    opts.max_errors = 10;

    ASSERT_TRUE(append_run_log(path, sample_result(1), opts));
    ASSERT_TRUE(append_run_log(path, sample_result(0), ValidationOptions{}));

    std::istringstream lines(read_file(path));
    std::string line;
    std::vector<nlohmann::json> records;
    while (std::getline(lines, line)) records.push_back(nlohmann::json::parse(line));

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["file_path"], "users.csv");
    EXPECT_EQ(records[0]["max_errors"], 10);
    EXPECT_EQ(records[0]["error_count"], 2);
    EXPECT_EQ(records[0]["delimiter"], ",");
    EXPECT_TRUE(records[1]["max_errors"].is_null());
    EXPECT_TRUE(records[0].contains("ts"));
}

TEST(RunLog, UnwritableLogReturnsFalse) {
    testfiles::TempDir dir;
    // a directory where the log file should be
    const std::string path = dir.join("taken");
    std::filesystem::create_directories(path);
    EXPECT_FALSE(append_run_log(path, sample_result(0), ValidationOptions{}));
}
