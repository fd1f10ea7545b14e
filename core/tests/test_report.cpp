#include <gtest/gtest.h>
#include "tracedigit/report.h"
#include "tracedigit/error.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace TraceDigit;

static DigitizeResult MakeResult() {
    DigitizeResult r;
    r.status                            = DigitizeStatus::Ok;
    r.width                             = 300;
    r.height                            = 200;
    r.detection.peaks                   = {50, 150, 250};
    r.detection.prominences             = {12.5, 20.0, 8.0};
    r.detection.profile_stats.mean      = 4.0;
    r.detection.profile_stats.stddev    = 2.0;
    r.boundaries                        = {0, 100, 200, 300};
    r.landmarks                         = {{0, 48, 50}, {2, 251, 150}};
    r.calibrated                        = true;
    r.scale                             = AxisScale{0.5, 99.5};

    CycleSample a;
    a.cycle        = 1;
    a.region_index = 0;
    a.column       = 48;
    a.row          = 50;
    a.value        = 12.5;
    CycleSample b;
    b.cycle        = 2;
    b.region_index = 2;
    b.column       = 251;
    b.row          = 150;
    b.value        = -3.25;
    r.samples      = {a, b};

    r.summary.count  = 2;
    r.summary.mean   = 4.625;
    r.summary.stddev = 7.875;
    return r;
}

TEST(Report, SamplesCsv) {
    const std::string csv = SamplesToCsv(MakeResult());
    EXPECT_EQ(csv, "Cycle #,Y Position (pixels),Converted Y Position (0.5-99.5 scale)\n"
                   "1,50,12.5\n"
                   "2,150,-3.25\n");
}

TEST(Report, SummaryCsv) {
    SummaryStats s;
    s.count  = 2;
    s.mean   = 4.625;
    s.stddev = 7.875;
    EXPECT_EQ(SummaryToCsv(s), "Statistic,Value\nMean,4.625\nStd,7.875\n");
}

TEST(Report, SummaryCsvLeavesNaNEmpty) {
    SummaryStats s;
    s.mean   = std::numeric_limits<double>::quiet_NaN();
    s.stddev = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(SummaryToCsv(s), "Statistic,Value\nMean,\nStd,\n");
}

TEST(Report, JsonDocument) {
    const nlohmann::json j = nlohmann::json::parse(ResultToJsonString(MakeResult()));
    EXPECT_EQ(j.at("status"), "ok");
    EXPECT_EQ(j.at("width"), 300);
    ASSERT_EQ(j.at("peaks").size(), 3u);
    EXPECT_EQ(j.at("peaks")[1].at("column"), 150);
    EXPECT_DOUBLE_EQ(j.at("peaks")[0].at("prominence").get<double>(), 12.5);
    EXPECT_EQ(j.at("boundaries"), nlohmann::json::array({0, 100, 200, 300}));
    ASSERT_EQ(j.at("landmarks").size(), 2u);
    EXPECT_EQ(j.at("landmarks")[1].at("region"), 2);
    ASSERT_EQ(j.at("samples").size(), 2u);
    EXPECT_DOUBLE_EQ(j.at("samples")[1].at("value").get<double>(), -3.25);
    EXPECT_DOUBLE_EQ(j.at("summary").at("mean").get<double>(), 4.625);
    EXPECT_FALSE(j.at("scale").at("degenerate").get<bool>());
}

TEST(Report, JsonSkippedImageHasNoSamples) {
    DigitizeResult r;
    r.status = DigitizeStatus::InsufficientPeaks;
    r.width  = 10;
    r.height = 10;
    const nlohmann::json j = nlohmann::json::parse(ResultToJsonString(r));
    EXPECT_EQ(j.at("status"), "insufficient_peaks");
    EXPECT_TRUE(j.at("peaks").empty());
    EXPECT_FALSE(j.contains("samples"));
}

TEST(Report, JsonNaNSummaryIsNull) {
    DigitizeResult r;
    r.status         = DigitizeStatus::NoLandmarks;
    r.calibrated     = true;
    r.summary.mean   = std::numeric_limits<double>::quiet_NaN();
    r.summary.stddev = std::numeric_limits<double>::quiet_NaN();
    const nlohmann::json j = nlohmann::json::parse(ResultToJsonString(r));
    EXPECT_TRUE(j.at("summary").at("mean").is_null());
    EXPECT_EQ(j.at("status"), "no_landmarks");
}

TEST(Report, WriteTextFile) {
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "tracedigit_report_test.csv";
    WriteTextFile(path.string(), "a,b\n1,2\n");

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "a,b\n1,2\n");
    std::filesystem::remove(path);

    EXPECT_THROW(WriteTextFile("/nonexistent/dir/out.csv", "x"), IOError);
}
