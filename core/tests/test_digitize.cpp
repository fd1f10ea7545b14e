#include <gtest/gtest.h>
#include "tracedigit/digitize.h"
#include "tracedigit/error.h"
#include "tracedigit/synthetic.h"

#include <cmath>
#include <vector>

using namespace TraceDigit;

static SyntheticTraceSpec FourCycles() {
    SyntheticTraceSpec spec;
    spec.width          = 650;
    spec.height         = 400;
    spec.centers        = {100, 250, 400, 550};
    spec.amplitude_rows = 300.0;
    spec.sigma_cols     = 15.0;
    spec.baseline_rows  = 20.0;
    spec.value          = 200;
    return spec;
}

TEST(Digitize, GaussianRoundTrip) {
    const SyntheticTraceSpec spec = FourCycles();
    cv::Mat img                   = RenderSyntheticTrace(spec);

    DigitizeResult r = Digitize(img, DigitizeConfig{}, AxisScale{0.0, 100.0});
    EXPECT_EQ(r.status, DigitizeStatus::Ok);
    EXPECT_EQ(r.width, 650);
    EXPECT_EQ(r.height, 400);

    ASSERT_EQ(r.detection.peaks.size(), 4u);
    for (size_t i = 0; i < 4; ++i) { EXPECT_NEAR(r.detection.peaks[i], spec.centers[i], 2); }

    const std::vector<int> expected_bounds = {25, 175, 325, 475, 625};
    ASSERT_EQ(r.boundaries.size(), expected_bounds.size());
    for (size_t i = 0; i < expected_bounds.size(); ++i) {
        EXPECT_NEAR(r.boundaries[i], expected_bounds[i], 2);
    }
    ASSERT_EQ(r.regions.size(), 4u);

    const int apex_row = SyntheticTraceRow(spec, spec.centers[0]);
    EXPECT_EQ(apex_row, 80);
    ASSERT_EQ(r.landmarks.size(), 4u);
    ASSERT_EQ(r.samples.size(), 4u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(r.landmarks[i].region_index, static_cast<int>(i));
        EXPECT_EQ(r.landmarks[i].row, apex_row);
        EXPECT_NEAR(r.landmarks[i].column, spec.centers[i], 2);

        EXPECT_EQ(r.samples[i].cycle, static_cast<int>(i) + 1);
        EXPECT_EQ(r.samples[i].row, apex_row);
        EXPECT_DOUBLE_EQ(r.samples[i].value, 80.0);
    }

    EXPECT_EQ(r.summary.count, 4);
    EXPECT_DOUBLE_EQ(r.summary.mean, 80.0);
    EXPECT_DOUBLE_EQ(r.summary.stddev, 0.0);
    EXPECT_FALSE(r.degenerate_scale);
}

TEST(Digitize, LineTraceRoundTrip) {
    SyntheticTraceSpec spec = FourCycles();
    spec.filled             = false;
    spec.thickness          = 3;
    cv::Mat img             = RenderSyntheticTrace(spec);

    DigitizeConfig cfg;
    DigitizeResult r = Digitize(img, cfg, AxisScale{0.0, 100.0});
    ASSERT_EQ(r.status, DigitizeStatus::Ok);
    EXPECT_GE(r.regions.size(), 2u);
    EXPECT_FALSE(r.landmarks.empty());
    for (const Landmark& lm : r.landmarks) { EXPECT_LE(lm.row, 80); }
}

TEST(Digitize, SinglePeakIsInsufficient) {
    SyntheticTraceSpec spec = FourCycles();
    spec.centers            = {300};
    cv::Mat img             = RenderSyntheticTrace(spec);

    DigitizeResult r = Digitize(img, DigitizeConfig{}, AxisScale{0.0, 100.0});
    EXPECT_EQ(r.status, DigitizeStatus::InsufficientPeaks);
    EXPECT_FALSE(r.HasRegions());
    EXPECT_LE(r.detection.peaks.size(), 1u);
    EXPECT_TRUE(r.boundaries.empty());
    EXPECT_TRUE(r.regions.empty());
    EXPECT_TRUE(r.landmarks.empty());
    EXPECT_TRUE(r.samples.empty());
    EXPECT_FALSE(r.calibrated);
}

TEST(Digitize, SpacingWiderThanImageIsInsufficient) {
    cv::Mat img = RenderSyntheticTrace(FourCycles());
    DigitizeConfig cfg;
    cfg.peaks.distance_min = 3e9;
    ASSERT_NO_THROW(cfg.Validate());

    DigitizeResult r = LocateCycles(img, cfg);
    EXPECT_EQ(r.status, DigitizeStatus::InsufficientPeaks);
    EXPECT_EQ(r.detection.peaks.size(), 1u);
}

TEST(Digitize, BlankImageIsInsufficient) {
    cv::Mat img(50, 200, CV_8UC1, cv::Scalar(0));
    DigitizeResult r = Digitize(img, DigitizeConfig{}, AxisScale{0.0, 1.0});
    EXPECT_EQ(r.status, DigitizeStatus::InsufficientPeaks);
    EXPECT_TRUE(r.samples.empty());
}

TEST(Digitize, DarkRegionIsOmitted) {
    const SyntheticTraceSpec spec = FourCycles();
    cv::Mat img                   = RenderSyntheticTrace(spec);

    // Dim the second cycle below the landmark threshold while keeping its peak.
    cv::Mat second = img.colRange(175, 325);
    second.setTo(cv::Scalar(100), second > 0);

    DigitizeConfig cfg;
    cfg.landmark.intensity_threshold = 150;
    DigitizeResult r = Digitize(img, cfg, AxisScale{0.0, 100.0});

    ASSERT_EQ(r.status, DigitizeStatus::Ok);
    ASSERT_EQ(r.regions.size(), 4u);
    ASSERT_EQ(r.landmarks.size(), 3u);
    EXPECT_EQ(r.landmarks[0].region_index, 0);
    EXPECT_EQ(r.landmarks[1].region_index, 2);
    EXPECT_EQ(r.landmarks[2].region_index, 3);

    ASSERT_EQ(r.samples.size(), 3u);
    EXPECT_EQ(r.samples[1].cycle, 2);
    EXPECT_EQ(r.samples[1].region_index, 2);
    EXPECT_EQ(r.summary.count, 3);
}

TEST(Digitize, NoLandmarksAboveThreshold) {
    cv::Mat img = RenderSyntheticTrace(FourCycles());

    DigitizeConfig cfg;
    cfg.landmark.intensity_threshold = 255;
    DigitizeResult r = Digitize(img, cfg, AxisScale{0.0, 100.0});

    EXPECT_EQ(r.status, DigitizeStatus::NoLandmarks);
    EXPECT_EQ(r.regions.size(), 4u);
    EXPECT_TRUE(r.samples.empty());
    EXPECT_EQ(r.summary.count, 0);
    EXPECT_TRUE(std::isnan(r.summary.mean));
}

TEST(Digitize, DegenerateScaleIsFlagged) {
    cv::Mat img = RenderSyntheticTrace(FourCycles());

    DigitizeResult r = Digitize(img, DigitizeConfig{}, AxisScale{7.0, 7.0});
    ASSERT_EQ(r.status, DigitizeStatus::Ok);
    EXPECT_TRUE(r.degenerate_scale);
    for (const CycleSample& s : r.samples) { EXPECT_DOUBLE_EQ(s.value, 7.0); }
    EXPECT_DOUBLE_EQ(r.summary.stddev, 0.0);
}

TEST(Digitize, TwoPhaseMatchesOnePass) {
    cv::Mat img = RenderSyntheticTrace(FourCycles());
    const AxisScale scale{-1.0, 3.0};

    DigitizeResult located = LocateCycles(img, DigitizeConfig{});
    EXPECT_FALSE(located.calibrated);
    EXPECT_TRUE(located.samples.empty());
    ApplyCalibration(located, scale);

    DigitizeResult direct = Digitize(img, DigitizeConfig{}, scale);
    ASSERT_EQ(located.samples.size(), direct.samples.size());
    for (size_t i = 0; i < direct.samples.size(); ++i) {
        EXPECT_EQ(located.samples[i].row, direct.samples[i].row);
        EXPECT_DOUBLE_EQ(located.samples[i].value, direct.samples[i].value);
    }
}

TEST(Digitize, InvalidMatrixThrows) {
    EXPECT_THROW(Digitize(cv::Mat(), DigitizeConfig{}, AxisScale{}), InputError);
    cv::Mat color(10, 10, CV_8UC3, cv::Scalar(0, 0, 0));
    EXPECT_THROW(Digitize(color, DigitizeConfig{}, AxisScale{}), InputError);
}

TEST(Digitize, CalibratingEmptyResultThrows) {
    DigitizeResult r;
    EXPECT_THROW(ApplyCalibration(r, AxisScale{}), InputError);
}
