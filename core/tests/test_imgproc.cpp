#include <gtest/gtest.h>
#include "tracedigit/imgproc.h"
#include "tracedigit/error.h"

#include <vector>

#include <opencv2/imgcodecs.hpp>

using namespace TraceDigit;

static PreprocessConfig IdentityConfig() {
    PreprocessConfig cfg;
    cfg.target_width         = 0;
    cfg.upscale_factor       = 1.0f;
    cfg.brightness_threshold = 0;
    return cfg;
}

TEST(ImgProc, ResizeCropAndUpscale) {
    cv::Mat input(100, 200, CV_8UC3, cv::Scalar(30, 60, 90));

    PreprocessConfig cfg;
    cfg.target_width   = 100;
    cfg.upscale_factor = 2.0f;
    ImgProc proc(cfg);

    ImgProcResult r = proc.Run(input, cv::Rect(10, 5, 40, 20), "sample");
    EXPECT_EQ(r.name, "sample");
    EXPECT_EQ(r.resized.cols, 100);
    EXPECT_EQ(r.resized.rows, 50);
    EXPECT_EQ(r.roi, cv::Rect(10, 5, 40, 20));
    EXPECT_EQ(r.cropped.size(), cv::Size(40, 20));
    EXPECT_EQ(r.upscaled.size(), cv::Size(80, 40));
    EXPECT_EQ(r.intensity.type(), CV_8UC1);
    EXPECT_EQ(r.width(), 80);
    EXPECT_EQ(r.height(), 40);
}

TEST(ImgProc, TargetWidthTruncatesHeight) {
    cv::Mat input(101, 300, CV_8UC3, cv::Scalar(0, 0, 0));
    PreprocessConfig cfg = IdentityConfig();
    cfg.target_width     = 200;
    ImgProcResult r      = ImgProc(cfg).Run(input);
    EXPECT_EQ(r.resized.cols, 200);
    EXPECT_EQ(r.resized.rows, 67);
}

TEST(ImgProc, EmptyRoiSelectsWholeImage) {
    cv::Mat input(30, 40, CV_8UC3, cv::Scalar(1, 2, 3));
    ImgProcResult r = ImgProc(IdentityConfig()).Run(input);
    EXPECT_EQ(r.roi, cv::Rect(0, 0, 40, 30));
    EXPECT_EQ(r.intensity.size(), cv::Size(40, 30));
}

TEST(ImgProc, RoiIsClipped) {
    cv::Mat input(30, 40, CV_8UC3, cv::Scalar(1, 2, 3));
    ImgProcResult r = ImgProc(IdentityConfig()).Run(input, cv::Rect(30, 20, 50, 50));
    EXPECT_EQ(r.roi, cv::Rect(30, 20, 10, 10));
}

TEST(ImgProc, RoiOutsideImageThrows) {
    cv::Mat input(30, 40, CV_8UC3, cv::Scalar(1, 2, 3));
    EXPECT_THROW(ImgProc(IdentityConfig()).Run(input, cv::Rect(50, 50, 5, 5)), InputError);
}

TEST(ImgProc, BrightnessFloorZeroesDarkPixels) {
    cv::Mat input = (cv::Mat_<uint8_t>(1, 4) << 0, 4, 5, 200);

    PreprocessConfig cfg     = IdentityConfig();
    cfg.brightness_threshold = 5;
    ImgProcResult r          = ImgProc(cfg).Run(input);

    ASSERT_EQ(r.intensity.size(), cv::Size(4, 1));
    EXPECT_EQ(r.intensity.at<uint8_t>(0, 0), 0);
    EXPECT_EQ(r.intensity.at<uint8_t>(0, 1), 0);
    EXPECT_EQ(r.intensity.at<uint8_t>(0, 2), 5);
    EXPECT_EQ(r.intensity.at<uint8_t>(0, 3), 200);
}

TEST(ImgProc, GrayInputIsPreserved) {
    cv::Mat input(8, 8, CV_8UC1, cv::Scalar(77));
    ImgProcResult r = ImgProc(IdentityConfig()).Run(input);
    EXPECT_EQ(r.upscaled.channels(), 3);
    EXPECT_EQ(cv::countNonZero(r.intensity != 77), 0);
}

TEST(ImgProc, DecodeFromBuffer) {
    cv::Mat input(20, 30, CV_8UC1, cv::Scalar(120));
    std::vector<uint8_t> png;
    ASSERT_TRUE(cv::imencode(".png", input, png));

    ImgProcResult r = ImgProc(IdentityConfig()).RunFromBuffer(png, cv::Rect(), "buf");
    EXPECT_EQ(r.name, "buf");
    EXPECT_EQ(r.intensity.size(), cv::Size(30, 20));
    EXPECT_EQ(r.intensity.at<uint8_t>(10, 10), 120);
}

TEST(ImgProc, InvalidInputs) {
    ImgProc proc(IdentityConfig());
    EXPECT_THROW(proc.Run(cv::Mat()), InputError);
    EXPECT_THROW(proc.RunFromBuffer(std::vector<uint8_t>{}), InputError);
    EXPECT_THROW(proc.RunFromBuffer(std::vector<uint8_t>{1, 2, 3, 4}), IOError);
    EXPECT_THROW(proc.Run(std::string("/nonexistent/image.jpg")), IOError);
}
