#include <gtest/gtest.h>
#include "tracedigit/segment.h"
#include "tracedigit/error.h"

#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace TraceDigit;

TEST(Segment, ExtrapolatesHalfGapAtBothEnds) {
    const std::vector<int> peaks = {100, 250, 400, 550};
    EXPECT_EQ(ComputeRegionBoundaries(peaks, 650), (std::vector<int>{25, 175, 325, 475, 625}));
}

TEST(Segment, ClampsToImageEdges) {
    const std::vector<int> left = {10, 100};
    EXPECT_EQ(ComputeRegionBoundaries(left, 200), (std::vector<int>{0, 55, 145}));

    const std::vector<int> right = {50, 190};
    EXPECT_EQ(ComputeRegionBoundaries(right, 200), (std::vector<int>{0, 120, 200}));
}

TEST(Segment, OddGapsUseFloorDivision) {
    const std::vector<int> peaks = {0, 3};
    EXPECT_EQ(ComputeRegionBoundaries(peaks, 10), (std::vector<int>{0, 1, 4}));
}

TEST(Segment, UnevenSpacingUsesOuterGaps) {
    const std::vector<int> peaks = {40, 60, 140};
    // Left uses the first gap (20), right the last gap (80).
    EXPECT_EQ(ComputeRegionBoundaries(peaks, 1000), (std::vector<int>{30, 50, 100, 180}));
}

TEST(Segment, RegionsMatchBoundaries) {
    const std::vector<int> peaks = {100, 250, 400, 550};
    std::vector<Region> regions  = SegmentRegions(peaks, 650);
    ASSERT_EQ(regions.size(), 4u);
    EXPECT_EQ(regions[0].index, 0);
    EXPECT_EQ(regions[0].start, 25);
    EXPECT_EQ(regions[0].end, 175);
    EXPECT_EQ(regions[3].index, 3);
    EXPECT_EQ(regions[3].start, 475);
    EXPECT_EQ(regions[3].end, 625);
    EXPECT_EQ(regions[1].Width(), 150);
    EXPECT_TRUE(regions[1].Contains(250));
    EXPECT_FALSE(regions[1].Contains(325));
}

TEST(Segment, RandomPeaksGiveContiguousRegions) {
    std::mt19937 rng(1234);
    for (int trial = 0; trial < 200; ++trial) {
        const int width = std::uniform_int_distribution<int>(2, 2000)(rng);
        const int count = std::uniform_int_distribution<int>(2, std::min(width, 40))(rng);

        std::set<int> unique;
        std::uniform_int_distribution<int> col(0, width - 1);
        while (static_cast<int>(unique.size()) < count) { unique.insert(col(rng)); }
        const std::vector<int> peaks(unique.begin(), unique.end());

        const std::vector<int> b    = ComputeRegionBoundaries(peaks, width);
        const std::vector<Region> r = SegmentRegions(peaks, width);

        ASSERT_EQ(b.size(), peaks.size() + 1);
        ASSERT_EQ(r.size(), peaks.size());
        EXPECT_TRUE(std::is_sorted(b.begin(), b.end()));
        EXPECT_GE(b.front(), 0);
        EXPECT_LE(b.back(), width);
        for (size_t i = 0; i < r.size(); ++i) {
            EXPECT_EQ(r[i].index, static_cast<int>(i));
            EXPECT_LE(r[i].start, r[i].end);
            if (i + 1 < r.size()) { EXPECT_EQ(r[i].end, r[i + 1].start); }
        }
    }
}

TEST(Segment, RejectsTooFewPeaks) {
    const std::vector<int> one = {10};
    EXPECT_THROW(ComputeRegionBoundaries(one, 100), InputError);
    const std::vector<int> none;
    EXPECT_THROW(SegmentRegions(none, 100), InputError);
}

TEST(Segment, ErrorsNameTheCallingFunction) {
    const std::vector<int> one = {10};
    try {
        ComputeRegionBoundaries(one, 100);
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("ComputeRegionBoundaries:", 0), 0u) << e.what();
    }
    try {
        SegmentRegions(one, 100);
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("SegmentRegions:", 0), 0u) << e.what();
    }
}

TEST(Segment, RejectsMalformedPeaks) {
    const std::vector<int> unordered = {50, 20};
    EXPECT_THROW(ComputeRegionBoundaries(unordered, 100), InputError);

    const std::vector<int> duplicate = {20, 20};
    EXPECT_THROW(ComputeRegionBoundaries(duplicate, 100), InputError);

    const std::vector<int> outside = {20, 100};
    EXPECT_THROW(ComputeRegionBoundaries(outside, 100), InputError);

    const std::vector<int> negative = {-1, 20};
    EXPECT_THROW(ComputeRegionBoundaries(negative, 100), InputError);

    const std::vector<int> ok = {1, 2};
    EXPECT_THROW(ComputeRegionBoundaries(ok, 0), InputError);
}

TEST(Segment, RegionsFromBoundaries) {
    const std::vector<int> b = {0, 5, 5, 9};
    std::vector<Region> r    = RegionsFromBoundaries(b);
    ASSERT_EQ(r.size(), 3u);
    EXPECT_TRUE(r[1].Empty());
    EXPECT_EQ(r[2].start, 5);
    EXPECT_EQ(r[2].end, 9);

    EXPECT_TRUE(RegionsFromBoundaries(std::vector<int>{7}).empty());

    const std::vector<int> bad = {0, 5, 3};
    EXPECT_THROW(RegionsFromBoundaries(bad), InputError);
}
