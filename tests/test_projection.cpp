#include "czistack/compose/Projection.hpp"
#include "czistack/compose/Colorize.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

using namespace czistack;
using czistack::test::makeStack;

TEST(Projection, Tags) {
    EXPECT_EQ(reductionTag(Reduction::Max), "mip");
    EXPECT_EQ(reductionTag(Reduction::Mean), "aip");
}

TEST(Projection, DepthOneEqualsThePlane) {
    const ImageStack s = makeStack({1, 1, 3, 5}, [](int, int, int y, int x) { return y * 50 + x * 7; });

    cv::Mat mip = projectChannel(s, 0, Reduction::Max);
    cv::Mat aip = projectChannel(s, 0, Reduction::Mean);
    ASSERT_EQ(mip.type(), CV_8UC1);
    ASSERT_EQ(aip.type(), CV_64FC1);

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            EXPECT_EQ(mip.at<std::uint8_t>(y, x), s.at(0, 0, y, x));
            EXPECT_EQ(aip.at<double>(y, x), static_cast<double>(s.at(0, 0, y, x)));
        }
    }

    // after tinting, both projections are pixel-identical to the slice
    const Rgba color{200, 90, 255, 255};
    cv::Mat slice = colorizeRaw(s.plane(0, 0), color);
    EXPECT_EQ(cv::norm(colorizeRaw(mip, color), slice, cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(colorizeRaw(aip, color), slice, cv::NORM_INF), 0.0);
}

TEST(Projection, ConstantStackProjectsToTheConstant) {
    for (int v : {0, 1, 77, 128, 254, 255}) {
        for (int depth : {2, 3, 7}) {
            const ImageStack s = makeStack({1, depth, 4, 4}, [v](int, int, int, int) { return v; });
            cv::Mat mip = projectChannel(s, 0, Reduction::Max);
            cv::Mat aip = projectChannel(s, 0, Reduction::Mean);
            for (int y = 0; y < 4; ++y) {
                for (int x = 0; x < 4; ++x) {
                    EXPECT_EQ(mip.at<std::uint8_t>(y, x), v);
                    EXPECT_EQ(aip.at<double>(y, x), static_cast<double>(v)) << "v=" << v << " depth=" << depth;
                }
            }
        }
    }
}

TEST(Projection, MaxAndMeanAlongDepth) {
    // z values at pixel (0,0): 10, 40, 25  -> max 40, mean 25
    // z values at pixel (0,1): 1, 2, 2     -> max 2,  mean 5/3
    const int vals[3][2] = {{10, 1}, {40, 2}, {25, 2}};
    const ImageStack s = makeStack({1, 3, 1, 2}, [&](int, int z, int, int x) { return vals[z][x]; });

    cv::Mat mip = projectChannel(s, 0, Reduction::Max);
    cv::Mat aip = projectChannel(s, 0, Reduction::Mean);
    EXPECT_EQ(mip.at<std::uint8_t>(0, 0), 40);
    EXPECT_EQ(mip.at<std::uint8_t>(0, 1), 2);
    EXPECT_DOUBLE_EQ(aip.at<double>(0, 0), 25.0);
    EXPECT_DOUBLE_EQ(aip.at<double>(0, 1), 5.0 / 3.0);
}

TEST(Projection, MeanIsNotTruncated) {
    // 0 and 255 -> 127.5, which the tint rounds (half to even) to 128 for k=255
    const ImageStack s = makeStack({1, 2, 1, 1}, [](int, int z, int, int) { return z ? 255 : 0; });
    cv::Mat aip = projectChannel(s, 0, Reduction::Mean);
    EXPECT_EQ(aip.at<double>(0, 0), 127.5);
    EXPECT_EQ(colorizeRaw(aip, Rgba{255, 255, 255, 255}).at<cv::Vec3b>(0, 0)[0], 128);
}

TEST(Projection, ChannelsAreIndependent) {
    const ImageStack s = makeStack({2, 2, 2, 2}, [](int c, int z, int, int) { return c == 0 ? 5 + z : 200 - z; });
    EXPECT_EQ(projectChannel(s, 0, Reduction::Max).at<std::uint8_t>(1, 1), 6);
    EXPECT_EQ(projectChannel(s, 1, Reduction::Max).at<std::uint8_t>(1, 1), 200);
    EXPECT_DOUBLE_EQ(projectChannel(s, 1, Reduction::Mean).at<double>(0, 0), 199.5);
}

TEST(Projection, RejectsEmptyStack) {
    EXPECT_THROW(project({}, Reduction::Max), std::invalid_argument);
}
