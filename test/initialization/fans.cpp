#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "../../include/Ptah.h"

namespace Ptah::Initialization::Tests {

    TEST(FansTests, DenseShapeUsesRowsAndColumns) {
        const auto fans = compute_fans({64, 128});
        EXPECT_DOUBLE_EQ(fans.fan_in, 64.0);
        EXPECT_DOUBLE_EQ(fans.fan_out, 128.0);
    }

    TEST(FansTests, ChannelsLastConvolutionKernel) {
        const auto fans = compute_fans({3, 3, 16, 32}, "channels_last");
        EXPECT_DOUBLE_EQ(fans.fan_in, 3.0 * 3.0 * 16.0);
        EXPECT_DOUBLE_EQ(fans.fan_out, 3.0 * 3.0 * 32.0);
    }

    TEST(FansTests, ChannelsFirstConvolutionKernel) {
        // (depth, input_depth, rows, cols)
        const auto fans = compute_fans({32, 16, 5, 3}, DataFormat::ChannelsFirst);
        EXPECT_DOUBLE_EQ(fans.fan_in, 16.0 * 15.0);
        EXPECT_DOUBLE_EQ(fans.fan_out, 32.0 * 15.0);
    }

    TEST(FansTests, OneDimensionalKernelReceptiveFieldIsLeadingAxis) {
        const auto fans = compute_fans({7, 4, 8});
        EXPECT_DOUBLE_EQ(fans.fan_in, 28.0);
        EXPECT_DOUBLE_EQ(fans.fan_out, 56.0);
    }

    TEST(FansTests, ThreeDimensionalKernel) {
        const auto fans = compute_fans({2, 3, 4, 5, 6});
        EXPECT_DOUBLE_EQ(fans.fan_in, 24.0 * 5.0);
        EXPECT_DOUBLE_EQ(fans.fan_out, 24.0 * 6.0);
    }

    TEST(FansTests, OtherRanksUseSquareRootOfVolume) {
        const auto vector_fans = compute_fans({16});
        EXPECT_DOUBLE_EQ(vector_fans.fan_in, 4.0);
        EXPECT_DOUBLE_EQ(vector_fans.fan_out, 4.0);

        const auto rank6 = compute_fans({2, 2, 2, 2, 2, 3});
        EXPECT_NEAR(rank6.fan_in, std::sqrt(96.0), 1e-12);
        EXPECT_DOUBLE_EQ(rank6.fan_in, rank6.fan_out);
    }

    TEST(FansTests, LayoutStringIsCaseInsensitive) {
        const auto fans = compute_fans({32, 16, 3, 3}, "Channels_First");
        EXPECT_DOUBLE_EQ(fans.fan_in, 144.0);
        EXPECT_DOUBLE_EQ(fans.fan_out, 288.0);
    }

    TEST(FansTests, UnknownLayoutIsRejected) {
        EXPECT_THROW((void)compute_fans({3, 3, 16, 32}, "channels_middle"), std::invalid_argument);
    }

    TEST(FansTests, LayoutIsIgnoredOutsideConvolutionRanks) {
        const auto dense = compute_fans({64, 128}, "bogus");
        EXPECT_DOUBLE_EQ(dense.fan_in, 64.0);
        EXPECT_DOUBLE_EQ(dense.fan_out, 128.0);

        const auto vector_fans = compute_fans({16}, "bogus");
        EXPECT_DOUBLE_EQ(vector_fans.fan_in, 4.0);
    }

    TEST(FansTests, DataFormatNamesRoundTrip) {
        EXPECT_EQ(Details::data_format_from_string(Details::to_string(DataFormat::ChannelsFirst)), DataFormat::ChannelsFirst);
        EXPECT_EQ(Details::data_format_from_string(Details::to_string(DataFormat::ChannelsLast)), DataFormat::ChannelsLast);
    }
}
