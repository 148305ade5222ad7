#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include <torch/torch.h>

#include "../../include/Ptah.h"

namespace Ptah::Initialization::Tests {

    TEST(ApplyTests, KernelOrderMovesChannelsBehindSpatialAxes) {
        EXPECT_EQ(Details::torch_to_kernel_order(2), (std::vector<std::int64_t>{1, 0}));
        EXPECT_EQ(Details::torch_to_kernel_order(4), (std::vector<std::int64_t>{2, 3, 1, 0}));
        EXPECT_EQ(Details::invert({2, 3, 1, 0}), (std::vector<std::int64_t>{3, 2, 0, 1}));
    }

    TEST(ApplyTests, ChannelsLastWritesTheGeneratedTensorAsIs) {
        auto parameter = torch::empty({4, 3}, torch::kFloat64);
        apply(Orthogonal({.seed = 5}), parameter);
        EXPECT_TRUE(torch::equal(parameter, generate(Orthogonal({.seed = 5}), {4, 3}, torch::kFloat64)));
    }

    TEST(ApplyTests, LinearWeightIsGeneratedInKernelOrder) {
        auto parameter = torch::empty({3, 4}, torch::kFloat64);
        apply(Orthogonal({.seed = 5}), parameter, DataFormat::ChannelsFirst);
        const auto expected = generate(Orthogonal({.seed = 5}), {4, 3}, torch::kFloat64);
        EXPECT_TRUE(torch::equal(parameter, expected.t()));
    }

    TEST(ApplyTests, ConvolutionWeightIsPermutedBack) {
        auto parameter = torch::empty({5, 2, 3, 3}, torch::kFloat64);
        const auto descriptor = GlorotUniform(11);
        apply(descriptor, parameter, DataFormat::ChannelsFirst);
        const auto expected = generate(descriptor, {3, 3, 2, 5}, torch::kFloat64);
        EXPECT_TRUE(torch::equal(parameter.permute({2, 3, 1, 0}), expected));
    }

    TEST(ApplyTests, ModuleWeightAndBiasAreInitialized) {
        torch::nn::Linear linear(torch::nn::LinearOptions(6, 4));
        apply_module_initialization(linear, Constant({.value = 0.5}));
        EXPECT_TRUE(torch::all(linear->weight == 0.5).item<bool>());
        EXPECT_TRUE(torch::all(linear->bias == 0.0).item<bool>());
        EXPECT_TRUE(linear->weight.requires_grad());
    }

    TEST(ApplyTests, BiasIsLeftAloneWhenNoDescriptorIsGiven) {
        torch::nn::Conv2d conv(torch::nn::Conv2dOptions(2, 5, 3));
        const auto bias = conv->bias.clone();
        apply_module_initialization(conv, HeNormal(2), std::nullopt);
        EXPECT_TRUE(torch::equal(conv->bias, bias));
        EXPECT_EQ(conv->weight.sizes().vec(), (std::vector<std::int64_t>{5, 2, 3, 3}));
    }
}
