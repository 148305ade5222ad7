#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../../include/Ptah.h"

namespace Ptah::Initialization::Tests {

    TEST(RandomInitializerTests, NormalMatchesConfiguredMoments) {
        const auto tensor = generate(RandomNormal({.mean = 1.5, .stddev = 0.5, .seed = 7}), {200, 200}, torch::kFloat64);
        EXPECT_NEAR(tensor.mean().item<double>(), 1.5, 0.01);
        EXPECT_NEAR(tensor.std().item<double>(), 0.5, 0.01);
    }

    TEST(RandomInitializerTests, UniformStaysWithinBounds) {
        const auto tensor = generate(RandomUniform({.minval = -0.2, .maxval = 0.7, .seed = 11}), {100, 100});
        EXPECT_GE(tensor.min().item<double>(), -0.2);
        EXPECT_LE(tensor.max().item<double>(), 0.7);
        EXPECT_LT(tensor.min().item<double>(), -0.15);
        EXPECT_GT(tensor.max().item<double>(), 0.65);
    }

    TEST(RandomInitializerTests, TruncatedNormalNeverExceedsTwoStandardDeviations) {
        const double mean = 0.3;
        const double stddev = 0.05;
        const auto tensor = generate(TruncatedNormal({.mean = mean, .stddev = stddev}), {300, 300}, torch::kFloat64);
        EXPECT_GE(tensor.min().item<double>(), mean - 2.0 * stddev - 1e-12);
        EXPECT_LE(tensor.max().item<double>(), mean + 2.0 * stddev + 1e-12);
        EXPECT_NEAR(tensor.mean().item<double>(), mean, 1e-3);
        // Truncation at 2 sigma shrinks the standard deviation to ~0.88 sigma.
        EXPECT_NEAR(tensor.std().item<double>(), 0.8796 * stddev, 2e-3);
    }

    TEST(RandomInitializerTests, SeededCallsAreReproducible) {
        const std::vector<Descriptor> descriptors{
            RandomNormal({.seed = 42}),
            RandomUniform({.seed = 42}),
            TruncatedNormal({.seed = 42}),
        };
        for (const auto& descriptor : descriptors) {
            const auto first = generate(descriptor, {16, 8});
            const auto second = generate(descriptor, {16, 8});
            EXPECT_TRUE(torch::equal(first, second)) << class_name(descriptor);
        }
    }

    TEST(RandomInitializerTests, DifferentSeedsDiffer) {
        const auto first = generate(RandomNormal({.seed = 1}), {32});
        const auto second = generate(RandomNormal({.seed = 2}), {32});
        EXPECT_FALSE(torch::equal(first, second));
    }

    TEST(RandomInitializerTests, SeededCallsLeaveGlobalGeneratorAlone) {
        torch::manual_seed(123);
        const auto expected = torch::randn({8});

        torch::manual_seed(123);
        (void)generate(RandomNormal({.seed = 5}), {64});
        const auto actual = torch::randn({8});
        EXPECT_TRUE(torch::equal(expected, actual));
    }

    TEST(RandomInitializerTests, InvalidParametersAreRejected) {
        EXPECT_THROW((void)RandomNormal({.stddev = -1.0}), std::invalid_argument);
        EXPECT_THROW((void)TruncatedNormal({.stddev = -0.1}), std::invalid_argument);
        EXPECT_THROW((void)RandomUniform({.minval = 1.0, .maxval = 0.0}), std::invalid_argument);
    }

    TEST(RandomInitializerTests, IntegerDtypeIsRejected) {
        EXPECT_THROW((void)generate(RandomNormal(), {4, 4}, torch::kInt32), std::invalid_argument);
    }
}
