#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

#include "../../include/Ptah.h"

namespace Ptah::Initialization::Tests {

    TEST(ConstantInitializerTests, ZerosFillsEveryElement) {
        for (const Shape& shape : {Shape{7}, Shape{4, 5}, Shape{3, 3, 2, 8}}) {
            const auto tensor = generate(Zeros(), shape);
            EXPECT_EQ(tensor.sizes().vec(), shape);
            EXPECT_EQ(tensor.scalar_type(), torch::kFloat32);
            EXPECT_TRUE(tensor.eq(0).all().item<bool>());
        }
    }

    TEST(ConstantInitializerTests, OnesFillsEveryElement) {
        const auto tensor = generate(Ones(), {6, 2, 3}, torch::kFloat64);
        EXPECT_EQ(tensor.scalar_type(), torch::kFloat64);
        EXPECT_TRUE(tensor.eq(1).all().item<bool>());
    }

    TEST(ConstantInitializerTests, ConstantUsesConfiguredValue) {
        const auto tensor = generate(Constant({.value = 0.25}), {10, 10});
        EXPECT_TRUE(tensor.eq(0.25).all().item<bool>());
    }

    TEST(ConstantInitializerTests, ConstantHonoursIntegerDtype) {
        const auto tensor = generate(Constant({.value = 3.0}), {4}, torch::kInt64);
        EXPECT_EQ(tensor.scalar_type(), torch::kInt64);
        EXPECT_EQ(tensor.sum().item<std::int64_t>(), 12);
    }

    TEST(ConstantInitializerTests, RejectsEmptyOrNonPositiveShapes) {
        EXPECT_THROW((void)generate(Zeros(), Shape{}), std::invalid_argument);
        EXPECT_THROW((void)generate(Ones(), {3, 0}), std::invalid_argument);
        EXPECT_THROW((void)generate(Constant(), {-1, 2}), std::invalid_argument);
    }
}
