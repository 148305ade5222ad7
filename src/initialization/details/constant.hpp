#ifndef PTAH_INITIALIZATION_DETAILS_CONSTANT_HPP
#define PTAH_INITIALIZATION_DETAILS_CONSTANT_HPP

#include <torch/torch.h>

#include "common.hpp"

namespace Ptah::Initialization::Details {

    struct ZerosDescriptor {};

    struct OnesDescriptor {};

    struct ConstantOptions {
        double value{0.0};
    };

    struct ConstantDescriptor {
        ConstantOptions options{};
    };

    [[nodiscard]] inline torch::Tensor fill(const Shape& shape, double value, torch::Dtype dtype)
    {
        torch::NoGradGuard no_grad;
        validate_shape(shape, "Constant initializer");
        return torch::full(shape, value, tensor_options(dtype));
    }

    [[nodiscard]] inline torch::Tensor generate(const ZerosDescriptor&, const Shape& shape, torch::Dtype dtype)
    {
        return fill(shape, 0.0, dtype);
    }

    [[nodiscard]] inline torch::Tensor generate(const OnesDescriptor&, const Shape& shape, torch::Dtype dtype)
    {
        return fill(shape, 1.0, dtype);
    }

    [[nodiscard]] inline torch::Tensor generate(const ConstantDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        return fill(shape, descriptor.options.value, dtype);
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_CONSTANT_HPP
