#ifndef PTAH_INITIALIZATION_DETAILS_IDENTITY_HPP
#define PTAH_INITIALIZATION_DETAILS_IDENTITY_HPP

#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

#include "common.hpp"

namespace Ptah::Initialization::Details {

    struct IdentityOptions {
        double gain{1.0};
    };

    struct IdentityDescriptor {
        IdentityOptions options{};
    };

    [[nodiscard]] inline torch::Tensor generate(const IdentityDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        if (shape.size() != 2 || shape[0] != shape[1] || shape[0] <= 0) {
            std::ostringstream message;
            message << "Identity initializer can only be used for 2D square matrices, got " << format_shape(shape) << '.';
            throw std::invalid_argument(message.str());
        }
        torch::NoGradGuard no_grad;
        return torch::eye(shape[0], tensor_options(torch::kFloat64)).mul_(descriptor.options.gain).to(dtype);
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_IDENTITY_HPP
