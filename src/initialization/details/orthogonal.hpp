#ifndef PTAH_INITIALIZATION_DETAILS_ORTHOGONAL_HPP
#define PTAH_INITIALIZATION_DETAILS_ORTHOGONAL_HPP
// "Exact solutions to the nonlinear dynamics of learning in deep linear neural networks" https://arxiv.org/abs/1312.6120
#include <cstdint>
#include <tuple>

#include <torch/torch.h>

#include "common.hpp"

namespace Ptah::Initialization::Details {

    struct OrthogonalOptions {
        double gain{1.0};
        Seed seed{};
    };

    struct OrthogonalDescriptor {
        OrthogonalOptions options{};
    };

    [[nodiscard]] inline torch::Tensor generate(const OrthogonalDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        torch::NoGradGuard no_grad;
        validate_shape(shape, "Orthogonal");
        require_floating(dtype, "Orthogonal");

        std::int64_t num_rows = 1;
        for (std::size_t i = 0; i + 1 < shape.size(); ++i) {
            num_rows *= shape[i];
        }
        const std::int64_t num_cols = shape.back();

        auto generator = make_generator(descriptor.options.seed);
        auto flat = torch::randn({num_rows, num_cols}, generator, tensor_options(torch::kFloat64));

        torch::Tensor u, singular, vh;
        std::tie(u, singular, vh) = torch::linalg_svd(flat, /*full_matrices=*/false);

        // U is (rows, min) and Vh is (min, cols); exactly one of them has the flat shape
        // unless the matrix is square, in which case U is taken.
        auto q = (u.size(0) == num_rows && u.size(1) == num_cols) ? u : vh;
        q = q.reshape(shape);
        q = q.narrow(0, 0, shape[0]);
        if (shape.size() > 1) {
            q = q.narrow(1, 0, shape[1]);
        }
        return q.mul(descriptor.options.gain).contiguous().to(dtype);
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_ORTHOGONAL_HPP
