#ifndef PTAH_INITIALIZATION_DETAILS_CONVOLUTION_AWARE_HPP
#define PTAH_INITIALIZATION_DETAILS_CONVOLUTION_AWARE_HPP
// "Convolution Aware Initialization" https://arxiv.org/abs/1702.06295
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"
#include "fans.hpp"
#include "orthogonal.hpp"

namespace Ptah::Initialization::Details {

    struct ConvolutionAwareOptions {
        double eps_std{0.05};
        Seed seed{};
    };

    struct ConvolutionAwareDescriptor {
        ConvolutionAwareOptions options{};
    };

    inline void validate(const ConvolutionAwareOptions& options)
    {
        if (!(options.eps_std >= 0.0)) {
            std::ostringstream message;
            message << "ConvolutionAware requires a non-negative eps_std, got " << options.eps_std << '.';
            throw std::invalid_argument(message.str());
        }
    }

    namespace detail {
        inline torch::Tensor inverse_rfft(const torch::Tensor& spectrum, const Shape& kernel_shape)
        {
            const auto complex = spectrum.to(torch::kComplexDouble);
            if (kernel_shape.size() == 1) {
                return torch::fft::irfft(complex, kernel_shape[0], /*dim=*/-1);
            }
            return torch::fft::irfft2(complex, torch::IntArrayRef(kernel_shape), /*dim=*/{-2, -1});
        }

        // Output shape of the inverse real transform of a kernel-shaped spectrum. The last axis
        // grows to 2 (n - 1), kept at 1 for single-tap kernels.
        inline Shape transform_shape(const Shape& kernel_shape)
        {
            Shape transformed = kernel_shape;
            transformed.back() = std::max<std::int64_t>(1, 2 * (kernel_shape.back() - 1));
            const auto probe = inverse_rfft(torch::zeros(kernel_shape, tensor_options(torch::kFloat64)), transformed);
            return Shape(probe.sizes().begin(), probe.sizes().end());
        }

        inline torch::Tensor symmetrize(const torch::Tensor& matrix)
        {
            return matrix + matrix.t() - torch::diag(torch::diag(matrix));
        }

        // Rows of U^T from the SVD of symmetric Gaussian matrices. stack / size + 1 blocks are
        // drawn even when fewer would do, and the surplus rows are dropped.
        inline torch::Tensor create_basis(std::int64_t stack_size,
                                          std::int64_t size,
                                          double eps_std,
                                          at::Generator& generator)
        {
            const auto options = tensor_options(torch::kFloat64);
            if (size == 1) {
                return torch::empty({stack_size, size}, options).normal_(0.0, eps_std, generator);
            }

            const std::int64_t blocks = stack_size / size + 1;
            std::vector<torch::Tensor> rows;
            rows.reserve(static_cast<std::size_t>(blocks));
            for (std::int64_t block = 0; block < blocks; ++block) {
                auto matrix = symmetrize(torch::randn({size, size}, generator, options));
                torch::Tensor u, singular, vh;
                std::tie(u, singular, vh) = torch::linalg_svd(matrix, /*full_matrices=*/true);
                rows.push_back(u.t());
            }
            return torch::cat(rows, 0).narrow(0, 0, stack_size);
        }
    }

    [[nodiscard]] inline torch::Tensor generate(const ConvolutionAwareDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        const auto& options = descriptor.options;
        validate(options);
        validate_shape(shape, "ConvolutionAware");
        require_floating(dtype, "ConvolutionAware");

        const auto rank = shape.size();
        if (rank != 3 && rank != 4) {
            return generate(OrthogonalDescriptor{{.gain = 1.0, .seed = options.seed}}, shape, dtype);
        }

        torch::NoGradGuard no_grad;
        const Shape kernel_shape(shape.begin(), shape.end() - 2);
        const std::int64_t stack_size = shape[rank - 2];
        const std::int64_t filters_size = shape[rank - 1];
        const double variance = 2.0 / compute_fans(shape, DataFormat::ChannelsLast).fan_in;

        const Shape fourier_shape = detail::transform_shape(kernel_shape);
        std::int64_t basis_size = 1;
        for (const auto dimension : fourier_shape) {
            basis_size *= dimension;
        }

        Shape basis_shape{stack_size};
        basis_shape.insert(basis_shape.end(), fourier_shape.begin(), fourier_shape.end());
        Shape filter_shape{stack_size};
        filter_shape.insert(filter_shape.end(), kernel_shape.begin(), kernel_shape.end());

        auto generator = make_generator(options.seed);
        std::vector<torch::Tensor> filters;
        filters.reserve(static_cast<std::size_t>(filters_size));
        for (std::int64_t filter = 0; filter < filters_size; ++filter) {
            const auto basis = detail::create_basis(stack_size, basis_size, options.eps_std, generator).reshape(basis_shape);
            auto spatial = detail::inverse_rfft(basis, kernel_shape);
            auto noise = torch::empty(filter_shape, tensor_options(torch::kFloat64)).normal_(0.0, options.eps_std, generator);
            filters.push_back(spatial + noise);
        }

        // (filters, stack, spatial...)
        auto init = torch::stack(filters, 0);
        const double current_variance = init.var(/*unbiased=*/false).item<double>();
        if (current_variance > 0.0) {
            init = init.mul(std::sqrt(variance / current_variance));
        }

        const std::vector<std::int64_t> order = rank == 3
            ? std::vector<std::int64_t>{2, 1, 0}
            : std::vector<std::int64_t>{2, 3, 1, 0};
        return init.permute(order).contiguous().to(dtype);
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_CONVOLUTION_AWARE_HPP
