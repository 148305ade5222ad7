#ifndef PTAH_INITIALIZATION_DETAILS_RANDOM_HPP
#define PTAH_INITIALIZATION_DETAILS_RANDOM_HPP

#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

#include "common.hpp"

namespace Ptah::Initialization::Details {

    struct RandomNormalOptions {
        double mean{0.0};
        double stddev{0.05};
        Seed seed{};
    };

    struct RandomNormalDescriptor {
        RandomNormalOptions options{};
    };

    struct RandomUniformOptions {
        double minval{-0.05};
        double maxval{0.05};
        Seed seed{};
    };

    struct RandomUniformDescriptor {
        RandomUniformOptions options{};
    };

    // Values further than two standard deviations from the mean are never produced.
    struct TruncatedNormalOptions {
        double mean{0.0};
        double stddev{0.05};
        Seed seed{};
    };

    struct TruncatedNormalDescriptor {
        TruncatedNormalOptions options{};
    };

    namespace detail {
        inline void validate_stddev(double stddev, std::string_view context)
        {
            if (!(stddev >= 0.0)) {
                std::ostringstream message;
                message << context << " requires a non-negative stddev, got " << stddev << '.';
                throw std::invalid_argument(message.str());
            }
        }
    }

    inline void validate(const RandomNormalOptions& options)
    {
        detail::validate_stddev(options.stddev, "RandomNormal");
    }

    inline void validate(const TruncatedNormalOptions& options)
    {
        detail::validate_stddev(options.stddev, "TruncatedNormal");
    }

    inline void validate(const RandomUniformOptions& options)
    {
        if (!(options.minval <= options.maxval)) {
            std::ostringstream message;
            message << "RandomUniform requires minval <= maxval, got [" << options.minval << ", " << options.maxval << "].";
            throw std::invalid_argument(message.str());
        }
    }

    [[nodiscard]] inline torch::Tensor sample_normal(const Shape& shape,
                                                     double mean,
                                                     double stddev,
                                                     torch::Dtype dtype,
                                                     at::Generator& generator)
    {
        torch::NoGradGuard no_grad;
        return torch::empty(shape, tensor_options(dtype)).normal_(mean, stddev, generator);
    }

    [[nodiscard]] inline torch::Tensor sample_uniform(const Shape& shape,
                                                      double minval,
                                                      double maxval,
                                                      torch::Dtype dtype,
                                                      at::Generator& generator)
    {
        torch::NoGradGuard no_grad;
        if (minval == maxval) {
            return torch::full(shape, minval, tensor_options(dtype));
        }
        return torch::empty(shape, tensor_options(dtype)).uniform_(minval, maxval, generator);
    }

    [[nodiscard]] inline torch::Tensor generate(const RandomNormalDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        const auto& options = descriptor.options;
        validate(options);
        validate_shape(shape, "RandomNormal");
        require_floating(dtype, "RandomNormal");
        auto generator = make_generator(options.seed);
        return sample_normal(shape, options.mean, options.stddev, dtype, generator);
    }

    [[nodiscard]] inline torch::Tensor generate(const RandomUniformDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        const auto& options = descriptor.options;
        validate(options);
        validate_shape(shape, "RandomUniform");
        require_floating(dtype, "RandomUniform");
        auto generator = make_generator(options.seed);
        return sample_uniform(shape, options.minval, options.maxval, dtype, generator);
    }

    [[nodiscard]] inline torch::Tensor generate(const TruncatedNormalDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        const auto& options = descriptor.options;
        validate(options);
        validate_shape(shape, "TruncatedNormal");
        require_floating(dtype, "TruncatedNormal");
        auto generator = make_generator(options.seed);
        return sample_truncated_normal(shape, options.mean, options.stddev, dtype, generator);
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_RANDOM_HPP
