#ifndef PTAH_INITIALIZATION_DETAILS_COMMON_HPP
#define PTAH_INITIALIZATION_DETAILS_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

namespace Ptah::Initialization::Details {
    using Shape = std::vector<std::int64_t>;
    using Seed = std::optional<std::uint64_t>;

    inline std::string to_lower(std::string_view value)
    {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) {
            return static_cast<char>(std::tolower(character));
        });
        return lowered;
    }

    inline std::string format_shape(const Shape& shape)
    {
        std::ostringstream stream;
        stream << '(';
        for (std::size_t i = 0; i < shape.size(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << shape[i];
        }
        stream << ')';
        return stream.str();
    }

    inline void validate_shape(const Shape& shape, std::string_view context)
    {
        const bool valid = !shape.empty()
            && std::all_of(shape.begin(), shape.end(), [](std::int64_t dimension) { return dimension > 0; });
        if (!valid) {
            std::ostringstream message;
            message << context << " requires a non-empty shape of positive dimensions, got " << format_shape(shape) << '.';
            throw std::invalid_argument(message.str());
        }
    }

    inline void require_floating(torch::Dtype dtype, std::string_view context)
    {
        if (!c10::isFloatingType(dtype)) {
            std::ostringstream message;
            message << context << " can only generate floating point tensors, got " << c10::toString(dtype) << '.';
            throw std::invalid_argument(message.str());
        }
    }

    [[nodiscard]] inline torch::TensorOptions tensor_options(torch::Dtype dtype)
    {
        return torch::TensorOptions().dtype(dtype).device(torch::kCPU);
    }

    // A seeded call owns its generator, so repeated calls replay the same stream
    // and the process-wide generator is left untouched.
    [[nodiscard]] inline at::Generator make_generator(const Seed& seed)
    {
        if (seed.has_value()) {
            return at::make_generator<at::CPUGeneratorImpl>(*seed);
        }
        return at::detail::getDefaultCPUGenerator();
    }

    // Inverse-CDF sampling of N(mean, stddev) restricted to mean +/- 2 stddev.
    [[nodiscard]] inline torch::Tensor sample_truncated_normal(const Shape& shape,
                                                               double mean,
                                                               double stddev,
                                                               torch::Dtype dtype,
                                                               at::Generator& generator)
    {
        torch::NoGradGuard no_grad;
        if (stddev == 0.0) {
            return torch::full(shape, mean, tensor_options(dtype));
        }

        constexpr double kCutoff = 2.0;
        constexpr double kSqrt2 = 1.41421356237309504880;
        const auto normal_cdf = [](double value) { return 0.5 * (1.0 + std::erf(value / kSqrt2)); };
        const double lower = normal_cdf(-kCutoff);
        const double upper = normal_cdf(kCutoff);

        auto samples = torch::empty(shape, tensor_options(torch::kFloat64));
        samples.uniform_(2.0 * lower - 1.0, 2.0 * upper - 1.0, generator);
        samples.erfinv_();
        samples.mul_(stddev * kSqrt2).add_(mean);
        samples.clamp_(mean - kCutoff * stddev, mean + kCutoff * stddev);
        return samples.to(dtype);
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_COMMON_HPP
