#ifndef PTAH_INITIALIZATION_DETAILS_VARIANCE_SCALING_HPP
#define PTAH_INITIALIZATION_DETAILS_VARIANCE_SCALING_HPP

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "common.hpp"
#include "fans.hpp"
#include "random.hpp"

namespace Ptah::Initialization::Details {
    enum class FanMode {
        FanIn,
        FanOut,
        FanAvg,
    };

    enum class Distribution {
        Normal,
        Uniform,
    };

    // normal  : truncated N(0, sqrt(scale / n))
    // uniform : U(-sqrt(3 scale / n), sqrt(3 scale / n))
    // n is fan_in, fan_out or their average depending on the mode.
    struct VarianceScalingOptions {
        double scale{1.0};
        FanMode mode{FanMode::FanIn};
        Distribution distribution{Distribution::Normal};
        Seed seed{};
    };

    struct VarianceScalingDescriptor {
        VarianceScalingOptions options{};
    };

    inline std::string to_string(FanMode mode)
    {
        switch (mode) {
            case FanMode::FanOut: return "fan_out";
            case FanMode::FanAvg: return "fan_avg";
            case FanMode::FanIn:
            default: return "fan_in";
        }
    }

    inline std::string to_string(Distribution distribution)
    {
        switch (distribution) {
            case Distribution::Uniform: return "uniform";
            case Distribution::Normal:
            default: return "normal";
        }
    }

    inline FanMode fan_mode_from_string(std::string_view value)
    {
        const auto lowered = to_lower(value);
        if (lowered == "fan_in") return FanMode::FanIn;
        if (lowered == "fan_out") return FanMode::FanOut;
        if (lowered == "fan_avg") return FanMode::FanAvg;
        std::ostringstream message;
        message << "Invalid VarianceScaling mode '" << value << "', expected one of {fan_in, fan_out, fan_avg}.";
        throw std::invalid_argument(message.str());
    }

    inline Distribution distribution_from_string(std::string_view value)
    {
        const auto lowered = to_lower(value);
        if (lowered == "normal") return Distribution::Normal;
        if (lowered == "uniform") return Distribution::Uniform;
        std::ostringstream message;
        message << "Invalid VarianceScaling distribution '" << value << "', expected one of {normal, uniform}.";
        throw std::invalid_argument(message.str());
    }

    inline void validate(const VarianceScalingOptions& options)
    {
        if (!(options.scale > 0.0)) {
            std::ostringstream message;
            message << "VarianceScaling requires a positive scale, got " << options.scale << '.';
            throw std::invalid_argument(message.str());
        }
    }

    [[nodiscard]] inline double effective_scale(const VarianceScalingOptions& options, const Fans& fans)
    {
        switch (options.mode) {
            case FanMode::FanOut:
                return options.scale / std::max(1.0, fans.fan_out);
            case FanMode::FanAvg:
                return options.scale / std::max(1.0, (fans.fan_in + fans.fan_out) / 2.0);
            case FanMode::FanIn:
            default:
                return options.scale / std::max(1.0, fans.fan_in);
        }
    }

    [[nodiscard]] inline torch::Tensor generate(const VarianceScalingDescriptor& descriptor, const Shape& shape, torch::Dtype dtype)
    {
        const auto& options = descriptor.options;
        validate(options);
        validate_shape(shape, "VarianceScaling");
        require_floating(dtype, "VarianceScaling");

        const double scale = effective_scale(options, compute_fans(shape));
        auto generator = make_generator(options.seed);
        if (options.distribution == Distribution::Uniform) {
            const double limit = std::sqrt(3.0 * scale);
            return sample_uniform(shape, -limit, limit, dtype, generator);
        }
        return sample_truncated_normal(shape, 0.0, std::sqrt(scale), dtype, generator);
    }
}

#endif // PTAH_INITIALIZATION_DETAILS_VARIANCE_SCALING_HPP
