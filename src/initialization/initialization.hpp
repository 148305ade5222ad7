#ifndef PTAH_INITIALIZATION_HPP
#define PTAH_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <string_view>
#include <variant>

#include "details/common.hpp"
#include "details/fans.hpp"
#include "details/constant.hpp"
#include "details/random.hpp"
#include "details/variance_scaling.hpp"
#include "details/orthogonal.hpp"
#include "details/convolution_aware.hpp"
#include "details/identity.hpp"

namespace Ptah::Initialization {
    using Shape = Details::Shape;
    using Seed = Details::Seed;

    using DataFormat = Details::DataFormat;
    using Fans = Details::Fans;
    using FanMode = Details::FanMode;
    using Distribution = Details::Distribution;

    using ZerosDescriptor = Details::ZerosDescriptor;
    using OnesDescriptor = Details::OnesDescriptor;

    using ConstantOptions = Details::ConstantOptions;
    using ConstantDescriptor = Details::ConstantDescriptor;

    using RandomNormalOptions = Details::RandomNormalOptions;
    using RandomNormalDescriptor = Details::RandomNormalDescriptor;

    using RandomUniformOptions = Details::RandomUniformOptions;
    using RandomUniformDescriptor = Details::RandomUniformDescriptor;

    using TruncatedNormalOptions = Details::TruncatedNormalOptions;
    using TruncatedNormalDescriptor = Details::TruncatedNormalDescriptor;

    using VarianceScalingOptions = Details::VarianceScalingOptions;
    using VarianceScalingDescriptor = Details::VarianceScalingDescriptor;

    using OrthogonalOptions = Details::OrthogonalOptions;
    using OrthogonalDescriptor = Details::OrthogonalDescriptor;

    using ConvolutionAwareOptions = Details::ConvolutionAwareOptions;
    using ConvolutionAwareDescriptor = Details::ConvolutionAwareDescriptor;

    using IdentityOptions = Details::IdentityOptions;
    using IdentityDescriptor = Details::IdentityDescriptor;

    using Descriptor = std::variant<ZerosDescriptor,
                                    OnesDescriptor,
                                    ConstantDescriptor,
                                    RandomNormalDescriptor,
                                    RandomUniformDescriptor,
                                    TruncatedNormalDescriptor,
                                    VarianceScalingDescriptor,
                                    OrthogonalDescriptor,
                                    ConvolutionAwareDescriptor,
                                    IdentityDescriptor>;


    [[nodiscard]] inline constexpr auto Zeros() noexcept -> ZerosDescriptor {
        return {};
    }

    [[nodiscard]] inline constexpr auto Ones() noexcept -> OnesDescriptor {
        return {};
    }

    [[nodiscard]] inline constexpr auto Constant(const ConstantOptions& options = {}) noexcept -> ConstantDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto RandomNormal(const RandomNormalOptions& options = {}) -> RandomNormalDescriptor {
        Details::validate(options);
        return {options};
    }

    [[nodiscard]] inline auto RandomUniform(const RandomUniformOptions& options = {}) -> RandomUniformDescriptor {
        Details::validate(options);
        return {options};
    }

    [[nodiscard]] inline auto TruncatedNormal(const TruncatedNormalOptions& options = {}) -> TruncatedNormalDescriptor {
        Details::validate(options);
        return {options};
    }

    [[nodiscard]] inline auto VarianceScaling(const VarianceScalingOptions& options = {}) -> VarianceScalingDescriptor {
        Details::validate(options);
        return {options};
    }

    [[nodiscard]] inline auto VarianceScaling(double scale,
                                              std::string_view mode,
                                              std::string_view distribution,
                                              Seed seed = {}) -> VarianceScalingDescriptor {
        return VarianceScaling({.scale = scale,
                                .mode = Details::fan_mode_from_string(mode),
                                .distribution = Details::distribution_from_string(distribution),
                                .seed = seed});
    }

    [[nodiscard]] inline constexpr auto Orthogonal(const OrthogonalOptions& options = {}) noexcept -> OrthogonalDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto ConvolutionAware(const ConvolutionAwareOptions& options = {}) -> ConvolutionAwareDescriptor {
        Details::validate(options);
        return {options};
    }

    [[nodiscard]] inline constexpr auto Identity(const IdentityOptions& options = {}) noexcept -> IdentityDescriptor {
        return {options};
    }

    // LeCun 98, Efficient Backprop http://yann.lecun.com/exdb/publis/pdf/lecun-98b.pdf
    [[nodiscard]] inline auto LecunUniform(Seed seed = {}) -> VarianceScalingDescriptor {
        return VarianceScaling({.scale = 1.0, .mode = FanMode::FanIn, .distribution = Distribution::Uniform, .seed = seed});
    }

    [[nodiscard]] inline auto LecunNormal(Seed seed = {}) -> VarianceScalingDescriptor {
        return VarianceScaling({.scale = 1.0, .mode = FanMode::FanIn, .distribution = Distribution::Normal, .seed = seed});
    }

    // Glorot & Bengio, AISTATS 2010 http://jmlr.org/proceedings/papers/v9/glorot10a/glorot10a.pdf
    [[nodiscard]] inline auto GlorotNormal(Seed seed = {}) -> VarianceScalingDescriptor {
        return VarianceScaling({.scale = 1.0, .mode = FanMode::FanAvg, .distribution = Distribution::Normal, .seed = seed});
    }

    [[nodiscard]] inline auto GlorotUniform(Seed seed = {}) -> VarianceScalingDescriptor {
        return VarianceScaling({.scale = 1.0, .mode = FanMode::FanAvg, .distribution = Distribution::Uniform, .seed = seed});
    }

    // He et al. http://arxiv.org/abs/1502.01852
    [[nodiscard]] inline auto HeNormal(Seed seed = {}) -> VarianceScalingDescriptor {
        return VarianceScaling({.scale = 2.0, .mode = FanMode::FanIn, .distribution = Distribution::Normal, .seed = seed});
    }

    [[nodiscard]] inline auto HeUniform(Seed seed = {}) -> VarianceScalingDescriptor {
        return VarianceScaling({.scale = 2.0, .mode = FanMode::FanIn, .distribution = Distribution::Uniform, .seed = seed});
    }

    [[nodiscard]] inline Fans compute_fans(const Shape& shape, DataFormat format = DataFormat::ChannelsLast) {
        return Details::compute_fans(shape, format);
    }

    [[nodiscard]] inline Fans compute_fans(const Shape& shape, std::string_view data_format) {
        return Details::compute_fans(shape, data_format);
    }
}

#include "registry.hpp"

#endif //PTAH_INITIALIZATION_HPP
